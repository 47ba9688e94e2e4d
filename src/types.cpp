/**
 * @file types.cpp
 * @brief Error construction and formatting for the shared types
 */

#include "saudi_id/types.h"
#include <algorithm>
#include <cctype>

namespace saudi_id {

ParseError ParseError::wrongLength(size_t actual) {
    ParseError e;
    e.kind = ParseErrorKind::WRONG_LENGTH;
    e.actualLength = actual;
    return e;
}

ParseError ParseError::nonDigit(size_t position, std::string offending) {
    ParseError e;
    e.kind = ParseErrorKind::NON_DIGIT;
    e.actualLength = ID_LENGTH;
    e.position = position;
    e.offending = std::move(offending);
    return e;
}

ParseError ParseError::invalidCategory(int leadingDigit) {
    ParseError e;
    e.kind = ParseErrorKind::INVALID_CATEGORY;
    e.actualLength = ID_LENGTH;
    e.leadingDigit = leadingDigit;
    return e;
}

ParseError ParseError::checksumMismatch(int expected, int actual) {
    ParseError e;
    e.kind = ParseErrorKind::CHECKSUM_MISMATCH;
    e.actualLength = ID_LENGTH;
    e.expectedCheckDigit = expected;
    e.actualCheckDigit = actual;
    return e;
}

std::string ParseError::code() const {
    return parseErrorKindToString(kind);
}

std::string ParseError::message() const {
    switch (kind) {
        case ParseErrorKind::WRONG_LENGTH:
            return "expected " + std::to_string(ID_LENGTH) + " digits, got " +
                   std::to_string(actualLength);
        case ParseErrorKind::NON_DIGIT:
            return "non-digit '" + offending + "' at position " + std::to_string(position);
        case ParseErrorKind::INVALID_CATEGORY:
            return "leading digit " + std::to_string(leadingDigit) +
                   " is not a known category (1 = citizen, 2 = resident)";
        case ParseErrorKind::CHECKSUM_MISMATCH:
            return "check digit is " + std::to_string(actualCheckDigit) +
                   ", expected " + std::to_string(expectedCheckDigit);
    }
    return "unknown parse error";
}

bool ParseError::operator==(const ParseError& other) const {
    return kind == other.kind &&
           actualLength == other.actualLength &&
           position == other.position &&
           offending == other.offending &&
           leadingDigit == other.leadingDigit &&
           expectedCheckDigit == other.expectedCheckDigit &&
           actualCheckDigit == other.actualCheckDigit;
}

GenerationError GenerationError::invalidCategory(int leadingDigit) {
    GenerationError e;
    e.kind = GenerationErrorKind::INVALID_CATEGORY;
    e.leadingDigit = leadingDigit;
    return e;
}

GenerationError GenerationError::randomnessUnavailable(std::string detail) {
    GenerationError e;
    e.kind = GenerationErrorKind::RANDOMNESS_UNAVAILABLE;
    e.detail = std::move(detail);
    return e;
}

std::string GenerationError::code() const {
    return generationErrorKindToString(kind);
}

std::string GenerationError::message() const {
    switch (kind) {
        case GenerationErrorKind::INVALID_CATEGORY:
            return "payload leading digit " + std::to_string(leadingDigit) +
                   " is not a known category (1 = citizen, 2 = resident)";
        case GenerationErrorKind::RANDOMNESS_UNAVAILABLE:
            return detail.empty() ? "randomness source unavailable"
                                  : "randomness source unavailable: " + detail;
    }
    return "unknown generation error";
}

std::optional<Category> categoryFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "citizen") return Category::CITIZEN;
    if (lower == "resident") return Category::RESIDENT;
    return std::nullopt;
}

} // namespace saudi_id
