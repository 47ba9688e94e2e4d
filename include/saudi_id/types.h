/**
 * @file types.h
 * @brief Common types for the Saudi national ID library
 *
 * Shared enums, digit containers and error structs used across the
 * identifier model, checksum engine and generator.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace saudi_id {

/// Number of digits in a national ID
constexpr size_t ID_LENGTH = 10;

/// Number of payload digits (category digit included, check digit excluded)
constexpr size_t PAYLOAD_LENGTH = ID_LENGTH - 1;

/// Leading digit of citizen IDs
constexpr uint8_t CITIZEN_PREFIX = 1;

/// Leading digit of resident IDs
constexpr uint8_t RESIDENT_PREFIX = 2;

using Digits = std::array<uint8_t, ID_LENGTH>;
using Payload = std::array<uint8_t, PAYLOAD_LENGTH>;

/// @brief Holder category encoded in the first digit
enum class Category {
    CITIZEN,    ///< Leading digit 1
    RESIDENT    ///< Leading digit 2
};

/// @brief Parse-time failure kinds, in the order they are checked
enum class ParseErrorKind {
    WRONG_LENGTH,       ///< Not exactly 10 characters/digits
    NON_DIGIT,          ///< A character (or value) outside 0-9
    INVALID_CATEGORY,   ///< Leading digit is not 1 or 2
    CHECKSUM_MISMATCH   ///< Check digit does not match the payload
};

/// @brief Generation-time failure kinds
enum class GenerationErrorKind {
    INVALID_CATEGORY,       ///< Fixed payload does not start with 1 or 2
    RANDOMNESS_UNAVAILABLE  ///< Randomness source failed or produced nothing usable
};

/**
 * @brief Parse failure with diagnostic details
 *
 * Only the fields relevant to @ref kind are meaningful.
 */
struct ParseError {
    ParseErrorKind kind = ParseErrorKind::WRONG_LENGTH;
    size_t actualLength = 0;        ///< WRONG_LENGTH: number of characters/digits seen
    size_t position = 0;            ///< NON_DIGIT: zero-based offset of the first offender
    std::string offending;          ///< NON_DIGIT: offending character (or value, for digit input)
    int leadingDigit = -1;          ///< INVALID_CATEGORY: the rejected leading digit
    int expectedCheckDigit = -1;    ///< CHECKSUM_MISMATCH: digit computed from the payload
    int actualCheckDigit = -1;      ///< CHECKSUM_MISMATCH: digit found in the input

    static ParseError wrongLength(size_t actual);
    static ParseError nonDigit(size_t position, std::string offending);
    static ParseError invalidCategory(int leadingDigit);
    static ParseError checksumMismatch(int expected, int actual);

    /// @brief Stable upper-case code, e.g. "WRONG_LENGTH"
    std::string code() const;

    /// @brief Human-readable diagnostic
    std::string message() const;

    bool operator==(const ParseError& other) const;
    bool operator!=(const ParseError& other) const { return !(*this == other); }
};

/// @brief Generation failure with diagnostic details
struct GenerationError {
    GenerationErrorKind kind = GenerationErrorKind::RANDOMNESS_UNAVAILABLE;
    int leadingDigit = -1;  ///< INVALID_CATEGORY: the rejected leading digit
    std::string detail;     ///< RANDOMNESS_UNAVAILABLE: reason reported by the source

    static GenerationError invalidCategory(int leadingDigit);
    static GenerationError randomnessUnavailable(std::string detail);

    std::string code() const;
    std::string message() const;
};

/// @brief Convert Category to string ("CITIZEN" / "RESIDENT")
inline std::string categoryToString(Category c) {
    switch (c) {
        case Category::CITIZEN:  return "CITIZEN";
        case Category::RESIDENT: return "RESIDENT";
    }
    return "UNKNOWN";
}

/// @brief Leading digit used for a category
inline uint8_t categoryPrefix(Category c) {
    return c == Category::CITIZEN ? CITIZEN_PREFIX : RESIDENT_PREFIX;
}

/// @brief Category for a leading digit, or std::nullopt if it is not 1 or 2
inline std::optional<Category> categoryFromPrefix(int digit) {
    if (digit == CITIZEN_PREFIX) return Category::CITIZEN;
    if (digit == RESIDENT_PREFIX) return Category::RESIDENT;
    return std::nullopt;
}

/**
 * @brief Parse a category name (case-insensitive "citizen" / "resident")
 * @return Category, or std::nullopt for any other text
 */
std::optional<Category> categoryFromString(const std::string& name);

/// @brief Convert ParseErrorKind to string
inline std::string parseErrorKindToString(ParseErrorKind k) {
    switch (k) {
        case ParseErrorKind::WRONG_LENGTH:      return "WRONG_LENGTH";
        case ParseErrorKind::NON_DIGIT:         return "NON_DIGIT";
        case ParseErrorKind::INVALID_CATEGORY:  return "INVALID_CATEGORY";
        case ParseErrorKind::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";
    }
    return "UNKNOWN";
}

/// @brief Convert GenerationErrorKind to string
inline std::string generationErrorKindToString(GenerationErrorKind k) {
    switch (k) {
        case GenerationErrorKind::INVALID_CATEGORY:       return "INVALID_CATEGORY";
        case GenerationErrorKind::RANDOMNESS_UNAVAILABLE: return "RANDOMNESS_UNAVAILABLE";
    }
    return "UNKNOWN";
}

} // namespace saudi_id
