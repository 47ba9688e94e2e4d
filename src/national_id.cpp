/**
 * @file national_id.cpp
 * @brief NationalId parsing and rendering
 */

#include "saudi_id/national_id.h"
#include "saudi_id/checksum.h"
#include "saudi_id/exceptions.h"
#include <spdlog/spdlog.h>

namespace saudi_id {

namespace {

ParseResult reject(ParseError error) {
    spdlog::debug("[NationalId] Rejected: {} ({})", error.code(), error.message());
    return ParseResult::failure(std::move(error));
}

} // anonymous namespace

ParseResult NationalId::fromCheckedDigits(const Digits& digits) {
    if (!categoryFromPrefix(digits[0])) {
        return reject(ParseError::invalidCategory(digits[0]));
    }

    uint8_t expected = checksum::computeCheckDigit(checksum::payloadOf(digits));
    uint8_t actual = digits[ID_LENGTH - 1];
    if (expected != actual) {
        return reject(ParseError::checksumMismatch(expected, actual));
    }

    return ParseResult::success(NationalId(digits));
}

ParseResult NationalId::parse(const std::string& text) {
    if (text.length() != ID_LENGTH) {
        return reject(ParseError::wrongLength(text.length()));
    }

    Digits digits{};
    for (size_t i = 0; i < ID_LENGTH; ++i) {
        char c = text[i];
        // Plain ASCII range check: std::isdigit is locale dependent
        if (c < '0' || c > '9') {
            return reject(ParseError::nonDigit(i, std::string(1, c)));
        }
        digits[i] = static_cast<uint8_t>(c - '0');
    }

    return fromCheckedDigits(digits);
}

NationalId NationalId::of(const std::string& text) {
    ParseResult result = parse(text);
    if (!result.ok()) {
        throw InvalidNationalIdException(*result.error);
    }
    return *result.id;
}

ParseResult NationalId::fromDigits(const std::vector<uint8_t>& digits) {
    if (digits.size() != ID_LENGTH) {
        return reject(ParseError::wrongLength(digits.size()));
    }

    Digits checked{};
    for (size_t i = 0; i < ID_LENGTH; ++i) {
        if (digits[i] > 9) {
            return reject(ParseError::nonDigit(i, std::to_string(digits[i])));
        }
        checked[i] = digits[i];
    }

    return fromCheckedDigits(checked);
}

ParseResult NationalId::fromNumber(uint32_t value) {
    // Expand most significant digit first; leading zeros are not representable
    std::vector<uint8_t> digits;
    while (value > 0) {
        digits.insert(digits.begin(), static_cast<uint8_t>(value % 10));
        value /= 10;
    }

    return fromDigits(digits);
}

Category NationalId::getCategory() const noexcept {
    return digits_[0] == CITIZEN_PREFIX ? Category::CITIZEN : Category::RESIDENT;
}

Payload NationalId::getPayload() const noexcept {
    return checksum::payloadOf(digits_);
}

uint32_t NationalId::toNumber() const noexcept {
    uint32_t value = 0;
    for (uint8_t d : digits_) {
        value = value * 10 + d;
    }
    return value;
}

std::string NationalId::toString() const {
    std::string text;
    text.reserve(ID_LENGTH);
    for (uint8_t d : digits_) {
        text += static_cast<char>('0' + d);
    }
    return text;
}

} // namespace saudi_id
