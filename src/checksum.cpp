/**
 * @file checksum.cpp
 * @brief Luhn-family check digit implementation
 */

#include "saudi_id/checksum.h"
#include <algorithm>

namespace saudi_id::checksum {

uint8_t foldDigit(uint8_t digit, size_t position) noexcept {
    if (position % 2 != 0) {
        return digit;
    }

    uint8_t doubled = static_cast<uint8_t>(digit * 2);
    return doubled >= 10 ? static_cast<uint8_t>(doubled - 9) : doubled;
}

uint32_t foldSum(const uint8_t* digits, size_t count) noexcept {
    uint32_t sum = 0;
    for (size_t i = 0; i < count; ++i) {
        sum += foldDigit(digits[i], i);
    }
    return sum;
}

uint8_t computeCheckDigit(const Payload& payload) noexcept {
    uint32_t sum = foldSum(payload.data(), payload.size());
    return static_cast<uint8_t>((10 - (sum % 10)) % 10);
}

bool verify(const Payload& payload, uint8_t claimed) noexcept {
    return claimed == computeCheckDigit(payload);
}

bool isValidSequence(const Digits& digits) noexcept {
    // Position 9 is odd, so the check digit enters the sum unchanged
    return foldSum(digits.data(), digits.size()) % 10 == 0;
}

Payload payloadOf(const Digits& digits) noexcept {
    Payload payload{};
    std::copy_n(digits.begin(), PAYLOAD_LENGTH, payload.begin());
    return payload;
}

} // namespace saudi_id::checksum
