/**
 * @file national_id.h
 * @brief Value Object for a Saudi Arabian national identification number
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "types.h"

namespace saudi_id {

class NationalIdGenerator;
struct ParseResult;

/**
 * @brief Saudi national ID Value Object
 *
 * Ten decimal digits: a category digit (1 = citizen, 2 = resident),
 * eight body digits and a Luhn-family check digit. Instances exist only
 * after every invariant has been checked, and are immutable.
 *
 * Usage:
 * @code
 *   ParseResult result = NationalId::parse("1000000008");
 *   if (result.ok()) {
 *       Category c = result.id->getCategory();
 *   } else {
 *       spdlog::warn("rejected: {}", result.error->message());
 *   }
 * @endcode
 */
class NationalId {
private:
    Digits digits_;

    explicit NationalId(const Digits& digits) : digits_(digits) {}

    /// Category, checksum and construction for a sequence already known to be 10 digits in 0..9
    static ParseResult fromCheckedDigits(const Digits& digits);

    friend class NationalIdGenerator;

public:
    /**
     * @brief Parse canonical text form
     *
     * Input must be exactly 10 ASCII digits, without whitespace or
     * separators. Checks length, then characters, then category, then
     * check digit; the first failure is reported.
     *
     * @param text Candidate ID
     * @return ParseResult holding either the ID or the ParseError
     */
    static ParseResult parse(const std::string& text);

    /**
     * @brief Parse canonical text form, throwing on failure
     * @throws InvalidNationalIdException carrying the ParseError
     */
    static NationalId of(const std::string& text);

    /**
     * @brief Build from a digit sequence (values 0-9, category digit first)
     *
     * A value above 9 is reported as NON_DIGIT with its decimal value.
     */
    static ParseResult fromDigits(const std::vector<uint8_t>& digits);

    /**
     * @brief Build from the numeric form of an ID
     *
     * The decimal expansion (no leading zeros) must be 10 digits long,
     * so 0 and anything below 1000000000 fail with WRONG_LENGTH.
     */
    static ParseResult fromNumber(uint32_t value);

    [[nodiscard]] Category getCategory() const noexcept;

    [[nodiscard]] bool isCitizen() const noexcept {
        return getCategory() == Category::CITIZEN;
    }

    [[nodiscard]] bool isResident() const noexcept {
        return getCategory() == Category::RESIDENT;
    }

    [[nodiscard]] const Digits& getDigits() const noexcept {
        return digits_;
    }

    [[nodiscard]] Payload getPayload() const noexcept;

    [[nodiscard]] uint8_t getCheckDigit() const noexcept {
        return digits_[ID_LENGTH - 1];
    }

    /// @brief Numeric form (fits in 32 bits, the leading digit is 1 or 2)
    [[nodiscard]] uint32_t toNumber() const noexcept;

    /// @brief Canonical 10-digit text
    [[nodiscard]] std::string toString() const;

    bool operator==(const NationalId& other) const noexcept {
        return digits_ == other.digits_;
    }

    bool operator!=(const NationalId& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const NationalId& other) const noexcept {
        return digits_ < other.digits_;
    }
};

/**
 * @brief Outcome of a parse: exactly one of @ref id and @ref error is set
 */
struct ParseResult {
    std::optional<NationalId> id;
    std::optional<ParseError> error;

    static ParseResult success(const NationalId& id) {
        ParseResult r;
        r.id = id;
        return r;
    }

    static ParseResult failure(ParseError error) {
        ParseResult r;
        r.error = std::move(error);
        return r;
    }

    [[nodiscard]] bool ok() const noexcept {
        return id.has_value();
    }
};

} // namespace saudi_id

namespace std {
    template<>
    struct hash<saudi_id::NationalId> {
        size_t operator()(const saudi_id::NationalId& id) const noexcept {
            return hash<uint32_t>()(id.toNumber());
        }
    };
}
