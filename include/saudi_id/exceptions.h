/**
 * @file exceptions.h
 * @brief Exception hierarchy for the Saudi national ID library
 *
 * The parse and generate entry points report failures as typed result
 * values. Exceptions are reserved for the throwing convenience API
 * (NationalId::of), randomness providers and configuration.
 */

#pragma once

#include <stdexcept>
#include <string>
#include "types.h"

namespace saudi_id {

/**
 * @brief Base exception for all saudi_id exceptions
 */
class SaudiIdException : public std::runtime_error {
public:
    explicit SaudiIdException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Text did not parse as a valid national ID
 */
class InvalidNationalIdException : public SaudiIdException {
private:
    ParseError error_;

public:
    explicit InvalidNationalIdException(ParseError error)
        : SaudiIdException("Invalid national ID: " + error.message()),
          error_(std::move(error)) {}

    [[nodiscard]] const ParseError& getError() const noexcept {
        return error_;
    }

    /**
     * @brief Get the error code (e.g., "CHECKSUM_MISMATCH")
     */
    [[nodiscard]] std::string getCode() const {
        return error_.code();
    }
};

/**
 * @brief Randomness source could not produce bytes
 */
class RandomnessException : public SaudiIdException {
public:
    explicit RandomnessException(const std::string& message)
        : SaudiIdException("Randomness error: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public SaudiIdException {
public:
    explicit ConfigException(const std::string& message)
        : SaudiIdException("Configuration error: " + message) {}
};

} // namespace saudi_id
