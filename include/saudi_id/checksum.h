/**
 * @file checksum.h
 * @brief Check digit computation for Saudi national IDs
 *
 * Pure functions, no I/O. Luhn-family double-and-fold scheme:
 *   - payload digits at even positions (0, 2, 4, 6, 8) are doubled,
 *     and 9 is subtracted from doubled values >= 10
 *   - digits at odd positions are taken as-is
 *   - the check digit brings the total to a multiple of 10
 *
 * Every single-digit substitution is detected at every position, since
 * the fold map {0..9} -> {0,2,4,6,8,1,3,5,7,9} is a permutation.
 * Adjacent transpositions are detected except 0<->9.
 *
 * Callers validate digit ranges beforehand; these functions assume
 * every digit is in 0..9.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include "types.h"

namespace saudi_id::checksum {

/**
 * @brief Contribution of one digit to the fold-sum
 * @param digit Digit value (0-9)
 * @param position Zero-based position within the ID
 * @return Doubled-and-folded value for even positions, the digit otherwise
 */
uint8_t foldDigit(uint8_t digit, size_t position) noexcept;

/**
 * @brief Fold-sum S over the first @p count digits
 * @param digits Digit values (0-9), position 0 first
 * @param count Number of digits to accumulate
 */
uint32_t foldSum(const uint8_t* digits, size_t count) noexcept;

/**
 * @brief Compute the check digit for a 9-digit payload
 *
 * (10 - (S mod 10)) mod 10, where S is the payload fold-sum.
 *
 * @param payload Payload digits, category digit first
 * @return Check digit (0-9)
 */
uint8_t computeCheckDigit(const Payload& payload) noexcept;

/**
 * @brief Verify a claimed check digit against a payload
 * @return true if @p claimed equals computeCheckDigit(payload)
 */
bool verify(const Payload& payload, uint8_t claimed) noexcept;

/**
 * @brief Verify a full 10-digit sequence (payload + check digit)
 */
bool isValidSequence(const Digits& digits) noexcept;

/// @brief First 9 digits of a full sequence
Payload payloadOf(const Digits& digits) noexcept;

} // namespace saudi_id::checksum
