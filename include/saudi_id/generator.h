/**
 * @file generator.h
 * @brief National ID generation (random and fixed payload)
 *
 * Uses IRandomSource for randomness so generation stays deterministic
 * under a seeded source.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <vector>
#include "national_id.h"
#include "providers.h"
#include "types.h"

namespace saudi_id {

/**
 * @brief Outcome of a generation: exactly one of @ref id and @ref error is set
 */
struct GenerationResult {
    std::optional<NationalId> id;
    std::optional<GenerationError> error;

    [[nodiscard]] bool ok() const noexcept {
        return id.has_value();
    }
};

/**
 * @brief Outcome of a batch generation
 *
 * @ref ids holds every ID produced before the first failure.
 */
struct BatchResult {
    std::vector<NationalId> ids;
    std::optional<GenerationError> error;

    [[nodiscard]] bool ok() const noexcept {
        return !error.has_value();
    }
};

/**
 * @brief Generator of valid national IDs
 *
 * Usage:
 * @code
 *   OpenSslRandomSource source;
 *   NationalIdGenerator generator(&source);
 *   GenerationResult result = generator.generate(Category::RESIDENT);
 * @endcode
 */
class NationalIdGenerator {
public:
    /// Bytes requested from the source per sampling round
    static constexpr size_t BYTES_PER_ROUND = 16;

    /// Sampling rounds before giving up with RANDOMNESS_UNAVAILABLE
    static constexpr int MAX_ROUNDS = 8;

    /**
     * @brief Constructor
     * @param randomSource Randomness provider (non-owning)
     * @throws std::invalid_argument if randomSource is nullptr
     */
    explicit NationalIdGenerator(IRandomSource* randomSource);

    /**
     * @brief Generate a random ID of the given category
     *
     * Draws 8 uniformly distributed digits for positions 1..8 (bytes >= 250
     * are discarded so no digit is favoured), prefixes the category digit
     * and appends the check digit.
     *
     * @return GenerationResult; RANDOMNESS_UNAVAILABLE if the source throws
     *         or yields no usable bytes within MAX_ROUNDS rounds
     */
    GenerationResult generate(Category category);

    /**
     * @brief Generate @p count random IDs, stopping at the first failure
     */
    BatchResult generateBatch(Category category, size_t count);

    /**
     * @brief Complete a fixed payload with its check digit
     *
     * @param payload Nine digits, category digit first
     * @return GenerationResult; INVALID_CATEGORY if payload[0] is not 1 or 2
     * @throws std::invalid_argument if any payload digit is above 9
     */
    static GenerationResult generateWithPayload(const Payload& payload);

private:
    IRandomSource* randomSource_;
};

} // namespace saudi_id
