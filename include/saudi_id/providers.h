/**
 * @file providers.h
 * @brief Provider interfaces for infrastructure abstraction
 *
 * The generator never reaches for a process-wide random engine. Callers
 * inject a source:
 *   - Production: OpenSslRandomSource (RAND_bytes, CSPRNG)
 *   - Tests / reproducible batches: SeededRandomSource
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace saudi_id {

/**
 * @brief Random byte source interface
 *
 * Implementations must be safe to call from several threads at once
 * without producing correlated output.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * @brief Fill a buffer with random bytes
     * @param buffer Destination (non-owning)
     * @param length Number of bytes to write
     * @throws RandomnessException if the source cannot deliver
     */
    virtual void fill(uint8_t* buffer, size_t length) = 0;
};

} // namespace saudi_id
