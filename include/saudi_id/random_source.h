/**
 * @file random_source.h
 * @brief Concrete IRandomSource implementations
 */

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include "providers.h"

namespace saudi_id {

/**
 * @brief Cryptographically seeded source backed by OpenSSL RAND_bytes
 *
 * Thread-safe: OpenSSL's default DRBG is safe for concurrent use.
 */
class OpenSslRandomSource : public IRandomSource {
public:
    void fill(uint8_t* buffer, size_t length) override;
};

/**
 * @brief Deterministic source (std::mt19937_64) for tests and reproducible output
 *
 * Same seed, same byte stream. Not suitable where unpredictability matters.
 */
class SeededRandomSource : public IRandomSource {
public:
    explicit SeededRandomSource(uint64_t seed);

    void fill(uint8_t* buffer, size_t length) override;

private:
    std::mt19937_64 engine_;
    std::mutex mutex_;
};

/**
 * @brief Create a source by configuration name
 * @param name "openssl" or "seeded"
 * @param seed Seed used by the seeded source
 * @throws ConfigException for an unknown name
 */
std::unique_ptr<IRandomSource> makeRandomSource(const std::string& name, uint64_t seed);

} // namespace saudi_id
