/**
 * @file random_source.cpp
 * @brief OpenSSL and seeded random sources
 */

#include "saudi_id/random_source.h"
#include "saudi_id/exceptions.h"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>
#include <climits>

namespace saudi_id {

void OpenSslRandomSource::fill(uint8_t* buffer, size_t length) {
    if (length == 0) {
        return;
    }
    if (length > static_cast<size_t>(INT_MAX)) {
        throw RandomnessException("request of " + std::to_string(length) + " bytes is too large");
    }

    if (RAND_bytes(buffer, static_cast<int>(length)) != 1) {
        unsigned long err = ERR_get_error();
        char errBuf[256];
        ERR_error_string_n(err, errBuf, sizeof(errBuf));
        spdlog::error("[OpenSslRandomSource] RAND_bytes failed: {}", errBuf);
        throw RandomnessException(std::string("RAND_bytes failed: ") + errBuf);
    }
}

SeededRandomSource::SeededRandomSource(uint64_t seed) : engine_(seed) {
    spdlog::debug("[SeededRandomSource] Seeded with {}", seed);
}

void SeededRandomSource::fill(uint8_t* buffer, size_t length) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t i = 0;
    while (i < length) {
        uint64_t word = engine_();
        for (int b = 0; b < 8 && i < length; ++b, ++i) {
            buffer[i] = static_cast<uint8_t>(word & 0xFF);
            word >>= 8;
        }
    }
}

std::unique_ptr<IRandomSource> makeRandomSource(const std::string& name, uint64_t seed) {
    if (name == "openssl") {
        return std::make_unique<OpenSslRandomSource>();
    }
    if (name == "seeded") {
        return std::make_unique<SeededRandomSource>(seed);
    }
    throw ConfigException("unknown random source '" + name + "' (expected openssl or seeded)");
}

} // namespace saudi_id
