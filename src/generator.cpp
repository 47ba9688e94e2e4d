/**
 * @file generator.cpp
 * @brief NationalIdGenerator implementation
 */

#include "saudi_id/generator.h"
#include "saudi_id/checksum.h"
#include "saudi_id/exceptions.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

namespace saudi_id {

namespace {

// Largest multiple of 10 that fits in a byte; bytes at or above it are discarded
constexpr uint8_t SAMPLE_LIMIT = 250;

GenerationResult failure(GenerationError error) {
    GenerationResult result;
    result.error = std::move(error);
    return result;
}

} // anonymous namespace

NationalIdGenerator::NationalIdGenerator(IRandomSource* randomSource)
    : randomSource_(randomSource) {
    if (!randomSource_) {
        throw std::invalid_argument("NationalIdGenerator requires a random source");
    }
}

GenerationResult NationalIdGenerator::generate(Category category) {
    Digits digits{};
    digits[0] = categoryPrefix(category);

    size_t filled = 1;
    std::array<uint8_t, BYTES_PER_ROUND> buffer{};

    for (int round = 0; round < MAX_ROUNDS && filled < PAYLOAD_LENGTH; ++round) {
        try {
            randomSource_->fill(buffer.data(), buffer.size());
        } catch (const RandomnessException& e) {
            spdlog::warn("[NationalIdGenerator] Random source failed: {}", e.what());
            return failure(GenerationError::randomnessUnavailable(e.what()));
        }

        for (uint8_t byte : buffer) {
            if (filled == PAYLOAD_LENGTH) break;
            if (byte < SAMPLE_LIMIT) {
                digits[filled++] = static_cast<uint8_t>(byte % 10);
            }
        }
    }

    if (filled < PAYLOAD_LENGTH) {
        spdlog::warn("[NationalIdGenerator] No usable random bytes after {} rounds", MAX_ROUNDS);
        return failure(GenerationError::randomnessUnavailable(
            "no usable bytes after " + std::to_string(MAX_ROUNDS) + " rounds"));
    }

    digits[ID_LENGTH - 1] = checksum::computeCheckDigit(checksum::payloadOf(digits));

    GenerationResult result;
    result.id = NationalId(digits);
    spdlog::trace("[NationalIdGenerator] Generated {} ID", categoryToString(category));
    return result;
}

BatchResult NationalIdGenerator::generateBatch(Category category, size_t count) {
    BatchResult batch;
    batch.ids.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        GenerationResult result = generate(category);
        if (!result.ok()) {
            spdlog::warn("[NationalIdGenerator] Batch stopped after {} of {} IDs", i, count);
            batch.error = result.error;
            return batch;
        }
        batch.ids.push_back(*result.id);
    }

    spdlog::debug("[NationalIdGenerator] Generated batch of {} {} IDs",
                  count, categoryToString(category));
    return batch;
}

GenerationResult NationalIdGenerator::generateWithPayload(const Payload& payload) {
    for (size_t i = 0; i < PAYLOAD_LENGTH; ++i) {
        if (payload[i] > 9) {
            throw std::invalid_argument("payload digit " + std::to_string(payload[i]) +
                                        " at position " + std::to_string(i) + " is not 0-9");
        }
    }

    if (!categoryFromPrefix(payload[0])) {
        spdlog::debug("[NationalIdGenerator] Payload rejected: leading digit {}",
                      static_cast<int>(payload[0]));
        return failure(GenerationError::invalidCategory(payload[0]));
    }

    Digits digits{};
    std::copy(payload.begin(), payload.end(), digits.begin());
    digits[ID_LENGTH - 1] = checksum::computeCheckDigit(payload);

    GenerationResult result;
    result.id = NationalId(digits);
    return result;
}

} // namespace saudi_id
