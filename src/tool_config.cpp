/**
 * @file tool_config.cpp
 * @brief Environment loading for ToolConfig
 */

#include "saudi_id/config/tool_config.h"
#include "saudi_id/exceptions.h"
#include "saudi_id/logging/logger.h"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace saudi_id::config {

int ToolConfig::envStoi(const char* val, int defaultVal, int minVal, int maxVal) {
    try {
        int v = std::stoi(val);
        return std::clamp(v, minVal, maxVal);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer env value '{}', using default {}", val, defaultVal);
        return defaultVal;
    }
}

uint64_t ToolConfig::envStoull(const char* val, uint64_t defaultVal) {
    std::string text(val);
    // std::stoull accepts a leading '-' and wraps around
    if (text.empty() || text.find('-') != std::string::npos) {
        spdlog::warn("Invalid unsigned env value '{}', using default {}", text, defaultVal);
        return defaultVal;
    }
    try {
        size_t consumed = 0;
        uint64_t v = std::stoull(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return v;
    } catch (const std::exception&) {
        spdlog::warn("Invalid unsigned env value '{}', using default {}", text, defaultVal);
        return defaultVal;
    }
}

ToolConfig ToolConfig::fromEnvironment() {
    ToolConfig config;

    if (auto val = std::getenv(LOG_LEVEL)) config.logLevel = val;
    if (auto val = std::getenv(LOG_FILE)) config.logFile = val;
    if (auto val = std::getenv(RANDOM_SOURCE)) config.randomSource = val;
    if (auto val = std::getenv(SEED)) config.seed = envStoull(val, 0);
    if (auto val = std::getenv(OUTPUT)) config.outputFormat = val;
    if (auto val = std::getenv(MAX_COUNT)) config.maxCount = envStoi(val, 100000, 1, 10000000);

    return config;
}

void ToolConfig::validate() const {
    if (randomSource != "openssl" && randomSource != "seeded") {
        throw ConfigException(std::string(RANDOM_SOURCE) + " must be openssl or seeded, got '" +
                              randomSource + "'");
    }
    if (outputFormat != "text" && outputFormat != "json") {
        throw ConfigException(std::string(OUTPUT) + " must be text or json, got '" +
                              outputFormat + "'");
    }
    if (!logging::Logger::parseLevel(logLevel)) {
        throw ConfigException(std::string(LOG_LEVEL) + " '" + logLevel + "' is not a log level");
    }
    if (maxCount < 1) {
        throw ConfigException(std::string(MAX_COUNT) + " must be at least 1");
    }
}

} // namespace saudi_id::config
