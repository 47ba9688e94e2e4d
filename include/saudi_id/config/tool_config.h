#pragma once

/**
 * @file tool_config.h
 * @brief saudi-id tool configuration loaded from environment variables
 *
 * Command-line flags override these values after loading.
 */

#include <cstdint>
#include <string>

namespace saudi_id::config {

struct ToolConfig {
    std::string logLevel = "warn";
    std::string logFile;                 // Empty: console only
    std::string randomSource = "openssl"; // "openssl" or "seeded"
    uint64_t seed = 0;
    std::string outputFormat = "text";   // "text" or "json"
    int maxCount = 100000;               // Upper bound for generate --count

    /// Environment variable names
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "SAUDI_ID_LOG_FILE";
    static constexpr const char* RANDOM_SOURCE = "SAUDI_ID_RANDOM_SOURCE";
    static constexpr const char* SEED = "SAUDI_ID_SEED";
    static constexpr const char* OUTPUT = "SAUDI_ID_OUTPUT";
    static constexpr const char* MAX_COUNT = "SAUDI_ID_MAX_COUNT";

    // Safe environment variable integer parser with range clamping
    static int envStoi(const char* val, int defaultVal, int minVal, int maxVal);

    // Unsigned 64-bit variant (no clamping), falls back to the default on bad input
    static uint64_t envStoull(const char* val, uint64_t defaultVal);

    static ToolConfig fromEnvironment();

    /**
     * @brief Check enumerated values
     * @throws ConfigException for an unknown random source, output format or log level
     */
    void validate() const;

    bool jsonOutput() const { return outputFormat == "json"; }
};

} // namespace saudi_id::config
