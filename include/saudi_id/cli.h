/**
 * @file cli.h
 * @brief saudi-id command-line front end
 *
 * Usage:
 *   saudi-id validate <id>... | -        (ids from stdin, one per line)
 *   saudi-id generate [--type citizen|resident] [--count N] [--seed S]
 *   saudi-id check-digit <9-digit payload>
 *
 * Global flags: --json, --log-level <level>, --help
 */

#pragma once

#include <iosfwd>
#include <string>
#include <vector>
#include "config/tool_config.h"

namespace saudi_id::cli {

/// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_INVALID = 1;     ///< At least one ID rejected
constexpr int EXIT_USAGE = 2;       ///< Bad arguments or configuration
constexpr int EXIT_RANDOMNESS = 3;  ///< Randomness source unavailable

/**
 * @brief Run the tool
 * @param args Arguments without the program name
 * @param in Source for "validate -"
 * @param out Results
 * @param err Usage and error messages
 * @param config Configuration loaded from the environment (flags override it)
 * @return Process exit code
 */
int run(const std::vector<std::string>& args,
        std::istream& in,
        std::ostream& out,
        std::ostream& err,
        config::ToolConfig config);

/// @brief Write the usage text
void printUsage(std::ostream& os);

} // namespace saudi_id::cli
