/**
 * @file saudi_id_main.cpp
 * @brief saudi-id command-line tool
 *
 * Validates and generates Saudi national IDs.
 *
 * Usage:
 *   ./saudi-id validate 1000000008 2000000006
 *   ./saudi-id generate --type resident --count 5
 *   ./saudi-id check-digit 100000000
 */

#include <iostream>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "saudi_id/cli.h"
#include "saudi_id/config/tool_config.h"
#include "saudi_id/exceptions.h"
#include "saudi_id/logging/logger.h"

int main(int argc, char* argv[]) {
    auto config = saudi_id::config::ToolConfig::fromEnvironment();

    saudi_id::logging::Logger::initialize(
        "saudi-id", config.logLevel, !config.logFile.empty(), config.logFile);

    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        int code = saudi_id::cli::run(args, std::cin, std::cout, std::cerr, config);
        saudi_id::logging::Logger::flush();
        return code;
    } catch (const saudi_id::SaudiIdException& e) {
        spdlog::critical("saudi-id failed: {}", e.what());
        saudi_id::logging::Logger::flush();
        return saudi_id::cli::EXIT_USAGE;
    }
}
