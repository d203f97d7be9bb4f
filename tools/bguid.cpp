/**
 * @file bguid.cpp
 * @brief Command line converter between UUIDs and beautiful GUIDs
 *
 * Usage:
 *   ./bguid encode <uuid>...
 *   ./bguid decode [--lowercase] [--strict] <beautiful>...
 *   ./bguid generate [--count N]
 *
 * Environment:
 *   BGUID_LOG_LEVEL, BGUID_LOG_FILE,
 *   BGUID_ALLOW_EXTRA_SEGMENTS, BGUID_ALLOW_OVERSIZED_GROUPS
 */

#include "bguid/cli/cli.h"
#include "bguid/common/config_manager.h"
#include "bguid/common/exceptions.h"
#include "bguid/common/logger.h"
#include <iostream>
#include <string>

namespace {

void initializeLogging(const bguid::common::ConfigManager& config) {
    std::string level = config.getString(bguid::common::ConfigManager::LOG_LEVEL, "warn");
    if (!bguid::common::Logger::isValidLevel(level)) {
        throw bguid::common::ConfigException(
            std::string(bguid::common::ConfigManager::LOG_LEVEL) + " has unknown level '" + level + "'");
    }
    std::string logFile = config.getString(bguid::common::ConfigManager::LOG_FILE);
    bguid::common::Logger::initialize("bguid", level, !logFile.empty(), logFile);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto& config = bguid::common::ConfigManager::getInstance();

    try {
        initializeLogging(config);
    } catch (const bguid::common::ConfigException& e) {
        std::cerr << e.what() << std::endl;
        return bguid::cli::EXIT_USAGE;
    }

    int rc = bguid::cli::run(argc, argv, bguid::guid::DecodeOptions::fromConfig(config),
                             std::cout, std::cerr);
    bguid::common::Logger::flush();
    return rc;
}
