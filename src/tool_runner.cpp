#include "tool_runner.hpp"
#include "run_lock.hpp"
#include "run_summary.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <iostream>
#include <memory>
#include <unistd.h>

std::string defaultConfigFile() {
    if (const char* fromEnv = std::getenv("VAULTKEEPER_CONFIG"); fromEnv && *fromEnv) {
        return fromEnv;
    }
    return "settings.json";
}

int runTool(const std::string& component, const std::string& configFile,
            const std::function<int(const BackupConfig&, const Logger&)>& body) {
    std::unique_ptr<BackupConfig> config;
    try {
        config = std::make_unique<BackupConfig>(configFile);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return static_cast<int>(ExitCode::Configuration);
    }

    Logger logger(component, config->logDir, config->debug ? LogLevel::Debug : LogLevel::Info);
    for (const auto& warning : config->loadWarnings) {
        logger.warning(warning);
    }
    logger.debug(config->describe());

    if (config->lowPriority) {
        errno = 0;
        if (::nice(10) == -1 && errno != 0) {
            logger.warning(std::format("Could not lower priority: {}", std::strerror(errno)));
        }
    }

    auto lock = RunLock::acquire(RunLock::pathFor(config->logDir), logger);
    if (!lock) {
        logger.error(lock.error());
        return static_cast<int>(ExitCode::Fatal);
    }

    try {
        return body(*config, logger);
    } catch (const std::exception& e) {
        logger.error(std::format("Unexpected error: {}", e.what()));
        return static_cast<int>(ExitCode::Fatal);
    }
}
