/**
 * @file tool_runner.hpp
 * @brief Shared start-up for the command line tools.
 */

#ifndef TOOL_RUNNER_HPP
#define TOOL_RUNNER_HPP

#include <functional>
#include <string>
#include "backup_config.hpp"
#include "logger.hpp"

/**
 * @brief Settings file used when --config is not given: $VAULTKEEPER_CONFIG, else ./settings.json.
 */
std::string defaultConfigFile();

/**
 * @brief Loads the configuration, builds the logger, lowers priority if configured,
 *        takes the shared run lock and runs @p body.
 *
 * @param component Log prefix of the tool (e.g. "db-backup").
 * @param configFile Settings file.
 * @param body Tool logic; returns the process exit code.
 * @return int Exit code: 2 if the configuration cannot be loaded, 1 if the lock is held
 *         or @p body throws, otherwise the value returned by @p body.
 */
int runTool(const std::string& component, const std::string& configFile,
            const std::function<int(const BackupConfig&, const Logger&)>& body);

#endif // TOOL_RUNNER_HPP
