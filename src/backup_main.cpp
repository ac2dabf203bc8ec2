#include "backup_api.hpp"
#include "tool_runner.hpp"
#include <iostream>
#include <string>

namespace {

void printUsage() {
    std::cout << "Usage: vaultkeeper-backup [options]\n"
              << "Options:\n"
              << "  --config <file>       Settings file (default $VAULTKEEPER_CONFIG or ./settings.json)\n"
              << "  --format <list>|all   Comma separated formats: native, portable, structured, tabular, schema\n"
              << "                        (default native)\n"
              << "  --validate            Fail the run if any artifact does not pass verification\n"
              << "  --dry-run             Show what would be done without writing anything\n"
              << "  --verify <artifact>   Verify an existing encrypted artifact and exit\n"
              << "  -h, --help            Show this help message\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string configFile = defaultConfigFile();
    std::string formatList = "native";
    std::string verifyPath;
    bool validate = false;
    bool dryRun = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            formatList = argv[++i];
        } else if (arg == "--verify" && i + 1 < argc) {
            verifyPath = argv[++i];
        } else if (arg == "--validate") {
            validate = true;
        } else if (arg == "--dry-run") {
            dryRun = true;
        } else {
            std::cerr << "Error: Unknown or incomplete option: " << arg << std::endl;
            printUsage();
            return static_cast<int>(ExitCode::Configuration);
        }
    }

    auto formats = parseFormatList(formatList);
    if (!formats) {
        std::cerr << "Error: " << formats.error() << std::endl;
        return static_cast<int>(ExitCode::Configuration);
    }

    return runTool("db-backup", configFile, [&](const BackupConfig& config, const Logger& logger) {
        BackupAPI api(config, logger);

        if (!verifyPath.empty()) {
            RunSummary summary("verify");
            auto result = api.verifyArtifact(verifyPath, summary);
            std::cout << summary.render();
            if (!result) {
                return static_cast<int>(ExitCode::Configuration);
            }
            return static_cast<int>(result->passed() ? ExitCode::Success : ExitCode::Fatal);
        }

        if (dryRun) {
            if (auto liveDb = config.requireDatabaseFile(); !liveDb) {
                logger.error(liveDb.error());
                return static_cast<int>(ExitCode::Configuration);
            }
            std::cout << api.planDatabaseBackup(*formats);
            return static_cast<int>(ExitCode::Success);
        }

        RunSummary summary("database backup");
        if (auto set = api.runDatabaseBackup(*formats, validate, summary); !set) {
            logger.error(set.error());
        }
        std::cout << summary.render();
        api.notifyIfNeeded(summary, "database backup");
        return static_cast<int>(summary.exitCode());
    });
}
