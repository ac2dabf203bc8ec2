#include "backup_api.hpp"
#include "tool_runner.hpp"
#include <iostream>
#include <string>

namespace {

void printUsage() {
    std::cout << "Usage: vaultkeeper-full-backup [options]\n"
              << "Options:\n"
              << "  --config <file>   Settings file (default $VAULTKEEPER_CONFIG or ./settings.json)\n"
              << "  --include-logs    Add the log directory to the archive\n"
              << "  --name <label>    Append a label to the backup name\n"
              << "  --report-only     Show what would be included without producing anything\n"
              << "  -h, --help        Show this help message\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string configFile = defaultConfigFile();
    FullBackupOptions options;
    bool reportOnly = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--name" && i + 1 < argc) {
            options.label = argv[++i];
        } else if (arg == "--include-logs") {
            options.includeLogs = true;
        } else if (arg == "--report-only") {
            reportOnly = true;
        } else {
            std::cerr << "Error: Unknown or incomplete option: " << arg << std::endl;
            printUsage();
            return static_cast<int>(ExitCode::Configuration);
        }
    }

    return runTool("full-backup", configFile, [&](const BackupConfig& config, const Logger& logger) {
        BackupAPI api(config, logger);
        if (reportOnly) {
            std::cout << api.reportFullBackup(options);
            return static_cast<int>(ExitCode::Success);
        }

        RunSummary summary("full backup");
        if (auto set = api.runFullBackup(options, summary); !set) {
            logger.error(set.error());
        }
        std::cout << summary.render();
        api.notifyIfNeeded(summary, "full backup");
        return static_cast<int>(summary.exitCode());
    });
}
