#include "backup_api.hpp"
#include "tool_runner.hpp"
#include <format>
#include <iostream>
#include <optional>
#include <string>

namespace {

void printUsage() {
    std::cout << "Usage: vaultkeeper-restore [options] [artifact]\n"
              << "Restores the whole system from a full archive unless a narrower scope is given.\n"
              << "Options:\n"
              << "  --config <file>            Settings file (default $VAULTKEEPER_CONFIG or ./settings.json)\n"
              << "  --database-only [artifact] Restore only the database\n"
              << "  --config-only [artifact]   Restore only the configuration tree from a full archive\n"
              << "  --latest                   Use the newest matching backup\n"
              << "  --dry-run                  Decrypt, extract and verify without applying anything\n"
              << "  -h, --help                 Show this help message\n";
}

bool takesValue(int i, int argc, char** argv) {
    return i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0;
}

} // namespace

int main(int argc, char** argv) {
    std::string configFile = defaultConfigFile();
    std::optional<RestoreScope> scope;
    std::string artifact;
    bool latest = false;
    bool dryRun = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--database-only" || arg == "--config-only") {
            if (scope) {
                std::cerr << "Error: Only one of --database-only and --config-only may be given" << std::endl;
                return static_cast<int>(ExitCode::Configuration);
            }
            scope = arg == "--database-only" ? RestoreScope::DatabaseOnly : RestoreScope::ConfigOnly;
            if (takesValue(i, argc, argv)) {
                artifact = argv[++i];
            }
        } else if (arg == "--latest") {
            latest = true;
        } else if (arg == "--dry-run") {
            dryRun = true;
        } else if (arg.rfind("--", 0) != 0 && artifact.empty()) {
            artifact = arg;
        } else {
            std::cerr << "Error: Unknown or incomplete option: " << arg << std::endl;
            printUsage();
            return static_cast<int>(ExitCode::Configuration);
        }
    }

    if (artifact.empty() == !latest) {
        std::cerr << "Error: Give either an artifact or --latest" << std::endl;
        printUsage();
        return static_cast<int>(ExitCode::Configuration);
    }

    return runTool("restore", configFile, [&](const BackupConfig& config, const Logger& logger) {
        BackupAPI api(config, logger);
        RestoreRequest request;
        request.scope = scope.value_or(RestoreScope::Full);
        request.dryRun = dryRun;
        if (latest) {
            auto newest = api.latestArtifact(request.scope);
            if (!newest) {
                logger.error(newest.error());
                return static_cast<int>(ExitCode::Configuration);
            }
            request.artifact = *newest;
        } else {
            request.artifact = artifact;
        }
        logger.info(std::format("Selected backup: {}", request.artifact.string()));

        RunSummary summary(std::format("{} restore", toString(request.scope)));
        if (auto outcome = api.runRestore(request, summary); outcome) {
            logger.info(std::format("Restore finished in state {}", toString(outcome->finalState)));
        }
        std::cout << summary.render();
        api.notifyIfNeeded(summary, "restore");
        return static_cast<int>(summary.exitCode());
    });
}
