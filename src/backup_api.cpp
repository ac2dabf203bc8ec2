#include "backup_api.hpp"
#include "notification.hpp"
#include "remote_transfer.hpp"
#include "service_control.hpp"
#include <format>
#include <unistd.h>

namespace {

std::string hostName() {
    char buf[256] = {};
    if (::gethostname(buf, sizeof(buf) - 1) != 0) {
        return "unknown-host";
    }
    return buf;
}

} // namespace

BackupAPI::BackupAPI(const BackupConfig& config, const Logger& logger)
    : config_(config),
      logger_(logger),
      compressor_(9),
      encryptor_(config.passphrase, config.scratchDir, config.operationTimeout, config.lowPriority),
      codec_(compressor_, encryptor_, logger),
      verifier_(codec_, checker_, archiver_, config.scratchDir, logger),
      producer_(config, codec_, verifier_, archiver_, logger),
      volumes_(config.helperImage, config.operationTimeout, config.lowPriority),
      retention_(logger),
      assembler_(config, producer_, codec_, verifier_, archiver_, volumes_, retention_, logger) {}

void BackupAPI::offload(const BackupSet& set, RunSummary& summary) const {
    std::unique_ptr<RemoteTransferStrategy> transfer;
    try {
        transfer = makeRemoteTransfer(config_);
    } catch (const std::exception& e) {
        logger_.warning(std::format("Offload not configured correctly: {}", e.what()));
        summary.warned("offload", FailureCategory::Configuration, e.what());
        return;
    }
    if (!transfer) {
        logger_.debug("Cloud offload not configured, skipping upload");
        return;
    }
    const std::string remoteSubdir = std::format("{}/{}", toString(set.category), set.id);
    logger_.info(std::format("Uploading set {} via {}", set.id, transfer->name()));
    auto sent = transfer->transfer(set.directory, remoteSubdir);
    if (!sent) {
        logger_.warning(std::format("Upload failed, local backup kept: {}", sent.error()));
        summary.warned("offload", FailureCategory::Artifact, sent.error());
        return;
    }
    logger_.info(std::format("Uploaded {} file(s) to {}", *sent, remoteSubdir));
    summary.succeeded("offload", std::format("{} file(s) via {}", *sent, transfer->name()));
}

void BackupAPI::applyRetention(BackupCategory category, const std::string& protectedId, RunSummary& summary) const {
    const bool database = category == BackupCategory::Database;
    BackupCatalog catalog(database ? config_.dbBackupDir : config_.fullBackupDir, category);
    auto pruned = retention_.prune(catalog, database ? config_.keepDb : config_.keepFull, protectedId);
    if (!pruned) {
        summary.warned("retention", FailureCategory::Resource, pruned.error());
        return;
    }
    summary.succeeded("retention", std::format("removed {}, {} remaining", pruned->removed.size(), pruned->remaining));
}

std::expected<BackupSet, std::string> BackupAPI::runDatabaseBackup(const std::vector<ArtifactFormat>& formats,
                                                                   bool requireVerified, RunSummary& summary) {
    auto liveDb = config_.requireDatabaseFile();
    if (!liveDb) {
        summary.fatal(FailureCategory::Configuration, liveDb.error());
        return std::unexpected(liveDb.error());
    }

    auto set = producer_.produce(*liveDb, formats, config_.dbBackupDir, summary);
    if (!set) {
        return set;
    }
    if (requireVerified && !set->verified()) {
        const std::string err = std::format("Set {} failed verification and --validate was given", set->id);
        logger_.error(err);
        summary.fatal(FailureCategory::Verification, err);
        return std::unexpected(err);
    }
    offload(*set, summary);
    applyRetention(BackupCategory::Database, set->id, summary);
    return set;
}

std::string BackupAPI::planDatabaseBackup(const std::vector<ArtifactFormat>& formats) const {
    return producer_.plan(config_.databasePath, formats, config_.dbBackupDir);
}

std::expected<VerificationResult, std::string> BackupAPI::verifyArtifact(const fs::path& artifact,
                                                                         RunSummary& summary) const {
    auto format = formatFromArtifactName(artifact.filename().string());
    if (!format) {
        const std::string err = std::format("Cannot infer the format of {}", artifact.filename().string());
        summary.fatal(FailureCategory::Configuration, err);
        return std::unexpected(err);
    }
    std::optional<fs::path> liveSource;
    if (auto liveDb = config_.requireDatabaseFile(); liveDb && *format != ArtifactFormat::FullArchive) {
        liveSource = *liveDb;
    }

    VerificationResult result = verifier_.verify(artifact, *format, liveSource);
    const std::string component = artifact.filename().string();
    if (!result.passed()) {
        summary.failed(component, FailureCategory::Verification, result.describe());
        summary.fatal(FailureCategory::Verification, std::format("{} failed verification", component));
    } else if (result.hasWarnings()) {
        summary.warned(component, FailureCategory::Verification, result.describe());
    } else {
        summary.succeeded(component, result.describe());
    }
    return result;
}

std::expected<BackupSet, std::string> BackupAPI::runFullBackup(const FullBackupOptions& options,
                                                               RunSummary& summary) {
    auto set = assembler_.assembleFull(config_.fullBackupDir, options, summary);
    if (!set) {
        return set;
    }
    offload(*set, summary);
    applyRetention(BackupCategory::Full, set->id, summary);
    return set;
}

std::string BackupAPI::reportFullBackup(const FullBackupOptions& options) const {
    return assembler_.report(config_.fullBackupDir, options);
}

std::expected<RestoreOutcome, std::string> BackupAPI::runRestore(const RestoreRequest& request,
                                                                 RunSummary& summary) {
    const std::string service = request.scope == RestoreScope::DatabaseOnly ? config_.serviceName : std::string();
    ComposeServiceController controller(config_.projectRoot, service, config_.operationTimeout);
    DockerHealthProbe health(config_.healthContainers);
    RestoreOrchestrator orchestrator(config_, codec_, verifier_, archiver_, checker_, controller, health, volumes_,
                                     logger_);
    return orchestrator.restore(request, summary);
}

std::expected<fs::path, std::string> BackupAPI::latestArtifact(RestoreScope scope) const {
    return latestRestorableArtifact(config_, scope);
}

void BackupAPI::notifyIfNeeded(const RunSummary& summary, const std::string& operation) const {
    if (!summary.isFatal() && !summary.isDegraded()) {
        return;
    }
    std::vector<std::unique_ptr<NotificationStrategy>> notifiers;
    try {
        notifiers = makeNotifiers(config_);
    } catch (const std::exception& e) {
        logger_.warning(std::format("Notifications not configured correctly: {}", e.what()));
        return;
    }
    const std::string subject = std::format("[VaultKeeper] {} {} on {}", operation,
                                            summary.isFatal() ? "FAILED" : "degraded", hostName());
    const std::string body = summary.render();
    for (const auto& notifier : notifiers) {
        if (auto sent = notifier->notify(subject, body); !sent) {
            logger_.warning(std::format("{} notification failed: {}", notifier->name(), sent.error()));
        } else {
            logger_.info(std::format("Sent {} notification", notifier->name()));
        }
    }
}
