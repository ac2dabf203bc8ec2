#include "restore.hpp"
#include "file_utils.hpp"
#include <algorithm>
#include <format>
#include <thread>

namespace {

fs::path sibling(const fs::path& target, const char* suffix) {
    return fs::path(target.string() + suffix);
}

bool acceptsFormat(RestoreScope scope, ArtifactFormat format) {
    if (format == ArtifactFormat::FullArchive) {
        return true;
    }
    return scope == RestoreScope::DatabaseOnly &&
           (format == ArtifactFormat::Native || format == ArtifactFormat::Portable);
}

} // namespace

const char* toString(RestoreScope scope) {
    switch (scope) {
        case RestoreScope::DatabaseOnly: return "database-only";
        case RestoreScope::ConfigOnly: return "config-only";
        case RestoreScope::Full: return "full";
    }
    return "unknown";
}

const char* toString(RestoreState state) {
    switch (state) {
        case RestoreState::Idle: return "Idle";
        case RestoreState::ServiceQuiesced: return "ServiceQuiesced";
        case RestoreState::Decrypted: return "Decrypted";
        case RestoreState::Extracted: return "Extracted";
        case RestoreState::Applied: return "Applied";
        case RestoreState::ServiceResumed: return "ServiceResumed";
        case RestoreState::HealthVerified: return "HealthVerified";
        case RestoreState::Failed: return "Failed";
    }
    return "Unknown";
}

RestoreStateMachine::RestoreStateMachine(bool dryRun) : dryRun_(dryRun), history_{RestoreState::Idle} {}

bool RestoreStateMachine::isAllowed(RestoreState from, RestoreState to, bool dryRun) {
    if (to == RestoreState::Failed) {
        return from != RestoreState::HealthVerified && from != RestoreState::Failed;
    }
    switch (from) {
        case RestoreState::Idle:
            return dryRun ? to == RestoreState::Decrypted : to == RestoreState::ServiceQuiesced;
        case RestoreState::ServiceQuiesced:
            return to == RestoreState::Decrypted;
        case RestoreState::Decrypted:
            return to == RestoreState::Extracted;
        case RestoreState::Extracted:
            return !dryRun && to == RestoreState::Applied;
        case RestoreState::Applied:
            return to == RestoreState::ServiceResumed;
        case RestoreState::ServiceResumed:
            return to == RestoreState::HealthVerified;
        case RestoreState::HealthVerified:
        case RestoreState::Failed:
            return false;
    }
    return false;
}

std::expected<void, std::string> RestoreStateMachine::advance(RestoreState next) {
    if (!isAllowed(state_, next, dryRun_)) {
        std::string err = std::format("Illegal restore transition {} -> {}{}", toString(state_), toString(next),
                                      dryRun_ ? " (dry run)" : "");
        fail();
        return std::unexpected(err);
    }
    state_ = next;
    history_.push_back(next);
    return {};
}

void RestoreStateMachine::fail() {
    if (state_ == RestoreState::Failed || state_ == RestoreState::HealthVerified) {
        return;
    }
    state_ = RestoreState::Failed;
    history_.push_back(RestoreState::Failed);
}

bool RestoreStateMachine::reached(RestoreState state) const {
    return std::ranges::find(history_, state) != history_.end();
}

bool RestoreStateMachine::isTerminal() const {
    return state_ == RestoreState::HealthVerified || state_ == RestoreState::Failed ||
           (dryRun_ && state_ == RestoreState::Extracted);
}

RestoreOrchestrator::RestoreOrchestrator(const BackupConfig& config, const ArtifactCodec& codec,
                                         const IntegrityVerifier& verifier, const Archiver& archiver,
                                         const DatabaseChecker& checker, ServiceController& service,
                                         const HealthProbe& health, const VolumeExporter& volumes,
                                         const Logger& logger)
    : config_(config), codec_(codec), verifier_(verifier), archiver_(archiver), checker_(checker),
      service_(service), health_(health), volumes_(volumes), logger_(logger),
      sleeper_([](std::chrono::seconds delay) { std::this_thread::sleep_for(delay); }) {}

std::expected<void, std::string> RestoreOrchestrator::quiesce() {
    logger_.info("Stopping service");
    if (auto stopped = service_.stop(); !stopped) {
        return std::unexpected(std::format("Failed to stop service: {}", stopped.error()));
    }
    if (service_.isRunning()) {
        return std::unexpected("Service still reports running after stop; refusing to restore");
    }
    return {};
}

std::expected<fs::path, std::string> RestoreOrchestrator::decrypt(const fs::path& artifact,
                                                                  const fs::path& scratch) const {
    auto decrypted = codec_.decryptToTemp(artifact, scratch);
    if (!decrypted) {
        return std::unexpected(decrypted.error());
    }
    auto plain = codec_.decompress(*decrypted);
    if (auto wiped = secureRemove(*decrypted); !wiped) {
        logger_.warning(wiped.error());
    }
    if (!plain) {
        return std::unexpected(plain.error());
    }
    return *plain;
}

std::expected<fs::path, std::string> RestoreOrchestrator::databaseCandidate(const fs::path& plain,
                                                                            ArtifactFormat format,
                                                                            const fs::path& scratch) const {
    fs::path candidate = plain;
    if (format == ArtifactFormat::Portable) {
        candidate = scratch / "replayed.sqlite3";
        auto replayed = checker_.replayDump(plain, candidate);
        if (auto wiped = secureRemove(plain); !wiped) {
            logger_.warning(wiped.error());
        }
        if (!replayed) {
            return std::unexpected(std::format("Dump replay failed: {}", replayed.error()));
        }
    } else if (format != ArtifactFormat::Native) {
        return std::unexpected(std::format("{} artifacts cannot be restored", toString(format)));
    }
    if (auto checked = checker_.integrityCheck(candidate); !checked) {
        return std::unexpected(std::format("Restored database failed integrity check: {}", checked.error()));
    }
    return candidate;
}

std::expected<fs::path, std::string> RestoreOrchestrator::embeddedDatabase(const fs::path& archiveRoot,
                                                                           const fs::path& scratch) const {
    BackupCatalog catalog(archiveRoot / "database", BackupCategory::Database);
    auto entry = catalog.latest();
    if (!entry) {
        return std::unexpected("Full archive holds no database set");
    }
    ArtifactFormat format = ArtifactFormat::Native;
    auto artifact = catalog.artifactIn(*entry, ArtifactFormat::Native);
    if (!artifact) {
        format = ArtifactFormat::Portable;
        artifact = catalog.artifactIn(*entry, ArtifactFormat::Portable);
    }
    if (!artifact) {
        return std::unexpected(std::format("Database set {} in the archive holds no restorable artifact", entry->id));
    }
    logger_.info(std::format("Using embedded database artifact {}", artifact->filename().string()));

    const fs::path embeddedDir = scratch / "embedded";
    std::error_code ec;
    fs::create_directories(embeddedDir, ec);
    auto plain = codec_.open(*artifact, embeddedDir);
    if (!plain) {
        return std::unexpected(plain.error());
    }
    return databaseCandidate(*plain, format, embeddedDir);
}

std::expected<RestoreOrchestrator::Extraction, std::string> RestoreOrchestrator::extract(
    const fs::path& plain, ArtifactFormat format, RestoreScope scope, const fs::path& scratch) const {
    Extraction extraction;
    if (format != ArtifactFormat::FullArchive) {
        auto candidate = databaseCandidate(plain, format, scratch);
        if (!candidate) {
            return std::unexpected(candidate.error());
        }
        extraction.database = *candidate;
        return extraction;
    }

    extraction.archiveRoot = scratch / "archive";
    std::error_code ec;
    fs::create_directories(extraction.archiveRoot, ec);
    auto entries = archiver_.extract(plain, extraction.archiveRoot);
    if (auto wiped = secureRemove(plain); !wiped) {
        logger_.warning(wiped.error());
    }
    if (!entries) {
        return std::unexpected(std::format("Archive extraction failed: {}", entries.error()));
    }
    logger_.info(std::format("Extracted {} entries", *entries));

    if (scope == RestoreScope::ConfigOnly) {
        if (!fs::is_directory(extraction.archiveRoot / "project", ec)) {
            return std::unexpected("Full archive holds no configuration tree");
        }
        return extraction;
    }
    auto candidate = embeddedDatabase(extraction.archiveRoot, scratch);
    if (!candidate) {
        return std::unexpected(candidate.error());
    }
    extraction.database = *candidate;
    return extraction;
}

std::expected<void, std::string> RestoreOrchestrator::applyDatabase(const fs::path& candidate) const {
    const fs::path& target = config_.databasePath;
    if (target.empty()) {
        return std::unexpected("No database path configured");
    }
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);

    const fs::path staged = sibling(target, ".restore-new");
    fs::remove(staged, ec);
    if (!fs::copy_file(candidate, staged, fs::copy_options::overwrite_existing, ec)) {
        return std::unexpected(std::format("Failed to stage database at {}: {}", staged.string(), ec.message()));
    }
    if (auto checked = checker_.integrityCheck(staged); !checked) {
        fs::remove(staged, ec);
        return std::unexpected(std::format("Staged database failed integrity check: {}", checked.error()));
    }
    for (const char* suffix : {"-wal", "-shm", "-journal"}) {
        fs::remove(sibling(target, suffix), ec);
    }
    if (auto replaced = atomicReplace(staged, target); !replaced) {
        fs::remove(staged, ec);
        return std::unexpected(replaced.error());
    }
    logger_.info(std::format("Database restored to {}", target.string()));
    return {};
}

std::expected<void, std::string> RestoreOrchestrator::applyConfiguration(const fs::path& projectStage,
                                                                         std::vector<std::string>& applied) const {
    std::error_code ec;
    if (!fs::is_directory(projectStage, ec)) {
        return std::unexpected("Full archive holds no configuration tree");
    }
    for (const auto& entry : config_.configPaths) {
        if (!isContainedRelative(entry)) {
            continue;
        }
        const fs::path source = projectStage / entry;
        if (!fs::exists(fs::symlink_status(source, ec))) {
            logger_.debug(std::format("Configuration entry {} not in archive", entry));
            continue;
        }
        const fs::path target = config_.projectRoot / entry;
        if (config_.isSecretFile(target)) {
            logger_.warning(std::format("Not overwriting secret file {}", target.string()));
            continue;
        }

        const fs::path staged = sibling(target, ".restore-new");
        fs::remove_all(staged, ec);
        fs::create_directories(target.parent_path(), ec);
        auto copied = copyTree(source, staged, [this, &source, &target](const fs::path& path) {
            return config_.isSecretFile(target / path.lexically_relative(source));
        });
        if (!copied) {
            fs::remove_all(staged, ec);
            return std::unexpected(copied.error());
        }
        // Secret files inside a restored directory are kept from the live tree.
        if (fs::is_directory(target, ec) && fs::is_directory(staged, ec)) {
            for (auto it = fs::recursive_directory_iterator(target, ec);
                 !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
                if (it->is_regular_file() && config_.isSecretFile(it->path())) {
                    const fs::path keep = staged / it->path().lexically_relative(target);
                    std::error_code copyEc;
                    fs::create_directories(keep.parent_path(), copyEc);
                    fs::copy_file(it->path(), keep, fs::copy_options::overwrite_existing, copyEc);
                }
            }
        }
        if (auto replaced = atomicReplace(staged, target); !replaced) {
            fs::remove_all(staged, ec);
            return std::unexpected(replaced.error());
        }
        applied.push_back(entry);
    }
    logger_.info(std::format("Configuration restored: {} entries", applied.size()));
    return {};
}

std::expected<void, std::string> RestoreOrchestrator::applyData(const fs::path& snapshot,
                                                                const fs::path& scratch) const {
    const fs::path extractDir = scratch / "data-extract";
    std::error_code ec;
    fs::create_directories(extractDir, ec);
    if (auto extracted = archiver_.extract(snapshot, extractDir); !extracted) {
        return std::unexpected(std::format("Data snapshot extraction failed: {}", extracted.error()));
    }
    const fs::path source = extractDir / "data";
    if (!fs::is_directory(source, ec)) {
        return std::unexpected("Data snapshot holds no data directory");
    }

    const fs::path& target = config_.dataDir;
    const fs::path staged = sibling(target, ".restore-new");
    fs::remove_all(staged, ec);
    fs::create_directories(target.parent_path(), ec);
    if (auto copied = copyTree(source, staged); !copied) {
        fs::remove_all(staged, ec);
        return std::unexpected(copied.error());
    }

    // The snapshot excludes the live database; carry the current one over until it is replaced.
    const fs::path db = fs::absolute(config_.databasePath).lexically_normal();
    const fs::path relative = db.lexically_relative(fs::absolute(target).lexically_normal());
    if (!config_.databasePath.empty() && isContainedRelative(relative)) {
        for (const char* suffix : {"", "-wal", "-shm"}) {
            const fs::path live = sibling(db, suffix);
            if (fs::exists(live, ec)) {
                const fs::path keep = sibling(staged / relative, suffix);
                fs::create_directories(keep.parent_path(), ec);
                if (!fs::copy_file(live, keep, fs::copy_options::overwrite_existing, ec)) {
                    fs::remove_all(staged, ec);
                    return std::unexpected(std::format("Failed to carry {} over: {}", live.string(), ec.message()));
                }
            }
        }
    }

    if (auto replaced = atomicReplace(staged, target); !replaced) {
        fs::remove_all(staged, ec);
        return std::unexpected(replaced.error());
    }
    logger_.info(std::format("Data directory restored to {}", target.string()));
    return {};
}

std::expected<void, std::string> RestoreOrchestrator::applyVolumes(const fs::path& volumeStage,
                                                                   std::vector<std::string>& applied) const {
    std::error_code ec;
    if (!fs::is_directory(volumeStage, ec)) {
        logger_.warning("Full archive holds no volumes");
        return {};
    }
    for (const auto& volume : config_.volumes) {
        const fs::path archive = volumeStage / (sanitizeName(volume) + ".tar.gz");
        if (!fs::exists(archive, ec)) {
            logger_.warning(std::format("Volume {} not in archive, left unchanged", volume));
            continue;
        }
        logger_.info(std::format("Importing volume {}", volume));
        if (auto imported = volumes_.importVolume(volume, archive); !imported) {
            return std::unexpected(imported.error());
        }
        applied.push_back("volume " + volume);
    }
    return {};
}

std::expected<void, std::string> RestoreOrchestrator::apply(const Extraction& extraction, RestoreScope scope,
                                                            const fs::path& scratch, RestoreOutcome& outcome) const {
    if (scope == RestoreScope::ConfigOnly) {
        return applyConfiguration(extraction.archiveRoot / "project", outcome.applied);
    }
    if (scope == RestoreScope::Full) {
        if (auto done = applyVolumes(extraction.archiveRoot / "volumes", outcome.applied); !done) {
            return done;
        }
        const fs::path snapshot = extraction.archiveRoot / "data-snapshot.tar.gz";
        std::error_code ec;
        if (fs::exists(snapshot, ec)) {
            if (auto done = applyData(snapshot, scratch); !done) {
                return done;
            }
            outcome.applied.push_back(config_.dataDir.string());
        } else {
            logger_.warning("Full archive holds no data snapshot");
        }
        if (auto done = applyConfiguration(extraction.archiveRoot / "project", outcome.applied); !done) {
            return done;
        }
    }
    if (!extraction.database) {
        return std::unexpected("No database candidate to apply");
    }
    if (auto done = applyDatabase(*extraction.database); !done) {
        return done;
    }
    outcome.applied.push_back(config_.databasePath.string());
    return {};
}

std::expected<int, std::string> RestoreOrchestrator::waitHealthy() {
    const int attempts = std::max(1, config_.healthCheckAttempts);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (health_.isHealthy()) {
            return attempt;
        }
        logger_.debug(std::format("Health check {}/{} not healthy yet", attempt, attempts));
        if (attempt < attempts) {
            sleeper_(config_.healthCheckInterval);
        }
    }
    return std::unexpected(std::format("Service not healthy after {} attempts ({}s interval)", attempts,
                                       config_.healthCheckInterval.count()));
}

std::expected<RestoreOutcome, std::string> RestoreOrchestrator::restore(const RestoreRequest& request,
                                                                        RunSummary& summary) {
    machine_ = RestoreStateMachine(request.dryRun);
    RestoreOutcome outcome;
    bool stopAttempted = false;
    bool applying = false;

    auto abort = [&](FailureCategory category, const std::string& err) -> std::unexpected<std::string> {
        machine_.fail();
        logger_.error(std::format("Restore failed: {}", err));
        summary.fatal(category, err);
        if (stopAttempted && !applying) {
            logger_.info("Resuming service after failed restore");
            if (auto started = service_.start(); !started) {
                logger_.error(std::format("Failed to resume service: {}", started.error()));
            }
        } else if (applying) {
            logger_.error("Service left stopped; re-run the restore from a known-good backup");
        }
        return std::unexpected(err);
    };

    std::error_code ec;
    if (!fs::is_regular_file(request.artifact, ec)) {
        return abort(FailureCategory::Configuration,
                     std::format("Backup artifact not found: {}", request.artifact.string()));
    }
    auto format = formatFromArtifactName(request.artifact.filename().string());
    if (!format || !acceptsFormat(request.scope, *format)) {
        return abort(FailureCategory::Configuration,
                     std::format("{} cannot be used for a {} restore", request.artifact.filename().string(),
                                 toString(request.scope)));
    }
    outcome.format = *format;
    logger_.info(std::format("Starting {} restore{} from {}", toString(request.scope),
                             request.dryRun ? " (dry run)" : "", request.artifact.string()));

    auto scratch = ScopedTempDir::create(config_.scratchDir, "vaultkeeper-restore-", &logger_);
    if (!scratch) {
        return abort(FailureCategory::Resource, scratch.error());
    }

    if (!request.dryRun) {
        stopAttempted = true;
        if (auto quiesced = quiesce(); !quiesced) {
            return abort(FailureCategory::Restore, quiesced.error());
        }
        if (auto moved = machine_.advance(RestoreState::ServiceQuiesced); !moved) {
            return abort(FailureCategory::Restore, moved.error());
        }
        summary.succeeded("quiesce");
    }

    auto plain = decrypt(request.artifact, scratch->path());
    if (!plain) {
        return abort(FailureCategory::Restore, plain.error());
    }
    if (auto moved = machine_.advance(RestoreState::Decrypted); !moved) {
        return abort(FailureCategory::Restore, moved.error());
    }
    summary.succeeded("decrypt", request.artifact.filename().string());

    auto extraction = extract(*plain, *format, request.scope, scratch->path());
    if (!extraction) {
        return abort(FailureCategory::Restore, extraction.error());
    }
    if (auto moved = machine_.advance(RestoreState::Extracted); !moved) {
        return abort(FailureCategory::Restore, moved.error());
    }
    summary.succeeded("extract");

    if (request.dryRun) {
        VerificationResult verification = verifier_.verify(request.artifact, *format);
        outcome.verification = verification.describe();
        if (!verification.passed()) {
            machine_.fail();
            summary.fatal(FailureCategory::Verification, outcome.verification);
            return std::unexpected(std::format("Verification failed: {}", outcome.verification));
        }
        summary.succeeded("verify", outcome.verification);
        outcome.finalState = machine_.state();
        logger_.info("Dry run complete; nothing was applied");
        return outcome;
    }

    if (!RestoreStateMachine::isAllowed(machine_.state(), RestoreState::Applied, request.dryRun) ||
        !machine_.reached(RestoreState::ServiceQuiesced)) {
        return abort(FailureCategory::Restore, "Refusing to apply: service was not quiesced");
    }
    if (service_.isRunning()) {
        return abort(FailureCategory::Restore, "Refusing to apply: service reports running");
    }

    applying = true;
    if (auto applied = apply(*extraction, request.scope, scratch->path(), outcome); !applied) {
        return abort(FailureCategory::Restore, applied.error());
    }
    if (auto moved = machine_.advance(RestoreState::Applied); !moved) {
        return abort(FailureCategory::Restore, moved.error());
    }
    summary.succeeded("apply", std::format("{} target(s)", outcome.applied.size()));
    applying = false;
    stopAttempted = false;

    logger_.info("Starting service");
    if (auto started = service_.start(); !started) {
        return abort(FailureCategory::Restore, std::format("Failed to start service: {}", started.error()));
    }
    if (auto moved = machine_.advance(RestoreState::ServiceResumed); !moved) {
        return abort(FailureCategory::Restore, moved.error());
    }
    summary.succeeded("resume");

    auto attempts = waitHealthy();
    if (!attempts) {
        return abort(FailureCategory::Restore, attempts.error());
    }
    outcome.healthAttempts = *attempts;
    if (auto moved = machine_.advance(RestoreState::HealthVerified); !moved) {
        return abort(FailureCategory::Restore, moved.error());
    }
    summary.succeeded("health", std::format("healthy after {} attempt(s)", *attempts));
    outcome.finalState = machine_.state();
    logger_.info("Restore complete");
    return outcome;
}

std::expected<fs::path, std::string> latestRestorableArtifact(const BackupConfig& config, RestoreScope scope) {
    if (scope == RestoreScope::DatabaseOnly) {
        BackupCatalog catalog(config.dbBackupDir, BackupCategory::Database);
        if (auto latest = catalog.latestArtifact(ArtifactFormat::Native)) {
            return *latest;
        }
        return std::unexpected(std::format("No encrypted database backup found in {}", config.dbBackupDir.string()));
    }
    BackupCatalog catalog(config.fullBackupDir, BackupCategory::Full);
    if (auto latest = catalog.latestArtifact(ArtifactFormat::FullArchive)) {
        return *latest;
    }
    return std::unexpected(std::format("No encrypted full backup found in {}", config.fullBackupDir.string()));
}
