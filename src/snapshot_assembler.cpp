#include "snapshot_assembler.hpp"
#include "file_utils.hpp"
#include "run_lock.hpp"
#include <format>
#include <fstream>
#include <ranges>
#include <sstream>

namespace {

std::string joinNames(const Json::Value& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name.asString();
    }
    return joined;
}

} // namespace

SnapshotAssembler::SnapshotAssembler(const BackupConfig& config, const BackupProducer& producer,
                                     const ArtifactCodec& codec, const IntegrityVerifier& verifier,
                                     const Archiver& archiver, const VolumeExporter& volumes,
                                     const RetentionManager& retention, const Logger& logger)
    : config_(config), producer_(producer), codec_(codec), verifier_(verifier), archiver_(archiver),
      volumes_(volumes), retention_(retention), logger_(logger),
      clock_([] { return std::chrono::system_clock::now(); }) {}

std::string SnapshotAssembler::setIdFor(std::chrono::system_clock::time_point time, const std::string& label) {
    std::string id = formatTimestamp(time);
    if (!label.empty()) {
        id += "-" + sanitizeName(label);
    }
    return id;
}

std::vector<fs::path> SnapshotAssembler::liveDatabaseFiles() const {
    if (config_.databasePath.empty()) {
        return {};
    }
    const fs::path db = fs::absolute(config_.databasePath).lexically_normal();
    return {db, fs::path(db.string() + "-wal"), fs::path(db.string() + "-shm"), fs::path(db.string() + "-journal")};
}

std::optional<CatalogEntry> SnapshotAssembler::reusableDatabaseSet() const {
    BackupCatalog catalog(config_.dbBackupDir, BackupCategory::Database);
    const auto now = clock_();
    const auto entries = catalog.list();
    for (const auto& entry : entries | std::views::reverse) {
        if (entry.createdAt > now) {
            continue;
        }
        if (now - entry.createdAt > config_.freshnessWindow) {
            break;
        }
        if (catalog.artifactIn(entry, ArtifactFormat::Native) && catalog.isVerified(entry)) {
            return entry;
        }
    }
    return std::nullopt;
}

void SnapshotAssembler::exportVolumes(const fs::path& stage, RunSummary& summary, Json::Value& components) const {
    const fs::path volumeDir = stage / "volumes";
    std::error_code ec;
    fs::create_directories(volumeDir, ec);
    Json::Value& report = components["volumes"];
    report = Json::Value(Json::objectValue);

    for (const auto& volume : config_.volumes) {
        const std::string component = std::format("volume {}", volume);
        if (!volumes_.exists(volume)) {
            logger_.warning(std::format("Volume {} not found, skipping", volume));
            summary.warned(component, FailureCategory::Artifact, "volume not found, skipped");
            report[volume] = "missing";
            continue;
        }
        const fs::path archive = volumeDir / (sanitizeName(volume) + ".tar.gz");
        logger_.info(std::format("Exporting volume {}", volume));
        if (auto exported = volumes_.exportVolume(volume, archive); !exported) {
            logger_.error(exported.error());
            summary.failed(component, FailureCategory::Artifact, exported.error());
            report[volume] = "failed";
            continue;
        }
        logger_.info(std::format("Exported volume {} ({})", volume, humanSize(pathSize(archive))));
        summary.succeeded(component, archive.filename().string());
        report[volume] = archive.filename().string();
    }
}

void SnapshotAssembler::copyConfiguration(const fs::path& stage, RunSummary& summary,
                                          Json::Value& components) const {
    const fs::path projectDir = stage / "project";
    std::error_code ec;
    fs::create_directories(projectDir, ec);

    Json::Value copied(Json::arrayValue);
    Json::Value failed(Json::arrayValue);
    Json::Value missing(Json::arrayValue);
    Json::Value excluded(Json::arrayValue);
    excluded.append("settings.json");
    for (const auto& managed : {config_.dataDir, config_.logDir, config_.dbBackupDir, config_.fullBackupDir}) {
        const fs::path relative = managed.lexically_relative(config_.projectRoot);
        if (isContainedRelative(relative) && relative != ".") {
            excluded.append(relative.generic_string() + "/");
        }
    }

    for (const auto& entry : config_.configPaths) {
        const fs::path relative(entry);
        if (!isContainedRelative(relative)) {
            logger_.error(std::format("Refusing configuration path outside the project: {}", entry));
            failed.append(entry);
            continue;
        }
        const fs::path source = config_.projectRoot / relative;
        if (!fs::exists(fs::symlink_status(source, ec))) {
            logger_.warning(std::format("Configuration path not found: {}", entry));
            missing.append(entry);
            continue;
        }
        if (config_.isSecretFile(source)) {
            excluded.append(entry);
            continue;
        }

        const fs::path target = projectDir / relative;
        fs::create_directories(target.parent_path(), ec);
        auto done = copyTree(source, target, [this, &excluded](const fs::path& path) {
            if (!config_.isSecretFile(path)) {
                return false;
            }
            excluded.append(path.lexically_relative(config_.projectRoot).generic_string());
            return true;
        });
        if (!done) {
            logger_.error(done.error());
            failed.append(entry);
            continue;
        }
        copied.append(fs::is_directory(target, ec) ? entry + "/" : entry);
    }

    Json::Value manifest;
    manifest["copied"] = copied;
    manifest["failed"] = failed;
    manifest["missing"] = missing;
    manifest["excluded"] = excluded;
    manifest["note"] = "settings.json intentionally excluded to avoid secret sprawl.";
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    std::ofstream out(projectDir / "config-manifest.json");
    out << Json::writeString(writer, manifest) << '\n';
    if (!out) {
        failed.append("config-manifest.json");
    }

    components["configuration"] = manifest;
    logger_.info(std::format("Configuration copy: {} item(s) copied", copied.size()));
    if (!failed.empty()) {
        summary.failed("configuration", FailureCategory::Artifact, std::format("failed: {}", joinNames(failed)));
    } else {
        summary.succeeded("configuration", std::format("{} item(s)", copied.size()));
    }
}

void SnapshotAssembler::includeDatabase(const fs::path& stage, RunSummary& summary, Json::Value& components) const {
    const fs::path databaseDir = stage / "database";
    std::error_code ec;
    fs::create_directories(databaseDir, ec);
    Json::Value& report = components["database"];

    if (auto reusable = reusableDatabaseSet()) {
        const auto age = std::chrono::duration_cast<std::chrono::hours>(clock_() - reusable->createdAt);
        logger_.info(std::format("Using existing database set {} ({}h old)", reusable->id, age.count()));
        if (auto copied = copyTree(reusable->directory, databaseDir / reusable->id); copied) {
            report["source"] = "reused";
            report["set"] = reusable->id;
            summary.succeeded("database", std::format("reused set {}", reusable->id));
            return;
        } else {
            logger_.warning(std::format("Failed to copy existing database set, creating a new one: {}",
                                        copied.error()));
            fs::remove_all(databaseDir / reusable->id, ec);
        }
    } else {
        logger_.info("No database set within the freshness window, creating a new one");
    }

    auto liveDb = config_.requireDatabaseFile();
    if (!liveDb) {
        logger_.error(liveDb.error());
        summary.failed("database", FailureCategory::Configuration, liveDb.error());
        report["source"] = "failed";
        return;
    }

    RunSummary inner("database backup");
    auto set = producer_.produce(*liveDb, {ArtifactFormat::Native, ArtifactFormat::Portable}, config_.dbBackupDir,
                                 inner);
    if (!set) {
        logger_.error(std::format("Inline database backup failed: {}", set.error()));
        summary.failed("database", FailureCategory::Artifact, set.error());
        report["source"] = "failed";
        return;
    }
    if (auto copied = copyTree(set->directory, databaseDir / set->id); !copied) {
        logger_.error(copied.error());
        summary.failed("database", FailureCategory::Artifact, copied.error());
        report["source"] = "failed";
        return;
    }
    report["source"] = "fresh";
    report["set"] = set->id;
    if (inner.isDegraded()) {
        summary.warned("database", FailureCategory::Verification,
                       std::format("fresh set {} completed with warnings", set->id));
    } else {
        summary.succeeded("database", std::format("fresh set {}", set->id));
    }

    BackupCatalog catalog(config_.dbBackupDir, BackupCategory::Database);
    if (auto pruned = retention_.prune(catalog, config_.keepDb, set->id); !pruned) {
        logger_.warning(std::format("Database retention failed: {}", pruned.error()));
    }
}

void SnapshotAssembler::snapshotData(const fs::path& stage, RunSummary& summary, Json::Value& components) const {
    std::error_code ec;
    if (config_.dataDir.empty() || !fs::is_directory(config_.dataDir, ec)) {
        logger_.warning(std::format("Data directory {} not found, skipping data snapshot", config_.dataDir.string()));
        summary.warned("data snapshot", FailureCategory::Artifact, "data directory not found");
        components["data"] = "missing";
        return;
    }

    ArchiveOptions options;
    options.gzip = true;
    options.excludes = liveDatabaseFiles();
    options.rootName = "data";
    const fs::path archive = stage / "data-snapshot.tar.gz";
    logger_.info(std::format("Creating data snapshot of {}", config_.dataDir.string()));
    auto entries = archiver_.create(config_.dataDir, archive, options);
    if (!entries) {
        fs::remove(archive, ec);
        logger_.error(std::format("Data snapshot failed: {}", entries.error()));
        summary.failed("data snapshot", FailureCategory::Artifact, entries.error());
        components["data"] = "failed";
        return;
    }
    logger_.info(std::format("Data snapshot created: {} entries, {}", *entries, humanSize(pathSize(archive))));
    summary.succeeded("data snapshot", archive.filename().string());
    components["data"] = archive.filename().string();
}

void SnapshotAssembler::archiveLogs(const fs::path& stage, RunSummary& summary, Json::Value& components) const {
    std::error_code ec;
    if (!fs::is_directory(config_.logDir, ec)) {
        summary.warned("logs", FailureCategory::Artifact, "log directory not found");
        components["logs"] = "missing";
        return;
    }
    ArchiveOptions options;
    options.gzip = true;
    options.excludes = {fs::absolute(RunLock::pathFor(config_.logDir)).lexically_normal()};
    options.rootName = "logs";
    const fs::path archive = stage / "logs.tar.gz";
    if (auto entries = archiver_.create(config_.logDir, archive, options); !entries) {
        fs::remove(archive, ec);
        logger_.error(std::format("Log archive failed: {}", entries.error()));
        summary.failed("logs", FailureCategory::Artifact, entries.error());
        components["logs"] = "failed";
        return;
    }
    summary.succeeded("logs", archive.filename().string());
    components["logs"] = archive.filename().string();
}

std::expected<BackupSet, std::string> SnapshotAssembler::assembleFull(const fs::path& outDir,
                                                                      const FullBackupOptions& options,
                                                                      RunSummary& summary) const {
    std::error_code ec;
    fs::create_directories(outDir, ec);
    if (ec) {
        std::string err = std::format("Cannot create backup directory {}: {}", outDir.string(), ec.message());
        summary.fatal(FailureCategory::Resource, err);
        return std::unexpected(err);
    }
    fs::permissions(outDir, fs::perms::owner_all, fs::perm_options::replace, ec);

    BackupSet set;
    set.category = BackupCategory::Full;
    set.createdAt = clock_();
    set.id = setIdFor(set.createdAt, options.label);
    set.directory = outDir / set.id;
    if (!fs::create_directory(set.directory, ec)) {
        std::string err = ec ? std::format("Cannot create backup set {}: {}", set.directory.string(), ec.message())
                             : std::format("Backup set {} already exists", set.directory.string());
        summary.fatal(FailureCategory::Resource, err);
        return std::unexpected(err);
    }
    fs::permissions(set.directory, fs::perms::owner_all, fs::perm_options::replace, ec);
    logger_.info(std::format("Creating full backup set {}", set.id));

    auto fail = [&](FailureCategory category, const std::string& err) -> std::unexpected<std::string> {
        logger_.error(err);
        summary.fatal(category, err);
        if (auto removed = secureRemove(set.directory); !removed) {
            logger_.warning(removed.error());
        }
        return std::unexpected(err);
    };

    auto workDir = ScopedTempDir::create(set.directory, ".work-", &logger_);
    if (!workDir) {
        return fail(FailureCategory::Resource, workDir.error());
    }
    const fs::path stage = workDir->path() / "stage";
    fs::create_directory(stage, ec);
    if (ec) {
        return fail(FailureCategory::Resource, std::format("Cannot create staging area: {}", ec.message()));
    }

    Json::Value components(Json::objectValue);
    exportVolumes(stage, summary, components);
    copyConfiguration(stage, summary, components);
    includeDatabase(stage, summary, components);
    snapshotData(stage, summary, components);
    if (options.includeLogs) {
        archiveLogs(stage, summary, components);
    }

    const std::string plainName = plainArtifactName(BackupCategory::Full, ArtifactFormat::FullArchive, set.id);
    const fs::path plain = workDir->path() / plainName;
    const fs::path finalPath = set.directory / codec_.artifactName(plainName);
    logger_.info("Assembling final archive");
    auto entries = archiver_.create(stage, plain);
    if (!entries) {
        return fail(FailureCategory::Artifact, std::format("Failed to create archive: {}", entries.error()));
    }
    if (auto wiped = secureRemove(stage); !wiped) {
        logger_.warning(wiped.error());
    }

    auto sizes = codec_.seal(plain, finalPath);
    if (auto wiped = secureRemove(plain); !wiped) {
        logger_.warning(wiped.error());
    }
    if (!sizes) {
        return fail(FailureCategory::Artifact, std::format("Failed to seal archive: {}", sizes.error()));
    }
    logger_.info(std::format("Final encrypted archive: {} ({})", finalPath.filename().string(),
                             humanSize(sizes->encrypted)));

    BackupArtifact artifact;
    artifact.format = ArtifactFormat::FullArchive;
    artifact.path = finalPath;
    artifact.sizes = *sizes;
    VerificationResult verification = verifier_.verify(finalPath, ArtifactFormat::FullArchive);
    artifact.verified = verification.passed();
    artifact.verification = verification.describe();
    if (artifact.verified) {
        summary.succeeded("full archive", finalPath.filename().string());
    } else {
        summary.warned("full archive", FailureCategory::Verification,
                       std::format("{} kept unverified: {}", finalPath.filename().string(), artifact.verification));
    }
    set.artifacts.push_back(std::move(artifact));

    set.metadata["label"] = options.label;
    set.metadata["entries"] = Json::UInt64(*entries);
    set.metadata["components"] = components;
    if (auto written = writeManifest(set); !written) {
        logger_.warning(written.error());
        summary.warned("manifest", FailureCategory::Artifact, written.error());
    }
    logger_.info(std::format("Full backup set {} complete ({})", set.id,
                             set.verified() ? "verified" : "NOT verified"));
    return set;
}

std::string SnapshotAssembler::report(const fs::path& outDir, const FullBackupOptions& options) const {
    std::ostringstream out;
    std::error_code ec;
    out << "Report only: no files will be written.\n"
        << "  Destination: " << (outDir / setIdFor(clock_(), options.label)).string() << '\n';

    out << "  Volumes:\n";
    for (const auto& volume : config_.volumes) {
        out << "    " << volume << (volumes_.exists(volume) ? "" : " (not found, would be skipped)") << '\n';
    }

    out << "  Configuration:\n";
    for (const auto& entry : config_.configPaths) {
        const fs::path source = config_.projectRoot / entry;
        out << "    " << entry;
        if (!isContainedRelative(entry)) {
            out << " (outside the project, refused)";
        } else if (!fs::exists(fs::symlink_status(source, ec))) {
            out << " (not found)";
        } else if (config_.isSecretFile(source)) {
            out << " (secret file, excluded)";
        } else {
            out << " (" << humanSize(pathSize(source)) << ")";
        }
        out << '\n';
    }

    out << "  Database: ";
    if (auto reusable = reusableDatabaseSet()) {
        out << "reuse set " << reusable->id << '\n';
    } else {
        out << "create a new set from " << config_.databasePath.string() << '\n';
    }

    out << "  Data directory: " << config_.dataDir.string();
    if (fs::is_directory(config_.dataDir, ec)) {
        out << " (" << humanSize(pathSize(config_.dataDir)) << ", live database excluded)\n";
    } else {
        out << " (not found, would be skipped)\n";
    }
    out << "  Logs: " << (options.includeLogs ? config_.logDir.string() : std::string("not included")) << '\n';

    BackupCatalog catalog(outDir, BackupCategory::Full);
    const size_t existing = catalog.list().size();
    out << "  Existing full sets: " << existing << ", keep " << config_.keepFull << '\n';
    return out.str();
}
