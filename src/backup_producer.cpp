#include "backup_producer.hpp"
#include "file_utils.hpp"
#include <algorithm>
#include <format>
#include <sqlite3.h>
#include <sstream>

BackupProducer::BackupProducer(const BackupConfig& config, const ArtifactCodec& codec,
                               const IntegrityVerifier& verifier, const Archiver& archiver, const Logger& logger)
    : config_(config), codec_(codec), verifier_(verifier), archiver_(archiver), logger_(logger),
      clock_([] { return std::chrono::system_clock::now(); }),
      factory_([this](ArtifactFormat format) { return makeBackupStrategy(format, archiver_); }),
      spaceProbe_([](const fs::path& dir) -> std::optional<std::uintmax_t> {
          std::error_code ec;
          auto info = fs::space(dir, ec);
          if (ec) {
              return std::nullopt;
          }
          return info.available;
      }) {}

ArtifactFormat BackupProducer::primaryFormat(const std::vector<ArtifactFormat>& formats) {
    if (formats.empty() || std::ranges::find(formats, ArtifactFormat::Native) != formats.end()) {
        return ArtifactFormat::Native;
    }
    return formats.front();
}

std::expected<BackupArtifact, std::string> BackupProducer::produceFormat(ArtifactFormat format,
                                                                         const fs::path& liveSource,
                                                                         const fs::path& stagingDir,
                                                                         const BackupSet& set) const {
    const std::string plainName = plainArtifactName(set.category, format, set.id);
    const fs::path plainPath = stagingDir / plainName;
    const fs::path finalPath = set.directory / codec_.artifactName(plainName);

    auto strategy = factory_(format);
    if (!strategy) {
        return std::unexpected("no extraction strategy");
    }
    logger_.info(std::format("Creating {} backup", toString(format)));
    auto extracted = strategy->execute(liveSource, plainPath);
    if (!extracted) {
        if (auto wiped = secureRemove(plainPath); !wiped) {
            logger_.warning(wiped.error());
        }
        return std::unexpected(std::format("extraction failed: {}", extracted.error()));
    }

    auto sizes = codec_.seal(*extracted, finalPath);
    if (auto wiped = secureRemove(*extracted); !wiped) {
        logger_.warning(wiped.error());
    }
    if (!sizes) {
        return std::unexpected(sizes.error());
    }

    BackupArtifact artifact;
    artifact.format = format;
    artifact.path = finalPath;
    artifact.sizes = *sizes;
    logger_.info(std::format("Created {} ({} -> {})", finalPath.filename().string(), humanSize(sizes->plain),
                             humanSize(sizes->encrypted)));

    VerificationResult verification = verifier_.verify(finalPath, format, liveSource);
    artifact.verified = verification.passed();
    artifact.verification = verification.describe();
    return artifact;
}

std::expected<BackupSet, std::string> BackupProducer::produce(const fs::path& liveSource,
                                                              const std::vector<ArtifactFormat>& formats,
                                                              const fs::path& outDir, RunSummary& summary) const {
    std::error_code ec;
    if (!fs::is_regular_file(liveSource, ec)) {
        std::string err = std::format("SQLite database not found at {}", liveSource.string());
        summary.fatal(FailureCategory::Configuration, err);
        return std::unexpected(err);
    }
    if (formats.empty()) {
        summary.fatal(FailureCategory::Configuration, "No backup format selected");
        return std::unexpected("No backup format selected");
    }

    const std::uintmax_t dbSize = pathSize(liveSource);
    fs::create_directories(outDir, ec);
    if (ec) {
        std::string err = std::format("Cannot create backup directory {}: {}", outDir.string(), ec.message());
        summary.fatal(FailureCategory::Resource, err);
        return std::unexpected(err);
    }
    fs::permissions(outDir, fs::perms::owner_all, fs::perm_options::replace, ec);

    if (auto available = spaceProbe_(outDir); available && *available < dbSize * kSpaceFactor) {
        std::string err = std::format("Insufficient disk space in {}: {} available, {} required",
                                      outDir.string(), humanSize(*available), humanSize(dbSize * kSpaceFactor));
        summary.fatal(FailureCategory::Resource, err);
        return std::unexpected(err);
    }

    BackupSet set;
    set.category = BackupCategory::Database;
    set.createdAt = clock_();
    set.id = formatTimestamp(set.createdAt);
    set.directory = outDir / set.id;
    if (!fs::create_directory(set.directory, ec)) {
        std::string err = ec ? std::format("Cannot create backup set {}: {}", set.directory.string(), ec.message())
                             : std::format("Backup set {} already exists", set.directory.string());
        summary.fatal(FailureCategory::Resource, err);
        return std::unexpected(err);
    }
    fs::permissions(set.directory, fs::perms::owner_all, fs::perm_options::replace, ec);
    logger_.info(std::format("Creating database backup set {} ({})", set.id, humanSize(dbSize)));

    const ArtifactFormat primary = primaryFormat(formats);
    bool primaryOk = false;
    Json::Value failedFormats(Json::arrayValue);
    {
        auto staging = ScopedTempDir::create(set.directory, ".staging-", &logger_);
        if (!staging) {
            fs::remove_all(set.directory, ec);
            summary.fatal(FailureCategory::Resource, staging.error());
            return std::unexpected(staging.error());
        }

        for (auto format : formats) {
            const std::string component = std::format("{} format", toString(format));
            auto artifact = produceFormat(format, liveSource, staging->path(), set);
            if (!artifact) {
                logger_.error(std::format("{} backup failed: {}", toString(format), artifact.error()));
                summary.failed(component, FailureCategory::Artifact, artifact.error());
                failedFormats.append(toString(format));
                continue;
            }
            if (format == primary) {
                primaryOk = true;
            }
            if (artifact->verified) {
                summary.succeeded(component, artifact->path.filename().string());
            } else {
                summary.warned(component, FailureCategory::Verification,
                               std::format("{} kept unverified: {}", artifact->path.filename().string(),
                                           artifact->verification));
            }
            set.artifacts.push_back(std::move(*artifact));
        }
    }

    set.metadata["source"]["file"] = liveSource.filename().string();
    set.metadata["source"]["size"] = Json::UInt64(dbSize);
    set.metadata["sqlite_version"] = sqlite3_libversion();
    set.metadata["primary_format"] = toString(primary);
    set.metadata["failed_formats"] = failedFormats;
    if (auto written = writeManifest(set); !written) {
        logger_.warning(written.error());
        summary.warned("manifest", FailureCategory::Artifact, written.error());
    }

    if (!primaryOk) {
        std::string err = std::format("Primary {} format failed; set {} is incomplete", toString(primary), set.id);
        summary.fatal(FailureCategory::Artifact, err);
        return std::unexpected(err);
    }
    logger_.info(std::format("Backup set {} complete: {} artifact(s), {}", set.id, set.artifacts.size(),
                             set.verified() ? "verified" : "NOT fully verified"));
    return set;
}

std::string BackupProducer::plan(const fs::path& liveSource, const std::vector<ArtifactFormat>& formats,
                                 const fs::path& outDir) const {
    std::ostringstream out;
    const std::uintmax_t dbSize = pathSize(liveSource);
    out << "Dry run: no files will be written.\n"
        << "  Database: " << liveSource.string() << " (" << humanSize(dbSize) << ")\n"
        << "  Formats:";
    for (auto format : formats) {
        out << ' ' << toString(format) << (format == primaryFormat(formats) ? "*" : "");
    }
    out << "  (* primary)\n"
        << "  Destination: " << (outDir / formatTimestamp(clock_())).string() << '\n'
        << "  Required free space: " << humanSize(dbSize * kSpaceFactor);
    fs::path probeDir = outDir;
    std::error_code ec;
    while (!probeDir.empty() && !fs::exists(probeDir, ec) && probeDir != probeDir.parent_path()) {
        probeDir = probeDir.parent_path();
    }
    if (auto available = spaceProbe_(probeDir)) {
        out << " (available " << humanSize(*available) << ")";
    }
    out << '\n';

    BackupCatalog catalog(outDir, BackupCategory::Database);
    const size_t existing = catalog.list().size();
    out << "  Existing sets: " << existing << ", keep " << config_.keepDb;
    if (config_.keepDb > 0 && existing + 1 > static_cast<size_t>(config_.keepDb)) {
        out << " (retention would remove " << existing + 1 - static_cast<size_t>(config_.keepDb) << ")";
    }
    out << '\n';
    return out.str();
}
