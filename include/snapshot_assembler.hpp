/**
 * @file snapshot_assembler.hpp
 * @brief Builds full backup sets: runtime volumes, configuration, database and data in one archive.
 *
 * The assembler stages every component into a private directory inside the new set,
 * archives the stage into a single tar, seals it through the ArtifactCodec and verifies
 * the sealed archive. Component failures are collected in the RunSummary; only a
 * failure to produce the final archive fails the run.
 */

#ifndef SNAPSHOT_ASSEMBLER_HPP
#define SNAPSHOT_ASSEMBLER_HPP

#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <json/json.h>
#include "archiver.hpp"
#include "artifact_codec.hpp"
#include "backup_config.hpp"
#include "backup_producer.hpp"
#include "backup_set.hpp"
#include "logger.hpp"
#include "retention.hpp"
#include "run_summary.hpp"
#include "verifier.hpp"
#include "volume_exporter.hpp"

namespace fs = std::filesystem;

struct FullBackupOptions {
    bool includeLogs = false; ///< Add the log directory as logs.tar.gz.
    std::string label;        ///< Optional label appended to the set id.
};

class SnapshotAssembler {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @brief Constructs an assembler.
     *
     * @param config Deployment configuration.
     * @param producer Used inline when no recent database set can be reused.
     * @param codec Seals the final archive.
     * @param verifier Verifies the sealed archive.
     * @param archiver Creates the data snapshot and the final archive.
     * @param volumes Exports runtime volumes.
     * @param retention Prunes database sets created inline.
     * @param logger Logger for component progress.
     */
    SnapshotAssembler(const BackupConfig& config, const BackupProducer& producer, const ArtifactCodec& codec,
                      const IntegrityVerifier& verifier, const Archiver& archiver, const VolumeExporter& volumes,
                      const RetentionManager& retention, const Logger& logger);

    /**
     * @brief Creates a new full backup set under @p outDir.
     *
     * @param outDir Root of full backup sets.
     * @param options Log inclusion and label.
     * @param summary Receives per-component outcomes.
     * @return std::expected<BackupSet, std::string> The set, or an error if no final archive was produced.
     */
    std::expected<BackupSet, std::string> assembleFull(const fs::path& outDir, const FullBackupOptions& options,
                                                       RunSummary& summary) const;

    /**
     * @brief Describes what assembleFull() would include, without producing anything.
     */
    std::string report(const fs::path& outDir, const FullBackupOptions& options) const;

    /**
     * @brief Newest database set inside the freshness window that holds a verified native artifact.
     */
    std::optional<CatalogEntry> reusableDatabaseSet() const;

    /**
     * @brief Set id for a full backup: the timestamp, plus "-<label>" when a label is given.
     */
    static std::string setIdFor(std::chrono::system_clock::time_point time, const std::string& label);

    void setClock(Clock clock) { clock_ = std::move(clock); }

private:
    void exportVolumes(const fs::path& stage, RunSummary& summary, Json::Value& components) const;
    void copyConfiguration(const fs::path& stage, RunSummary& summary, Json::Value& components) const;
    void includeDatabase(const fs::path& stage, RunSummary& summary, Json::Value& components) const;
    void snapshotData(const fs::path& stage, RunSummary& summary, Json::Value& components) const;
    void archiveLogs(const fs::path& stage, RunSummary& summary, Json::Value& components) const;
    std::vector<fs::path> liveDatabaseFiles() const;

    const BackupConfig& config_;
    const BackupProducer& producer_;
    const ArtifactCodec& codec_;
    const IntegrityVerifier& verifier_;
    const Archiver& archiver_;
    const VolumeExporter& volumes_;
    const RetentionManager& retention_;
    const Logger& logger_;
    Clock clock_;
};

#endif // SNAPSHOT_ASSEMBLER_HPP
