/**
 * @file backup_api.hpp
 * @brief High-level entry points used by the command line tools.
 *
 * BackupAPI wires the production components (gzip, gpg, libarchive, SQLite, Docker)
 * from one BackupConfig and runs the complete workflows: produce or assemble a set,
 * offload it, apply retention and alert the operator when a run did not fully succeed.
 */

#ifndef BACKUP_API_HPP
#define BACKUP_API_HPP

#include <expected>
#include <filesystem>
#include <string>
#include <vector>
#include "archiver.hpp"
#include "artifact_codec.hpp"
#include "backup_config.hpp"
#include "backup_producer.hpp"
#include "backup_set.hpp"
#include "database.hpp"
#include "logger.hpp"
#include "restore.hpp"
#include "retention.hpp"
#include "run_summary.hpp"
#include "snapshot_assembler.hpp"
#include "verifier.hpp"
#include "volume_exporter.hpp"

namespace fs = std::filesystem;

class BackupAPI {
public:
    /**
     * @brief Builds every component from @p config.
     *
     * @param config Loaded configuration; must outlive the API object.
     * @param logger Logger shared by all components.
     */
    BackupAPI(const BackupConfig& config, const Logger& logger);

    BackupAPI(const BackupAPI&) = delete;
    BackupAPI& operator=(const BackupAPI&) = delete;

    /**
     * @brief Produces a database set, offloads it and prunes old database sets.
     *
     * @param formats Formats to produce.
     * @param requireVerified Treat any unverified artifact as fatal (--validate).
     * @param summary Receives the outcome of every step.
     */
    std::expected<BackupSet, std::string> runDatabaseBackup(const std::vector<ArtifactFormat>& formats,
                                                            bool requireVerified, RunSummary& summary);

    /**
     * @brief Dry-run plan for runDatabaseBackup().
     */
    std::string planDatabaseBackup(const std::vector<ArtifactFormat>& formats) const;

    /**
     * @brief Verifies an existing artifact, inferring its format from the file name.
     *
     * Database artifacts are cross-checked against the live database when it exists.
     */
    std::expected<VerificationResult, std::string> verifyArtifact(const fs::path& artifact, RunSummary& summary) const;

    /**
     * @brief Assembles a full set, offloads it and prunes old full sets.
     */
    std::expected<BackupSet, std::string> runFullBackup(const FullBackupOptions& options, RunSummary& summary);

    /**
     * @brief Report-only description for runFullBackup().
     */
    std::string reportFullBackup(const FullBackupOptions& options) const;

    /**
     * @brief Restores from an artifact using the Docker Compose service controller.
     */
    std::expected<RestoreOutcome, std::string> runRestore(const RestoreRequest& request, RunSummary& summary);

    /**
     * @brief Newest artifact for a restore of @p scope.
     */
    std::expected<fs::path, std::string> latestArtifact(RestoreScope scope) const;

    /**
     * @brief Sends the summary to every configured channel if the run failed or degraded.
     */
    void notifyIfNeeded(const RunSummary& summary, const std::string& operation) const;

private:
    void offload(const BackupSet& set, RunSummary& summary) const;
    void applyRetention(BackupCategory category, const std::string& protectedId, RunSummary& summary) const;

    const BackupConfig& config_;
    const Logger& logger_;
    GzipCompressor compressor_;
    GpgEncryptor encryptor_;
    ArtifactCodec codec_;
    LibArchiveArchiver archiver_;
    SqliteDatabaseChecker checker_;
    IntegrityVerifier verifier_;
    BackupProducer producer_;
    DockerVolumeExporter volumes_;
    RetentionManager retention_;
    SnapshotAssembler assembler_;
};

#endif // BACKUP_API_HPP
