/**
 * @file restore.hpp
 * @brief Restore Orchestrator: the inverse of the backup pipeline.
 *
 * A restore walks a linear state machine
 * Idle -> ServiceQuiesced -> Decrypted -> Extracted -> Applied -> ServiceResumed -> HealthVerified,
 * with Failed reachable from every non-terminal state. A dry run goes straight from
 * Idle to Decrypted and stops after Extracted, so it can never reach Applied.
 */

#ifndef RESTORE_HPP
#define RESTORE_HPP

#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "archiver.hpp"
#include "artifact_codec.hpp"
#include "backup_config.hpp"
#include "backup_set.hpp"
#include "database.hpp"
#include "logger.hpp"
#include "run_summary.hpp"
#include "service_control.hpp"
#include "verifier.hpp"
#include "volume_exporter.hpp"

namespace fs = std::filesystem;

enum class RestoreScope {
    DatabaseOnly, ///< Only the live database file.
    ConfigOnly,   ///< Only the allow-listed configuration tree.
    Full          ///< Volumes, data directory, configuration and database.
};

enum class RestoreState {
    Idle,
    ServiceQuiesced,
    Decrypted,
    Extracted,
    Applied,
    ServiceResumed,
    HealthVerified,
    Failed
};

const char* toString(RestoreScope scope);
const char* toString(RestoreState state);

struct RestoreRequest {
    fs::path artifact;                          ///< Encrypted artifact to restore from.
    RestoreScope scope = RestoreScope::DatabaseOnly;
    bool dryRun = false;                        ///< Stop after Extracted and verification.
};

/**
 * @brief Validated restore state transitions.
 */
class RestoreStateMachine {
public:
    explicit RestoreStateMachine(bool dryRun = false);

    /**
     * @brief Moves to @p next if the transition table allows it.
     *
     * An illegal transition moves the machine to Failed and returns an error.
     */
    std::expected<void, std::string> advance(RestoreState next);

    /**
     * @brief Moves to Failed from any non-terminal state.
     */
    void fail();

    /**
     * @brief Returns true if @p from -> @p to is allowed for the given mode.
     */
    static bool isAllowed(RestoreState from, RestoreState to, bool dryRun);

    RestoreState state() const { return state_; }
    const std::vector<RestoreState>& history() const { return history_; }
    bool reached(RestoreState state) const;
    bool isTerminal() const;

private:
    bool dryRun_;
    RestoreState state_ = RestoreState::Idle;
    std::vector<RestoreState> history_;
};

/**
 * @brief Result of a restore that reached its terminal success state.
 */
struct RestoreOutcome {
    RestoreState finalState = RestoreState::Idle;
    ArtifactFormat format = ArtifactFormat::Native;
    int healthAttempts = 0;          ///< Health polls performed.
    std::vector<std::string> applied; ///< Targets replaced, in order.
    std::string verification;        ///< Verifier summary (dry run only).
};

class RestoreOrchestrator {
public:
    using Sleeper = std::function<void(std::chrono::seconds)>;

    /**
     * @brief Constructs an orchestrator.
     *
     * @param config Deployment configuration (targets, health policy, scratch location).
     * @param codec Decrypt/decompress pipeline.
     * @param verifier Used by dry runs.
     * @param archiver Extracts full archives and data snapshots.
     * @param checker Integrity check and dump replay.
     * @param service Controls the consuming service.
     * @param health Health probe polled after the service is resumed.
     * @param volumes Imports runtime volumes on full restores.
     * @param logger Logger for state changes.
     */
    RestoreOrchestrator(const BackupConfig& config, const ArtifactCodec& codec, const IntegrityVerifier& verifier,
                        const Archiver& archiver, const DatabaseChecker& checker, ServiceController& service,
                        const HealthProbe& health, const VolumeExporter& volumes, const Logger& logger);

    /**
     * @brief Runs one restore.
     *
     * Failures before Applied resume the service again; failures during or after Applied
     * leave it in whatever state it is in. Nothing is rolled back.
     *
     * @return std::expected<RestoreOutcome, std::string> The outcome, or the error that moved the restore to Failed.
     */
    std::expected<RestoreOutcome, std::string> restore(const RestoreRequest& request, RunSummary& summary);

    const RestoreStateMachine& stateMachine() const { return machine_; }

    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

private:
    struct Extraction {
        fs::path archiveRoot;                ///< Extracted full archive (empty for database artifacts).
        std::optional<fs::path> database;    ///< Candidate database file.
    };

    std::expected<void, std::string> quiesce();
    std::expected<fs::path, std::string> decrypt(const fs::path& artifact, const fs::path& scratch) const;
    std::expected<Extraction, std::string> extract(const fs::path& plain, ArtifactFormat format, RestoreScope scope,
                                                   const fs::path& scratch) const;
    std::expected<fs::path, std::string> databaseCandidate(const fs::path& plain, ArtifactFormat format,
                                                           const fs::path& scratch) const;
    std::expected<fs::path, std::string> embeddedDatabase(const fs::path& archiveRoot,
                                                          const fs::path& scratch) const;

    std::expected<void, std::string> apply(const Extraction& extraction, RestoreScope scope, const fs::path& scratch,
                                           RestoreOutcome& outcome) const;
    std::expected<void, std::string> applyDatabase(const fs::path& candidate) const;
    std::expected<void, std::string> applyConfiguration(const fs::path& projectStage,
                                                        std::vector<std::string>& applied) const;
    std::expected<void, std::string> applyData(const fs::path& snapshot, const fs::path& scratch) const;
    std::expected<void, std::string> applyVolumes(const fs::path& volumeStage,
                                                  std::vector<std::string>& applied) const;

    std::expected<int, std::string> waitHealthy();

    const BackupConfig& config_;
    const ArtifactCodec& codec_;
    const IntegrityVerifier& verifier_;
    const Archiver& archiver_;
    const DatabaseChecker& checker_;
    ServiceController& service_;
    const HealthProbe& health_;
    const VolumeExporter& volumes_;
    const Logger& logger_;
    Sleeper sleeper_;
    RestoreStateMachine machine_;
};

/**
 * @brief Newest artifact suitable for @p scope: a native database artifact, or a full archive.
 */
std::expected<fs::path, std::string> latestRestorableArtifact(const BackupConfig& config, RestoreScope scope);

#endif // RESTORE_HPP
