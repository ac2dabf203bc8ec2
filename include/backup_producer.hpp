/**
 * @file backup_producer.hpp
 * @brief Produces one timestamped database backup set in one or more formats.
 *
 * Each requested format is extracted, sealed and verified independently; a failing
 * format never stops its siblings. The run succeeds when the primary format (native
 * if requested, otherwise the first one requested) produced an artifact.
 */

#ifndef BACKUP_PRODUCER_HPP
#define BACKUP_PRODUCER_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "archiver.hpp"
#include "artifact_codec.hpp"
#include "backup_config.hpp"
#include "backup_set.hpp"
#include "database_backup.hpp"
#include "logger.hpp"
#include "run_summary.hpp"
#include "verifier.hpp"

namespace fs = std::filesystem;

class BackupProducer {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using StrategyFactory = std::function<std::unique_ptr<DatabaseBackupStrategy>(ArtifactFormat)>;
    using SpaceProbe = std::function<std::optional<std::uintmax_t>(const fs::path&)>;

    /// Free space required in the output directory, as a multiple of the database size.
    static constexpr std::uintmax_t kSpaceFactor = 4;

    BackupProducer(const BackupConfig& config, const ArtifactCodec& codec, const IntegrityVerifier& verifier,
                   const Archiver& archiver, const Logger& logger);

    /**
     * @brief Creates a new backup set under @p outDir.
     *
     * @param liveSource Live database file (read-only).
     * @param formats Formats to produce, in order.
     * @param outDir Category root; the set directory is created inside it.
     * @param summary Receives per-format outcomes.
     * @return std::expected<BackupSet, std::string> The set, or an error if the primary format failed
     *         or a resource limit was hit.
     */
    std::expected<BackupSet, std::string> produce(const fs::path& liveSource, const std::vector<ArtifactFormat>& formats,
                                                  const fs::path& outDir, RunSummary& summary) const;

    /**
     * @brief Describes what produce() would do, without writing anything.
     */
    std::string plan(const fs::path& liveSource, const std::vector<ArtifactFormat>& formats,
                     const fs::path& outDir) const;

    /**
     * @brief Format whose failure fails the run.
     */
    static ArtifactFormat primaryFormat(const std::vector<ArtifactFormat>& formats);

    void setClock(Clock clock) { clock_ = std::move(clock); }
    void setStrategyFactory(StrategyFactory factory) { factory_ = std::move(factory); }
    void setSpaceProbe(SpaceProbe probe) { spaceProbe_ = std::move(probe); }

private:
    std::expected<BackupArtifact, std::string> produceFormat(ArtifactFormat format, const fs::path& liveSource,
                                                             const fs::path& stagingDir, const BackupSet& set) const;

    const BackupConfig& config_;
    const ArtifactCodec& codec_;
    const IntegrityVerifier& verifier_;
    const Archiver& archiver_;
    const Logger& logger_;
    Clock clock_;
    StrategyFactory factory_;
    SpaceProbe spaceProbe_;
};

#endif // BACKUP_PRODUCER_HPP
