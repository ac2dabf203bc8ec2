/**
 * @file verifier.hpp
 * @brief Layered integrity verification of encrypted artifacts.
 *
 * Layers run in order: existence, decrypt, decompress, format-specific structure
 * check, and an optional cross-check against the live database. A layer only runs
 * if the previous one passed. Decrypted material lives in a private scratch
 * directory that is wiped before verify() returns.
 */

#ifndef VERIFIER_HPP
#define VERIFIER_HPP

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include "archiver.hpp"
#include "artifact_codec.hpp"
#include "backup_set.hpp"
#include "database.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

enum class VerificationLayer {
    Existence,
    Decrypt,
    Decompress,
    Structure,
    CrossCheck
};

enum class LayerStatus {
    NotRun,
    Passed,
    Failed,
    Warning, ///< Only used for the cross-check: a mismatch is reported, not fatal.
    Skipped
};

const char* toString(VerificationLayer layer);
const char* toString(LayerStatus status);

struct LayerResult {
    VerificationLayer layer;
    LayerStatus status = LayerStatus::NotRun;
    std::string detail;
};

/**
 * @brief Per-layer outcome of one verification. Transient; summarized into the set manifest.
 */
class VerificationResult {
public:
    VerificationResult();

    void set(VerificationLayer layer, LayerStatus status, std::string detail = {});
    LayerStatus status(VerificationLayer layer) const;
    const LayerResult& layer(VerificationLayer layer) const;

    /**
     * @brief True when no layer failed and the structure check passed.
     */
    bool passed() const;

    bool hasWarnings() const;
    std::optional<LayerResult> firstFailure() const;

    /**
     * @brief One-line summary ("existence=passed decrypt=failed(...) ...").
     */
    std::string describe() const;

private:
    std::array<LayerResult, 5> layers_;
};

/**
 * @brief Compares coarse statistics of a recovered database with the live one.
 *
 * @return Empty string when consistent, otherwise a description of the mismatches.
 */
std::string compareStats(const DatabaseStats& recovered, const DatabaseStats& live);

class IntegrityVerifier {
public:
    /**
     * @param codec Decrypt/decompress pipeline.
     * @param checker Engine-level database checks.
     * @param archiver Archive reader for bundles and full snapshots.
     * @param scratchParent Parent of the private scratch directory used per verification.
     * @param logger Logger for per-layer results.
     */
    IntegrityVerifier(const ArtifactCodec& codec, const DatabaseChecker& checker, const Archiver& archiver,
                      fs::path scratchParent, const Logger& logger);

    /**
     * @brief Verifies one encrypted artifact.
     *
     * @param artifact Encrypted artifact path.
     * @param format Logical format of the payload.
     * @param liveSource Live database to cross-check against, if any.
     */
    VerificationResult verify(const fs::path& artifact, ArtifactFormat format,
                              const std::optional<fs::path>& liveSource = std::nullopt) const;

private:
    void checkStructure(const fs::path& plain, ArtifactFormat format, const fs::path& scratch,
                        const std::optional<fs::path>& liveSource, VerificationResult& result) const;
    void crossCheck(const std::expected<DatabaseStats, std::string>& recovered,
                    const std::optional<fs::path>& liveSource, bool schemaOnly, VerificationResult& result) const;

    const ArtifactCodec& codec_;
    const DatabaseChecker& checker_;
    const Archiver& archiver_;
    fs::path scratchParent_;
    const Logger& logger_;
};

#endif // VERIFIER_HPP
