#include "verifier.hpp"
#include "file_utils.hpp"
#include <algorithm>
#include <format>
#include <fstream>

namespace {

size_t indexOf(VerificationLayer layer) {
    return static_cast<size_t>(layer);
}

std::expected<Json::Value, std::string> parseJsonFile(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(std::format("Cannot open {}", path.filename().string()));
    }
    Json::Value root;
    Json::Reader reader;
    if (!reader.parse(file, root)) {
        return std::unexpected(std::format("Invalid JSON in {}: {}", path.filename().string(),
                                           reader.getFormattedErrorMessages()));
    }
    return root;
}

} // namespace

const char* toString(VerificationLayer layer) {
    switch (layer) {
        case VerificationLayer::Existence:  return "existence";
        case VerificationLayer::Decrypt:    return "decrypt";
        case VerificationLayer::Decompress: return "decompress";
        case VerificationLayer::Structure:  return "structure";
        case VerificationLayer::CrossCheck: return "cross-check";
    }
    return "unknown";
}

const char* toString(LayerStatus status) {
    switch (status) {
        case LayerStatus::NotRun:  return "not-run";
        case LayerStatus::Passed:  return "passed";
        case LayerStatus::Failed:  return "failed";
        case LayerStatus::Warning: return "warning";
        case LayerStatus::Skipped: return "skipped";
    }
    return "unknown";
}

VerificationResult::VerificationResult() {
    for (auto layer : {VerificationLayer::Existence, VerificationLayer::Decrypt, VerificationLayer::Decompress,
                       VerificationLayer::Structure, VerificationLayer::CrossCheck}) {
        layers_[indexOf(layer)].layer = layer;
    }
}

void VerificationResult::set(VerificationLayer layer, LayerStatus status, std::string detail) {
    layers_[indexOf(layer)].status = status;
    layers_[indexOf(layer)].detail = std::move(detail);
}

LayerStatus VerificationResult::status(VerificationLayer layer) const {
    return layers_[indexOf(layer)].status;
}

const LayerResult& VerificationResult::layer(VerificationLayer layer) const {
    return layers_[indexOf(layer)];
}

bool VerificationResult::passed() const {
    return !firstFailure() && status(VerificationLayer::Structure) == LayerStatus::Passed;
}

bool VerificationResult::hasWarnings() const {
    return std::ranges::any_of(layers_, [](const LayerResult& r) { return r.status == LayerStatus::Warning; });
}

std::optional<LayerResult> VerificationResult::firstFailure() const {
    for (const auto& result : layers_) {
        if (result.status == LayerStatus::Failed) {
            return result;
        }
    }
    return std::nullopt;
}

std::string VerificationResult::describe() const {
    std::string text;
    for (const auto& result : layers_) {
        if (!text.empty()) {
            text += ' ';
        }
        text += std::format("{}={}", toString(result.layer), toString(result.status));
        if (!result.detail.empty() && (result.status == LayerStatus::Failed || result.status == LayerStatus::Warning)) {
            text += std::format("({})", result.detail);
        }
    }
    return text;
}

std::string compareStats(const DatabaseStats& recovered, const DatabaseStats& live) {
    std::string mismatches;
    auto note = [&mismatches](const std::string& item) {
        mismatches += mismatches.empty() ? item : "; " + item;
    };
    if (recovered.tableCount != live.tableCount) {
        note(std::format("table count {} vs live {}", recovered.tableCount, live.tableCount));
    }
    for (const auto& [table, rows] : recovered.rowCounts) {
        auto it = live.rowCounts.find(table);
        if (it != live.rowCounts.end() && it->second != rows) {
            note(std::format("{} has {} rows vs live {}", table, rows, it->second));
        }
    }
    return mismatches;
}

IntegrityVerifier::IntegrityVerifier(const ArtifactCodec& codec, const DatabaseChecker& checker,
                                     const Archiver& archiver, fs::path scratchParent, const Logger& logger)
    : codec_(codec), checker_(checker), archiver_(archiver), scratchParent_(std::move(scratchParent)),
      logger_(logger) {}

VerificationResult IntegrityVerifier::verify(const fs::path& artifact, ArtifactFormat format,
                                             const std::optional<fs::path>& liveSource) const {
    VerificationResult result;
    const std::string name = artifact.filename().string();

    std::error_code ec;
    if (!fs::is_regular_file(artifact, ec)) {
        result.set(VerificationLayer::Existence, LayerStatus::Failed, "artifact not found");
    } else if (fs::file_size(artifact, ec) == 0 || ec) {
        result.set(VerificationLayer::Existence, LayerStatus::Failed, "artifact is empty");
    } else {
        result.set(VerificationLayer::Existence, LayerStatus::Passed);
    }
    if (result.firstFailure()) {
        logger_.warning(std::format("Verification of {} failed: {}", name, result.describe()));
        return result;
    }

    auto scratch = ScopedTempDir::create(scratchParent_, "vaultkeeper-verify-", &logger_);
    if (!scratch) {
        result.set(VerificationLayer::Decrypt, LayerStatus::Failed, scratch.error());
        logger_.warning(std::format("Verification of {} failed: {}", name, result.describe()));
        return result;
    }

    auto decrypted = codec_.decryptToTemp(artifact, scratch->path());
    if (!decrypted) {
        result.set(VerificationLayer::Decrypt, LayerStatus::Failed, decrypted.error());
    } else {
        result.set(VerificationLayer::Decrypt, LayerStatus::Passed);
        auto plain = codec_.decompress(*decrypted);
        if (!plain) {
            result.set(VerificationLayer::Decompress, LayerStatus::Failed, plain.error());
        } else {
            result.set(VerificationLayer::Decompress, LayerStatus::Passed);
            std::error_code removeEc;
            fs::remove(*decrypted, removeEc);
            checkStructure(*plain, format, scratch->path(), liveSource, result);
        }
    }

    if (result.passed()) {
        if (result.hasWarnings()) {
            logger_.warning(std::format("Verified {} with warnings: {}", name, result.describe()));
        } else {
            logger_.info(std::format("Verified {}", name));
        }
    } else {
        logger_.warning(std::format("Verification of {} failed: {}", name, result.describe()));
    }
    return result;
}

void IntegrityVerifier::checkStructure(const fs::path& plain, ArtifactFormat format, const fs::path& scratch,
                                       const std::optional<fs::path>& liveSource, VerificationResult& result) const {
    auto fail = [&result](const std::string& detail) {
        result.set(VerificationLayer::Structure, LayerStatus::Failed, detail);
    };

    switch (format) {
        case ArtifactFormat::Native: {
            if (auto ok = checker_.integrityCheck(plain); !ok) {
                return fail(ok.error());
            }
            result.set(VerificationLayer::Structure, LayerStatus::Passed);
            crossCheck(checker_.stats(plain), liveSource, false, result);
            return;
        }
        case ArtifactFormat::Portable:
        case ArtifactFormat::Schema: {
            const fs::path replay = scratch / "replay.sqlite3";
            if (auto replayed = checker_.replayDump(plain, replay); !replayed) {
                return fail(replayed.error());
            }
            if (auto ok = checker_.integrityCheck(replay); !ok) {
                return fail(ok.error());
            }
            result.set(VerificationLayer::Structure, LayerStatus::Passed);
            crossCheck(checker_.stats(replay), liveSource, format == ArtifactFormat::Schema, result);
            return;
        }
        case ArtifactFormat::Structured: {
            auto root = parseJsonFile(plain);
            if (!root) {
                return fail(root.error());
            }
            const Json::Value& data = (*root)["database_export"]["data"];
            if (!data.isObject()) {
                return fail("export has no database_export.data object");
            }
            result.set(VerificationLayer::Structure, LayerStatus::Passed);
            DatabaseStats stats;
            stats.tableCount = static_cast<int>(data.size());
            for (const auto& table : data.getMemberNames()) {
                stats.rowCounts[table] = static_cast<std::int64_t>(data[table].size());
            }
            crossCheck(stats, liveSource, false, result);
            return;
        }
        case ArtifactFormat::Tabular: {
            const fs::path extracted = scratch / "extract";
            if (auto done = archiver_.extract(plain, extracted); !done) {
                return fail(done.error());
            }
            auto manifest = parseJsonFile(extracted / "csv-exports" / "manifest.json");
            if (!manifest) {
                return fail(std::format("bundle manifest missing or invalid: {}", manifest.error()));
            }
            result.set(VerificationLayer::Structure, LayerStatus::Passed);
            if (!liveSource) {
                result.set(VerificationLayer::CrossCheck, LayerStatus::Skipped);
                return;
            }
            auto live = checker_.stats(*liveSource);
            if (!live) {
                result.set(VerificationLayer::CrossCheck, LayerStatus::Warning, live.error());
                return;
            }
            // Empty tables are not exported, so only row counts are compared.
            DatabaseStats stats;
            stats.tableCount = live->tableCount;
            const Json::Value& counts = (*manifest)["row_counts"];
            for (const auto& table : counts.getMemberNames()) {
                stats.rowCounts[table] = counts[table].asInt64();
            }
            std::string mismatch = compareStats(stats, *live);
            result.set(VerificationLayer::CrossCheck, mismatch.empty() ? LayerStatus::Passed : LayerStatus::Warning,
                       mismatch);
            return;
        }
        case ArtifactFormat::VolumeArchive:
        case ArtifactFormat::ConfigArchive:
        case ArtifactFormat::FullArchive: {
            auto entries = archiver_.verify(plain);
            if (!entries) {
                return fail(entries.error());
            }
            result.set(VerificationLayer::Structure, LayerStatus::Passed, std::format("{} entries", *entries));
            result.set(VerificationLayer::CrossCheck, LayerStatus::Skipped);
            return;
        }
    }
}

void IntegrityVerifier::crossCheck(const std::expected<DatabaseStats, std::string>& recovered,
                                   const std::optional<fs::path>& liveSource, bool schemaOnly,
                                   VerificationResult& result) const {
    if (!liveSource) {
        result.set(VerificationLayer::CrossCheck, LayerStatus::Skipped);
        return;
    }
    if (!recovered) {
        result.set(VerificationLayer::CrossCheck, LayerStatus::Warning, recovered.error());
        return;
    }
    auto live = checker_.stats(*liveSource);
    if (!live) {
        result.set(VerificationLayer::CrossCheck, LayerStatus::Warning, live.error());
        return;
    }
    std::string mismatch;
    if (schemaOnly) {
        if (recovered->tableCount != live->tableCount) {
            mismatch = std::format("table count {} vs live {}", recovered->tableCount, live->tableCount);
        }
    } else {
        mismatch = compareStats(*recovered, *live);
    }
    if (!mismatch.empty()) {
        logger_.warning(std::format("Cross-check mismatch (live database may have changed): {}", mismatch));
    }
    result.set(VerificationLayer::CrossCheck, mismatch.empty() ? LayerStatus::Passed : LayerStatus::Warning, mismatch);
}
