/**
 * @file backup_set.hpp
 * @brief Backup sets, artifact naming and the on-disk catalog.
 *
 * A backup set is one timestamped directory ("YYYYMMDD-HHMMSS", optionally
 * followed by "-<label>") under a category root. It holds the encrypted
 * artifacts of one run and a plaintext backup-manifest.json without secrets.
 * Artifact file names encode category, format and timestamp:
 * "<category>-<format>-<timestamp>[-label].<ext>.gz.gpg".
 */

#ifndef BACKUP_SET_HPP
#define BACKUP_SET_HPP

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "artifact_codec.hpp"

namespace fs = std::filesystem;

enum class BackupCategory {
    Database,
    Full
};

enum class ArtifactFormat {
    Native,        ///< Engine-native database snapshot.
    Portable,      ///< SQL text dump.
    Structured,    ///< JSON export.
    Tabular,       ///< Per-table CSV bundle.
    Schema,        ///< Schema-only SQL.
    VolumeArchive, ///< One runtime volume.
    ConfigArchive, ///< Allow-listed configuration tree.
    FullArchive    ///< Complete assembled snapshot.
};

const char* toString(BackupCategory category);
const char* toString(ArtifactFormat format);

/**
 * @brief Parses a database format name ("native", "portable", "structured", "tabular", "schema").
 */
std::optional<ArtifactFormat> parseFormat(const std::string& name);

/**
 * @brief Parses a comma separated list of formats, or "all".
 */
std::expected<std::vector<ArtifactFormat>, std::string> parseFormatList(const std::string& list);

/**
 * @brief Every database format, in production order.
 */
std::vector<ArtifactFormat> allDatabaseFormats();

/**
 * @brief Extension of the plaintext payload, including the dot (".sqlite3", ".sql", ...).
 */
std::string plainExtension(ArtifactFormat format);

/**
 * @brief Plaintext payload name, e.g. "database-native-20240131-120000.sqlite3".
 */
std::string plainArtifactName(BackupCategory category, ArtifactFormat format, const std::string& setId);

/**
 * @brief Recovers the format encoded in an artifact file name.
 */
std::optional<ArtifactFormat> formatFromArtifactName(const std::string& fileName);

/**
 * @brief One encrypted file inside a set.
 */
struct BackupArtifact {
    ArtifactFormat format = ArtifactFormat::Native;
    fs::path path;
    ArtifactSizes sizes;
    bool verified = false;          ///< All verification layers passed.
    std::string verification;       ///< One-line verification outcome.
};

/**
 * @brief One timestamped backup run.
 */
struct BackupSet {
    BackupCategory category = BackupCategory::Database;
    std::string id;                 ///< Directory name.
    fs::path directory;
    std::chrono::system_clock::time_point createdAt;
    std::vector<BackupArtifact> artifacts;
    Json::Value metadata;           ///< Extra manifest fields (source, components, ...).

    /**
     * @brief True when the set has artifacts and every one of them passed verification.
     */
    bool verified() const;

    const BackupArtifact* find(ArtifactFormat format) const;
};

/**
 * @brief Writes backup-manifest.json into the set directory.
 */
std::expected<void, std::string> writeManifest(const BackupSet& set);

/**
 * @brief Reads backup-manifest.json from a set directory.
 */
std::optional<Json::Value> readManifest(const fs::path& setDirectory);

/**
 * @brief A set directory discovered on disk.
 */
struct CatalogEntry {
    std::string id;
    fs::path directory;
    std::chrono::system_clock::time_point createdAt;
};

/**
 * @brief Read-only view of the sets under one category root.
 */
class BackupCatalog {
public:
    BackupCatalog(fs::path root, BackupCategory category);

    /**
     * @brief All set directories, oldest first. Names that do not start with a timestamp are ignored.
     */
    std::vector<CatalogEntry> list() const;

    std::optional<CatalogEntry> latest() const;

    /**
     * @brief Newest artifact of @p format across all sets.
     */
    std::optional<fs::path> latestArtifact(ArtifactFormat format) const;

    /**
     * @brief Artifact of @p format inside one set, if present.
     */
    std::optional<fs::path> artifactIn(const CatalogEntry& entry, ArtifactFormat format) const;

    /**
     * @brief Reads the set-level verified attribute from the manifest (false if absent).
     */
    bool isVerified(const CatalogEntry& entry) const;

    /**
     * @brief Extracts the timestamp of a set directory name ("20240131-120000-weekly").
     */
    static std::optional<std::chrono::system_clock::time_point> parseSetId(const std::string& name);

    const fs::path& root() const { return root_; }
    BackupCategory category() const { return category_; }

private:
    fs::path root_;
    BackupCategory category_;
};

#endif // BACKUP_SET_HPP
