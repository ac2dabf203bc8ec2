/**
 * @file database_backup.hpp
 * @brief Database extraction strategies for VaultKeeper.
 *
 * Each strategy turns the live SQLite database into one plaintext payload in a
 * staging directory. The live file is only ever opened read-only, so a running
 * writer is neither blocked nor modified.
 *
 * @note Requires libsqlite3; the tabular strategy also needs an Archiver (libarchive).
 */

#ifndef DATABASE_BACKUP_HPP
#define DATABASE_BACKUP_HPP

#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include "archiver.hpp"
#include "backup_set.hpp"

namespace fs = std::filesystem;

/**
 * @brief Interface for database extraction strategies.
 */
class DatabaseBackupStrategy {
public:
    virtual ~DatabaseBackupStrategy() = default;

    virtual ArtifactFormat format() const = 0;

    /**
     * @brief Extracts the live database into @p outputPath.
     *
     * @param liveDb Live database file (opened read-only).
     * @param outputPath Plaintext payload path inside the staging directory.
     * @return std::expected<fs::path, std::string> The written payload or an error message.
     */
    virtual std::expected<fs::path, std::string> execute(const fs::path& liveDb, const fs::path& outputPath) = 0;
};

/**
 * @brief Page-level copy through the SQLite online backup API.
 */
class NativeBackupStrategy : public DatabaseBackupStrategy {
public:
    ArtifactFormat format() const override { return ArtifactFormat::Native; }
    std::expected<fs::path, std::string> execute(const fs::path& liveDb, const fs::path& outputPath) override;
};

/**
 * @brief SQL text dump replayable with `sqlite3 new.db < dump.sql`.
 */
class PortableDumpStrategy : public DatabaseBackupStrategy {
public:
    ArtifactFormat format() const override { return ArtifactFormat::Portable; }
    std::expected<fs::path, std::string> execute(const fs::path& liveDb, const fs::path& outputPath) override;
};

/**
 * @brief JSON document with metadata, schema and per-table rows.
 *
 * BLOB values are written as lower-case hex strings.
 */
class StructuredExportStrategy : public DatabaseBackupStrategy {
public:
    ArtifactFormat format() const override { return ArtifactFormat::Structured; }
    std::expected<fs::path, std::string> execute(const fs::path& liveDb, const fs::path& outputPath) override;
};

/**
 * @brief One RFC 4180 CSV file per non-empty table plus manifest.json, bundled into a tar.
 */
class TabularExportStrategy : public DatabaseBackupStrategy {
public:
    explicit TabularExportStrategy(const Archiver& archiver);

    ArtifactFormat format() const override { return ArtifactFormat::Tabular; }
    std::expected<fs::path, std::string> execute(const fs::path& liveDb, const fs::path& outputPath) override;

private:
    const Archiver& archiver_;
};

/**
 * @brief Schema-only SQL (tables, indexes, triggers, views and header pragmas).
 */
class SchemaOnlyStrategy : public DatabaseBackupStrategy {
public:
    ArtifactFormat format() const override { return ArtifactFormat::Schema; }
    std::expected<fs::path, std::string> execute(const fs::path& liveDb, const fs::path& outputPath) override;
};

/**
 * @brief Creates the strategy for a database format.
 *
 * @throws std::invalid_argument If @p format is not a database format.
 */
std::unique_ptr<DatabaseBackupStrategy> makeBackupStrategy(ArtifactFormat format, const Archiver& archiver);

/**
 * @brief Escapes one CSV field (RFC 4180).
 */
std::string csvField(const std::string& value);

#endif // DATABASE_BACKUP_HPP
