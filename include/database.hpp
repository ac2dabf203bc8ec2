/**
 * @file database.hpp
 * @brief Thin RAII wrapper over the SQLite C API and the database consistency checker.
 *
 * Every backup path opens the live database read-only; only restore creates or
 * rewrites database files, and only in staging locations.
 *
 * @note Requires libsqlite3.
 */

#ifndef DATABASE_HPP
#define DATABASE_HPP

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace fs = std::filesystem;

enum class OpenMode {
    ReadOnly,  ///< Never writes; safe against an active writer.
    ReadWrite, ///< Existing file only.
    Create     ///< Creates the file if missing.
};

/**
 * @brief Owns one sqlite3 connection.
 */
class SqliteDatabase {
public:
    static std::expected<SqliteDatabase, std::string> open(const fs::path& path, OpenMode mode);

    SqliteDatabase(SqliteDatabase&& other) noexcept;
    SqliteDatabase& operator=(SqliteDatabase&& other) noexcept;
    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;
    ~SqliteDatabase();

    /**
     * @brief Runs one or more statements that return no rows.
     */
    std::expected<void, std::string> exec(const std::string& sql) const;

    /**
     * @brief Runs a query and calls @p onRow for every result row.
     */
    std::expected<void, std::string> forEachRow(const std::string& sql,
                                                const std::function<void(sqlite3_stmt*)>& onRow) const;

    /**
     * @brief Returns the first column of every row as text (NULL becomes "").
     */
    std::expected<std::vector<std::string>, std::string> queryColumn(const std::string& sql) const;

    /**
     * @brief Returns the first column of the first row as an integer.
     */
    std::expected<std::int64_t, std::string> queryInt(const std::string& sql) const;

    /**
     * @brief Names of user tables in creation order (sqlite_* tables excluded).
     */
    std::expected<std::vector<std::string>, std::string> userTables() const;

    sqlite3* handle() const { return db_; }
    const fs::path& path() const { return path_; }

private:
    SqliteDatabase(sqlite3* db, fs::path path) : db_(db), path_(std::move(path)) {}

    sqlite3* db_ = nullptr;
    fs::path path_;
};

/**
 * @brief Quotes an identifier for SQL ("my ""table"").
 */
std::string quoteIdentifier(const std::string& name);

/**
 * @brief Coarse content summary used to cross-check a backup against the live source.
 */
struct DatabaseStats {
    int tableCount = 0;
    std::map<std::string, std::int64_t> rowCounts;
};

/**
 * @brief Interface for engine-level database checks.
 */
class DatabaseChecker {
public:
    virtual ~DatabaseChecker() = default;

    /**
     * @brief Runs the engine's consistency check on the database at @p path.
     */
    virtual std::expected<void, std::string> integrityCheck(const fs::path& path) const = 0;

    /**
     * @brief Replays a SQL text dump into a new database at @p target.
     */
    virtual std::expected<void, std::string> replayDump(const fs::path& dump, const fs::path& target) const = 0;

    /**
     * @brief Collects table and row counts without modifying the database.
     */
    virtual std::expected<DatabaseStats, std::string> stats(const fs::path& path) const = 0;
};

class SqliteDatabaseChecker : public DatabaseChecker {
public:
    std::expected<void, std::string> integrityCheck(const fs::path& path) const override;
    std::expected<void, std::string> replayDump(const fs::path& dump, const fs::path& target) const override;
    std::expected<DatabaseStats, std::string> stats(const fs::path& path) const override;
};

#endif // DATABASE_HPP
