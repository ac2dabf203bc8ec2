#include "database.hpp"
#include <format>
#include <fstream>
#include <sstream>

std::expected<SqliteDatabase, std::string> SqliteDatabase::open(const fs::path& path, OpenMode mode) {
    int flags = 0;
    switch (mode) {
        case OpenMode::ReadOnly:  flags = SQLITE_OPEN_READONLY; break;
        case OpenMode::ReadWrite: flags = SQLITE_OPEN_READWRITE; break;
        case OpenMode::Create:    flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE; break;
    }
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string err = std::format("Cannot open database {}: {}", path.string(),
                                      db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
        sqlite3_close(db);
        return std::unexpected(err);
    }
    sqlite3_busy_timeout(db, 5000);
    return SqliteDatabase(db, path);
}

SqliteDatabase::SqliteDatabase(SqliteDatabase&& other) noexcept : db_(other.db_), path_(std::move(other.path_)) {
    other.db_ = nullptr;
}

SqliteDatabase& SqliteDatabase::operator=(SqliteDatabase&& other) noexcept {
    if (this != &other) {
        sqlite3_close(db_);
        db_ = other.db_;
        path_ = std::move(other.path_);
        other.db_ = nullptr;
    }
    return *this;
}

SqliteDatabase::~SqliteDatabase() {
    sqlite3_close(db_);
}

std::expected<void, std::string> SqliteDatabase::exec(const std::string& sql) const {
    char* message = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &message) != SQLITE_OK) {
        std::string err = message ? message : sqlite3_errmsg(db_);
        sqlite3_free(message);
        return std::unexpected(std::format("SQL error in {}: {}", path_.filename().string(), err));
    }
    return {};
}

std::expected<void, std::string> SqliteDatabase::forEachRow(const std::string& sql,
                                                            const std::function<void(sqlite3_stmt*)>& onRow) const {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::unexpected(std::format("SQL error in {}: {}", path_.filename().string(), sqlite3_errmsg(db_)));
    }
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        onRow(stmt);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return std::unexpected(std::format("SQL error in {}: {}", path_.filename().string(), sqlite3_errmsg(db_)));
    }
    return {};
}

std::expected<std::vector<std::string>, std::string> SqliteDatabase::queryColumn(const std::string& sql) const {
    std::vector<std::string> values;
    auto done = forEachRow(sql, [&values](sqlite3_stmt* stmt) {
        const unsigned char* text = sqlite3_column_text(stmt, 0);
        values.emplace_back(text ? reinterpret_cast<const char*>(text) : "");
    });
    if (!done) {
        return std::unexpected(done.error());
    }
    return values;
}

std::expected<std::int64_t, std::string> SqliteDatabase::queryInt(const std::string& sql) const {
    std::int64_t value = 0;
    bool found = false;
    auto done = forEachRow(sql, [&](sqlite3_stmt* stmt) {
        if (!found) {
            value = sqlite3_column_int64(stmt, 0);
            found = true;
        }
    });
    if (!done) {
        return std::unexpected(done.error());
    }
    if (!found) {
        return std::unexpected(std::format("Query returned no rows: {}", sql));
    }
    return value;
}

std::expected<std::vector<std::string>, std::string> SqliteDatabase::userTables() const {
    return queryColumn("SELECT name FROM sqlite_master WHERE type = 'table' AND name NOT LIKE 'sqlite_%' "
                       "ORDER BY rowid");
}

std::string quoteIdentifier(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::expected<void, std::string> SqliteDatabaseChecker::integrityCheck(const fs::path& path) const {
    auto db = SqliteDatabase::open(path, OpenMode::ReadOnly);
    if (!db) {
        return std::unexpected(db.error());
    }
    auto rows = db->queryColumn("PRAGMA integrity_check");
    if (!rows) {
        return std::unexpected(rows.error());
    }
    if (rows->size() == 1 && rows->front() == "ok") {
        return {};
    }
    std::string detail = rows->empty() ? "no result" : rows->front();
    return std::unexpected(std::format("Integrity check failed for {}: {}", path.filename().string(), detail));
}

std::expected<void, std::string> SqliteDatabaseChecker::replayDump(const fs::path& dump, const fs::path& target) const {
    std::ifstream file(dump, std::ios::binary);
    if (!file) {
        return std::unexpected(std::format("Cannot read dump {}", dump.string()));
    }
    std::ostringstream sql;
    sql << file.rdbuf();

    std::error_code ec;
    fs::remove(target, ec);
    auto db = SqliteDatabase::open(target, OpenMode::Create);
    if (!db) {
        return std::unexpected(db.error());
    }
    if (auto replayed = db->exec(sql.str()); !replayed) {
        return std::unexpected(std::format("Dump replay failed: {}", replayed.error()));
    }
    return {};
}

std::expected<DatabaseStats, std::string> SqliteDatabaseChecker::stats(const fs::path& path) const {
    auto db = SqliteDatabase::open(path, OpenMode::ReadOnly);
    if (!db) {
        return std::unexpected(db.error());
    }
    auto tables = db->userTables();
    if (!tables) {
        return std::unexpected(tables.error());
    }
    DatabaseStats stats;
    stats.tableCount = static_cast<int>(tables->size());
    for (const auto& table : *tables) {
        auto count = db->queryInt(std::format("SELECT COUNT(*) FROM {}", quoteIdentifier(table)));
        if (!count) {
            return std::unexpected(count.error());
        }
        stats.rowCounts[table] = *count;
    }
    return stats;
}
