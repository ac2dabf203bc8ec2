#include "database_backup.hpp"
#include "database.hpp"
#include "file_utils.hpp"
#include <chrono>
#include <format>
#include <fstream>
#include <memory>
#include <set>
#include <stdexcept>

namespace {

std::expected<std::vector<std::string>, std::string> tableColumns(const SqliteDatabase& db, const std::string& table) {
    std::vector<std::string> columns;
    auto done = db.forEachRow(std::format("PRAGMA table_info({})", quoteIdentifier(table)), [&columns](sqlite3_stmt* stmt) {
        columns.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)));
    });
    if (!done) {
        return std::unexpected(done.error());
    }
    return columns;
}

std::string joinQuoted(const std::vector<std::string>& columns) {
    std::string joined;
    for (const auto& column : columns) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += quoteIdentifier(column);
    }
    return joined;
}

std::string hexEncode(const void* data, int size) {
    static const char digits[] = "0123456789abcdef";
    const auto* bytes = static_cast<const unsigned char*>(data);
    std::string out;
    out.reserve(static_cast<size_t>(size) * 2);
    for (int i = 0; i < size; ++i) {
        out += digits[bytes[i] >> 4];
        out += digits[bytes[i] & 0x0f];
    }
    return out;
}

std::string nowUtc() {
    return isoTimestamp(std::chrono::system_clock::now());
}

std::expected<void, std::string> finishStream(std::ofstream& out, const fs::path& path) {
    out.flush();
    if (!out) {
        return std::unexpected(std::format("Write error on {}", path.string()));
    }
    out.close();
    return {};
}

/**
 * Writes INSERT statements for every row of @p table as SQL literals produced by quote().
 */
std::expected<void, std::string> dumpRows(const SqliteDatabase& db, const std::string& table, std::ofstream& out) {
    auto columns = tableColumns(db, table);
    if (!columns) {
        return std::unexpected(columns.error());
    }
    if (columns->empty()) {
        return {};
    }
    std::string values;
    for (const auto& column : *columns) {
        if (!values.empty()) {
            values += " || ',' || ";
        }
        values += std::format("quote({})", quoteIdentifier(column));
    }
    const std::string prefix = std::format("INSERT INTO {}({}) VALUES(", quoteIdentifier(table), joinQuoted(*columns));
    return db.forEachRow(std::format("SELECT {} FROM {}", values, quoteIdentifier(table)), [&](sqlite3_stmt* stmt) {
        const unsigned char* text = sqlite3_column_text(stmt, 0);
        out << prefix << (text ? reinterpret_cast<const char*>(text) : "NULL") << ");\n";
    });
}

} // namespace

std::expected<fs::path, std::string> NativeBackupStrategy::execute(const fs::path& liveDb, const fs::path& outputPath) {
    auto source = SqliteDatabase::open(liveDb, OpenMode::ReadOnly);
    if (!source) {
        return std::unexpected(source.error());
    }
    auto target = SqliteDatabase::open(outputPath, OpenMode::Create);
    if (!target) {
        return std::unexpected(target.error());
    }

    sqlite3_backup* backup = sqlite3_backup_init(target->handle(), "main", source->handle(), "main");
    if (!backup) {
        return std::unexpected(std::format("Cannot start online backup: {}", sqlite3_errmsg(target->handle())));
    }
    int rc = SQLITE_OK;
    do {
        rc = sqlite3_backup_step(backup, 256);
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            sqlite3_sleep(100);
        }
    } while (rc == SQLITE_OK || rc == SQLITE_BUSY || rc == SQLITE_LOCKED);
    sqlite3_backup_finish(backup);

    if (rc != SQLITE_DONE) {
        std::error_code ec;
        fs::remove(outputPath, ec);
        return std::unexpected(std::format("Online backup failed: {}", sqlite3_errstr(rc)));
    }
    return outputPath;
}

std::expected<fs::path, std::string> PortableDumpStrategy::execute(const fs::path& liveDb, const fs::path& outputPath) {
    auto db = SqliteDatabase::open(liveDb, OpenMode::ReadOnly);
    if (!db) {
        return std::unexpected(db.error());
    }
    std::ofstream out(outputPath, std::ios::trunc);
    if (!out) {
        return std::unexpected(std::format("Failed to open {} for writing", outputPath.string()));
    }

    out << "-- VaultKeeper database backup (portable SQL format)\n"
        << "-- Created: " << nowUtc() << '\n'
        << "-- SQLite version: " << sqlite3_libversion() << '\n'
        << "-- Source: " << liveDb.filename().string() << " (" << humanSize(pathSize(liveDb)) << ")\n"
        << "-- Restore: sqlite3 database.db < " << outputPath.filename().string() << "\n--\n"
        << "PRAGMA foreign_keys=OFF;\n"
        << "BEGIN TRANSACTION;\n\n";

    if (auto begun = db->exec("BEGIN DEFERRED"); !begun) {
        return std::unexpected(begun.error());
    }

    struct SchemaRow {
        std::string type;
        std::string name;
        std::string sql;
    };
    std::vector<SchemaRow> schema;
    auto listed = db->forEachRow("SELECT type, name, sql FROM sqlite_master WHERE sql NOT NULL ORDER BY rowid",
                                 [&schema](sqlite3_stmt* stmt) {
        schema.push_back({reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)),
                          reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)),
                          reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2))});
    });
    if (!listed) {
        return std::unexpected(listed.error());
    }

    bool hasSequence = false;
    for (const auto& row : schema) {
        if (row.type != "table") {
            continue;
        }
        if (row.name == "sqlite_sequence") {
            hasSequence = true;
            continue;
        }
        if (row.name.starts_with("sqlite_")) {
            continue;
        }
        out << row.sql << ";\n";
        if (auto rows = dumpRows(*db, row.name, out); !rows) {
            return std::unexpected(rows.error());
        }
    }
    if (hasSequence) {
        out << "DELETE FROM sqlite_sequence;\n";
        if (auto rows = dumpRows(*db, "sqlite_sequence", out); !rows) {
            return std::unexpected(rows.error());
        }
    }
    for (const auto& row : schema) {
        if (row.type != "table" && !row.name.starts_with("sqlite_")) {
            out << row.sql << ";\n";
        }
    }

    auto userVersion = db->queryInt("PRAGMA user_version");
    if (!userVersion) {
        return std::unexpected(userVersion.error());
    }
    if (auto ended = db->exec("COMMIT"); !ended) {
        return std::unexpected(ended.error());
    }
    if (*userVersion != 0) {
        out << "PRAGMA user_version=" << *userVersion << ";\n";
    }

    out << "\n-- End of dump\n"
        << "COMMIT;\n"
        << "PRAGMA foreign_keys=ON;\n"
        << "-- Restore complete. Run 'PRAGMA integrity_check;' to verify.\n";
    if (auto finished = finishStream(out, outputPath); !finished) {
        return std::unexpected(finished.error());
    }
    return outputPath;
}

std::expected<fs::path, std::string> StructuredExportStrategy::execute(const fs::path& liveDb,
                                                                       const fs::path& outputPath) {
    auto db = SqliteDatabase::open(liveDb, OpenMode::ReadOnly);
    if (!db) {
        return std::unexpected(db.error());
    }
    if (auto begun = db->exec("BEGIN DEFERRED"); !begun) {
        return std::unexpected(begun.error());
    }

    Json::Value exportRoot;
    Json::Value& metadata = exportRoot["database_export"]["metadata"];
    metadata["created"] = nowUtc();
    metadata["generator"] = "VaultKeeper";
    metadata["format_version"] = "1.0";
    metadata["sqlite_version"] = sqlite3_libversion();
    metadata["database_file"] = liveDb.filename().string();
    metadata["database_size"] = Json::UInt64(pathSize(liveDb));
    metadata["encoding"] = "UTF-8";
    metadata["blob_encoding"] = "hex";

    Json::Value schema(Json::arrayValue);
    auto listed = db->forEachRow("SELECT name, type, sql FROM sqlite_master WHERE type IN ('table', 'index', 'view', "
                                 "'trigger') AND name NOT LIKE 'sqlite_%' ORDER BY rowid",
                                 [&schema](sqlite3_stmt* stmt) {
        Json::Value item;
        item["name"] = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        item["type"] = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        const unsigned char* sql = sqlite3_column_text(stmt, 2);
        item["sql"] = sql ? Json::Value(reinterpret_cast<const char*>(sql)) : Json::Value();
        schema.append(item);
    });
    if (!listed) {
        return std::unexpected(listed.error());
    }
    exportRoot["database_export"]["schema"] = schema;

    auto tables = db->userTables();
    if (!tables) {
        return std::unexpected(tables.error());
    }
    Json::Value& data = exportRoot["database_export"]["data"];
    data = Json::Value(Json::objectValue);
    for (const auto& table : *tables) {
        Json::Value rows(Json::arrayValue);
        auto read = db->forEachRow(std::format("SELECT * FROM {}", quoteIdentifier(table)), [&rows](sqlite3_stmt* stmt) {
            Json::Value row(Json::objectValue);
            for (int i = 0; i < sqlite3_column_count(stmt); ++i) {
                const char* column = sqlite3_column_name(stmt, i);
                switch (sqlite3_column_type(stmt, i)) {
                    case SQLITE_INTEGER:
                        row[column] = Json::Int64(sqlite3_column_int64(stmt, i));
                        break;
                    case SQLITE_FLOAT:
                        row[column] = sqlite3_column_double(stmt, i);
                        break;
                    case SQLITE_TEXT:
                        row[column] = reinterpret_cast<const char*>(sqlite3_column_text(stmt, i));
                        break;
                    case SQLITE_BLOB:
                        row[column] = hexEncode(sqlite3_column_blob(stmt, i), sqlite3_column_bytes(stmt, i));
                        break;
                    default:
                        row[column] = Json::Value();
                        break;
                }
            }
            rows.append(row);
        });
        if (!read) {
            return std::unexpected(read.error());
        }
        data[table] = rows;
    }
    if (auto ended = db->exec("COMMIT"); !ended) {
        return std::unexpected(ended.error());
    }

    std::ofstream out(outputPath, std::ios::trunc);
    if (!out) {
        return std::unexpected(std::format("Failed to open {} for writing", outputPath.string()));
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(exportRoot, &out);
    out << '\n';
    if (auto finished = finishStream(out, outputPath); !finished) {
        return std::unexpected(finished.error());
    }
    return outputPath;
}

std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

TabularExportStrategy::TabularExportStrategy(const Archiver& archiver) : archiver_(archiver) {}

std::expected<fs::path, std::string> TabularExportStrategy::execute(const fs::path& liveDb, const fs::path& outputPath) {
    auto db = SqliteDatabase::open(liveDb, OpenMode::ReadOnly);
    if (!db) {
        return std::unexpected(db.error());
    }

    fs::path csvDir = outputPath;
    csvDir += ".d";
    std::error_code ec;
    fs::create_directories(csvDir, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to create {}: {}", csvDir.string(), ec.message()));
    }
    auto cleanup = [&csvDir]() {
        std::error_code removeEc;
        fs::remove_all(csvDir, removeEc);
    };

    if (auto begun = db->exec("BEGIN DEFERRED"); !begun) {
        cleanup();
        return std::unexpected(begun.error());
    }
    auto tables = db->userTables();
    if (!tables) {
        cleanup();
        return std::unexpected(tables.error());
    }

    Json::Value exported(Json::arrayValue);
    Json::Value rowCounts(Json::objectValue);
    Json::Value files(Json::objectValue);
    std::set<std::string> usedNames{"manifest.json"};
    for (const auto& table : *tables) {
        auto count = db->queryInt(std::format("SELECT COUNT(*) FROM {}", quoteIdentifier(table)));
        if (!count) {
            cleanup();
            return std::unexpected(count.error());
        }
        if (*count == 0) {
            continue;
        }

        const std::string base = sanitizeName(table);
        std::string fileName = base + ".csv";
        for (int suffix = 2; !usedNames.insert(fileName).second; ++suffix) {
            fileName = std::format("{}-{}.csv", base, suffix);
        }
        const fs::path csvPath = csvDir / fileName;
        std::ofstream csv(csvPath, std::ios::trunc);
        if (!csv) {
            cleanup();
            return std::unexpected(std::format("Failed to open {} for writing", csvPath.string()));
        }
        bool header = false;
        auto read = db->forEachRow(std::format("SELECT * FROM {}", quoteIdentifier(table)), [&](sqlite3_stmt* stmt) {
            const int columns = sqlite3_column_count(stmt);
            if (!header) {
                for (int i = 0; i < columns; ++i) {
                    csv << (i ? "," : "") << csvField(sqlite3_column_name(stmt, i));
                }
                csv << "\r\n";
                header = true;
            }
            for (int i = 0; i < columns; ++i) {
                if (i) {
                    csv << ',';
                }
                switch (sqlite3_column_type(stmt, i)) {
                    case SQLITE_NULL:
                        break;
                    case SQLITE_BLOB:
                        csv << hexEncode(sqlite3_column_blob(stmt, i), sqlite3_column_bytes(stmt, i));
                        break;
                    default:
                        csv << csvField(reinterpret_cast<const char*>(sqlite3_column_text(stmt, i)));
                        break;
                }
            }
            csv << "\r\n";
        });
        if (!read) {
            cleanup();
            return std::unexpected(read.error());
        }
        if (auto finished = finishStream(csv, csvPath); !finished) {
            cleanup();
            return std::unexpected(finished.error());
        }
        exported.append(table);
        rowCounts[table] = Json::Int64(*count);
        files[table] = fileName;
    }
    if (auto ended = db->exec("COMMIT"); !ended) {
        cleanup();
        return std::unexpected(ended.error());
    }

    Json::Value manifest;
    manifest["export_metadata"]["created"] = nowUtc();
    manifest["export_metadata"]["database_file"] = liveDb.filename().string();
    manifest["export_metadata"]["database_size"] = Json::UInt64(pathSize(liveDb));
    manifest["export_metadata"]["sqlite_version"] = sqlite3_libversion();
    manifest["export_metadata"]["export_format"] = "csv";
    manifest["export_metadata"]["tables_exported"] = exported.size();
    manifest["tables"] = exported;
    manifest["row_counts"] = rowCounts;
    manifest["files"] = files;
    manifest["usage"]["encoding"] = "UTF-8";
    manifest["usage"]["quoting"] = "RFC 4180";

    {
        const fs::path manifestPath = csvDir / "manifest.json";
        std::ofstream out(manifestPath, std::ios::trunc);
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
        writer->write(manifest, &out);
        out << '\n';
        if (auto finished = finishStream(out, manifestPath); !finished) {
            cleanup();
            return std::unexpected(finished.error());
        }
    }

    ArchiveOptions options;
    options.rootName = "csv-exports";
    auto archived = archiver_.create(csvDir, outputPath, options);
    cleanup();
    if (!archived) {
        return std::unexpected(archived.error());
    }
    return outputPath;
}

std::expected<fs::path, std::string> SchemaOnlyStrategy::execute(const fs::path& liveDb, const fs::path& outputPath) {
    auto db = SqliteDatabase::open(liveDb, OpenMode::ReadOnly);
    if (!db) {
        return std::unexpected(db.error());
    }
    std::ofstream out(outputPath, std::ios::trunc);
    if (!out) {
        return std::unexpected(std::format("Failed to open {} for writing", outputPath.string()));
    }

    out << "-- VaultKeeper schema-only backup\n"
        << "-- Created: " << nowUtc() << '\n'
        << "-- Source: " << liveDb.filename().string() << '\n'
        << "-- Contains tables, indexes, triggers and views; no data.\n"
        << "-- Usage: sqlite3 new_database.db < " << outputPath.filename().string() << "\n--\n\n"
        << "PRAGMA foreign_keys=OFF;\n"
        << "BEGIN TRANSACTION;\n\n";

    auto written = db->forEachRow("SELECT sql FROM sqlite_master WHERE sql NOT NULL AND name NOT LIKE 'sqlite_%' "
                                  "ORDER BY CASE type WHEN 'table' THEN 0 ELSE 1 END, rowid",
                                  [&out](sqlite3_stmt* stmt) {
        out << reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)) << ";\n";
    });
    if (!written) {
        return std::unexpected(written.error());
    }

    auto userVersion = db->queryInt("PRAGMA user_version");
    auto applicationId = db->queryInt("PRAGMA application_id");
    if (!userVersion || !applicationId) {
        return std::unexpected(!userVersion ? userVersion.error() : applicationId.error());
    }
    out << "\nPRAGMA user_version=" << *userVersion << ";\n"
        << "PRAGMA application_id=" << *applicationId << ";\n"
        << "\nCOMMIT;\n"
        << "PRAGMA foreign_keys=ON;\n"
        << "-- End of schema backup\n";
    if (auto finished = finishStream(out, outputPath); !finished) {
        return std::unexpected(finished.error());
    }
    return outputPath;
}

std::unique_ptr<DatabaseBackupStrategy> makeBackupStrategy(ArtifactFormat format, const Archiver& archiver) {
    switch (format) {
        case ArtifactFormat::Native:     return std::make_unique<NativeBackupStrategy>();
        case ArtifactFormat::Portable:   return std::make_unique<PortableDumpStrategy>();
        case ArtifactFormat::Structured: return std::make_unique<StructuredExportStrategy>();
        case ArtifactFormat::Tabular:    return std::make_unique<TabularExportStrategy>(archiver);
        case ArtifactFormat::Schema:     return std::make_unique<SchemaOnlyStrategy>();
        default:
            break;
    }
    throw std::invalid_argument(std::format("{} is not a database format", toString(format)));
}
