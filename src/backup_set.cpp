#include "backup_set.hpp"
#include "file_utils.hpp"
#include <algorithm>
#include <format>
#include <fstream>
#include <memory>
#include <sstream>

namespace {

constexpr const char* kManifestName = "backup-manifest.json";

const std::vector<std::pair<ArtifactFormat, const char*>>& formatNames() {
    static const std::vector<std::pair<ArtifactFormat, const char*>> names = {
        {ArtifactFormat::Native, "native"},
        {ArtifactFormat::Portable, "portable"},
        {ArtifactFormat::Structured, "structured"},
        {ArtifactFormat::Tabular, "tabular"},
        {ArtifactFormat::Schema, "schema"},
        {ArtifactFormat::VolumeArchive, "volume"},
        {ArtifactFormat::ConfigArchive, "config"},
        {ArtifactFormat::FullArchive, "archive"},
    };
    return names;
}

} // namespace

const char* toString(BackupCategory category) {
    return category == BackupCategory::Database ? "database" : "full";
}

const char* toString(ArtifactFormat format) {
    for (const auto& [value, name] : formatNames()) {
        if (value == format) {
            return name;
        }
    }
    return "unknown";
}

std::optional<ArtifactFormat> parseFormat(const std::string& name) {
    for (const auto& format : allDatabaseFormats()) {
        if (name == toString(format)) {
            return format;
        }
    }
    return std::nullopt;
}

std::vector<ArtifactFormat> allDatabaseFormats() {
    return {ArtifactFormat::Native, ArtifactFormat::Portable, ArtifactFormat::Structured, ArtifactFormat::Tabular,
            ArtifactFormat::Schema};
}

std::expected<std::vector<ArtifactFormat>, std::string> parseFormatList(const std::string& list) {
    if (list == "all") {
        return allDatabaseFormats();
    }
    std::vector<ArtifactFormat> formats;
    std::istringstream items(list);
    std::string item;
    while (std::getline(items, item, ',')) {
        auto format = parseFormat(item);
        if (!format) {
            return std::unexpected(std::format("Unknown format: {} (expected native, portable, structured, "
                                               "tabular, schema or all)", item));
        }
        if (std::ranges::find(formats, *format) == formats.end()) {
            formats.push_back(*format);
        }
    }
    if (formats.empty()) {
        return std::unexpected("No backup format selected");
    }
    return formats;
}

std::string plainExtension(ArtifactFormat format) {
    switch (format) {
        case ArtifactFormat::Native:        return ".sqlite3";
        case ArtifactFormat::Portable:      return ".sql";
        case ArtifactFormat::Structured:    return ".json";
        case ArtifactFormat::Tabular:       return ".tar";
        case ArtifactFormat::Schema:        return ".sql";
        case ArtifactFormat::VolumeArchive: return ".tar.gz";
        case ArtifactFormat::ConfigArchive: return ".tar";
        case ArtifactFormat::FullArchive:   return ".tar";
    }
    return ".bin";
}

std::string plainArtifactName(BackupCategory category, ArtifactFormat format, const std::string& setId) {
    return std::format("{}-{}-{}{}", toString(category), toString(format), setId, plainExtension(format));
}

std::optional<ArtifactFormat> formatFromArtifactName(const std::string& fileName) {
    for (const char* category : {"database-", "full-"}) {
        if (!fileName.starts_with(category)) {
            continue;
        }
        std::string rest = fileName.substr(std::string(category).size());
        for (const auto& [value, name] : formatNames()) {
            if (rest.starts_with(std::string(name) + "-")) {
                return value;
            }
        }
    }
    return std::nullopt;
}

bool BackupSet::verified() const {
    return !artifacts.empty() &&
           std::ranges::all_of(artifacts, [](const BackupArtifact& artifact) { return artifact.verified; });
}

const BackupArtifact* BackupSet::find(ArtifactFormat format) const {
    auto it = std::ranges::find_if(artifacts, [format](const BackupArtifact& a) { return a.format == format; });
    return it == artifacts.end() ? nullptr : &*it;
}

std::expected<void, std::string> writeManifest(const BackupSet& set) {
    Json::Value manifest = set.metadata.isObject() ? set.metadata : Json::Value(Json::objectValue);
    manifest["category"] = toString(set.category);
    manifest["id"] = set.id;
    manifest["created"] = isoTimestamp(set.createdAt);
    manifest["verified"] = set.verified();

    Json::Value artifacts(Json::arrayValue);
    for (const auto& artifact : set.artifacts) {
        Json::Value entry;
        entry["format"] = toString(artifact.format);
        entry["file"] = artifact.path.filename().string();
        entry["plain_size"] = Json::UInt64(artifact.sizes.plain);
        entry["compressed_size"] = Json::UInt64(artifact.sizes.compressed);
        entry["encrypted_size"] = Json::UInt64(artifact.sizes.encrypted);
        entry["verified"] = artifact.verified;
        entry["verification"] = artifact.verification;
        artifacts.append(entry);
    }
    manifest["artifacts"] = artifacts;

    const fs::path target = set.directory / kManifestName;
    fs::path partial = target;
    partial += ".partial";
    {
        std::ofstream out(partial);
        if (!out.is_open()) {
            return std::unexpected(std::format("Failed to open manifest for writing: {}", partial.string()));
        }
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
        writer->write(manifest, &out);
        out << '\n';
        if (!out) {
            return std::unexpected(std::format("Failed to write manifest {}", partial.string()));
        }
    }
    std::error_code ec;
    fs::rename(partial, target, ec);
    if (ec) {
        fs::remove(partial, ec);
        return std::unexpected(std::format("Failed to finalize manifest {}", target.string()));
    }
    return {};
}

std::optional<Json::Value> readManifest(const fs::path& setDirectory) {
    std::ifstream file(setDirectory / kManifestName);
    if (!file.is_open()) {
        return std::nullopt;
    }
    Json::Value manifest;
    Json::Reader reader;
    if (!reader.parse(file, manifest) || !manifest.isObject()) {
        return std::nullopt;
    }
    return manifest;
}

BackupCatalog::BackupCatalog(fs::path root, BackupCategory category) : root_(std::move(root)), category_(category) {}

std::optional<std::chrono::system_clock::time_point> BackupCatalog::parseSetId(const std::string& name) {
    if (name.size() < 15) {
        return std::nullopt;
    }
    if (name.size() > 15 && name[15] != '-') {
        return std::nullopt;
    }
    return parseTimestamp(name.substr(0, 15));
}

std::vector<CatalogEntry> BackupCatalog::list() const {
    std::vector<CatalogEntry> entries;
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return entries;
    }
    for (const auto& item : fs::directory_iterator(root_, fs::directory_options::skip_permission_denied, ec)) {
        if (!item.is_directory() || item.is_symlink()) {
            continue;
        }
        const std::string name = item.path().filename().string();
        if (auto created = parseSetId(name)) {
            entries.push_back({name, item.path(), *created});
        }
    }
    std::ranges::sort(entries, [](const CatalogEntry& a, const CatalogEntry& b) {
        return a.createdAt != b.createdAt ? a.createdAt < b.createdAt : a.id < b.id;
    });
    return entries;
}

std::optional<CatalogEntry> BackupCatalog::latest() const {
    auto entries = list();
    if (entries.empty()) {
        return std::nullopt;
    }
    return entries.back();
}

std::optional<fs::path> BackupCatalog::artifactIn(const CatalogEntry& entry, ArtifactFormat format) const {
    const std::string prefix = std::format("{}-{}-", toString(category_), toString(format));
    std::error_code ec;
    for (const auto& item : fs::directory_iterator(entry.directory, ec)) {
        const std::string name = item.path().filename().string();
        if (item.is_regular_file() && name.starts_with(prefix) && name.ends_with(".gpg")) {
            return item.path();
        }
    }
    return std::nullopt;
}

std::optional<fs::path> BackupCatalog::latestArtifact(ArtifactFormat format) const {
    auto entries = list();
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        if (auto artifact = artifactIn(*it, format)) {
            return artifact;
        }
    }
    return std::nullopt;
}

bool BackupCatalog::isVerified(const CatalogEntry& entry) const {
    auto manifest = readManifest(entry.directory);
    return manifest && (*manifest)["verified"].asBool();
}
