#include "backup_config.hpp"
#include <cstdlib>
#include "file_utils.hpp"
#include <format>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <utility>

namespace {

std::vector<std::string> stringList(const Json::Value& settings, const char* key, std::vector<std::string> fallback) {
    if (!settings.isMember(key)) {
        return fallback;
    }
    const Json::Value& list = settings[key];
    if (!list.isArray()) {
        throw std::runtime_error(std::format("Configuration key {} must be an array of strings", key));
    }
    std::vector<std::string> values;
    for (const auto& item : list) {
        if (!item.isString()) {
            throw std::runtime_error(std::format("Configuration key {} must contain only strings", key));
        }
        values.push_back(item.asString());
    }
    return values;
}

int boundedInt(const Json::Value& settings, const char* key, int fallback, int minimum) {
    const Json::Value& value = settings.get(key, fallback);
    int parsed = 0;
    if (value.isInt()) {
        parsed = value.asInt();
    } else if (value.isString()) {
        try {
            parsed = std::stoi(value.asString());
        } catch (const std::exception&) {
            throw std::runtime_error(std::format("Configuration key {} is not an integer: {}", key, value.asString()));
        }
    } else {
        throw std::runtime_error(std::format("Configuration key {} is not an integer", key));
    }
    if (parsed < minimum) {
        throw std::runtime_error(std::format("Configuration key {} must be >= {} (got {})", key, minimum, parsed));
    }
    return parsed;
}

bool flag(const Json::Value& settings, const char* key, bool fallback) {
    const Json::Value& value = settings.get(key, fallback);
    if (value.isBool()) {
        return value.asBool();
    }
    if (value.isString()) {
        const std::string text = value.asString();
        return text == "1" || text == "true" || text == "yes";
    }
    return value.isInt() ? value.asInt() != 0 : fallback;
}

Json::Value parseSettingsFile(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", configFile));
    }
    Json::Value settings;
    Json::Reader reader;
    if (!reader.parse(file, settings) || !settings.isObject()) {
        throw std::runtime_error(std::format("Failed to parse config file: {}", configFile));
    }
    return settings;
}

fs::path trimmed(const fs::path& path) {
    fs::path normal = path.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

/// True if @p inner is @p outer or lies below it, compared lexically.
bool sameOrWithin(const fs::path& inner, const fs::path& outer) {
    const fs::path relative = trimmed(inner).lexically_relative(trimmed(outer));
    return !relative.empty() && *relative.begin() != "..";
}

fs::path defaultRoot(const std::string& configFile) {
    fs::path parent = fs::absolute(configFile).parent_path();
    return parent.empty() ? fs::current_path() : parent;
}

SecretChain defaultSecretChain(const Json::Value& settings) {
    SecretChain chain;
    chain.add(std::make_unique<EnvironmentSecretSource>());
    chain.add(std::make_unique<JsonSecretSource>(settings));
    return chain;
}

} // namespace

std::expected<fs::path, std::string> resolveDatabaseUrl(const std::string& url, const fs::path& projectRoot) {
    static const std::string scheme = "sqlite://";
    if (url.empty()) {
        return std::unexpected("DATABASE_URL not found in configuration");
    }
    if (url.rfind(scheme, 0) != 0) {
        return std::unexpected(std::format("Unsupported DATABASE_URL format: {}", url));
    }
    std::string location = url.substr(scheme.size());
    if (auto query = location.find('?'); query != std::string::npos) {
        location.erase(query);
    }
    if (location.empty()) {
        return std::unexpected("DATABASE_URL does not name a database file");
    }
    fs::path path(location);
    if (path.is_relative()) {
        path = projectRoot / path;
    }
    return path.lexically_normal();
}

BackupConfig::BackupConfig(const std::string& configFile)
    : configFile(fs::absolute(configFile)), projectRoot(defaultRoot(configFile)) {
    Json::Value settings = parseSettingsFile(configFile);
    SecretChain secrets = defaultSecretChain(settings);
    load(settings, secrets);

    struct stat st {};
    if (::stat(configFile.c_str(), &st) == 0 && (st.st_mode & 077) != 0) {
        loadWarnings.push_back(std::format("Insecure permissions on {} (should be 600)", configFile));
    }
}

BackupConfig::BackupConfig(const Json::Value& settings, const fs::path& projectRoot, const SecretSource& secrets,
                           const fs::path& configFile)
    : configFile(configFile), projectRoot(projectRoot) {
    load(settings, secrets);
}

fs::path BackupConfig::resolvePath(const std::string& value) const {
    fs::path path(value);
    if (path.is_relative()) {
        path = projectRoot / path;
    }
    return path.lexically_normal();
}

void BackupConfig::load(const Json::Value& settings, const SecretSource& secrets) {
    if (!settings.isObject()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }
    if (settings.isMember("PROJECT_ROOT")) {
        projectRoot = settings["PROJECT_ROOT"].asString();
    }
    if (projectRoot.empty()) {
        projectRoot = fs::current_path();
    }
    projectRoot = fs::absolute(projectRoot).lexically_normal();

    auto secret = secrets.lookup("BACKUP_PASSPHRASE");
    if (!secret) {
        throw std::runtime_error("BACKUP_PASSPHRASE is required in settings");
    }
    passphrase = *secret;
    passphraseSource = secrets.name();
    if (const auto* chain = dynamic_cast<const SecretChain*>(&secrets)) {
        passphraseSource = chain->resolvedBy("BACKUP_PASSPHRASE").value_or(passphraseSource);
    }

    databaseUrl = settings.get("DATABASE_URL", "").asString();
    auto dbPath = resolveDatabaseUrl(databaseUrl, projectRoot);
    if (!dbPath) {
        throw std::runtime_error(dbPath.error());
    }
    databasePath = *dbPath;

    dbBackupDir = resolvePath(settings.get("BACKUP_DIR", "backups/db").asString());
    fullBackupDir = resolvePath(settings.get("FULL_BACKUP_DIR", "backups/full").asString());
    logDir = resolvePath(settings.get("LOG_DIR", "logs").asString());
    dataDir = resolvePath(settings.get("DATA_DIR", "data/bwdata").asString());
    scratchDir = settings.isMember("SCRATCH_DIR") ? resolvePath(settings["SCRATCH_DIR"].asString())
                                                  : fs::temp_directory_path();

    keepDb = boundedInt(settings, "BACKUP_KEEP_DB", 30, 0);
    keepFull = boundedInt(settings, "BACKUP_KEEP_FULL", 8, 0);

    volumes = stringList(settings, "BACKUP_VOLUMES", {"caddy_data", "caddy_config"});
    configPaths = stringList(settings, "BACKUP_CONFIG_PATHS",
                             {"docker-compose.yml", "startup.sh", "caddy", "fail2ban", "templates", "action.d"});
    const std::vector<std::pair<const char*, fs::path>> managed = {
        {"the database", databasePath}, {"DATA_DIR", dataDir},       {"LOG_DIR", logDir},
        {"BACKUP_DIR", dbBackupDir},    {"FULL_BACKUP_DIR", fullBackupDir}, {"SCRATCH_DIR", scratchDir},
    };
    for (const auto& entry : configPaths) {
        fs::path candidate(entry);
        if (!isContainedRelative(candidate)) {
            throw std::runtime_error(std::format("Configuration path must stay inside the project root: {}", entry));
        }
        const fs::path absolute = projectRoot / candidate;
        if (sameOrWithin(projectRoot, absolute)) {
            throw std::runtime_error(std::format("Configuration path must not name the project root: {}", entry));
        }
        for (const auto& [name, path] : managed) {
            if (!sameOrWithin(path, projectRoot)) {
                continue;
            }
            if (sameOrWithin(absolute, path) || sameOrWithin(path, absolute)) {
                throw std::runtime_error(std::format("Configuration path {} overlaps {} ({})", entry, name,
                                                     path.string()));
            }
        }
    }

    freshnessWindow = std::chrono::hours(boundedInt(settings, "DB_FRESHNESS_HOURS", 24, 0));
    lowPriority = flag(settings, "LOW_PRIORITY", false);
    operationTimeout = std::chrono::seconds(boundedInt(settings, "OPERATION_TIMEOUT_SECONDS", 600, 1));
    healthCheckAttempts = boundedInt(settings, "HEALTH_CHECK_ATTEMPTS", 30, 1);
    healthCheckInterval = std::chrono::seconds(boundedInt(settings, "HEALTH_CHECK_INTERVAL_SECONDS", 5, 0));
    healthContainers = {settings.get("CONTAINER_NAME_VAULTWARDEN", "bw_vaultwarden").asString(),
                        settings.get("CONTAINER_NAME_CADDY", "bw_caddy").asString()};
    serviceName = settings.get("SERVICE_NAME", "vaultwarden").asString();
    helperImage = settings.get("HELPER_IMAGE", "alpine:3.19").asString();

    rcloneRemote = settings.get("RCLONE_REMOTE", "").asString();
    rclonePath = settings.get("RCLONE_PATH", "").asString();
    sftpConfig = settings["sftp"];
    telegramConfig = settings["telegram"];

    smtp.host = settings.get("SMTP_HOST", "").asString();
    smtp.from = settings.get("SMTP_FROM", "").asString();
    smtp.username = settings.get("SMTP_USERNAME", "").asString();
    smtp.password = secrets.lookup("SMTP_PASSWORD").value_or("");
    smtp.to = settings.get("ALERT_EMAIL_TO", settings.get("ADMIN_EMAIL", "").asString()).asString();

    debug = flag(settings, "DEBUG", false);
    if (const char* env = std::getenv("DEBUG"); env && std::string(env) == "1") {
        debug = true;
    }
}

std::expected<fs::path, std::string> BackupConfig::requireDatabaseFile() const {
    std::error_code ec;
    if (!fs::exists(databasePath, ec)) {
        return std::unexpected(std::format("SQLite database not found at {}", databasePath.string()));
    }
    if (!fs::is_regular_file(databasePath, ec)) {
        return std::unexpected(std::format("Database path is not a regular file: {}", databasePath.string()));
    }
    return databasePath;
}

bool BackupConfig::isSecretFile(const fs::path& candidate) const {
    if (candidate.filename() == "settings.json") {
        return true;
    }
    if (configFile.empty()) {
        return false;
    }
    std::error_code ec;
    if (fs::exists(candidate, ec) && fs::exists(configFile, ec)) {
        return fs::equivalent(candidate, configFile, ec);
    }
    return fs::absolute(candidate).lexically_normal() == fs::absolute(configFile).lexically_normal();
}

std::string BackupConfig::describe() const {
    std::ostringstream out;
    out << "Configuration Summary:\n"
        << "  Project root: " << projectRoot.string() << '\n'
        << "  DATABASE_URL: " << databaseUrl << '\n'
        << "  Database file: " << databasePath.string() << '\n'
        << "  BACKUP_PASSPHRASE: [REDACTED] (from " << passphraseSource << ")\n"
        << "  Database sets: " << dbBackupDir.string() << " (keep " << keepDb << ")\n"
        << "  Full sets: " << fullBackupDir.string() << " (keep " << keepFull << ")\n"
        << "  Freshness window: " << freshnessWindow.count() << "h\n"
        << "  Low priority: " << (lowPriority ? "yes" : "no") << '\n';
    if (!rcloneRemote.empty()) {
        out << "  Cloud offload: " << rcloneRemote << ':' << rclonePath << '\n';
    }
    if (smtp.enabled()) {
        out << "  SMTP_PASSWORD: [REDACTED]\n";
    }
    return out.str();
}
