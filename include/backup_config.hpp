/**
 * @file backup_config.hpp
 * @brief Configuration management for the VaultKeeper backup system.
 *
 * Defines the immutable configuration object shared by every component: database
 * location, encryption passphrase, backup roots, retention counts, runtime volumes,
 * configuration allow-list, timeouts and the optional offload/notification settings.
 * It is built once at process start and passed by const reference.
 *
 * @note Configuration is loaded from a JSON settings file. Relative paths resolve
 * against the project root (by default the directory holding the settings file).
 */

#ifndef BACKUP_CONFIG_HPP
#define BACKUP_CONFIG_HPP

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>
#include <json/json.h>
#include "secret_source.hpp"

namespace fs = std::filesystem;

/**
 * @brief SMTP settings used for e-mail notifications.
 */
struct SmtpConfig {
    std::string host;     ///< SMTP server (e.g. "smtp.example.org:587").
    std::string from;     ///< Envelope sender.
    std::string username; ///< SMTP username.
    std::string password; ///< SMTP password.
    std::string to;       ///< Alert recipient.

    bool enabled() const { return !host.empty() && !from.empty() && !to.empty(); }
};

/**
 * @brief Immutable configuration for one VaultKeeper process.
 */
class BackupConfig {
public:
    /**
     * @brief Loads the configuration from a settings file.
     *
     * The passphrase is resolved through the environment first and the settings file second.
     *
     * @param configFile Path to the JSON settings file.
     * @throws std::runtime_error If the file is unreadable, invalid, or a required key is missing or malformed.
     */
    explicit BackupConfig(const std::string& configFile);

    /**
     * @brief Builds a configuration from an already parsed settings document.
     *
     * @param settings Parsed settings.
     * @param projectRoot Root against which relative paths resolve.
     * @param secrets Secret lookup chain for the passphrase.
     * @param configFile Path of the live settings file (excluded from configuration copies).
     * @throws std::runtime_error If a required key is missing or malformed.
     */
    BackupConfig(const Json::Value& settings, const fs::path& projectRoot, const SecretSource& secrets,
                 const fs::path& configFile = {});

    /**
     * @brief Returns the live database file, failing if it does not exist.
     *
     * Backup paths call this before any side effect; restore tolerates a missing file.
     */
    std::expected<fs::path, std::string> requireDatabaseFile() const;

    /**
     * @brief Returns true if @p candidate is the live secret file.
     */
    bool isSecretFile(const fs::path& candidate) const;

    /**
     * @brief Multi-line summary with sensitive values redacted.
     */
    std::string describe() const;

    fs::path configFile;                        ///< Live settings file (never copied into backups).
    fs::path projectRoot;                       ///< Deployment root directory.
    std::string databaseUrl;                    ///< Raw DATABASE_URL value.
    fs::path databasePath;                      ///< Resolved SQLite file path.
    std::string passphrase;                     ///< Shared encryption passphrase. Never logged.
    std::string passphraseSource;               ///< Name of the source that supplied the passphrase.

    fs::path dbBackupDir;                       ///< Root of database backup sets.
    fs::path fullBackupDir;                     ///< Root of full backup sets.
    fs::path logDir;                            ///< Log and lock directory.
    fs::path dataDir;                           ///< Application data directory.
    fs::path scratchDir;                        ///< Parent of private temporary directories.

    int keepDb;                                 ///< Database sets to keep (0 disables pruning).
    int keepFull;                               ///< Full sets to keep (0 disables pruning).

    std::vector<std::string> volumes;           ///< Runtime volumes included in full backups.
    std::vector<std::string> configPaths;       ///< Allow-listed configuration paths relative to the project root.

    std::chrono::hours freshnessWindow;         ///< Max age of a reusable database set.
    bool lowPriority;                           ///< Run heavy work at reduced scheduling priority.
    std::chrono::seconds operationTimeout;      ///< Wall-clock limit for archive and helper operations.
    int healthCheckAttempts;                    ///< Health polls after a restore.
    std::chrono::seconds healthCheckInterval;   ///< Delay between health polls.
    std::vector<std::string> healthContainers;  ///< Containers that must report healthy.
    std::string serviceName;                    ///< Compose service holding the database open.
    std::string helperImage;                    ///< Disposable image used for volume export/import.

    std::string rcloneRemote;                   ///< Optional rclone remote name.
    std::string rclonePath;                     ///< Optional rclone path under the remote.
    Json::Value sftpConfig;                     ///< Optional SFTP offload settings.
    Json::Value telegramConfig;                 ///< Optional Telegram notification settings.
    SmtpConfig smtp;                            ///< Optional e-mail notification settings.
    bool debug;                                 ///< Emit debug log lines.
    std::vector<std::string> loadWarnings;      ///< Non-fatal findings while loading, logged by the caller.

private:
    void load(const Json::Value& settings, const SecretSource& secrets);
    fs::path resolvePath(const std::string& value) const;
};

/**
 * @brief Parses a connection-string-like database URL into a file path.
 *
 * Accepts "sqlite://<path>"; relative paths resolve against @p projectRoot.
 *
 * @return std::expected<fs::path, std::string> The resolved path or a description of what is wrong.
 */
std::expected<fs::path, std::string> resolveDatabaseUrl(const std::string& url, const fs::path& projectRoot);

#endif // BACKUP_CONFIG_HPP
