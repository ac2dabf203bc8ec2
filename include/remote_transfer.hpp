/**
 * @file remote_transfer.hpp
 * @brief Off-host copies of finished backup sets.
 *
 * Offload is best effort: a failed transfer is reported to the caller, which logs it
 * without failing the run. Only sealed artifacts and the plaintext manifest leave the
 * host; staging directories are never uploaded.
 *
 * @note SFTP transfers require libssh; rclone transfers require the rclone binary.
 */

#ifndef REMOTE_TRANSFER_HPP
#define REMOTE_TRANSFER_HPP

#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <json/json.h>
#include "backup_config.hpp"
#include "process_runner.hpp"

namespace fs = std::filesystem;

/**
 * @brief Interface for remote transfer strategies.
 */
class RemoteTransferStrategy {
public:
    virtual ~RemoteTransferStrategy() = default;

    /**
     * @brief Copies the sealed files of one set to the remote destination.
     *
     * @param setDirectory Local set directory.
     * @param remoteSubdir Destination below the configured remote root (e.g. "db/20240131-120000").
     * @return std::expected<size_t, std::string> Number of files transferred, or an error message.
     */
    virtual std::expected<size_t, std::string> transfer(const fs::path& setDirectory,
                                                        const std::string& remoteSubdir) = 0;

    /**
     * @brief Short name for log lines ("rclone", "sftp").
     */
    virtual std::string name() const = 0;
};

/**
 * @brief Files of a set that are uploaded: encrypted artifacts and the manifest, sorted by name.
 */
std::vector<fs::path> transferableFiles(const fs::path& setDirectory);

/**
 * @brief Mirrors sets with rclone and checks the remote file count afterwards.
 */
class RcloneTransferStrategy : public RemoteTransferStrategy {
public:
    /**
     * @param remote rclone remote name (without the colon).
     * @param path Root path under the remote.
     * @param timeout Wall-clock limit for one rclone invocation.
     */
    RcloneTransferStrategy(std::string remote, std::string path, std::chrono::seconds timeout);

    std::expected<size_t, std::string> transfer(const fs::path& setDirectory, const std::string& remoteSubdir) override;
    std::string name() const override { return "rclone"; }

private:
    std::string remote_;
    std::string path_;
    std::chrono::seconds timeout_;
    ProcessRunner runner_;
};

/**
 * @brief SFTP remote transfer strategy.
 */
class SFTPTransferStrategy : public RemoteTransferStrategy {
public:
    /**
     * @brief Constructs an SFTP transfer strategy.
     *
     * @param config JSON configuration containing host, user, password, port, and remote_dir.
     *        An empty password selects public key authentication.
     * @throws std::runtime_error If host, user or remote_dir is missing.
     */
    explicit SFTPTransferStrategy(const Json::Value& config);

    std::expected<size_t, std::string> transfer(const fs::path& setDirectory, const std::string& remoteSubdir) override;
    std::string name() const override { return "sftp"; }

private:
    std::string host_;       ///< SFTP host address.
    std::string user_;       ///< SFTP username.
    std::string password_;   ///< SFTP password (may be empty).
    int port_;               ///< SFTP port (default 22).
    std::string remote_dir_; ///< Remote root directory for backups.
};

/**
 * @brief Builds the configured offload strategy: rclone if RCLONE_REMOTE and RCLONE_PATH are set,
 *        otherwise SFTP if an sftp host is set, otherwise none.
 *
 * @throws std::runtime_error If the SFTP settings are incomplete.
 */
std::unique_ptr<RemoteTransferStrategy> makeRemoteTransfer(const BackupConfig& config);

#endif // REMOTE_TRANSFER_HPP
