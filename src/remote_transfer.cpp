#include "remote_transfer.hpp"
#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include <algorithm>
#include <cstdint>
#include <fcntl.h>
#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>

std::vector<fs::path> transferableFiles(const fs::path& setDirectory) {
    std::vector<fs::path> files;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(setDirectory, ec)) {
        const std::string name = entry.path().filename().string();
        if (!entry.is_regular_file() || name.starts_with(".")) {
            continue;
        }
        if (entry.path().extension() == ".gpg" || name == "backup-manifest.json") {
            files.push_back(entry.path());
        }
    }
    std::ranges::sort(files);
    return files;
}

RcloneTransferStrategy::RcloneTransferStrategy(std::string remote, std::string path, std::chrono::seconds timeout)
    : remote_(std::move(remote)), path_(std::move(path)), timeout_(timeout) {}

std::expected<size_t, std::string> RcloneTransferStrategy::transfer(const fs::path& setDirectory,
                                                                    const std::string& remoteSubdir) {
    const auto files = transferableFiles(setDirectory);
    if (files.empty()) {
        return std::unexpected(std::format("Nothing to upload in {}", setDirectory.string()));
    }
    const std::string destination = std::format("{}:{}/{}", remote_, path_, remoteSubdir);

    ProcessOptions options;
    options.timeout = timeout_;
    auto copied = runner_.run({"rclone", "copy", setDirectory.string(), destination, "--transfers=2",
                               "--checkers=2", "--exclude", ".*/**", "--exclude", "*.partial"},
                              options);
    if (!copied) {
        return std::unexpected(copied.error());
    }
    if (!copied->ok()) {
        return std::unexpected(std::format("rclone copy failed: {}", copied->describe()));
    }

    auto listed = runner_.run({"rclone", "lsf", destination, "--files-only"}, options);
    if (!listed) {
        return std::unexpected(listed.error());
    }
    if (!listed->ok()) {
        return std::unexpected(std::format("rclone lsf failed: {}", listed->describe()));
    }
    const size_t local = std::ranges::count_if(files, [](const fs::path& f) { return f.extension() == ".gpg"; });
    size_t remote = 0;
    std::istringstream lines(listed->output);
    for (std::string line; std::getline(lines, line);) {
        if (line.ends_with(".gpg")) {
            ++remote;
        }
    }
    if (remote != local) {
        return std::unexpected(std::format("Upload verification failed (local: {}, remote: {})", local, remote));
    }
    return files.size();
}

SFTPTransferStrategy::SFTPTransferStrategy(const Json::Value& config)
    : host_(config["host"].asString()),
      user_(config["user"].asString()),
      password_(config["password"].asString()),
      port_(config.get("port", 22).asInt()),
      remote_dir_(config["remote_dir"].asString()) {
    if (host_.empty() || user_.empty() || remote_dir_.empty()) {
        throw std::runtime_error("sftp settings need host, user and remote_dir");
    }
}

std::expected<size_t, std::string> SFTPTransferStrategy::transfer(const fs::path& setDirectory,
                                                                  const std::string& remoteSubdir) {
    const auto files = transferableFiles(setDirectory);
    if (files.empty()) {
        return std::unexpected(std::format("Nothing to upload in {}", setDirectory.string()));
    }

    ssh_session ssh = ssh_new();
    if (!ssh) {
        return std::unexpected("Failed to create SSH session");
    }
    ssh_options_set(ssh, SSH_OPTIONS_HOST, host_.c_str());
    ssh_options_set(ssh, SSH_OPTIONS_PORT, &port_);
    ssh_options_set(ssh, SSH_OPTIONS_USER, user_.c_str());
    if (ssh_connect(ssh) != SSH_OK) {
        std::string err = std::format("SSH connection to {} failed: {}", host_, ssh_get_error(ssh));
        ssh_free(ssh);
        return std::unexpected(err);
    }

    const int auth = password_.empty() ? ssh_userauth_publickey_auto(ssh, nullptr, nullptr)
                                       : ssh_userauth_password(ssh, nullptr, password_.c_str());
    if (auth != SSH_AUTH_SUCCESS) {
        ssh_disconnect(ssh);
        ssh_free(ssh);
        return std::unexpected(password_.empty() ? "SSH public key authentication failed"
                                                 : "SSH password authentication failed");
    }

    sftp_session sftp = sftp_new(ssh);
    if (!sftp || sftp_init(sftp) != SSH_OK) {
        if (sftp) {
            sftp_free(sftp);
        }
        ssh_disconnect(ssh);
        ssh_free(ssh);
        return std::unexpected("SFTP initialization failed");
    }

    auto close = [&] {
        sftp_free(sftp);
        ssh_disconnect(ssh);
        ssh_free(ssh);
    };

    std::string remoteDir = remote_dir_;
    for (const auto& part : fs::path(remoteSubdir)) {
        remoteDir += "/" + part.string();
        if (sftp_mkdir(sftp, remoteDir.c_str(), 0700) < 0 && sftp_get_error(sftp) != SSH_FX_FILE_ALREADY_EXISTS) {
            std::string err = std::format("Failed to create remote directory {}: {}", remoteDir, ssh_get_error(ssh));
            close();
            return std::unexpected(err);
        }
    }

    size_t transferred = 0;
    for (const auto& local : files) {
        const std::string remoteFile = remoteDir + "/" + local.filename().string();
        sftp_file file = sftp_open(sftp, remoteFile.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
        if (!file) {
            std::string err = std::format("Failed to open remote file {}: {}", remoteFile, ssh_get_error(ssh));
            close();
            return std::unexpected(err);
        }

        std::ifstream input(local, std::ios::binary);
        if (!input) {
            sftp_close(file);
            close();
            return std::unexpected(std::format("Failed to open local file {}", local.string()));
        }

        char buf[8192];
        std::uintmax_t written = 0;
        bool writeFailed = false;
        while (input) {
            input.read(buf, sizeof(buf));
            const std::streamsize n = input.gcount();
            if (n <= 0) {
                break;
            }
            if (sftp_write(file, buf, static_cast<size_t>(n)) != n) {
                writeFailed = true;
                break;
            }
            written += static_cast<std::uintmax_t>(n);
        }
        const bool closeFailed = sftp_close(file) != SSH_OK;
        std::error_code ec;
        if (writeFailed || closeFailed || written != fs::file_size(local, ec)) {
            std::string err = std::format("Upload of {} failed: {}", local.filename().string(), ssh_get_error(ssh));
            close();
            return std::unexpected(err);
        }
        ++transferred;
    }

    close();
    return transferred;
}

std::unique_ptr<RemoteTransferStrategy> makeRemoteTransfer(const BackupConfig& config) {
    if (!config.rcloneRemote.empty() && !config.rclonePath.empty()) {
        return std::make_unique<RcloneTransferStrategy>(config.rcloneRemote, config.rclonePath,
                                                        config.operationTimeout);
    }
    if (config.sftpConfig.isObject() && !config.sftpConfig["host"].asString().empty()) {
        return std::make_unique<SFTPTransferStrategy>(config.sftpConfig);
    }
    return nullptr;
}
