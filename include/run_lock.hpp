/**
 * @file run_lock.hpp
 * @brief Non-blocking advisory lock shared by the backup and restore tools.
 *
 * The lock file holds the owner's PID. A lock whose holder is no longer alive is
 * stale and is reclaimed instead of blocking forever.
 */

#ifndef RUN_LOCK_HPP
#define RUN_LOCK_HPP

#include <expected>
#include <filesystem>
#include <string>
#include "logger.hpp"

namespace fs = std::filesystem;

class RunLock {
public:
    /// Lock name shared by all three tools, so backup and restore never overlap.
    static constexpr const char* kSharedName = "backup-restore";

    /**
     * @brief Tries to take the lock without waiting.
     *
     * @param lockFile Path of the lock file (created 0600 if missing).
     * @param logger Receives a note when a stale lock is reclaimed.
     * @return std::expected<RunLock, std::string> The held lock, or a message naming the current holder.
     */
    static std::expected<RunLock, std::string> acquire(const fs::path& lockFile, const Logger& logger);

    /**
     * @brief Lock file path for @p name inside @p logDir.
     */
    static fs::path pathFor(const fs::path& logDir, const std::string& name = kSharedName);

    RunLock(RunLock&& other) noexcept;
    RunLock& operator=(RunLock&& other) noexcept;
    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;
    ~RunLock();

    const fs::path& path() const { return path_; }

private:
    RunLock(int fd, fs::path path) : fd_(fd), path_(std::move(path)) {}
    void release();

    int fd_ = -1;
    fs::path path_;
};

#endif // RUN_LOCK_HPP
