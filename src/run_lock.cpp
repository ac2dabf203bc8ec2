#include "run_lock.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <string>
#include <sys/file.h>
#include <unistd.h>

namespace {

pid_t readPid(int fd) {
    char buf[32] = {};
    ssize_t n = ::pread(fd, buf, sizeof(buf) - 1, 0);
    if (n <= 0) {
        return 0;
    }
    try {
        return static_cast<pid_t>(std::stol(std::string(buf, static_cast<size_t>(n))));
    } catch (const std::exception&) {
        return 0;
    }
}

bool processAlive(pid_t pid) {
    return pid > 0 && (::kill(pid, 0) == 0 || errno == EPERM);
}

} // namespace

fs::path RunLock::pathFor(const fs::path& logDir, const std::string& name) {
    return logDir / (name + ".lock");
}

std::expected<RunLock, std::string> RunLock::acquire(const fs::path& lockFile, const Logger& logger) {
    std::error_code ec;
    fs::create_directories(lockFile.parent_path(), ec);

    int fd = ::open(lockFile.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        return std::unexpected(std::format("Cannot open lock file {}: {}", lockFile.string(), std::strerror(errno)));
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        pid_t holder = readPid(fd);
        ::close(fd);
        if (err == EWOULDBLOCK) {
            return std::unexpected(holder > 0
                ? std::format("Another backup or restore run is in progress (PID {}, lock {})", holder, lockFile.string())
                : std::format("Another backup or restore run is in progress (lock {})", lockFile.string()));
        }
        return std::unexpected(std::format("Cannot lock {}: {}", lockFile.string(), std::strerror(err)));
    }

    pid_t previous = readPid(fd);
    if (previous > 0 && previous != ::getpid()) {
        if (processAlive(previous)) {
            logger.warning(std::format("Lock file {} names live PID {} without holding the lock; taking over",
                                       lockFile.string(), previous));
        } else {
            logger.info(std::format("Removed stale lock left by PID {}", previous));
        }
    }

    const std::string pid = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd, 0) != 0 || ::pwrite(fd, pid.data(), pid.size(), 0) != static_cast<ssize_t>(pid.size())) {
        std::string err = std::format("Cannot write lock file {}: {}", lockFile.string(), std::strerror(errno));
        ::flock(fd, LOCK_UN);
        ::close(fd);
        return std::unexpected(err);
    }
    return RunLock(fd, lockFile);
}

RunLock::RunLock(RunLock&& other) noexcept : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

RunLock& RunLock::operator=(RunLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

RunLock::~RunLock() {
    release();
}

void RunLock::release() {
    if (fd_ < 0) {
        return;
    }
    if (::ftruncate(fd_, 0) != 0) {
        // The PID left behind is detected as stale by the next run.
    }
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}
