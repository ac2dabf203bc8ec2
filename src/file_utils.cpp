#include "file_utils.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <format>
#include <iostream>
#include <unistd.h>
#include <vector>

namespace {

std::expected<void, std::string> zeroFill(const fs::path& file) {
    int fd = ::open(file.c_str(), O_WRONLY | O_CLOEXEC | O_NOFOLLOW);
    if (fd < 0) {
        return std::unexpected(std::format("Failed to open {} for wiping: {}", file.string(), std::strerror(errno)));
    }
    off_t size = ::lseek(fd, 0, SEEK_END);
    ::lseek(fd, 0, SEEK_SET);
    std::vector<char> zeros(64 * 1024, 0);
    off_t remaining = size > 0 ? size : 0;
    while (remaining > 0) {
        size_t chunk = static_cast<size_t>(std::min<off_t>(remaining, static_cast<off_t>(zeros.size())));
        ssize_t written = ::write(fd, zeros.data(), chunk);
        if (written <= 0) {
            if (written < 0 && errno == EINTR) continue;
            std::string err = std::format("Failed to wipe {}: {}", file.string(), std::strerror(errno));
            ::close(fd);
            return std::unexpected(err);
        }
        remaining -= written;
    }
    ::fsync(fd);
    ::close(fd);
    return {};
}

} // namespace

std::expected<ScopedTempDir, std::string> ScopedTempDir::create(const fs::path& parent, const std::string& prefix,
                                                                const Logger* logger) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to create {}: {}", parent.string(), ec.message()));
    }
    std::string pattern = (parent / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (!::mkdtemp(buffer.data())) {
        return std::unexpected(std::format("Failed to create temporary directory under {}: {}",
                                           parent.string(), std::strerror(errno)));
    }
    return ScopedTempDir(fs::path(buffer.data()), logger);
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept
    : path_(std::move(other.path_)), logger_(other.logger_) {
    other.path_.clear();
}

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
    if (this != &other) {
        wipe();
        path_ = std::move(other.path_);
        logger_ = other.logger_;
        other.path_.clear();
    }
    return *this;
}

ScopedTempDir::~ScopedTempDir() {
    wipe();
}

void ScopedTempDir::wipe() const {
    if (path_.empty()) {
        return;
    }
    if (auto removed = secureRemove(path_); !removed) {
        const std::string message = std::format("Temporary directory not fully wiped: {}", removed.error());
        if (logger_) {
            logger_->warning(message);
        } else {
            std::cerr << message << std::endl;
        }
    }
}

std::expected<void, std::string> secureRemove(const fs::path& path) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec || !fs::exists(status)) {
        return {};
    }

    std::string firstError;
    if (fs::is_regular_file(status)) {
        if (auto wiped = zeroFill(path); !wiped) {
            firstError = wiped.error();
        }
    } else if (fs::is_directory(status)) {
        for (auto it = fs::recursive_directory_iterator(path, fs::directory_options::skip_permission_denied, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file() && !it->is_symlink()) {
                if (auto wiped = zeroFill(it->path()); !wiped && firstError.empty()) {
                    firstError = wiped.error();
                }
            }
        }
    }

    fs::remove_all(path, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to remove {}: {}", path.string(), ec.message()));
    }
    if (!firstError.empty()) {
        return std::unexpected(firstError);
    }
    return {};
}

std::expected<void, std::string> atomicReplace(const fs::path& staged, const fs::path& target) {
    std::error_code ec;
    if (staged.parent_path() != target.parent_path()) {
        return std::unexpected(std::format("Staged path {} is not a sibling of {}", staged.string(), target.string()));
    }

    fs::path previous = target;
    previous += ".restore-old";
    bool hadTarget = fs::exists(fs::symlink_status(target, ec));
    if (hadTarget) {
        fs::remove_all(previous, ec);
        fs::rename(target, previous, ec);
        if (ec) {
            return std::unexpected(std::format("Failed to move {} aside: {}", target.string(), ec.message()));
        }
    }

    fs::rename(staged, target, ec);
    if (ec) {
        std::string err = std::format("Failed to rename {} into place: {}", staged.string(), ec.message());
        if (hadTarget) {
            std::error_code back;
            fs::rename(previous, target, back);
        }
        return std::unexpected(err);
    }

    if (hadTarget) {
        fs::remove_all(previous, ec);
    }
    return {};
}

std::expected<void, std::string> copyTree(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    auto status = fs::symlink_status(source, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to stat {}: {}", source.string(), ec.message()));
    }
    if (fs::is_directory(status)) {
        fs::copy(source, destination,
                 fs::copy_options::recursive | fs::copy_options::copy_symlinks | fs::copy_options::overwrite_existing,
                 ec);
    } else if (fs::is_symlink(status)) {
        fs::copy_symlink(source, destination, ec);
    } else {
        fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
    }
    if (ec) {
        return std::unexpected(std::format("Failed to copy {} to {}: {}", source.string(), destination.string(),
                                           ec.message()));
    }
    return {};
}

std::expected<void, std::string> copyTree(const fs::path& source, const fs::path& destination,
                                          const std::function<bool(const fs::path&)>& skip) {
    if (skip(source)) {
        return {};
    }
    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(source, ec))) {
        return copyTree(source, destination);
    }
    fs::create_directories(destination, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to create {}: {}", destination.string(), ec.message()));
    }

    auto it = fs::recursive_directory_iterator(source, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const fs::path target = destination / it->path().lexically_relative(source);
        const auto status = it->symlink_status(ec);
        if (ec) {
            break;
        }
        if (skip(it->path())) {
            if (fs::is_directory(status)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (fs::is_directory(status)) {
            fs::create_directories(target, ec);
        } else if (fs::is_symlink(status)) {
            fs::copy_symlink(it->path(), target, ec);
        } else {
            fs::copy_file(it->path(), target, fs::copy_options::overwrite_existing, ec);
        }
        if (ec) {
            return std::unexpected(std::format("Failed to copy {} to {}: {}", it->path().string(), target.string(),
                                               ec.message()));
        }
    }
    if (ec) {
        return std::unexpected(std::format("Failed to walk {}: {}", source.string(), ec.message()));
    }
    return {};
}

bool isContainedRelative(const fs::path& entry) {
    if (entry.empty() || entry.is_absolute()) {
        return false;
    }
    for (const auto& part : entry.lexically_normal()) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

std::uintmax_t pathSize(const fs::path& path) {
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        auto size = fs::file_size(path, ec);
        return ec ? 0 : size;
    }
    std::uintmax_t total = 0;
    if (fs::is_directory(path, ec)) {
        for (auto it = fs::recursive_directory_iterator(path, fs::directory_options::skip_permission_denied, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file()) {
                std::error_code sizeEc;
                auto size = it->file_size(sizeEc);
                if (!sizeEc) {
                    total += size;
                }
            }
        }
    }
    return total;
}

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
    auto timeT = std::chrono::system_clock::to_time_t(time);
    std::tm tmUtc {};
    gmtime_r(&timeT, &tmUtc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tmUtc);
    return buf;
}

std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& text) {
    if (text.size() != 15 || text[8] != '-') {
        return std::nullopt;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (i != 8 && (text[i] < '0' || text[i] > '9')) {
            return std::nullopt;
        }
    }
    std::tm tmUtc {};
    if (!::strptime(text.c_str(), "%Y%m%d-%H%M%S", &tmUtc)) {
        return std::nullopt;
    }
    std::time_t timeT = ::timegm(&tmUtc);
    if (timeT == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(timeT);
}

std::string isoTimestamp(std::chrono::system_clock::time_point time) {
    auto timeT = std::chrono::system_clock::to_time_t(time);
    std::tm tmUtc {};
    gmtime_r(&timeT, &tmUtc);
    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &tmUtc);
    return buf;
}

std::string humanSize(std::uintmax_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    return unit == 0 ? std::format("{} B", bytes) : std::format("{:.1f} {}", value, units[unit]);
}

std::string sanitizeName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '.' || c == '_' || c == '-';
        out.push_back(safe ? c : '-');
    }
    if (out.empty() || out == "." || out == "..") {
        out = "unnamed";
    }
    return out;
}
