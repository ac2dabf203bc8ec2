/**
 * @file file_utils.hpp
 * @brief Filesystem helpers shared by the backup and restore pipelines.
 *
 * Private temporary directories, secure deletion of decrypted material,
 * stage-then-rename replacement of live paths, and timestamp formatting for
 * backup set identifiers.
 */

#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace fs = std::filesystem;

class Logger;

/**
 * @brief Owns a 0700 temporary directory and wipes it on destruction.
 *
 * Regular files inside are overwritten with zeros before the tree is removed, so
 * decrypted payloads and passphrase files do not linger on disk.
 */
class ScopedTempDir {
public:
    /**
     * @brief Creates a new private directory under @p parent.
     *
     * @param parent Existing (or creatable) parent directory.
     * @param prefix Name prefix; a random suffix is appended.
     * @param logger Receives a warning if the directory cannot be wiped. Without one, stderr does.
     */
    static std::expected<ScopedTempDir, std::string> create(const fs::path& parent, const std::string& prefix,
                                                            const Logger* logger = nullptr);

    ScopedTempDir(ScopedTempDir&& other) noexcept;
    ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;
    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;
    ~ScopedTempDir();

    const fs::path& path() const { return path_; }

private:
    ScopedTempDir(fs::path path, const Logger* logger) : path_(std::move(path)), logger_(logger) {}

    void wipe() const;

    fs::path path_;
    const Logger* logger_;
};

/**
 * @brief Overwrites every regular file under @p path with zeros, then removes it.
 *
 * Errors are reported but removal is attempted for every entry.
 */
std::expected<void, std::string> secureRemove(const fs::path& path);

/**
 * @brief Replaces @p target with @p staged using renames only.
 *
 * Both paths must live in the same directory. An existing target is first moved
 * aside, the staged entry renamed into place, then the old copy removed. If the
 * second rename fails the original is moved back.
 */
std::expected<void, std::string> atomicReplace(const fs::path& staged, const fs::path& target);

/**
 * @brief Recursively copies a file or directory, preserving symlinks.
 */
std::expected<void, std::string> copyTree(const fs::path& source, const fs::path& destination);

/**
 * @brief Like copyTree(), but entries for which @p skip returns true are never written.
 *
 * @p skip sees source paths. A skipped directory is not descended into.
 */
std::expected<void, std::string> copyTree(const fs::path& source, const fs::path& destination,
                                          const std::function<bool(const fs::path&)>& skip);

/**
 * @brief Returns true if @p entry is a non-empty relative path that stays below its base (no ".." escape).
 */
bool isContainedRelative(const fs::path& entry);

/**
 * @brief Size of a regular file, or of all regular files below a directory.
 */
std::uintmax_t pathSize(const fs::path& path);

/**
 * @brief Formats a time as the backup set identifier "YYYYMMDD-HHMMSS" (UTC).
 */
std::string formatTimestamp(std::chrono::system_clock::time_point time);

/**
 * @brief Parses an identifier produced by formatTimestamp().
 */
std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& text);

/**
 * @brief ISO-like UTC string for manifests ("2024-01-31 12:00:00 UTC").
 */
std::string isoTimestamp(std::chrono::system_clock::time_point time);

/**
 * @brief Human readable byte count ("2.3 MB").
 */
std::string humanSize(std::uintmax_t bytes);

/**
 * @brief Replaces characters outside [A-Za-z0-9._-] with '-'.
 */
std::string sanitizeName(const std::string& name);

#endif // FILE_UTILS_HPP
