/**
 * @file archiver.hpp
 * @brief Tar archiving for staged backup trees.
 *
 * Bundles a staged directory into a single tar (optionally gzip-filtered), reads
 * archives back for verification, and extracts them safely for restore.
 *
 * @note Requires libarchive.
 */

#ifndef ARCHIVER_HPP
#define ARCHIVER_HPP

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Options for Archiver::create().
 */
struct ArchiveOptions {
    bool gzip = false;               ///< Apply the gzip filter inside the archive.
    std::vector<fs::path> excludes;  ///< Absolute paths skipped (with their subtrees).
    std::string rootName;            ///< Optional top-level directory name for entries.
};

/**
 * @brief Interface for archive creation, inspection and extraction.
 */
class Archiver {
public:
    virtual ~Archiver() = default;

    /**
     * @brief Archives the contents of @p sourceDir into @p archivePath.
     *
     * @return std::expected<size_t, std::string> Number of entries written, or an error.
     */
    virtual std::expected<size_t, std::string> create(const fs::path& sourceDir, const fs::path& archivePath,
                                                      const ArchiveOptions& options = {}) const = 0;

    /**
     * @brief Reads every entry and its data, failing on any structural error.
     *
     * @return std::expected<size_t, std::string> Number of entries read, or an error.
     */
    virtual std::expected<size_t, std::string> verify(const fs::path& archivePath) const = 0;

    /**
     * @brief Lists entry path names without extracting.
     */
    virtual std::expected<std::vector<std::string>, std::string> list(const fs::path& archivePath) const = 0;

    /**
     * @brief Extracts @p archivePath below @p destination.
     *
     * Absolute paths, ".." components and writes through symlinks are refused.
     */
    virtual std::expected<size_t, std::string> extract(const fs::path& archivePath,
                                                       const fs::path& destination) const = 0;
};

/**
 * @brief libarchive implementation producing pax tar files.
 */
class LibArchiveArchiver : public Archiver {
public:
    std::expected<size_t, std::string> create(const fs::path& sourceDir, const fs::path& archivePath,
                                              const ArchiveOptions& options = {}) const override;
    std::expected<size_t, std::string> verify(const fs::path& archivePath) const override;
    std::expected<std::vector<std::string>, std::string> list(const fs::path& archivePath) const override;
    std::expected<size_t, std::string> extract(const fs::path& archivePath,
                                               const fs::path& destination) const override;
};

#endif // ARCHIVER_HPP
