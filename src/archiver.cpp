#include "archiver.hpp"
#include <algorithm>
#include <archive.h>
#include <archive_entry.h>
#include <format>
#include <fstream>
#include <sys/stat.h>

namespace {

struct ReadHandle {
    struct archive* a;
    ReadHandle() : a(archive_read_new()) {
        archive_read_support_filter_all(a);
        archive_read_support_format_all(a);
    }
    ~ReadHandle() { archive_read_free(a); }
    ReadHandle(const ReadHandle&) = delete;
    ReadHandle& operator=(const ReadHandle&) = delete;
};

std::expected<void, std::string> openForRead(ReadHandle& handle, const fs::path& archivePath) {
    if (archive_read_open_filename(handle.a, archivePath.c_str(), 64 * 1024) != ARCHIVE_OK) {
        return std::unexpected(std::format("Failed to open archive {}: {}", archivePath.string(),
                                           archive_error_string(handle.a)));
    }
    return {};
}

bool isExcluded(const fs::path& path, const std::vector<fs::path>& excludes) {
    return std::ranges::any_of(excludes, [&path](const fs::path& excluded) { return path == excluded; });
}

std::expected<void, std::string> writeEntry(struct archive* a, const fs::path& path, const std::string& name) {
    struct stat st {};
    if (::lstat(path.c_str(), &st) != 0) {
        return std::unexpected(std::format("Failed to stat {}", path.string()));
    }

    struct archive_entry* ae = archive_entry_new();
    archive_entry_copy_stat(ae, &st);
    archive_entry_set_pathname(ae, name.c_str());
    if (S_ISLNK(st.st_mode)) {
        std::error_code ec;
        auto target = fs::read_symlink(path, ec);
        archive_entry_set_symlink(ae, target.c_str());
    }
    if (!S_ISREG(st.st_mode)) {
        archive_entry_set_size(ae, 0);
    }

    if (archive_write_header(a, ae) != ARCHIVE_OK) {
        std::string err = std::format("Failed to write header for {}: {}", name, archive_error_string(a));
        archive_entry_free(ae);
        return std::unexpected(err);
    }

    if (S_ISREG(st.st_mode)) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            archive_entry_free(ae);
            return std::unexpected(std::format("Failed to open file: {}", path.string()));
        }
        char buf[64 * 1024];
        while (file) {
            file.read(buf, sizeof(buf));
            std::streamsize count = file.gcount();
            if (count > 0 && archive_write_data(a, buf, static_cast<size_t>(count)) < 0) {
                std::string err = std::format("Failed to write data for {}: {}", name, archive_error_string(a));
                archive_entry_free(ae);
                return std::unexpected(err);
            }
        }
    }
    archive_entry_free(ae);
    return {};
}

} // namespace

std::expected<size_t, std::string> LibArchiveArchiver::create(const fs::path& sourceDir, const fs::path& archivePath,
                                                               const ArchiveOptions& options) const {
    std::error_code ec;
    if (!fs::is_directory(sourceDir, ec)) {
        return std::unexpected(std::format("Source directory does not exist: {}", sourceDir.string()));
    }

    struct archive* a = archive_write_new();
    if (options.gzip) {
        archive_write_add_filter_gzip(a);
    }
    archive_write_set_format_pax_restricted(a);
    if (archive_write_open_filename(a, archivePath.c_str()) != ARCHIVE_OK) {
        std::string errorMsg = std::format("Failed to open archive file: {} (error: {})", archivePath.string(),
                                           archive_error_string(a));
        archive_write_free(a);
        return std::unexpected(errorMsg);
    }

    auto fail = [&](const std::string& message) -> std::expected<size_t, std::string> {
        archive_write_close(a);
        archive_write_free(a);
        fs::remove(archivePath, ec);
        return std::unexpected(message);
    };

    const fs::path prefix = options.rootName.empty() ? fs::path() : fs::path(options.rootName);
    size_t entries = 0;
    if (!prefix.empty()) {
        if (auto written = writeEntry(a, sourceDir, prefix.string()); !written) {
            return fail(written.error());
        }
        ++entries;
    }

    std::vector<fs::path> paths;
    for (auto it = fs::recursive_directory_iterator(sourceDir, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (isExcluded(it->path(), options.excludes)) {
            if (it->is_directory() && !it->is_symlink()) {
                it.disable_recursion_pending();
            }
            continue;
        }
        paths.push_back(it->path());
    }
    if (ec) {
        return fail(std::format("Failed to walk {}: {}", sourceDir.string(), ec.message()));
    }
    std::ranges::sort(paths);

    for (const auto& path : paths) {
        if (path == archivePath) {
            continue;
        }
        fs::path name = prefix / path.lexically_relative(sourceDir);
        if (auto written = writeEntry(a, path, name.generic_string()); !written) {
            return fail(written.error());
        }
        ++entries;
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        std::string err = std::format("Failed to finalize archive {}: {}", archivePath.string(), archive_error_string(a));
        archive_write_free(a);
        fs::remove(archivePath, ec);
        return std::unexpected(err);
    }
    archive_write_free(a);
    return entries;
}

std::expected<size_t, std::string> LibArchiveArchiver::verify(const fs::path& archivePath) const {
    ReadHandle handle;
    if (auto opened = openForRead(handle, archivePath); !opened) {
        return std::unexpected(opened.error());
    }

    size_t entries = 0;
    struct archive_entry* entry = nullptr;
    char buf[64 * 1024];
    while (true) {
        int r = archive_read_next_header(handle.a, &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_WARN) {
            return std::unexpected(std::format("Archive {} is damaged: {}", archivePath.string(),
                                               archive_error_string(handle.a)));
        }
        la_ssize_t n = 0;
        while ((n = archive_read_data(handle.a, buf, sizeof(buf))) > 0) {
        }
        if (n < 0) {
            return std::unexpected(std::format("Archive {} has unreadable data for {}: {}", archivePath.string(),
                                               archive_entry_pathname(entry), archive_error_string(handle.a)));
        }
        ++entries;
    }
    if (entries == 0) {
        return std::unexpected(std::format("Archive {} contains no entries", archivePath.string()));
    }
    return entries;
}

std::expected<std::vector<std::string>, std::string> LibArchiveArchiver::list(const fs::path& archivePath) const {
    ReadHandle handle;
    if (auto opened = openForRead(handle, archivePath); !opened) {
        return std::unexpected(opened.error());
    }
    std::vector<std::string> names;
    struct archive_entry* entry = nullptr;
    while (true) {
        int r = archive_read_next_header(handle.a, &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_WARN) {
            return std::unexpected(std::format("Failed to list {}: {}", archivePath.string(),
                                               archive_error_string(handle.a)));
        }
        names.emplace_back(archive_entry_pathname(entry));
        archive_read_data_skip(handle.a);
    }
    return names;
}

std::expected<size_t, std::string> LibArchiveArchiver::extract(const fs::path& archivePath,
                                                               const fs::path& target) const {
    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to create {}: {}", target.string(), ec.message()));
    }
    const fs::path destination = fs::weakly_canonical(target, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to resolve {}: {}", target.string(), ec.message()));
    }

    ReadHandle handle;
    if (auto opened = openForRead(handle, archivePath); !opened) {
        return std::unexpected(opened.error());
    }

    struct archive* out = archive_write_disk_new();
    // Entry names are checked below before being rebased onto the destination, so
    // absolute paths are expected here.
    archive_write_disk_set_options(out, ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                            ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(out);

    auto fail = [&](const std::string& message) -> std::expected<size_t, std::string> {
        archive_write_free(out);
        return std::unexpected(message);
    };

    size_t entries = 0;
    struct archive_entry* entry = nullptr;
    while (true) {
        int r = archive_read_next_header(handle.a, &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_WARN) {
            return fail(std::format("Failed to read {}: {}", archivePath.string(), archive_error_string(handle.a)));
        }

        std::string name = archive_entry_pathname(entry);
        fs::path relative = fs::path(name).lexically_normal();
        if (relative.is_absolute() || relative.empty() || relative.string().starts_with("..")) {
            return fail(std::format("Refusing unsafe archive entry: {}", name));
        }
        const std::string fullPath = (destination / relative).string();
        archive_entry_set_pathname(entry, fullPath.c_str());
        if (const char* link = archive_entry_hardlink(entry)) {
            const std::string fullLink = (destination / fs::path(link).lexically_normal()).string();
            archive_entry_set_hardlink(entry, fullLink.c_str());
        }

        if (archive_write_header(out, entry) < ARCHIVE_WARN) {
            return fail(std::format("Failed to extract {}: {}", name, archive_error_string(out)));
        }
        const void* block = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        while (true) {
            int d = archive_read_data_block(handle.a, &block, &size, &offset);
            if (d == ARCHIVE_EOF) {
                break;
            }
            if (d < ARCHIVE_WARN) {
                return fail(std::format("Failed to read data for {}: {}", name, archive_error_string(handle.a)));
            }
            if (archive_write_data_block(out, block, size, offset) < ARCHIVE_WARN) {
                return fail(std::format("Failed to write data for {}: {}", name, archive_error_string(out)));
            }
        }
        if (archive_write_finish_entry(out) < ARCHIVE_WARN) {
            return fail(std::format("Failed to finish {}: {}", name, archive_error_string(out)));
        }
        ++entries;
    }

    if (archive_write_close(out) != ARCHIVE_OK) {
        return fail(std::format("Failed to finalize extraction of {}: {}", archivePath.string(),
                                archive_error_string(out)));
    }
    archive_write_free(out);
    return entries;
}
