/**
 * @file volume_exporter.hpp
 * @brief Export and import of container runtime volumes.
 *
 * The Docker implementation never touches volume storage directly: it attaches the
 * volume to a disposable helper container (read-only for export) and streams a
 * tar.gz through a bind-mounted directory.
 */

#ifndef VOLUME_EXPORTER_HPP
#define VOLUME_EXPORTER_HPP

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include "process_runner.hpp"

namespace fs = std::filesystem;

class VolumeExporter {
public:
    virtual ~VolumeExporter() = default;

    virtual bool exists(const std::string& volume) const = 0;

    /**
     * @brief Archives the contents of @p volume into @p archive (tar.gz).
     */
    virtual std::expected<void, std::string> exportVolume(const std::string& volume, const fs::path& archive) const = 0;

    /**
     * @brief Replaces the contents of @p volume with the tar.gz @p archive.
     */
    virtual std::expected<void, std::string> importVolume(const std::string& volume, const fs::path& archive) const = 0;
};

class DockerVolumeExporter : public VolumeExporter {
public:
    /**
     * @param helperImage Image used for the disposable helper (e.g. "alpine:3.19").
     * @param timeout Wall-clock limit for one export or import.
     * @param lowPriority Run the docker client at reduced priority.
     */
    DockerVolumeExporter(std::string helperImage, std::chrono::seconds timeout, bool lowPriority);

    bool exists(const std::string& volume) const override;
    std::expected<void, std::string> exportVolume(const std::string& volume, const fs::path& archive) const override;
    std::expected<void, std::string> importVolume(const std::string& volume, const fs::path& archive) const override;

private:
    std::expected<void, std::string> runDocker(const std::vector<std::string>& args) const;

    std::string helperImage_;
    std::chrono::seconds timeout_;
    bool lowPriority_;
    ProcessRunner runner_;
};

#endif // VOLUME_EXPORTER_HPP
