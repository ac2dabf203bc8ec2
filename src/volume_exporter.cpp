#include "volume_exporter.hpp"
#include <format>

DockerVolumeExporter::DockerVolumeExporter(std::string helperImage, std::chrono::seconds timeout, bool lowPriority)
    : helperImage_(std::move(helperImage)), timeout_(timeout), lowPriority_(lowPriority) {}

std::expected<void, std::string> DockerVolumeExporter::runDocker(const std::vector<std::string>& args) const {
    std::vector<std::string> argv = {"docker"};
    argv.insert(argv.end(), args.begin(), args.end());
    ProcessOptions options;
    options.timeout = timeout_;
    options.lowPriority = lowPriority_;
    auto result = runner_.run(argv, options);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!result->ok()) {
        return std::unexpected(std::format("docker {} failed: {}", args.front(), result->describe()));
    }
    return {};
}

bool DockerVolumeExporter::exists(const std::string& volume) const {
    ProcessOptions options;
    options.timeout = std::chrono::seconds(30);
    auto result = runner_.run({"docker", "volume", "inspect", volume}, options);
    return result && result->ok();
}

std::expected<void, std::string> DockerVolumeExporter::exportVolume(const std::string& volume,
                                                                    const fs::path& archive) const {
    const fs::path dir = fs::absolute(archive).parent_path();
    const std::string name = archive.filename().string();
    auto done = runDocker({"run", "--rm", "--network", "none",
                           "-v", std::format("{}:/source:ro", volume),
                           "-v", std::format("{}:/backup", dir.string()),
                           helperImage_, "tar", "-C", "/source", "-czf", "/backup/" + name, "."});
    if (!done) {
        std::error_code ec;
        fs::remove(archive, ec);
        return std::unexpected(std::format("Export of volume {} failed: {}", volume, done.error()));
    }
    return {};
}

std::expected<void, std::string> DockerVolumeExporter::importVolume(const std::string& volume,
                                                                    const fs::path& archive) const {
    const fs::path dir = fs::absolute(archive).parent_path();
    const std::string name = archive.filename().string();
    // The helper extracts into a sibling directory first so a corrupt archive leaves the volume untouched.
    const std::string script = std::format(
        "set -e; mkdir -p /target/.vaultkeeper-import; tar -xzf /backup/{0} -C /target/.vaultkeeper-import; "
        "find /target -mindepth 1 -maxdepth 1 ! -name .vaultkeeper-import -exec rm -rf {{}} +; "
        "cd /target/.vaultkeeper-import && find . -mindepth 1 -maxdepth 1 -exec mv {{}} /target/ \\; ; "
        "rmdir /target/.vaultkeeper-import",
        name);
    auto done = runDocker({"run", "--rm", "--network", "none",
                           "-v", std::format("{}:/target", volume),
                           "-v", std::format("{}:/backup:ro", dir.string()),
                           helperImage_, "sh", "-c", script});
    if (!done) {
        return std::unexpected(std::format("Import into volume {} failed: {}", volume, done.error()));
    }
    return {};
}
