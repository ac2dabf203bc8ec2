#include "artifact_codec.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <fstream>
#include <unistd.h>
#include <zlib.h>

namespace {

void removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

fs::path partialName(const fs::path& path) {
    fs::path partial = path;
    partial += ".partial";
    return partial;
}

std::expected<void, std::string> renameInto(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        removeQuietly(from);
        return std::unexpected(std::format("Failed to rename {} to {}: {}", from.string(), to.string(), ec.message()));
    }
    return {};
}

std::uintmax_t fileSize(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : size;
}

} // namespace

GzipCompressor::GzipCompressor(int level) : level_(level) {}

std::expected<void, std::string> GzipCompressor::compress(const fs::path& input, const fs::path& output) const {
    std::ifstream inFile(input, std::ios::binary);
    if (!inFile) {
        return std::unexpected(std::format("Failed to open {} for compression", input.string()));
    }
    const std::string mode = std::format("wb{}", level_);
    gzFile outFile = gzopen(output.c_str(), mode.c_str());
    if (!outFile) {
        return std::unexpected(std::format("Failed to open gzip file for writing: {}", output.string()));
    }

    char buf[64 * 1024];
    while (inFile) {
        inFile.read(buf, sizeof(buf));
        std::streamsize count = inFile.gcount();
        if (count > 0 && gzwrite(outFile, buf, static_cast<unsigned>(count)) != static_cast<int>(count)) {
            int errnum = 0;
            std::string err = std::format("gzip write failed for {}: {}", output.string(), gzerror(outFile, &errnum));
            gzclose(outFile);
            removeQuietly(output);
            return std::unexpected(err);
        }
    }
    if (inFile.bad()) {
        gzclose(outFile);
        removeQuietly(output);
        return std::unexpected(std::format("Read error while compressing {}", input.string()));
    }
    if (gzclose(outFile) != Z_OK) {
        removeQuietly(output);
        return std::unexpected(std::format("Failed to finalize gzip file {}", output.string()));
    }
    return {};
}

std::expected<void, std::string> GzipCompressor::decompress(const fs::path& input, const fs::path& output) const {
    gzFile inFile = gzopen(input.c_str(), "rb");
    if (!inFile) {
        return std::unexpected(std::format("Failed to open gzip file for reading: {}", input.string()));
    }
    std::ofstream outFile(output, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        gzclose(inFile);
        return std::unexpected(std::format("Failed to open {} for writing", output.string()));
    }

    char buf[64 * 1024];
    std::string err;
    bool checkedFormat = false;
    while (true) {
        int count = gzread(inFile, buf, sizeof(buf));
        if (!checkedFormat) {
            checkedFormat = true;
            if (count > 0 && gzdirect(inFile)) {
                err = std::format("{} is not gzip data", input.string());
                break;
            }
        }
        if (count < 0) {
            int errnum = 0;
            err = std::format("gzip read failed for {}: {}", input.string(), gzerror(inFile, &errnum));
            break;
        }
        if (count == 0) {
            break;
        }
        outFile.write(buf, count);
        if (!outFile) {
            err = std::format("Write error while decompressing into {}", output.string());
            break;
        }
    }
    int closeStatus = gzclose(inFile);
    outFile.close();
    if (err.empty() && closeStatus != Z_OK) {
        err = std::format("gzip stream in {} is truncated or corrupt", input.string());
    }
    if (!err.empty()) {
        removeQuietly(output);
        return std::unexpected(err);
    }
    return {};
}

std::expected<PassphraseFile, std::string> PassphraseFile::create(const fs::path& scratchParent,
                                                                  const std::string& passphrase) {
    auto dir = ScopedTempDir::create(scratchParent, "vaultkeeper-key-");
    if (!dir) {
        return std::unexpected(dir.error());
    }
    fs::path file = dir->path() / "passphrase";
    int fd = ::open(file.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        return std::unexpected(std::format("Failed to create passphrase file: {}", std::strerror(errno)));
    }
    size_t written = 0;
    while (written < passphrase.size()) {
        ssize_t n = ::write(fd, passphrase.data() + written, passphrase.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string err = std::format("Failed to write passphrase file: {}", std::strerror(errno));
            ::close(fd);
            return std::unexpected(err);
        }
        written += static_cast<size_t>(n);
    }
    ::close(fd);
    return PassphraseFile(std::move(*dir), std::move(file));
}

GpgEncryptor::GpgEncryptor(std::string passphrase, fs::path scratchParent, std::chrono::seconds timeout,
                           bool lowPriority)
    : passphrase_(std::move(passphrase)), scratchParent_(std::move(scratchParent)), timeout_(timeout),
      lowPriority_(lowPriority) {}

std::expected<void, std::string> GpgEncryptor::runGpg(const std::vector<std::string>& operation,
                                                      const fs::path& input, const fs::path& output) const {
    if (passphrase_.empty()) {
        return std::unexpected("Encryption passphrase is empty");
    }
    auto keyFile = PassphraseFile::create(scratchParent_, passphrase_);
    if (!keyFile) {
        return std::unexpected(keyFile.error());
    }

    std::vector<std::string> argv = {"gpg", "--batch", "--yes", "--quiet", "--no-tty",
                                     "--pinentry-mode", "loopback", "--no-symkey-cache",
                                     "--passphrase-file", keyFile->path().string()};
    argv.insert(argv.end(), operation.begin(), operation.end());
    argv.insert(argv.end(), {"--output", output.string(), input.string()});

    ProcessOptions options;
    options.timeout = timeout_;
    options.lowPriority = lowPriority_;
    auto result = runner_.run(argv, options);
    if (!result) {
        removeQuietly(output);
        return std::unexpected(result.error());
    }
    if (!result->ok()) {
        removeQuietly(output);
        return std::unexpected(std::format("gpg failed: {}", result->describe()));
    }
    return {};
}

std::expected<void, std::string> GpgEncryptor::encrypt(const fs::path& input, const fs::path& output) const {
    return runGpg({"--symmetric", "--cipher-algo", "AES256", "--compress-algo", "none"}, input, output);
}

std::expected<void, std::string> GpgEncryptor::decrypt(const fs::path& input, const fs::path& output) const {
    return runGpg({"--decrypt"}, input, output);
}

ArtifactCodec::ArtifactCodec(const Compressor& compressor, const Encryptor& encryptor, const Logger& logger)
    : compressor_(compressor), encryptor_(encryptor), logger_(logger) {}

std::string ArtifactCodec::artifactName(const std::string& plainName) const {
    return plainName + compressor_.extension() + encryptor_.extension();
}

std::expected<fs::path, std::string> ArtifactCodec::compress(const fs::path& path) const {
    fs::path output = path;
    output += compressor_.extension();
    fs::path partial = partialName(output);
    if (auto done = compressor_.compress(path, partial); !done) {
        removeQuietly(partial);
        return std::unexpected(done.error());
    }
    if (auto renamed = renameInto(partial, output); !renamed) {
        return std::unexpected(renamed.error());
    }
    return output;
}

std::expected<fs::path, std::string> ArtifactCodec::encrypt(const fs::path& path) const {
    fs::path output = path;
    output += encryptor_.extension();
    fs::path partial = partialName(output);
    if (auto done = encryptor_.encrypt(path, partial); !done) {
        removeQuietly(partial);
        return std::unexpected(done.error());
    }
    if (auto renamed = renameInto(partial, output); !renamed) {
        return std::unexpected(renamed.error());
    }
    return output;
}

std::expected<ArtifactSizes, std::string> ArtifactCodec::seal(const fs::path& plain, const fs::path& finalPath) const {
    ArtifactSizes sizes;
    sizes.plain = fileSize(plain);

    fs::path compressed = plain;
    compressed += compressor_.extension();
    fs::path encrypted = partialName(finalPath);

    logger_.debug(std::format("Compressing {}", plain.filename().string()));
    if (auto done = compressor_.compress(plain, compressed); !done) {
        removeQuietly(compressed);
        return std::unexpected(std::format("Compression failed: {}", done.error()));
    }
    sizes.compressed = fileSize(compressed);

    logger_.debug(std::format("Encrypting {}", finalPath.filename().string()));
    auto encryptedOk = encryptor_.encrypt(compressed, encrypted);
    if (auto wiped = secureRemove(compressed); !wiped) {
        logger_.warning(wiped.error());
    }
    if (!encryptedOk) {
        removeQuietly(encrypted);
        return std::unexpected(std::format("Encryption failed: {}", encryptedOk.error()));
    }
    sizes.encrypted = fileSize(encrypted);
    if (sizes.encrypted == 0) {
        removeQuietly(encrypted);
        return std::unexpected("Encryption produced an empty file");
    }

    if (auto renamed = renameInto(encrypted, finalPath); !renamed) {
        return std::unexpected(renamed.error());
    }
    return sizes;
}

std::expected<fs::path, std::string> ArtifactCodec::decryptToTemp(const fs::path& artifact,
                                                                  const fs::path& scratchDir) const {
    std::string name = artifact.filename().string();
    const std::string encExt = encryptor_.extension();
    if (name.size() > encExt.size() && name.ends_with(encExt)) {
        name.resize(name.size() - encExt.size());
    } else {
        name += ".decrypted";
    }
    fs::path output = scratchDir / name;
    if (auto done = encryptor_.decrypt(artifact, output); !done) {
        removeQuietly(output);
        return std::unexpected(std::format("Decryption failed: {}", done.error()));
    }
    return output;
}

std::expected<fs::path, std::string> ArtifactCodec::decompress(const fs::path& path) const {
    std::string name = path.filename().string();
    const std::string zExt = compressor_.extension();
    if (name.size() > zExt.size() && name.ends_with(zExt)) {
        name.resize(name.size() - zExt.size());
    } else {
        name += ".out";
    }
    fs::path output = path.parent_path() / name;
    if (auto done = compressor_.decompress(path, output); !done) {
        removeQuietly(output);
        return std::unexpected(std::format("Decompression failed: {}", done.error()));
    }
    return output;
}

std::expected<fs::path, std::string> ArtifactCodec::open(const fs::path& artifact, const fs::path& scratchDir) const {
    auto decrypted = decryptToTemp(artifact, scratchDir);
    if (!decrypted) {
        return std::unexpected(decrypted.error());
    }
    auto plain = decompress(*decrypted);
    removeQuietly(*decrypted);
    if (!plain) {
        return std::unexpected(plain.error());
    }
    return *plain;
}
