/**
 * @file artifact_codec.hpp
 * @brief Compress-then-encrypt primitive and its inverse.
 *
 * Every artifact written by VaultKeeper is gzip-compressed and then wrapped in an
 * OpenPGP symmetric envelope, so an operator can always recover it with
 * `gpg --decrypt file | gunzip` and no VaultKeeper code.
 *
 * @note Requires zlib for compression and the gpg executable in PATH for encryption.
 */

#ifndef ARTIFACT_CODEC_HPP
#define ARTIFACT_CODEC_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include "file_utils.hpp"
#include "logger.hpp"
#include "process_runner.hpp"

namespace fs = std::filesystem;

/**
 * @brief Interface for a stream compressor.
 */
class Compressor {
public:
    virtual ~Compressor() = default;

    /**
     * @brief Compresses @p input into @p output. On failure @p output is removed.
     */
    virtual std::expected<void, std::string> compress(const fs::path& input, const fs::path& output) const = 0;

    /**
     * @brief Decompresses @p input into @p output. Truncated or corrupt input is an error.
     */
    virtual std::expected<void, std::string> decompress(const fs::path& input, const fs::path& output) const = 0;

    /**
     * @brief File extension appended by compress(), including the dot.
     */
    virtual std::string extension() const = 0;
};

/**
 * @brief gzip compressor backed by zlib, output readable by gunzip.
 */
class GzipCompressor : public Compressor {
public:
    explicit GzipCompressor(int level = 9);

    std::expected<void, std::string> compress(const fs::path& input, const fs::path& output) const override;
    std::expected<void, std::string> decompress(const fs::path& input, const fs::path& output) const override;
    std::string extension() const override { return ".gz"; }

private:
    int level_; ///< zlib compression level (1-9).
};

/**
 * @brief Interface for symmetric passphrase encryption.
 */
class Encryptor {
public:
    virtual ~Encryptor() = default;

    /**
     * @brief Encrypts @p input into @p output. On failure @p output is removed.
     */
    virtual std::expected<void, std::string> encrypt(const fs::path& input, const fs::path& output) const = 0;

    /**
     * @brief Decrypts @p input into @p output. A wrong secret or damaged input is an error.
     */
    virtual std::expected<void, std::string> decrypt(const fs::path& input, const fs::path& output) const = 0;

    /**
     * @brief File extension appended by encrypt(), including the dot.
     */
    virtual std::string extension() const = 0;
};

/**
 * @brief Transient 0600 file holding the passphrase for a command-line tool.
 *
 * The file lives in its own 0700 directory. The destructor overwrites it with
 * zeros and removes the directory, on success and failure paths alike.
 */
class PassphraseFile {
public:
    static std::expected<PassphraseFile, std::string> create(const fs::path& scratchParent,
                                                             const std::string& passphrase);

    const fs::path& path() const { return file_; }

private:
    PassphraseFile(ScopedTempDir dir, fs::path file) : dir_(std::move(dir)), file_(std::move(file)) {}

    ScopedTempDir dir_;
    fs::path file_;
};

/**
 * @brief OpenPGP symmetric encryption (AES256) through the gpg executable.
 */
class GpgEncryptor : public Encryptor {
public:
    /**
     * @brief Constructs a gpg encryptor.
     *
     * @param passphrase Shared secret. Only ever handed to gpg through a PassphraseFile.
     * @param scratchParent Parent directory for the transient passphrase file.
     * @param timeout Wall-clock limit for one gpg invocation.
     * @param lowPriority Run gpg at reduced scheduling priority.
     */
    GpgEncryptor(std::string passphrase, fs::path scratchParent, std::chrono::seconds timeout, bool lowPriority);

    std::expected<void, std::string> encrypt(const fs::path& input, const fs::path& output) const override;
    std::expected<void, std::string> decrypt(const fs::path& input, const fs::path& output) const override;
    std::string extension() const override { return ".gpg"; }

private:
    std::expected<void, std::string> runGpg(const std::vector<std::string>& operation, const fs::path& input,
                                            const fs::path& output) const;

    std::string passphrase_;
    fs::path scratchParent_;
    std::chrono::seconds timeout_;
    bool lowPriority_;
    ProcessRunner runner_;
};

/**
 * @brief Sizes of one artifact at each pipeline stage.
 */
struct ArtifactSizes {
    std::uintmax_t plain = 0;
    std::uintmax_t compressed = 0;
    std::uintmax_t encrypted = 0;
};

/**
 * @brief Combines a Compressor and an Encryptor into the artifact pipeline.
 */
class ArtifactCodec {
public:
    ArtifactCodec(const Compressor& compressor, const Encryptor& encryptor, const Logger& logger);

    /**
     * @brief Compresses @p path next to itself and returns the compressed path.
     *
     * The output is written under a ".partial" name and renamed once complete.
     */
    std::expected<fs::path, std::string> compress(const fs::path& path) const;

    /**
     * @brief Encrypts @p path next to itself and returns the encrypted path.
     */
    std::expected<fs::path, std::string> encrypt(const fs::path& path) const;

    /**
     * @brief Compresses then encrypts @p plain into @p finalPath.
     *
     * @p finalPath only appears once both steps succeeded. The intermediate
     * compressed file is removed on every path; @p plain is left to the caller.
     */
    std::expected<ArtifactSizes, std::string> seal(const fs::path& plain, const fs::path& finalPath) const;

    /**
     * @brief Decrypts @p artifact into @p scratchDir and returns the decrypted path.
     */
    std::expected<fs::path, std::string> decryptToTemp(const fs::path& artifact, const fs::path& scratchDir) const;

    /**
     * @brief Decompresses @p path next to itself, stripping the compression extension.
     */
    std::expected<fs::path, std::string> decompress(const fs::path& path) const;

    /**
     * @brief Decrypts and decompresses @p artifact into @p scratchDir, returning the plaintext path.
     */
    std::expected<fs::path, std::string> open(const fs::path& artifact, const fs::path& scratchDir) const;

    /**
     * @brief Appends the compression and encryption extensions to @p plainName.
     */
    std::string artifactName(const std::string& plainName) const;

private:
    const Compressor& compressor_;
    const Encryptor& encryptor_;
    const Logger& logger_;
};

#endif // ARTIFACT_CODEC_HPP
