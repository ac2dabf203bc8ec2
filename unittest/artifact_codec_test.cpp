#include <gtest/gtest.h>
#include "artifact_codec.hpp"
#include "test_helpers.hpp"

class ArtifactCodecTest : public VaultKeeperTest {
protected:
    void SetUp() override {
        VaultKeeperTest::SetUp();
        codec_ = std::make_unique<ArtifactCodec>(gzip_, encryptor_, logger_);
        plain_ = root_ / "work" / "report.txt";
        writeFile(plain_, content_);
        fs::create_directories(root_ / "out");
        fs::create_directories(root_ / "scratch");
    }

    GzipCompressor gzip_;
    FakeEncryptor encryptor_;
    std::unique_ptr<ArtifactCodec> codec_;
    fs::path plain_;
    std::string content_ = std::string(4096, 'a') + "vault entries\n";
};

TEST_F(ArtifactCodecTest, ArtifactNameAppendsBothExtensions) {
    EXPECT_EQ(codec_->artifactName("database-native-20240101-000000.sqlite3"),
              "database-native-20240101-000000.sqlite3.gz.gpg");
}

TEST_F(ArtifactCodecTest, SealLeavesOnlyTheEncryptedArtifact) {
    const fs::path sealed = root_ / "out" / "report.txt.gz.gpg";
    auto sizes = codec_->seal(plain_, sealed);
    ASSERT_TRUE(sizes.has_value()) << sizes.error();

    EXPECT_EQ(sizes->plain, content_.size());
    EXPECT_GT(sizes->compressed, 0u);
    EXPECT_LT(sizes->compressed, sizes->plain);
    EXPECT_GT(sizes->encrypted, 0u);
    EXPECT_TRUE(fs::exists(sealed));
    EXPECT_FALSE(fs::exists(root_ / "work" / "report.txt.gz"));
    EXPECT_FALSE(fs::exists(root_ / "out" / "report.txt.gz.gpg.partial"));
    EXPECT_EQ(std::distance(fs::directory_iterator(root_ / "out"), fs::directory_iterator()), 1);
}

TEST_F(ArtifactCodecTest, OpenRecoversOriginalBytes) {
    const fs::path sealed = root_ / "out" / "report.txt.gz.gpg";
    ASSERT_TRUE(codec_->seal(plain_, sealed).has_value());

    auto opened = codec_->open(sealed, root_ / "scratch");
    ASSERT_TRUE(opened.has_value()) << opened.error();
    EXPECT_EQ(opened->filename(), "report.txt");
    EXPECT_EQ(readFile(*opened), content_);
    EXPECT_FALSE(fs::exists(root_ / "scratch" / "report.txt.gz"));
}

TEST_F(ArtifactCodecTest, TruncatedArtifactFailsToDecrypt) {
    const fs::path sealed = root_ / "out" / "report.txt.gz.gpg";
    ASSERT_TRUE(codec_->seal(plain_, sealed).has_value());
    fs::resize_file(sealed, fs::file_size(sealed) - 10);

    auto opened = codec_->open(sealed, root_ / "scratch");
    ASSERT_FALSE(opened.has_value());
    EXPECT_NE(opened.error().find("Decryption failed"), std::string::npos);
    EXPECT_TRUE(fs::is_empty(root_ / "scratch"));
}

TEST_F(ArtifactCodecTest, EncryptionFailureRemovesIntermediates) {
    encryptor_.failEncrypt = true;
    const fs::path sealed = root_ / "out" / "report.txt.gz.gpg";

    auto sizes = codec_->seal(plain_, sealed);
    ASSERT_FALSE(sizes.has_value());
    EXPECT_NE(sizes.error().find("Encryption failed"), std::string::npos);
    EXPECT_FALSE(fs::exists(sealed));
    EXPECT_FALSE(fs::exists(root_ / "work" / "report.txt.gz"));
    EXPECT_TRUE(fs::is_empty(root_ / "out"));
}

TEST_F(ArtifactCodecTest, GzipRejectsPlainInput) {
    const fs::path output = root_ / "scratch" / "out.bin";
    auto done = gzip_.decompress(plain_, output);
    ASSERT_FALSE(done.has_value());
    EXPECT_FALSE(fs::exists(output));
}

TEST_F(ArtifactCodecTest, GzipDetectsTruncatedStream) {
    const fs::path compressed = root_ / "scratch" / "report.txt.gz";
    ASSERT_TRUE(gzip_.compress(plain_, compressed).has_value());
    fs::resize_file(compressed, fs::file_size(compressed) / 2);

    const fs::path output = root_ / "scratch" / "report.txt";
    EXPECT_FALSE(gzip_.decompress(compressed, output).has_value());
    EXPECT_FALSE(fs::exists(output));
}

TEST_F(ArtifactCodecTest, PassphraseFileIsPrivateAndTransient) {
    fs::path keyPath;
    {
        auto keyFile = PassphraseFile::create(root_ / "scratch", kTestPassphrase);
        ASSERT_TRUE(keyFile.has_value()) << keyFile.error();
        keyPath = keyFile->path();
        EXPECT_EQ(readFile(keyPath), kTestPassphrase);
        EXPECT_EQ(fs::status(keyPath).permissions() & fs::perms::all,
                  fs::perms::owner_read | fs::perms::owner_write);
    }
    EXPECT_FALSE(fs::exists(keyPath));
    EXPECT_FALSE(fs::exists(keyPath.parent_path()));
}
