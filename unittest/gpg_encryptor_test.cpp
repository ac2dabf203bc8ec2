#include <gtest/gtest.h>
#include <cstdlib>
#include "artifact_codec.hpp"
#include "process_runner.hpp"
#include "test_helpers.hpp"

class GpgEncryptorTest : public VaultKeeperTest {
protected:
    void SetUp() override {
        VaultKeeperTest::SetUp();
        if (!ProcessRunner::commandExists("gpg")) {
            GTEST_SKIP() << "gpg is not installed";
        }
        gnupgHome_ = root_ / "gnupg";
        fs::create_directories(gnupgHome_);
        fs::permissions(gnupgHome_, fs::perms::owner_all, fs::perm_options::replace);
        ::setenv("GNUPGHOME", gnupgHome_.c_str(), 1);

        scratch_ = root_ / "scratch";
        plain_ = root_ / "plain.bin";
        writeFile(plain_, "encrypted vault payload\n");
    }

    void TearDown() override {
        if (!gnupgHome_.empty()) {
            if (ProcessRunner::commandExists("gpgconf")) {
                ProcessRunner runner;
                (void)runner.run({"gpgconf", "--kill", "gpg-agent"});
            }
            ::unsetenv("GNUPGHOME");
        }
    }

    GpgEncryptor makeEncryptor(const std::string& passphrase) const {
        return GpgEncryptor(passphrase, scratch_, std::chrono::seconds(60), false);
    }

    fs::path gnupgHome_;
    fs::path scratch_;
    fs::path plain_;
};

TEST_F(GpgEncryptorTest, RoundTripRecoversPlaintext) {
    auto gpg = makeEncryptor(kTestPassphrase);
    const fs::path encrypted = root_ / "plain.bin.gpg";
    auto done = gpg.encrypt(plain_, encrypted);
    ASSERT_TRUE(done.has_value()) << done.error();
    EXPECT_NE(readFile(encrypted), readFile(plain_));

    const fs::path decrypted = root_ / "decrypted.bin";
    auto opened = gpg.decrypt(encrypted, decrypted);
    ASSERT_TRUE(opened.has_value()) << opened.error();
    EXPECT_EQ(readFile(decrypted), readFile(plain_));
}

TEST_F(GpgEncryptorTest, WrongPassphraseFails) {
    const fs::path encrypted = root_ / "plain.bin.gpg";
    ASSERT_TRUE(makeEncryptor(kTestPassphrase).encrypt(plain_, encrypted).has_value());

    const fs::path decrypted = root_ / "decrypted.bin";
    auto opened = makeEncryptor("not-the-passphrase").decrypt(encrypted, decrypted);
    EXPECT_FALSE(opened.has_value());
    EXPECT_FALSE(fs::exists(decrypted));
}

TEST_F(GpgEncryptorTest, PassphraseFileIsRemovedAfterEachCall) {
    auto gpg = makeEncryptor(kTestPassphrase);
    ASSERT_TRUE(gpg.encrypt(plain_, root_ / "plain.bin.gpg").has_value());
    EXPECT_FALSE(gpg.decrypt(plain_, root_ / "bogus.out").has_value());

    EXPECT_TRUE(findDirectories(scratch_, "vaultkeeper-key-").empty());
}

TEST(GpgEncryptorConfigTest, EmptyPassphraseIsRejectedBeforeRunningGpg) {
    GpgEncryptor gpg("", fs::temp_directory_path(), std::chrono::seconds(5), false);
    auto done = gpg.encrypt("/nonexistent/input", "/nonexistent/output.gpg");
    ASSERT_FALSE(done.has_value());
    EXPECT_NE(done.error().find("passphrase is empty"), std::string::npos);
}
