#include <gtest/gtest.h>
#include <algorithm>
#include <unistd.h>
#include "file_utils.hpp"
#include "test_helpers.hpp"

class FileUtilsTest : public VaultKeeperTest {};

TEST_F(FileUtilsTest, TempDirIsPrivateAndWipedOnDestruction) {
    fs::path kept;
    {
        auto dir = ScopedTempDir::create(root_ / "scratch", "vaultkeeper-key-", &logger_);
        ASSERT_TRUE(dir.has_value()) << dir.error();
        kept = dir->path();
        EXPECT_EQ(fs::status(kept).permissions() & fs::perms::all, fs::perms::owner_all);
        writeFile(kept / "nested" / "plain.sqlite3", "decrypted payload");
    }
    EXPECT_FALSE(fs::exists(kept));
}

TEST_F(FileUtilsTest, FailedWipeIsLogged) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "directory permissions do not bind root";
    }
    Logger logger("scratch", root_ / "logs", LogLevel::Warning);
    fs::path locked;
    {
        auto dir = ScopedTempDir::create(root_ / "scratch", "vaultkeeper-restore-", &logger);
        ASSERT_TRUE(dir.has_value()) << dir.error();
        locked = dir->path() / "locked";
        writeFile(locked / "plain.sqlite3", "decrypted payload");
        fs::permissions(locked, fs::perms::owner_read | fs::perms::owner_exec, fs::perm_options::replace);
    }
    EXPECT_EQ(readFile(locked / "plain.sqlite3"), std::string(17, '\0'));
    fs::permissions(locked, fs::perms::owner_all, fs::perm_options::replace);

    const std::string log = readFile(root_ / "logs" / "backup.log");
    EXPECT_NE(log.find("WARNING: Temporary directory not fully wiped"), std::string::npos) << log;
}

TEST_F(FileUtilsTest, FilteredCopySkipsWithoutWriting) {
    writeFile(root_ / "caddy" / "Caddyfile", "vault.example.org\n");
    writeFile(root_ / "caddy" / "settings.json", "{}");
    writeFile(root_ / "caddy" / "private" / "key.pem", "key");
    writeFile(root_ / "caddy" / "sites" / "a.conf", "site");
    fs::create_symlink("sites/a.conf", root_ / "caddy" / "current.conf");

    std::vector<fs::path> skipped;
    auto copied = copyTree(root_ / "caddy", root_ / "copy", [&skipped](const fs::path& path) {
        const bool skip = path.filename() == "settings.json" || path.filename() == "private";
        if (skip) {
            skipped.push_back(path.filename());
        }
        return skip;
    });
    ASSERT_TRUE(copied.has_value()) << copied.error();

    EXPECT_EQ(readFile(root_ / "copy" / "Caddyfile"), "vault.example.org\n");
    EXPECT_EQ(readFile(root_ / "copy" / "sites" / "a.conf"), "site");
    EXPECT_TRUE(fs::is_symlink(root_ / "copy" / "current.conf"));
    EXPECT_EQ(fs::read_symlink(root_ / "copy" / "current.conf"), fs::path("sites/a.conf"));
    EXPECT_FALSE(fs::exists(root_ / "copy" / "settings.json"));
    EXPECT_FALSE(fs::exists(root_ / "copy" / "private"));
    std::ranges::sort(skipped);
    EXPECT_EQ(skipped, (std::vector<fs::path>{"private", "settings.json"}));
}

TEST_F(FileUtilsTest, FilteredCopyOfSkippedSingleFileWritesNothing) {
    writeFile(root_ / "settings.json", "{}");
    auto copied = copyTree(root_ / "settings.json", root_ / "copy.json",
                           [](const fs::path& path) { return path.filename() == "settings.json"; });
    ASSERT_TRUE(copied.has_value());
    EXPECT_FALSE(fs::exists(root_ / "copy.json"));
}
