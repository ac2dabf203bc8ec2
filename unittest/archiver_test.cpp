#include <gtest/gtest.h>
#include <algorithm>
#include <archive.h>
#include <archive_entry.h>
#include "archiver.hpp"
#include "test_helpers.hpp"

class ArchiverTest : public VaultKeeperTest {
protected:
    void SetUp() override {
        VaultKeeperTest::SetUp();
        source_ = root_ / "source";
        writeFile(source_ / "config.json", "{\"domain\": \"vault.example.org\"}\n");
        writeFile(source_ / "attachments" / "a1" / "blob.bin", std::string(2048, '\x07'));
        writeFile(source_ / "db.sqlite3", "live database");
        fs::create_directories(source_ / "empty");
    }

    static bool contains(const std::vector<std::string>& names, const std::string& name) {
        return std::ranges::find(names, name) != names.end();
    }

    /// Writes a tar holding a single entry with an arbitrary path.
    static void writeRawTar(const fs::path& archivePath, const std::string& entryName, const std::string& data) {
        struct archive* a = archive_write_new();
        archive_write_set_format_pax_restricted(a);
        ASSERT_EQ(archive_write_open_filename(a, archivePath.c_str()), ARCHIVE_OK);
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, entryName.c_str());
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        archive_entry_set_size(entry, static_cast<la_int64_t>(data.size()));
        archive_write_header(a, entry);
        archive_write_data(a, data.data(), data.size());
        archive_entry_free(entry);
        archive_write_close(a);
        archive_write_free(a);
    }

    LibArchiveArchiver archiver_;
    fs::path source_;
};

TEST_F(ArchiverTest, RootNamePrefixesEveryEntry) {
    ArchiveOptions options;
    options.gzip = true;
    options.rootName = "data";
    const fs::path archive = root_ / "data.tar.gz";

    auto entries = archiver_.create(source_, archive, options);
    ASSERT_TRUE(entries.has_value()) << entries.error();

    auto names = archiver_.list(archive);
    ASSERT_TRUE(names.has_value()) << names.error();
    EXPECT_EQ(names->size(), *entries);
    EXPECT_TRUE(contains(*names, "data/config.json"));
    EXPECT_TRUE(contains(*names, "data/attachments/a1/blob.bin"));
    EXPECT_TRUE(std::ranges::all_of(*names, [](const std::string& name) { return name.starts_with("data"); }));
}

TEST_F(ArchiverTest, ExcludedPathsAreLeftOut) {
    ArchiveOptions options;
    options.excludes = {source_ / "db.sqlite3", source_ / "attachments"};
    const fs::path archive = root_ / "filtered.tar";

    ASSERT_TRUE(archiver_.create(source_, archive, options).has_value());
    auto names = archiver_.list(archive);
    ASSERT_TRUE(names.has_value());
    EXPECT_TRUE(contains(*names, "config.json"));
    EXPECT_FALSE(contains(*names, "db.sqlite3"));
    EXPECT_FALSE(contains(*names, "attachments/a1/blob.bin"));
}

TEST_F(ArchiverTest, ExtractRestoresContent) {
    const fs::path archive = root_ / "tree.tar";
    ASSERT_TRUE(archiver_.create(source_, archive).has_value());
    ASSERT_TRUE(archiver_.verify(archive).has_value());

    const fs::path target = root_ / "restored";
    auto extracted = archiver_.extract(archive, target);
    ASSERT_TRUE(extracted.has_value()) << extracted.error();
    EXPECT_EQ(readFile(target / "config.json"), readFile(source_ / "config.json"));
    EXPECT_EQ(readFile(target / "attachments" / "a1" / "blob.bin"), std::string(2048, '\x07'));
    EXPECT_TRUE(fs::is_directory(target / "empty"));
}

TEST_F(ArchiverTest, ExtractRefusesParentTraversal) {
    const fs::path archive = root_ / "evil.tar";
    writeRawTar(archive, "../escaped.txt", "owned");

    auto extracted = archiver_.extract(archive, root_ / "target");
    ASSERT_FALSE(extracted.has_value());
    EXPECT_NE(extracted.error().find("unsafe"), std::string::npos);
    EXPECT_FALSE(fs::exists(root_ / "escaped.txt"));
}

TEST_F(ArchiverTest, ExtractRefusesAbsolutePaths) {
    const fs::path archive = root_ / "absolute.tar";
    writeRawTar(archive, (root_ / "absolute.txt").string(), "owned");

    EXPECT_FALSE(archiver_.extract(archive, root_ / "target").has_value());
    EXPECT_FALSE(fs::exists(root_ / "absolute.txt"));
}

TEST_F(ArchiverTest, VerifyRejectsGarbage) {
    writeFile(root_ / "garbage.tar", "this is not an archive at all");
    EXPECT_FALSE(archiver_.verify(root_ / "garbage.tar").has_value());
}

TEST_F(ArchiverTest, MissingSourceDirectoryFails) {
    EXPECT_FALSE(archiver_.create(root_ / "missing", root_ / "missing.tar").has_value());
    EXPECT_FALSE(fs::exists(root_ / "missing.tar"));
}
