#include <gtest/gtest.h>
#include "backup_set.hpp"
#include "test_helpers.hpp"

class BackupSetTest : public VaultKeeperTest {
protected:
    fs::path makeSet(const fs::path& parent, const std::string& id) {
        fs::create_directories(parent / id);
        return parent / id;
    }
};

TEST_F(BackupSetTest, FormatListParsing) {
    auto formats = parseFormatList("native,portable,native");
    ASSERT_TRUE(formats.has_value());
    EXPECT_EQ(*formats, (std::vector<ArtifactFormat>{ArtifactFormat::Native, ArtifactFormat::Portable}));

    EXPECT_EQ(parseFormatList("all").value(), allDatabaseFormats());
    EXPECT_EQ(allDatabaseFormats().size(), 5u);
    EXPECT_FALSE(parseFormatList("native,sql").has_value());
    EXPECT_FALSE(parseFormatList("").has_value());
    EXPECT_FALSE(parseFormat("archive").has_value());
}

TEST_F(BackupSetTest, ArtifactNamesEncodeCategoryFormatAndSet) {
    EXPECT_EQ(plainArtifactName(BackupCategory::Database, ArtifactFormat::Native, "20240101-020304"),
              "database-native-20240101-020304.sqlite3");
    EXPECT_EQ(plainArtifactName(BackupCategory::Database, ArtifactFormat::Tabular, "20240101-020304"),
              "database-tabular-20240101-020304.tar");
    EXPECT_EQ(plainArtifactName(BackupCategory::Full, ArtifactFormat::FullArchive, "20240101-020304-weekly"),
              "full-archive-20240101-020304-weekly.tar");

    EXPECT_EQ(formatFromArtifactName("database-portable-20240101-020304.sql.gz.gpg"), ArtifactFormat::Portable);
    EXPECT_EQ(formatFromArtifactName("full-archive-20240101-020304-weekly.tar.gz.gpg"), ArtifactFormat::FullArchive);
    EXPECT_FALSE(formatFromArtifactName("vaultwarden_backup.tar.gz.gpg").has_value());
}

TEST_F(BackupSetTest, SetIdParsing) {
    EXPECT_TRUE(BackupCatalog::parseSetId("20240101-020304").has_value());
    EXPECT_TRUE(BackupCatalog::parseSetId("20240101-020304-pre-upgrade").has_value());
    EXPECT_FALSE(BackupCatalog::parseSetId("20240101-020304x").has_value());
    EXPECT_FALSE(BackupCatalog::parseSetId("2024-01-01").has_value());
    EXPECT_FALSE(BackupCatalog::parseSetId("notes").has_value());
    EXPECT_EQ(formatTimestamp(*BackupCatalog::parseSetId("20240229-235959")), "20240229-235959");
}

TEST_F(BackupSetTest, CatalogListsSetsOldestFirst) {
    const fs::path dir = root_ / "backups" / "db";
    makeSet(dir, "20240102-000000");
    makeSet(dir, "20240101-000000");
    makeSet(dir, "20240103-000000-weekly");
    makeSet(dir, "notes");
    writeFile(dir / "20240104-000000", "a file, not a set");

    BackupCatalog catalog(dir, BackupCategory::Database);
    auto entries = catalog.list();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].id, "20240101-000000");
    EXPECT_EQ(entries[1].id, "20240102-000000");
    EXPECT_EQ(entries[2].id, "20240103-000000-weekly");
    EXPECT_EQ(catalog.latest()->id, "20240103-000000-weekly");

    BackupCatalog empty(root_ / "missing", BackupCategory::Full);
    EXPECT_TRUE(empty.list().empty());
    EXPECT_FALSE(empty.latest().has_value());
}

TEST_F(BackupSetTest, LatestArtifactSkipsSetsWithoutThatFormat) {
    const fs::path dir = root_ / "backups" / "db";
    const fs::path older = makeSet(dir, "20240101-000000");
    const fs::path newer = makeSet(dir, "20240102-000000");
    writeFile(older / "database-native-20240101-000000.sqlite3.gz.gpg", "x");
    writeFile(newer / "database-portable-20240102-000000.sql.gz.gpg", "x");
    writeFile(newer / "database-native-20240102-000000.sqlite3", "plaintext never counts");

    BackupCatalog catalog(dir, BackupCategory::Database);
    EXPECT_EQ(catalog.latestArtifact(ArtifactFormat::Native), older / "database-native-20240101-000000.sqlite3.gz.gpg");
    EXPECT_EQ(catalog.latestArtifact(ArtifactFormat::Portable), newer / "database-portable-20240102-000000.sql.gz.gpg");
    EXPECT_FALSE(catalog.latestArtifact(ArtifactFormat::Schema).has_value());
}

TEST_F(BackupSetTest, ManifestRecordsArtifactsAndVerification) {
    BackupSet set;
    set.id = "20240101-000000";
    set.directory = makeSet(root_, set.id);
    set.createdAt = *BackupCatalog::parseSetId(set.id);
    set.metadata["primary_format"] = "native";

    BackupArtifact artifact;
    artifact.format = ArtifactFormat::Native;
    artifact.path = set.directory / "database-native-20240101-000000.sqlite3.gz.gpg";
    artifact.sizes = {1000, 400, 450};
    artifact.verified = true;
    artifact.verification = "structure=passed";
    set.artifacts.push_back(artifact);

    ASSERT_TRUE(writeManifest(set).has_value());
    auto manifest = readManifest(set.directory);
    ASSERT_TRUE(manifest.has_value());
    EXPECT_EQ((*manifest)["id"].asString(), set.id);
    EXPECT_EQ((*manifest)["category"].asString(), "database");
    EXPECT_EQ((*manifest)["created"].asString(), "2024-01-01 00:00:00 UTC");
    EXPECT_EQ((*manifest)["primary_format"].asString(), "native");
    EXPECT_TRUE((*manifest)["verified"].asBool());
    ASSERT_EQ((*manifest)["artifacts"].size(), 1u);
    EXPECT_EQ((*manifest)["artifacts"][0]["file"].asString(), "database-native-20240101-000000.sqlite3.gz.gpg");
    EXPECT_EQ((*manifest)["artifacts"][0]["encrypted_size"].asUInt64(), 450u);
    EXPECT_FALSE(fs::exists(set.directory / "backup-manifest.json.partial"));

    BackupCatalog catalog(root_, BackupCategory::Database);
    ASSERT_EQ(catalog.list().size(), 1u);
    EXPECT_TRUE(catalog.isVerified(catalog.list().front()));
}

TEST_F(BackupSetTest, SetWithoutArtifactsIsNotVerified) {
    BackupSet set;
    EXPECT_FALSE(set.verified());
    EXPECT_EQ(set.find(ArtifactFormat::Native), nullptr);
}
