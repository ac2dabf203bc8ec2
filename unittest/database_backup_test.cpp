#include <gtest/gtest.h>
#include "database.hpp"
#include "database_backup.hpp"
#include "test_helpers.hpp"

class DatabaseBackupTest : public VaultKeeperTest {
protected:
    void SetUp() override {
        VaultKeeperTest::SetUp();
        liveDb_ = root_ / "data" / "db.sqlite3";
        createSampleDatabase(liveDb_);
        out_ = root_ / "out";
        fs::create_directories(out_);
        auto stats = checker_.stats(liveDb_);
        ASSERT_TRUE(stats.has_value()) << stats.error();
        liveStats_ = *stats;
    }

    fs::path liveDb_;
    fs::path out_;
    LibArchiveArchiver archiver_;
    SqliteDatabaseChecker checker_;
    DatabaseStats liveStats_;
};

TEST_F(DatabaseBackupTest, SampleDatabaseShape) {
    EXPECT_EQ(liveStats_.tableCount, 3);
    EXPECT_EQ(liveStats_.rowCounts.at("users"), 3);
    EXPECT_EQ(liveStats_.rowCounts.at("ciphers"), 6);
    EXPECT_EQ(liveStats_.rowCounts.at("empty_table"), 0);
}

TEST_F(DatabaseBackupTest, NativeSnapshotMatchesLiveDatabase) {
    NativeBackupStrategy strategy;
    auto output = strategy.execute(liveDb_, out_ / "native.sqlite3");
    ASSERT_TRUE(output.has_value()) << output.error();

    EXPECT_TRUE(checker_.integrityCheck(*output).has_value());
    auto stats = checker_.stats(*output);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(compareStats(*stats, liveStats_), "");
}

TEST_F(DatabaseBackupTest, PortableDumpReplaysToTheSameContent) {
    PortableDumpStrategy strategy;
    auto output = strategy.execute(liveDb_, out_ / "portable.sql");
    ASSERT_TRUE(output.has_value()) << output.error();

    const std::string dump = readFile(*output);
    EXPECT_NE(dump.find("CREATE TABLE users"), std::string::npos);
    EXPECT_NE(dump.find("INSERT INTO \"users\"(\"uuid\",\"email\",\"akey\") VALUES('u0','user0@example.org',X'00FF10');"),
              std::string::npos);
    EXPECT_NE(dump.find("CREATE INDEX idx_ciphers_user"), std::string::npos);
    EXPECT_NE(dump.find("DELETE FROM sqlite_sequence;"), std::string::npos);
    EXPECT_NE(dump.find("PRAGMA user_version=7;"), std::string::npos);

    const fs::path replayed = out_ / "replayed.sqlite3";
    auto done = checker_.replayDump(*output, replayed);
    ASSERT_TRUE(done.has_value()) << done.error();
    auto stats = checker_.stats(replayed);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(compareStats(*stats, liveStats_), "");
}

TEST_F(DatabaseBackupTest, StructuredExportHoldsEveryTable) {
    StructuredExportStrategy strategy;
    auto output = strategy.execute(liveDb_, out_ / "export.json");
    ASSERT_TRUE(output.has_value()) << output.error();

    Json::Value root;
    Json::Reader reader;
    ASSERT_TRUE(reader.parse(readFile(*output), root));
    const Json::Value& data = root["database_export"]["data"];
    EXPECT_EQ(data.size(), 3u);
    ASSERT_EQ(data["users"].size(), 3u);
    EXPECT_EQ(data["users"][0]["akey"].asString(), "00ff10");
    EXPECT_EQ(data["ciphers"][0]["data"].asString(), "Note, \"quoted\"");
    EXPECT_TRUE(data["empty_table"].isArray());
    EXPECT_EQ(root["database_export"]["metadata"]["blob_encoding"].asString(), "hex");
}

TEST_F(DatabaseBackupTest, TabularBundleSkipsEmptyTables) {
    TabularExportStrategy strategy(archiver_);
    auto output = strategy.execute(liveDb_, out_ / "tabular.tar");
    ASSERT_TRUE(output.has_value()) << output.error();
    EXPECT_FALSE(fs::exists(out_ / "tabular.tar.d"));

    const fs::path extracted = root_ / "extracted";
    ASSERT_TRUE(archiver_.extract(*output, extracted).has_value());
    const fs::path bundle = extracted / "csv-exports";
    EXPECT_TRUE(fs::exists(bundle / "users.csv"));
    EXPECT_TRUE(fs::exists(bundle / "ciphers.csv"));
    EXPECT_FALSE(fs::exists(bundle / "empty_table.csv"));

    const std::string ciphers = readFile(bundle / "ciphers.csv");
    EXPECT_TRUE(ciphers.starts_with("id,user_uuid,data\r\n"));
    EXPECT_NE(ciphers.find("\"Note, \"\"quoted\"\"\""), std::string::npos);

    Json::Value manifest;
    Json::Reader reader;
    ASSERT_TRUE(reader.parse(readFile(bundle / "manifest.json"), manifest));
    EXPECT_EQ(manifest["row_counts"]["users"].asInt64(), 3);
    EXPECT_EQ(manifest["row_counts"]["ciphers"].asInt64(), 6);
    EXPECT_FALSE(manifest["row_counts"].isMember("empty_table"));
}

TEST_F(DatabaseBackupTest, TabularFileNamesNeverCollide) {
    execute(liveDb_,
            "CREATE TABLE \"org users\" (id INTEGER); INSERT INTO \"org users\" VALUES (1);"
            "CREATE TABLE \"org-users\" (id INTEGER); INSERT INTO \"org-users\" VALUES (2), (3);");
    TabularExportStrategy strategy(archiver_);
    auto output = strategy.execute(liveDb_, out_ / "tabular.tar");
    ASSERT_TRUE(output.has_value()) << output.error();

    const fs::path extracted = root_ / "extracted";
    ASSERT_TRUE(archiver_.extract(*output, extracted).has_value());
    const fs::path bundle = extracted / "csv-exports";
    Json::Value manifest;
    Json::Reader reader;
    ASSERT_TRUE(reader.parse(readFile(bundle / "manifest.json"), manifest));

    const std::string first = manifest["files"]["org users"].asString();
    const std::string second = manifest["files"]["org-users"].asString();
    EXPECT_NE(first, second);
    std::set<std::string> names{first, second};
    EXPECT_EQ(names, (std::set<std::string>{"org-users.csv", "org-users-2.csv"}));
    EXPECT_EQ(readFile(bundle / first), "id\r\n1\r\n");
    EXPECT_EQ(readFile(bundle / second), "id\r\n2\r\n3\r\n");
}

TEST_F(DatabaseBackupTest, SchemaOnlyDumpHasNoRows) {
    SchemaOnlyStrategy strategy;
    auto output = strategy.execute(liveDb_, out_ / "schema.sql");
    ASSERT_TRUE(output.has_value()) << output.error();
    EXPECT_EQ(readFile(*output).find("INSERT INTO"), std::string::npos);

    const fs::path replayed = out_ / "schema.sqlite3";
    ASSERT_TRUE(checker_.replayDump(*output, replayed).has_value());
    auto stats = checker_.stats(replayed);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->tableCount, liveStats_.tableCount);
    EXPECT_EQ(stats->rowCounts.at("users"), 0);
}

TEST_F(DatabaseBackupTest, MissingSourceFails) {
    NativeBackupStrategy strategy;
    EXPECT_FALSE(strategy.execute(root_ / "absent.sqlite3", out_ / "native.sqlite3").has_value());
}

TEST_F(DatabaseBackupTest, IntegrityCheckRejectsGarbage) {
    writeFile(out_ / "garbage.sqlite3", std::string(8192, 'x'));
    EXPECT_FALSE(checker_.integrityCheck(out_ / "garbage.sqlite3").has_value());
}

TEST_F(DatabaseBackupTest, FactoryCoversDatabaseFormatsOnly) {
    for (auto format : allDatabaseFormats()) {
        auto strategy = makeBackupStrategy(format, archiver_);
        ASSERT_NE(strategy, nullptr);
        EXPECT_EQ(strategy->format(), format);
    }
    EXPECT_THROW(makeBackupStrategy(ArtifactFormat::FullArchive, archiver_), std::invalid_argument);
}

TEST(CsvFieldTest, QuotesOnlyWhenNeeded) {
    EXPECT_EQ(csvField("plain"), "plain");
    EXPECT_EQ(csvField("a,b"), "\"a,b\"");
    EXPECT_EQ(csvField("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(csvField("two\nlines"), "\"two\nlines\"");
}
