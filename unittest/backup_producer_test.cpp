#include <gtest/gtest.h>
#include "backup_producer.hpp"
#include "test_helpers.hpp"

namespace {

class FailingStrategy : public DatabaseBackupStrategy {
public:
    explicit FailingStrategy(ArtifactFormat format) : format_(format) {}

    ArtifactFormat format() const override { return format_; }

    std::expected<fs::path, std::string> execute(const fs::path&, const fs::path& outputPath) override {
        writeFile(outputPath, "half-written export");
        return std::unexpected("simulated export failure");
    }

private:
    ArtifactFormat format_;
};

std::chrono::system_clock::time_point at(const std::string& id) {
    return *BackupCatalog::parseSetId(id);
}

} // namespace

class BackupProducerTest : public VaultKeeperTest {
protected:
    void SetUp() override {
        VaultKeeperTest::SetUp();
        config_ = makeConfig();
        createSampleDatabase(config_->databasePath);
        pipeline_ = std::make_unique<Pipeline>(*config_, logger_);
        pipeline_->producer.setClock([] { return at("20240102-030405"); });
    }

    void failFormat(ArtifactFormat failing) {
        pipeline_->producer.setStrategyFactory([this, failing](ArtifactFormat format)
                                                   -> std::unique_ptr<DatabaseBackupStrategy> {
            if (format == failing) {
                return std::make_unique<FailingStrategy>(format);
            }
            return makeBackupStrategy(format, pipeline_->archiver);
        });
    }

    std::vector<std::string> setContents(const fs::path& dir) const {
        std::vector<std::string> names;
        for (const auto& entry : fs::directory_iterator(dir)) {
            names.push_back(entry.path().filename().string());
        }
        std::ranges::sort(names);
        return names;
    }

    std::unique_ptr<BackupConfig> config_;
    std::unique_ptr<Pipeline> pipeline_;
};

TEST_F(BackupProducerTest, NativeSetIsSealedVerifiedAndCatalogued) {
    RunSummary summary("database backup");
    auto set = pipeline_->producer.produce(config_->databasePath, {ArtifactFormat::Native}, config_->dbBackupDir,
                                           summary);
    ASSERT_TRUE(set.has_value()) << set.error();

    EXPECT_EQ(set->id, "20240102-030405");
    EXPECT_EQ(set->directory, config_->dbBackupDir / "20240102-030405");
    ASSERT_EQ(set->artifacts.size(), 1u);
    EXPECT_TRUE(set->verified());
    EXPECT_EQ(setContents(set->directory),
              (std::vector<std::string>{"backup-manifest.json", "database-native-20240102-030405.sqlite3.gz.gpg"}));
    EXPECT_EQ(summary.exitCode(), ExitCode::Success);

    auto manifest = readManifest(set->directory);
    ASSERT_TRUE(manifest.has_value());
    EXPECT_TRUE((*manifest)["verified"].asBool());
    EXPECT_EQ((*manifest)["primary_format"].asString(), "native");
    EXPECT_EQ((*manifest)["source"]["file"].asString(), "db.sqlite3");
    EXPECT_EQ((*manifest)["failed_formats"].size(), 0u);

    BackupCatalog catalog(config_->dbBackupDir, BackupCategory::Database);
    EXPECT_EQ(catalog.latestArtifact(ArtifactFormat::Native), set->artifacts.front().path);
}

TEST_F(BackupProducerTest, EveryFormatVerifies) {
    RunSummary summary("database backup");
    auto set = pipeline_->producer.produce(config_->databasePath, allDatabaseFormats(), config_->dbBackupDir,
                                           summary);
    ASSERT_TRUE(set.has_value()) << set.error();
    ASSERT_EQ(set->artifacts.size(), 5u);
    for (const auto& artifact : set->artifacts) {
        EXPECT_TRUE(artifact.verified) << toString(artifact.format) << ": " << artifact.verification;
        EXPECT_TRUE(artifact.path.string().ends_with(".gz.gpg"));
    }
    EXPECT_EQ(summary.exitCode(), ExitCode::Success) << summary.render();
    EXPECT_TRUE(findDirectories(config_->dbBackupDir, ".staging-").empty());
}

TEST_F(BackupProducerTest, FailedSecondaryFormatKeepsSiblings) {
    failFormat(ArtifactFormat::Structured);
    RunSummary summary("database backup");
    auto set = pipeline_->producer.produce(config_->databasePath, {ArtifactFormat::Native, ArtifactFormat::Structured},
                                           config_->dbBackupDir, summary);
    ASSERT_TRUE(set.has_value()) << set.error();

    ASSERT_EQ(set->artifacts.size(), 1u);
    EXPECT_EQ(set->artifacts.front().format, ArtifactFormat::Native);
    EXPECT_EQ(summary.exitCode(), ExitCode::Degraded);
    auto manifest = readManifest(set->directory);
    ASSERT_TRUE(manifest.has_value());
    ASSERT_EQ((*manifest)["failed_formats"].size(), 1u);
    EXPECT_EQ((*manifest)["failed_formats"][0].asString(), "structured");
    EXPECT_EQ(setContents(set->directory),
              (std::vector<std::string>{"backup-manifest.json", "database-native-20240102-030405.sqlite3.gz.gpg"}));
}

TEST_F(BackupProducerTest, FailedPrimaryFormatIsFatalButKeepsWhatWasMade) {
    failFormat(ArtifactFormat::Native);
    RunSummary summary("database backup");
    auto set = pipeline_->producer.produce(config_->databasePath, {ArtifactFormat::Native, ArtifactFormat::Portable},
                                           config_->dbBackupDir, summary);
    ASSERT_FALSE(set.has_value());
    EXPECT_EQ(summary.exitCode(), ExitCode::Fatal);

    const fs::path dir = config_->dbBackupDir / "20240102-030405";
    EXPECT_EQ(setContents(dir),
              (std::vector<std::string>{"backup-manifest.json", "database-portable-20240102-030405.sql.gz.gpg"}));
    auto manifest = readManifest(dir);
    ASSERT_TRUE(manifest.has_value());
    ASSERT_EQ((*manifest)["failed_formats"].size(), 1u);
    EXPECT_EQ((*manifest)["failed_formats"][0].asString(), "native");
}

TEST_F(BackupProducerTest, MissingDatabaseIsAConfigurationError) {
    fs::remove(config_->databasePath);
    RunSummary summary("database backup");
    auto set = pipeline_->producer.produce(config_->databasePath, {ArtifactFormat::Native}, config_->dbBackupDir,
                                           summary);
    ASSERT_FALSE(set.has_value());
    EXPECT_EQ(summary.exitCode(), ExitCode::Configuration);
    EXPECT_FALSE(fs::exists(config_->dbBackupDir));
}

TEST_F(BackupProducerTest, InsufficientSpaceStopsBeforeWriting) {
    pipeline_->producer.setSpaceProbe([](const fs::path&) -> std::optional<std::uintmax_t> { return 1024; });
    RunSummary summary("database backup");
    auto set = pipeline_->producer.produce(config_->databasePath, {ArtifactFormat::Native}, config_->dbBackupDir,
                                           summary);
    ASSERT_FALSE(set.has_value());
    EXPECT_NE(set.error().find("Insufficient disk space"), std::string::npos);
    EXPECT_EQ(summary.exitCode(), ExitCode::Fatal);
    EXPECT_TRUE(fs::is_empty(config_->dbBackupDir));
}

TEST_F(BackupProducerTest, ExistingSetIsNeverOverwritten) {
    RunSummary first("database backup");
    ASSERT_TRUE(pipeline_->producer.produce(config_->databasePath, {ArtifactFormat::Native}, config_->dbBackupDir,
                                            first).has_value());
    RunSummary second("database backup");
    auto again = pipeline_->producer.produce(config_->databasePath, {ArtifactFormat::Native}, config_->dbBackupDir,
                                             second);
    ASSERT_FALSE(again.has_value());
    EXPECT_NE(again.error().find("already exists"), std::string::npos);
    EXPECT_EQ(BackupCatalog(config_->dbBackupDir, BackupCategory::Database).list().size(), 1u);
}

TEST_F(BackupProducerTest, PrimaryFormatPrefersNative) {
    EXPECT_EQ(BackupProducer::primaryFormat({ArtifactFormat::Portable, ArtifactFormat::Native}), ArtifactFormat::Native);
    EXPECT_EQ(BackupProducer::primaryFormat({ArtifactFormat::Structured, ArtifactFormat::Portable}),
              ArtifactFormat::Structured);
}

TEST_F(BackupProducerTest, PlanWritesNothing) {
    const std::string plan = pipeline_->producer.plan(config_->databasePath, {ArtifactFormat::Native,
                                                      ArtifactFormat::Schema}, config_->dbBackupDir);
    EXPECT_NE(plan.find("Dry run"), std::string::npos);
    EXPECT_NE(plan.find("native* schema"), std::string::npos);
    EXPECT_NE(plan.find((config_->dbBackupDir / "20240102-030405").string()), std::string::npos);
    EXPECT_FALSE(fs::exists(config_->dbBackupDir));
}

TEST_F(BackupProducerTest, FreshNativeBackupRoundTripsTheWholeDatabase) {
    execute(config_->databasePath,
            "CREATE TABLE attachments (id INTEGER PRIMARY KEY, body BLOB NOT NULL);"
            "WITH RECURSIVE n(i) AS (SELECT 1 UNION ALL SELECT i + 1 FROM n WHERE i < 512) "
            "INSERT INTO attachments (body) SELECT randomblob(4096) FROM n;");
    const auto sourceSize = fs::file_size(config_->databasePath);
    ASSERT_GE(sourceSize, 2u * 1024 * 1024);

    RunSummary summary("database backup");
    auto set = pipeline_->producer.produce(config_->databasePath, {ArtifactFormat::Native}, config_->dbBackupDir,
                                           summary);
    ASSERT_TRUE(set.has_value()) << set.error();
    EXPECT_EQ(summary.exitCode(), ExitCode::Success) << summary.render();
    ASSERT_EQ(set->artifacts.size(), 1u);
    EXPECT_EQ(setContents(set->directory),
              (std::vector<std::string>{"backup-manifest.json", "database-native-20240102-030405.sqlite3.gz.gpg"}));
    EXPECT_LT(fs::file_size(set->artifacts.front().path), sourceSize + 64 * 1024);

    const fs::path scratch = root_ / "opened";
    fs::create_directories(scratch);
    auto plain = pipeline_->codec.open(set->artifacts.front().path, scratch);
    ASSERT_TRUE(plain.has_value()) << plain.error();
    EXPECT_EQ(fs::file_size(*plain), sourceSize);
    EXPECT_TRUE(pipeline_->checker.integrityCheck(*plain).has_value());
    EXPECT_EQ(rowCount(*plain, "attachments"), 512);
    EXPECT_EQ(rowCount(*plain, "users"), rowCount(config_->databasePath, "users"));
}
