#include <gtest/gtest.h>
#include <cstdlib>
#include "process_runner.hpp"
#include "restore.hpp"
#include "snapshot_assembler.hpp"
#include "test_helpers.hpp"

/**
 * @brief Runs every pipeline once, including a failing restore, and then
 * searches the whole tree for plaintext secrets and leftover scratch directories.
 */
class SecretHygieneTest : public VaultKeeperTest {
protected:
    void SetUp() override {
        VaultKeeperTest::SetUp();
        settings_["BACKUP_VOLUMES"].append("caddy_data");
        settings_["BACKUP_CONFIG_PATHS"].append("docker-compose.yml");
        settings_["BACKUP_CONFIG_PATHS"].append("caddy");
        config_ = makeConfig();
        createSampleDatabase(config_->databasePath);
        writeFile(root_ / "docker-compose.yml", "services: {}\n");
        writeFile(root_ / "caddy" / "Caddyfile", "vault.example.org\n");
        writeFile(config_->dataDir / "attachments" / "a1" / "file.bin", "attachment");
        volumes_.present = {"caddy_data"};
    }

    void runEverything(std::unique_ptr<Encryptor> encryptor) {
        Logger logger("hygiene", config_->logDir, LogLevel::Debug);
        logger.debug(config_->describe());

        Pipeline pipeline(*config_, logger, std::move(encryptor));
        RunSummary backup("database backup");
        auto set = pipeline.producer.produce(config_->databasePath, allDatabaseFormats(), config_->dbBackupDir,
                                             backup);
        ASSERT_TRUE(set.has_value()) << set.error();

        SnapshotAssembler assembler(*config_, pipeline.producer, pipeline.codec, pipeline.verifier,
                                    pipeline.archiver, volumes_, pipeline.retention, logger);
        FullBackupOptions options;
        options.includeLogs = true;
        RunSummary full("full backup");
        auto fullSet = assembler.assembleFull(config_->fullBackupDir, options, full);
        ASSERT_TRUE(fullSet.has_value()) << fullSet.error();

        const BackupArtifact* native = set->find(ArtifactFormat::Native);
        ASSERT_NE(native, nullptr);
        const fs::path corrupt = root_ / "corrupt" / native->path.filename();
        const std::string sealed = readFile(native->path);
        writeFile(corrupt, sealed.substr(0, sealed.size() / 2));

        FakeServiceController service;
        FakeHealthProbe health;
        RestoreOrchestrator orchestrator(*config_, pipeline.codec, pipeline.verifier, pipeline.archiver,
                                         pipeline.checker, service, health, volumes_, logger);
        orchestrator.setSleeper([](std::chrono::seconds) {});

        RunSummary failedRestore("restore");
        RestoreRequest request;
        request.artifact = corrupt;
        EXPECT_FALSE(orchestrator.restore(request, failedRestore).has_value());

        RunSummary restored("restore");
        request.artifact = native->path;
        auto outcome = orchestrator.restore(request, restored);
        EXPECT_TRUE(outcome.has_value()) << (outcome ? "" : outcome.error());
    }

    void expectNoPlaintextSecrets(const fs::path& skip = {}) const {
        std::error_code ec;
        int scanned = 0;
        for (auto it = fs::recursive_directory_iterator(root_, ec); !ec && it != fs::recursive_directory_iterator();
             it.increment(ec)) {
            if (!skip.empty() && it->path() == skip) {
                it.disable_recursion_pending();
                continue;
            }
            if (it->is_directory()) {
                for (const char* prefix : {"vaultkeeper-key-", "vaultkeeper-restore-", "vaultkeeper-verify-",
                                           ".staging-", ".work-"}) {
                    EXPECT_FALSE(it->path().filename().string().starts_with(prefix))
                        << "leftover scratch directory " << it->path();
                }
                continue;
            }
            if (!it->is_regular_file() || it->is_symlink()) {
                continue;
            }
            ++scanned;
            EXPECT_EQ(readFile(it->path()).find(kTestPassphrase), std::string::npos)
                << "passphrase found in " << it->path();
        }
        EXPECT_GT(scanned, 10);

        const std::string log = readFile(config_->logDir / "backup.log");
        EXPECT_NE(log.find("BACKUP_PASSPHRASE: [REDACTED]"), std::string::npos);
    }

    std::unique_ptr<BackupConfig> config_;
    FakeVolumeExporter volumes_;
};

TEST_F(SecretHygieneTest, NothingOnDiskHoldsThePassphrase) {
    runEverything(std::make_unique<FakeEncryptor>());
    expectNoPlaintextSecrets();
}

TEST_F(SecretHygieneTest, NothingOnDiskHoldsThePassphraseWithGpg) {
    if (!ProcessRunner::commandExists("gpg")) {
        GTEST_SKIP() << "gpg is not installed";
    }
    const fs::path gnupgHome = root_ / "gnupg";
    fs::create_directories(gnupgHome);
    fs::permissions(gnupgHome, fs::perms::owner_all, fs::perm_options::replace);
    ::setenv("GNUPGHOME", gnupgHome.c_str(), 1);

    runEverything(std::make_unique<GpgEncryptor>(config_->passphrase, config_->scratchDir, std::chrono::seconds(120),
                                                 false));

    if (ProcessRunner::commandExists("gpgconf")) {
        ProcessRunner runner;
        (void)runner.run({"gpgconf", "--kill", "gpg-agent"});
    }
    ::unsetenv("GNUPGHOME");
    expectNoPlaintextSecrets(gnupgHome);
}
