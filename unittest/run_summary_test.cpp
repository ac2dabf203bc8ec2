#include <gtest/gtest.h>
#include "run_summary.hpp"

TEST(RunSummaryTest, CleanRunSucceeds) {
    RunSummary summary("database backup");
    summary.succeeded("native format", "database-native-20240101-000000.sqlite3.gz.gpg");
    EXPECT_EQ(summary.exitCode(), ExitCode::Success);
    EXPECT_FALSE(summary.isDegraded());
    EXPECT_NE(summary.render().find("SUCCESS"), std::string::npos);
}

TEST(RunSummaryTest, WarningsAndFailuresDegrade) {
    RunSummary warned("full backup");
    warned.succeeded("configuration");
    warned.warned("volume caddy_config", FailureCategory::Artifact, "volume not found, skipped");
    EXPECT_EQ(warned.exitCode(), ExitCode::Degraded);

    RunSummary failed("database backup");
    failed.failed("tabular format", FailureCategory::Artifact, "extraction failed");
    EXPECT_EQ(failed.exitCode(), ExitCode::Degraded);

    const std::string text = failed.render();
    EXPECT_NE(text.find("DEGRADED"), std::string::npos);
    EXPECT_NE(text.find("[FAIL] tabular format [artifact]: extraction failed"), std::string::npos);
    EXPECT_NE(text.find("Exit code: 3"), std::string::npos);
}

TEST(RunSummaryTest, FatalOutranksDegraded) {
    RunSummary summary("restore");
    summary.warned("cross-check", FailureCategory::Verification, "row count changed");
    summary.fatal(FailureCategory::Restore, "Service still reports running");
    EXPECT_TRUE(summary.isFatal());
    EXPECT_EQ(summary.exitCode(), ExitCode::Fatal);
    EXPECT_NE(summary.render().find("Fatal [restore]: Service still reports running"), std::string::npos);
}

TEST(RunSummaryTest, ConfigurationFatalUsesItsOwnCode) {
    RunSummary summary("database backup");
    summary.fatal(FailureCategory::Configuration, "SQLite database not found");
    EXPECT_EQ(summary.exitCode(), ExitCode::Configuration);
    EXPECT_EQ(static_cast<int>(summary.exitCode()), 2);
}
