#include <gtest/gtest.h>
#include <unistd.h>
#include "run_lock.hpp"
#include "test_helpers.hpp"

class RunLockTest : public VaultKeeperTest {
protected:
    void SetUp() override {
        VaultKeeperTest::SetUp();
        lockFile_ = RunLock::pathFor(root_ / "logs");
    }

    fs::path lockFile_;
};

TEST_F(RunLockTest, AllToolsShareOneLockFile) {
    EXPECT_EQ(lockFile_, root_ / "logs" / "backup-restore.lock");
}

TEST_F(RunLockTest, SecondAcquireFailsWhileHeld) {
    auto first = RunLock::acquire(lockFile_, logger_);
    ASSERT_TRUE(first.has_value()) << first.error();
    EXPECT_EQ(readFile(lockFile_), std::to_string(::getpid()) + "\n");

    auto second = RunLock::acquire(lockFile_, logger_);
    ASSERT_FALSE(second.has_value());
    EXPECT_NE(second.error().find("in progress"), std::string::npos);
    EXPECT_NE(second.error().find(std::to_string(::getpid())), std::string::npos);
}

TEST_F(RunLockTest, ReleasedOnDestruction) {
    {
        auto held = RunLock::acquire(lockFile_, logger_);
        ASSERT_TRUE(held.has_value());
    }
    EXPECT_TRUE(readFile(lockFile_).empty());
    auto again = RunLock::acquire(lockFile_, logger_);
    EXPECT_TRUE(again.has_value());
}

TEST_F(RunLockTest, StalePidIsReclaimed) {
    writeFile(lockFile_, "999999\n");
    auto lock = RunLock::acquire(lockFile_, logger_);
    ASSERT_TRUE(lock.has_value()) << lock.error();
    EXPECT_EQ(readFile(lockFile_), std::to_string(::getpid()) + "\n");
}

TEST_F(RunLockTest, MovedLockStaysHeld) {
    auto acquired = RunLock::acquire(lockFile_, logger_);
    ASSERT_TRUE(acquired.has_value());
    RunLock moved = std::move(*acquired);
    EXPECT_EQ(moved.path(), lockFile_);
    EXPECT_FALSE(RunLock::acquire(lockFile_, logger_).has_value());
}
