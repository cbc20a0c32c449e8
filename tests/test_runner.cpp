#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cerrno>
#include <sstream>
#include "fs_fixture.hpp"
#include "cleanup/usage_scanner.hpp"
#include "service/cleanup_runner.hpp"

using namespace cachesweep;
using namespace cachesweep::service;
using cleanup::RunState;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

class StubProcessTable : public cleanup::ProcessTable {
public:
    MOCK_METHOD(std::vector<cleanup::ProcessInfo>, List, (), (override));
    MOCK_METHOD(int, Kill, (int pid), (override));
};

} // namespace

class CleanupRunnerTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        profile_ = test_root_ / "Default";
        temp_ = test_root_ / "tmp";
        WriteFile(profile_ / "Cache" / "Cache_Data" / "data_0", 100 * kMiB);
        WriteFile(profile_ / "GPUCache" / "data_1", 50 * kMiB);
        WriteFile(profile_ / "Bookmarks", 1 * kMiB);
        WriteFile(temp_ / "scoped_dir42" / "blob", 2048);

        config_.root_path = profile_.string();
        config_.cache_paths = {"Cache", "Code Cache", "GPUCache"};
        config_.temp_roots = {temp_.string()};
        config_.process_names = {"chrome"};
        config_.grace_period_ms = 0;
        config_.assume_yes = true;
        config_.parallel_scan = true;

        table_ = std::make_shared<NiceMock<StubProcessTable>>();
        ON_CALL(*table_, List()).WillByDefault(Return(std::vector<cleanup::ProcessInfo>{{4242, "chrome", "chrome"}}));
        ON_CALL(*table_, Kill(_)).WillByDefault(Return(0));
    }

    RunnerHooks Hooks(bool privileged) {
        RunnerHooks hooks;
        hooks.is_privileged = [privileged] { return privileged; };
        hooks.process_table = table_;
        hooks.restart = [this] { ++restarts_; return true; };
        hooks.in = &in_;
        hooks.out = &out_;
        return hooks;
    }

    fs::path profile_;
    fs::path temp_;
    CleanupConfig config_;
    std::shared_ptr<NiceMock<StubProcessTable>> table_;
    std::istringstream in_;
    std::ostringstream out_;
    int restarts_ = 0;
};

TEST_F(CleanupRunnerTest, CleansProfileAndReports) {
    EXPECT_CALL(*table_, Kill(4242)).WillOnce(Return(0));

    CleanupRunner runner(config_, Hooks(true));
    auto outcome = runner.Run();

    EXPECT_EQ(outcome.exit_code, kExitOk);
    EXPECT_EQ(outcome.final_state, RunState::DONE);
    EXPECT_FALSE(fs::exists(profile_ / "Cache"));
    EXPECT_FALSE(fs::exists(profile_ / "GPUCache"));
    EXPECT_TRUE(fs::exists(profile_ / "Bookmarks"));
    EXPECT_FALSE(fs::exists(temp_ / "scoped_dir42"));
    EXPECT_TRUE(fs::exists(temp_));

    ASSERT_TRUE(outcome.report.has_value());
    EXPECT_EQ(outcome.report->before_bytes, 151 * kMiB);
    EXPECT_EQ(outcome.report->after_bytes, 1 * kMiB);
    EXPECT_EQ(outcome.report->saved_bytes, static_cast<int64_t>(150 * kMiB));
    EXPECT_NEAR(outcome.report->saved_percent, 99.34, 0.01);
    EXPECT_EQ(outcome.cache.items_attempted, 2u);  // "Code Cache" is absent
    EXPECT_EQ(outcome.cache.items_succeeded, 2u);
    EXPECT_EQ(outcome.temp.items_succeeded, 1u);
    EXPECT_EQ(outcome.report->processes_terminated, 1u);
    EXPECT_NE(out_.str().find("Space saved:       150.00 MB (99.34%)"), std::string::npos);
}

TEST_F(CleanupRunnerTest, DefaultTempPrefixesLeaveForeignEntries) {
    WriteFile(temp_ / ".X11-unix" / "X0", 0);
    WriteFile(temp_ / "systemd-private-abc" / "tmp" / "f", 64);
    WriteFile(temp_ / "chrome_BITS_1" / "f", 64);
    WriteFile(temp_ / "undetected_chromedriver" / "chromedriver", 128);

    CleanupRunner runner(config_, Hooks(true));
    auto outcome = runner.Run();

    EXPECT_EQ(outcome.exit_code, kExitOk);
    EXPECT_EQ(outcome.temp.items_attempted, 3u);
    EXPECT_FALSE(fs::exists(temp_ / "scoped_dir42"));
    EXPECT_FALSE(fs::exists(temp_ / "chrome_BITS_1"));
    EXPECT_FALSE(fs::exists(temp_ / "undetected_chromedriver"));
    EXPECT_TRUE(fs::exists(temp_ / ".X11-unix" / "X0"));
    EXPECT_TRUE(fs::exists(temp_ / "systemd-private-abc" / "tmp" / "f"));
}

TEST_F(CleanupRunnerTest, EmptyPrefixListSkipsTempUnlessAllRequested) {
    WriteFile(temp_ / "foreign" / "f", 64);
    config_.temp_prefixes.clear();

    auto outcome = CleanupRunner(config_, Hooks(true)).Run();
    EXPECT_EQ(outcome.exit_code, kExitOk);
    EXPECT_EQ(outcome.temp.items_attempted, 0u);
    EXPECT_TRUE(fs::exists(temp_ / "foreign" / "f"));
    EXPECT_TRUE(fs::exists(temp_ / "scoped_dir42"));

    config_.purge_all_temp = true;
    outcome = CleanupRunner(config_, Hooks(true)).Run();
    EXPECT_EQ(outcome.temp.items_attempted, 2u);
    EXPECT_FALSE(fs::exists(temp_ / "foreign"));
    EXPECT_FALSE(fs::exists(temp_ / "scoped_dir42"));
    EXPECT_TRUE(fs::exists(temp_));
}

TEST_F(CleanupRunnerTest, UnprivilegedRunTouchesNothing) {
    EXPECT_CALL(*table_, List()).Times(0);
    EXPECT_CALL(*table_, Kill(_)).Times(0);
    auto before = cleanup::UsageScanner().Scan(test_root_);

    CleanupRunner runner(config_, Hooks(false));
    auto outcome = runner.Run();

    EXPECT_EQ(outcome.exit_code, kExitNotPrivileged);
    EXPECT_EQ(outcome.final_state, RunState::FAILED);
    EXPECT_FALSE(outcome.report.has_value());

    auto after = cleanup::UsageScanner().Scan(test_root_);
    EXPECT_EQ(before.total_bytes, after.total_bytes);
    EXPECT_EQ(before.per_folder_bytes, after.per_folder_bytes);
}

TEST_F(CleanupRunnerTest, MissingRootStopsBeforeAnyPurge) {
    EXPECT_CALL(*table_, Kill(_)).Times(0);
    config_.root_path = (test_root_ / "NoSuchProfile").string();

    CleanupRunner runner(config_, Hooks(true));
    auto outcome = runner.Run();

    EXPECT_EQ(outcome.exit_code, kExitRootMissing);
    EXPECT_EQ(outcome.final_state, RunState::FAILED);
    EXPECT_EQ(outcome.cache.items_attempted, 0u);
    EXPECT_TRUE(fs::exists(temp_ / "scoped_dir42" / "blob"));
}

TEST_F(CleanupRunnerTest, EndOfInputAtConfirmationCancels) {
    config_.assume_yes = false;
    in_.str("");

    CleanupRunner runner(config_, Hooks(true));
    auto outcome = runner.Run();

    EXPECT_EQ(outcome.exit_code, kExitCancelled);
    EXPECT_EQ(outcome.final_state, RunState::CANCELLED);
    EXPECT_TRUE(fs::exists(profile_ / "Cache"));
}

TEST_F(CleanupRunnerTest, EnterAtConfirmationProceeds) {
    config_.assume_yes = false;
    in_.str("\n");

    CleanupRunner runner(config_, Hooks(true));
    auto outcome = runner.Run();

    EXPECT_EQ(outcome.exit_code, kExitOk);
    EXPECT_FALSE(fs::exists(profile_ / "Cache"));
    EXPECT_NE(out_.str().find("press Enter"), std::string::npos);
}

TEST_F(CleanupRunnerTest, RestartOnlyOnAffirmativeAnswer) {
    config_.offer_restart = true;

    in_.str("yes\n");
    CleanupRunner(config_, Hooks(true)).Run();
    EXPECT_EQ(restarts_, 1);

    in_.clear();
    in_.str("\n");
    WriteFile(profile_ / "Cache" / "again", 10);
    CleanupRunner(config_, Hooks(true)).Run();
    EXPECT_EQ(restarts_, 1);

    in_.clear();
    in_.str("");
    CleanupRunner(config_, Hooks(true)).Run();
    EXPECT_EQ(restarts_, 1);
}

TEST_F(CleanupRunnerTest, UnkillableProcessDoesNotAbort) {
    EXPECT_CALL(*table_, Kill(4242)).WillOnce(Return(EPERM));

    CleanupRunner runner(config_, Hooks(true));
    auto outcome = runner.Run();

    EXPECT_EQ(outcome.exit_code, kExitOk);
    EXPECT_EQ(outcome.termination.failures.size(), 1u);
    EXPECT_FALSE(fs::exists(profile_ / "Cache"));
}

TEST_F(CleanupRunnerTest, WritesMetricsFileWhenConfigured) {
    config_.metrics_file = (test_root_ / "cachesweep.prom").string();

    CleanupRunner runner(config_, Hooks(true));
    runner.Run();

    EXPECT_TRUE(fs::exists(config_.metrics_file));
}

TEST(AffirmativeTest, AcceptsOnlyYes) {
    EXPECT_TRUE(IsAffirmative("y"));
    EXPECT_TRUE(IsAffirmative(" YES \n"));
    EXPECT_FALSE(IsAffirmative(""));
    EXPECT_FALSE(IsAffirmative("n"));
    EXPECT_FALSE(IsAffirmative("yeah"));
}
