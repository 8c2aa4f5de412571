#include <chrono>
#include <csignal>
#include <unistd.h>
#include <gtest/gtest.h>
#include "subprocess.hpp"
#include "text_format.hpp"
#include "vault_api.hpp"
#include "test_utils.hpp"

using namespace std::chrono_literals;

TEST(vault_api_test, decision_needs_a_pending_question) {
    TempDir dir;
    VaultConfig config = make_test_config(dir);
    VaultAPI api(config);

    EXPECT_FALSE(api.postDecision(Decision::Skip));
    EXPECT_FALSE(std::filesystem::exists(config.decisionFile));

    write_file(config.decisionRequestFile, R"({"label": "CAMERA"})");
    ASSERT_TRUE(api.postDecision(Decision::Overwrite));
    EXPECT_EQ(read_file(config.decisionFile), "overwrite\n");
}

TEST(vault_api_test, reads_progress_and_staleness) {
    TempDir dir;
    VaultConfig config = make_test_config(dir);
    VaultAPI api(config);
    EXPECT_FALSE(api.transferProgress());
    EXPECT_FALSE(api.syncStatus());

    ProgressRecord record;
    record.status = TransferStatus::Transferring;
    record.percent = 40;
    ASSERT_TRUE(ProgressStore(config.progressFile, config.statusFile).publish(record));

    auto progress = api.transferProgress();
    ASSERT_TRUE(progress);
    EXPECT_EQ(progress->percent, 40);
    EXPECT_FALSE(api.isStale(progress->timestamp));
    EXPECT_TRUE(api.isStale(progress->timestamp, std::chrono::system_clock::now() + 10min));
}

TEST(vault_api_test, schedule_update_keeps_other_keys) {
    TempDir dir;
    VaultConfig config = make_test_config(dir);
    write_file(config.scheduleFile, R"({"mode": "windowed", "start_hour": 22, "end_hour": 6, "theme": "dark"})");
    VaultAPI api(config);

    SyncSchedule schedule;
    schedule.mode = SyncMode::Continuous;
    auto stopped = api.updateSchedule(schedule);
    ASSERT_TRUE(stopped);
    EXPECT_FALSE(*stopped);

    auto json = readJsonFile(config.scheduleFile);
    ASSERT_TRUE(json);
    EXPECT_EQ((*json)["mode"].asString(), "continuous");
    EXPECT_EQ((*json)["theme"].asString(), "dark");
    EXPECT_EQ(api.schedule().mode, SyncMode::Continuous);
}

TEST(vault_api_test, narrowing_the_window_stops_a_running_sync) {
    TempDir dir;
    VaultConfig config = make_test_config(dir);
    VaultAPI api(config);

    auto sync = Subprocess::start({"sleep", "30"});
    ASSERT_TRUE(sync);
    write_file(config.syncLockFile, std::to_string(sync->pid()) + "\n");
    EXPECT_TRUE(api.isSyncActive());

    SyncSchedule schedule;
    schedule.startHour = 3;
    schedule.endHour = 3;
    auto stopped = api.updateSchedule(schedule);
    ASSERT_TRUE(stopped);
    EXPECT_TRUE(*stopped);

    auto exitCode = sync->wait();
    ASSERT_TRUE(exitCode);
    EXPECT_EQ(*exitCode, 128 + SIGTERM);
}

TEST(vault_api_test, stop_without_running_sync) {
    TempDir dir;
    VaultConfig config = make_test_config(dir);
    VaultAPI api(config);
    auto stopped = api.stopRunningSync();
    ASSERT_TRUE(stopped);
    EXPECT_FALSE(*stopped);
    EXPECT_FALSE(api.isSyncActive());
    EXPECT_FALSE(api.isTransferActive());

    write_file(config.transferLockFile, std::to_string(::getpid()) + "\n");
    EXPECT_TRUE(api.isTransferActive());
}
