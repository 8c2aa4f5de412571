#include <chrono>
#include <thread>
#include <gtest/gtest.h>
#include "fakes/fake_remote_store.hpp"
#include "sync_poller.hpp"
#include "test_utils.hpp"

using namespace std::chrono_literals;

TEST(sync_poller_test, percent_of_local_files) {
    EXPECT_EQ(syncPercent(0, 0), 100);
    EXPECT_EQ(syncPercent(5, 20), 25);
    EXPECT_EQ(syncPercent(30, 20), 100);
}

TEST(sync_poller_test, throughput_in_megabits) {
    EXPECT_EQ(formatMbps(1250000, 1s), "10.0 Mbps");
    EXPECT_EQ(formatMbps(0, 5s), "0.0 Mbps");
    EXPECT_EQ(formatMbps(100, 0s), "calculating...");
}

TEST(sync_poller_test, publishes_remote_progress) {
    TempDir dir;
    VaultConfig config = make_test_config(dir);
    ActivityLog log = make_test_log(config);
    SyncStatusStore store(config.syncStatusFile);
    FakeRemoteStore remote;
    remote.totals = RemoteSize{3, 3000};

    SyncStatusRecord base;
    base.folder = "Box-Sync/010325";
    SyncPoller poller(remote, store, log, "fake:Box-Sync/010325", base, 12, 10ms, [] { return true; });
    poller.start();
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (poller.samples() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    poller.stop();
    poller.stop();
    ASSERT_GE(poller.samples(), 2u);

    auto record = store.read();
    ASSERT_TRUE(record);
    EXPECT_TRUE(record->active);
    EXPECT_EQ(record->status, SyncState::Active);
    EXPECT_EQ(record->percent, 25);
    EXPECT_EQ(record->filesSynced, 3u);
    EXPECT_EQ(record->filesRemaining, 9u);
    EXPECT_EQ(record->folder, "Box-Sync/010325");
    EXPECT_EQ(record->message, "Syncing 3 of 12 files");
    EXPECT_EQ(record->speed, "0.0 Mbps");
}

TEST(sync_poller_test, stops_when_sync_exits) {
    TempDir dir;
    VaultConfig config = make_test_config(dir);
    ActivityLog log = make_test_log(config);
    SyncStatusStore store(config.syncStatusFile);
    FakeRemoteStore remote;

    SyncPoller poller(remote, store, log, "fake:x", SyncStatusRecord{}, 1, 5ms, [] { return false; });
    poller.start();
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(poller.samples(), 1u);
    poller.stop();
}
