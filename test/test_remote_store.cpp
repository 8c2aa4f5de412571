#include <algorithm>
#include <cstdlib>
#include <gtest/gtest.h>
#include "remote_store.hpp"
#include "test_utils.hpp"

TEST(remote_store_test, parses_size_output) {
    auto size = parseRemoteSize("NOTICE: config found\n{\"count\":42,\"bytes\":123456,\"sizeless\":0}\n");
    ASSERT_TRUE(size);
    EXPECT_EQ(size->count, 42u);
    EXPECT_EQ(size->bytes, 123456u);

    EXPECT_FALSE(parseRemoteSize("Failed to size: directory not found"));
    EXPECT_FALSE(parseRemoteSize("{\"count\": }"));
}

TEST(remote_store_test, builds_sync_command) {
    VaultConfig config;
    config.syncTool = "rclone";
    config.rcloneConfig = "/etc/rclone.conf";
    config.bandwidthLimit = "5M";
    config.syncTransfers = 2;
    config.syncCheckers = 4;
    config.syncExcludes = {"*.tmp", ".Trash-*/**"};
    RcloneRemoteStore store(config);

    EXPECT_EQ(store.remotePath("RaPi-PEBL-Sync/010325"), "gdrive:RaPi-PEBL-Sync/010325");
    EXPECT_EQ(store.syncCommand("/media/external-hdd/incoming", "gdrive:x"), (std::vector<std::string>{
        "rclone", "sync", "/media/external-hdd/incoming", "gdrive:x",
        "--config", "/etc/rclone.conf",
        "--bwlimit", "5M", "--transfers", "2", "--checkers", "4",
        "--exclude", "*.tmp", "--exclude", ".Trash-*/**",
        "-v", "--stats-one-line", "--stats", "5s"}));
}

TEST(remote_store_test, credentials_are_the_config_file) {
    TempDir dir;
    VaultConfig config = make_test_config(dir);
    RcloneRemoteStore store(config);
    EXPECT_FALSE(store.hasCredentials());
    write_file(config.rcloneConfig, "[gdrive]\ntype = drive\n");
    EXPECT_TRUE(store.hasCredentials());
}

TEST(remote_store_test, probes_and_sizes_through_the_tool) {
    TempDir dir;
    VaultConfig config = make_test_config(dir);
    write_file(dir.path() / "remote/Box-Sync/010325/a.jpg", "12345");
    write_file(dir.path() / "remote/Box-Sync/010325/b/c.jpg", "678");
    ::setenv("FAKE_RCLONE_ROOT", dir.str("remote").c_str(), 1);
    ::unsetenv("FAKE_RCLONE_OFFLINE");

    RcloneRemoteStore store(config);
    EXPECT_TRUE(store.probe());
    auto size = store.size(store.remotePath("Box-Sync/010325"));
    ASSERT_TRUE(size);
    EXPECT_EQ(size->count, 2u);
    EXPECT_EQ(size->bytes, 8u);

    ::setenv("FAKE_RCLONE_OFFLINE", "1", 1);
    EXPECT_FALSE(store.probe());
    ::unsetenv("FAKE_RCLONE_OFFLINE");
    ::unsetenv("FAKE_RCLONE_ROOT");
}
