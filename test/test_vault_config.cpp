#include <stdexcept>
#include <gtest/gtest.h>
#include "vault_config.hpp"
#include "test_utils.hpp"

using namespace std::chrono_literals;

TEST(vault_config_test, missing_file_keeps_defaults) {
    TempDir dir;
    VaultConfig config(dir.str("absent.json"));
    EXPECT_EQ(config.transferLockFile, "/tmp/usb-transfer.lock");
    EXPECT_EQ(config.destDir, "/media/external-hdd/incoming");
    EXPECT_EQ(config.decisionTimeout, 300s);
    EXPECT_EQ(config.partialSuccessCodes, std::vector<int>{23});
    EXPECT_EQ(config.transferLogFile(), "/var/log/usb-transfer/transfer.log");
}

TEST(vault_config_test, reads_sections) {
    TempDir dir;
    write_file(dir.path() / "usbvault.json", R"({
        "log_dir": "/srv/logs",
        "storage_root": "/mnt/backup",
        "verbose": true,
        "transfer": {
            "lock_file": "/run/t.lock",
            "automount_roots": ["/media/a", "/run/media/b"],
            "decision_timeout_sec": 1.5,
            "mount_attempts": 3,
            "partial_success_codes": [23, 24]
        },
        "sync": {
            "remote_name": "drive",
            "excludes": ["*.bak"],
            "poll_interval_sec": 2
        },
        "notifications": {
            "command": "/usr/local/bin/notify"
        }
    })");

    VaultConfig config(dir.str("usbvault.json"));
    EXPECT_EQ(config.logDir, "/srv/logs");
    EXPECT_TRUE(config.verbose);
    EXPECT_EQ(config.destDir, "/mnt/backup/incoming");
    EXPECT_EQ(config.transferLockFile, "/run/t.lock");
    EXPECT_EQ(config.automountRoots, (std::vector<std::string>{"/media/a", "/run/media/b"}));
    EXPECT_EQ(config.decisionTimeout, 1500ms);
    EXPECT_EQ(config.mountAttempts, 3);
    EXPECT_EQ(config.partialSuccessCodes, (std::vector<int>{23, 24}));
    EXPECT_EQ(config.remoteName, "drive");
    EXPECT_EQ(config.syncExcludes, std::vector<std::string>{"*.bak"});
    EXPECT_EQ(config.syncPollInterval, 2s);
    EXPECT_EQ(config.notifyCommand, "/usr/local/bin/notify");
    EXPECT_EQ(config.notificationLog, "/srv/logs/notifications.json");
    EXPECT_EQ(config.errorLogFile(), "/srv/logs/errors.log");
    EXPECT_TRUE(config.telegramConfig.isNull());
}

TEST(vault_config_test, rejects_malformed_files) {
    TempDir dir;
    write_file(dir.path() / "broken.json", "{ \"log_dir\": ");
    EXPECT_THROW({ VaultConfig config(dir.str("broken.json")); }, std::runtime_error);

    write_file(dir.path() / "array.json", "[1, 2]");
    EXPECT_THROW({ VaultConfig config(dir.str("array.json")); }, std::runtime_error);

    write_file(dir.path() / "negative.json", R"({"transfer": {"settle_delay_sec": -1}})");
    EXPECT_THROW({ VaultConfig config(dir.str("negative.json")); }, std::runtime_error);

    write_file(dir.path() / "zero.json", R"({"transfer": {"mount_attempts": 0}})");
    EXPECT_THROW({ VaultConfig config(dir.str("zero.json")); }, std::runtime_error);
}
