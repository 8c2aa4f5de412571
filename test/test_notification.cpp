#include <sstream>
#include <stdexcept>
#include <gtest/gtest.h>
#include "notification.hpp"
#include "test_utils.hpp"

namespace {

std::vector<Json::Value> read_json_lines(const std::string& path) {
    std::vector<Json::Value> entries;
    std::istringstream lines(read_file(path));
    std::string line;
    Json::CharReaderBuilder builder;
    while (std::getline(lines, line)) {
        Json::Value entry;
        std::string errors;
        std::istringstream stream(line);
        if (Json::parseFromStream(builder, stream, &entry, &errors)) {
            entries.push_back(entry);
        }
    }
    return entries;
}

} // namespace

TEST(notification_test, json_log_appends_one_line_per_event) {
    TempDir dir;
    JsonLogNotificationStrategy strategy(dir.str("log/notifications.json"));
    ASSERT_TRUE(strategy.notify({"Transfer Started", "Copying 3.4KiB from CAMERA...", NotificationCategory::Started}));
    ASSERT_TRUE(strategy.notify({"Transfer Failed", "Error copying from CAMERA. Check logs.", NotificationCategory::Failed}));

    auto entries = read_json_lines(dir.str("log/notifications.json"));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0]["title"].asString(), "Transfer Started");
    EXPECT_EQ(entries[0]["category"].asString(), "started");
    EXPECT_EQ(entries[1]["category"].asString(), "failed");
    EXPECT_FALSE(entries[1]["time"].asString().empty());
}

TEST(notification_test, command_reports_exit_status) {
    EXPECT_TRUE(CommandNotificationStrategy("true").notify({"a", "b", NotificationCategory::Complete}));
    EXPECT_FALSE(CommandNotificationStrategy("false").notify({"a", "b", NotificationCategory::Complete}));
}

TEST(notification_test, telegram_requires_token_and_chat) {
    Json::Value config;
    config["bot_token"] = "123:abc";
    EXPECT_THROW(TelegramNotificationStrategy strategy(config), std::runtime_error);
}

TEST(notification_test, dispatcher_logs_delivery_failures) {
    TempDir dir;
    VaultConfig config = make_test_config(dir);
    ActivityLog log = make_test_log(config);
    NotificationDispatcher dispatcher(log);
    dispatcher.add(std::make_unique<CommandNotificationStrategy>("false"));
    dispatcher.add(std::make_unique<JsonLogNotificationStrategy>(config.notificationLog));

    dispatcher.notify({"Mount Failed", "Could not mount USB drive CAMERA", NotificationCategory::Failed});

    EXPECT_EQ(read_json_lines(config.notificationLog).size(), 1u);
    EXPECT_NE(read_file(config.transferLogFile()).find("Notification [Mount Failed] Could not mount USB drive CAMERA"),
              std::string::npos);
    EXPECT_NE(read_file(config.errorLogFile()).find("not delivered"), std::string::npos);
}

TEST(notification_test, dispatcher_from_config) {
    TempDir dir;
    VaultConfig config = make_test_config(dir);
    ActivityLog log = make_test_log(config);
    EXPECT_EQ(NotificationDispatcher::fromConfig(config, log).size(), 1u);

    config.notifyCommand = "/usr/local/bin/notify-user";
    EXPECT_EQ(NotificationDispatcher::fromConfig(config, log).size(), 2u);

    config.telegramConfig["chat_id"] = "42";
    EXPECT_THROW(NotificationDispatcher::fromConfig(config, log), std::runtime_error);
}
