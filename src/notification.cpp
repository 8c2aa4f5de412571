#include "notification.hpp"
#include "activity_log.hpp"
#include "subprocess.hpp"
#include "text_format.hpp"
#include "vault_config.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <curl/curl.h>
#include <fmt/format.h>

namespace {

size_t writeCallback([[maybe_unused]] void* contents, size_t size, size_t nmemb, [[maybe_unused]] void* userp) {
    return size * nmemb;
}

constexpr long kTelegramTimeoutSec = 10;

} // namespace

std::string toString(NotificationCategory category) {
    switch (category) {
        case NotificationCategory::Started: return "started";
        case NotificationCategory::Complete: return "complete";
        case NotificationCategory::Failed: return "failed";
    }
    return "unknown";
}

JsonLogNotificationStrategy::JsonLogNotificationStrategy(std::string logFile) : logFile(std::move(logFile)) {}

std::expected<void, std::string> JsonLogNotificationStrategy::notify(const Notification& notification) {
    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(logFile).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    std::ofstream out(logFile, std::ios::app);
    if (!out.is_open()) {
        return std::unexpected(fmt::format("Failed to open notification log {}", logFile));
    }

    Json::Value entry;
    entry["time"] = isoTimestamp(std::chrono::system_clock::now());
    entry["title"] = notification.title;
    entry["message"] = notification.message;
    entry["category"] = toString(notification.category);
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    out << Json::writeString(builder, entry) << '\n';
    if (!out) {
        return std::unexpected(fmt::format("Failed to write notification log {}", logFile));
    }
    return {};
}

CommandNotificationStrategy::CommandNotificationStrategy(std::string command) : command(std::move(command)) {}

std::expected<void, std::string> CommandNotificationStrategy::notify(const Notification& notification) {
    auto result = runCommand({command, notification.title, notification.message});
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exitCode != 0) {
        return std::unexpected(fmt::format("Notifier {} exited with code {}", command, result->exitCode));
    }
    return {};
}

TelegramNotificationStrategy::TelegramNotificationStrategy(const Json::Value& config)
    : botToken(config["bot_token"].asString()), chatId(config["chat_id"].asString()) {
    if (botToken.empty() || chatId.empty()) {
        throw std::runtime_error("Telegram configuration requires bot_token and chat_id");
    }
}

std::expected<void, std::string> TelegramNotificationStrategy::notify(const Notification& notification) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    std::string text = fmt::format("{}: {}", notification.title, notification.message);
    char* escaped = curl_easy_escape(curl, text.c_str(), static_cast<int>(text.length()));
    if (!escaped) {
        curl_easy_cleanup(curl);
        return std::unexpected("Failed to escape Telegram message");
    }
    std::string url = fmt::format("https://api.telegram.org/bot{}/sendMessage?chat_id={}&text={}",
        botToken, chatId, escaped);
    curl_free(escaped);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, kTelegramTimeoutSec);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    CURLcode res = curl_easy_perform(curl);
    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(fmt::format("Failed to send Telegram notification: {}", curl_easy_strerror(res)));
    }
    if (httpCode != 200) {
        return std::unexpected(fmt::format("Telegram API returned HTTP {}", httpCode));
    }
    return {};
}

NotificationDispatcher::NotificationDispatcher(const ActivityLog& log) : log(&log) {}

void NotificationDispatcher::add(std::unique_ptr<NotificationStrategy> strategy) {
    strategies.push_back(std::move(strategy));
}

void NotificationDispatcher::notify(const Notification& notification) {
    log->logMessage(fmt::format("Notification [{}] {}", notification.title, notification.message));
    for (auto& strategy : strategies) {
        auto result = strategy->notify(notification);
        if (!result) {
            log->logError(fmt::format("Notification \"{}\" not delivered: {}", notification.title, result.error()));
        }
    }
}

NotificationDispatcher NotificationDispatcher::fromConfig(const VaultConfig& config, const ActivityLog& log) {
    NotificationDispatcher dispatcher(log);
    if (!config.notificationLog.empty()) {
        dispatcher.add(std::make_unique<JsonLogNotificationStrategy>(config.notificationLog));
    }
    if (!config.notifyCommand.empty()) {
        dispatcher.add(std::make_unique<CommandNotificationStrategy>(config.notifyCommand));
    }
    if (!config.telegramConfig.empty()) {
        dispatcher.add(std::make_unique<TelegramNotificationStrategy>(config.telegramConfig));
    }
    return dispatcher;
}
