/**
 * @file notification.hpp
 * @brief Defines notification strategies for UsbVault.
 *
 * Provides the interface and implementations for announcing transfer events: a
 * JSON-lines log read by the status dashboard, an external notifier command
 * (console broadcast, desktop popup, beeps, LED) and the Telegram Bot API.
 *
 * @note Requires libcurl for Telegram notifications.
 */

#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <expected>
#include <memory>
#include <string>
#include <vector>
#include <json/json.h>

class ActivityLog;
class VaultConfig;

/**
 * @brief Event class, used by notifiers to pick a sound or LED pattern.
 */
enum class NotificationCategory {
    Started,
    Complete,
    Failed
};

std::string toString(NotificationCategory category);

/**
 * @brief A user-facing event ("Transfer Complete", "Safe to remove USB ...").
 */
struct Notification {
    std::string title;
    std::string message;
    NotificationCategory category = NotificationCategory::Complete;
};

/**
 * @brief Interface for notification strategies.
 *
 * Defines the contract for delivering transfer notifications.
 */
class NotificationStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~NotificationStrategy() = default;

    /**
     * @brief Sends a notification.
     *
     * @param notification Event to deliver.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> notify(const Notification& notification) = 0;
};

/**
 * @brief Appends one JSON object per notification to a log file.
 */
class JsonLogNotificationStrategy : public NotificationStrategy {
public:
    explicit JsonLogNotificationStrategy(std::string logFile);

    std::expected<void, std::string> notify(const Notification& notification) override;

private:
    std::string logFile; ///< JSON-lines file read by the dashboard.
};

/**
 * @brief Runs an external notifier as "<command> <title> <message>".
 */
class CommandNotificationStrategy : public NotificationStrategy {
public:
    explicit CommandNotificationStrategy(std::string command);

    std::expected<void, std::string> notify(const Notification& notification) override;

private:
    std::string command; ///< Notifier executable.
};

/**
 * @brief Telegram notification strategy.
 *
 * Sends notifications using the Telegram Bot API.
 */
class TelegramNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @brief Constructs a Telegram notification strategy.
     *
     * @param config JSON configuration with bot_token and chat_id.
     * @throws std::runtime_error If configuration is invalid.
     */
    explicit TelegramNotificationStrategy(const Json::Value& config);

    /**
     * @brief Sends a notification via Telegram.
     *
     * Sends "title: message" to the configured Telegram chat.
     *
     * @param notification Event to deliver.
     * @return std::expected<void, std::string> Success or an error message.
     */
    std::expected<void, std::string> notify(const Notification& notification) override;

private:
    std::string botToken; ///< Telegram bot token.
    std::string chatId; ///< Telegram chat ID.
};

/**
 * @brief Fans a notification out to every configured strategy.
 *
 * Delivery failures are logged and never interrupt the job.
 */
class NotificationDispatcher {
public:
    explicit NotificationDispatcher(const ActivityLog& log);

    void add(std::unique_ptr<NotificationStrategy> strategy);

    void notify(const Notification& notification);

    std::size_t size() const { return strategies.size(); }

    /**
     * @brief Builds the dispatcher from the notification settings.
     *
     * @throws std::runtime_error If the Telegram section is present but incomplete.
     */
    static NotificationDispatcher fromConfig(const VaultConfig& config, const ActivityLog& log);

private:
    const ActivityLog* log;
    std::vector<std::unique_ptr<NotificationStrategy>> strategies;
};

#endif // NOTIFICATION_HPP
