/**
 * @file vault_config.hpp
 * @brief Configuration management for the UsbVault transfer and sync jobs.
 *
 * Defines the configuration class holding file locations, timing policy, external
 * tool settings and notification settings. Every setting has a built-in default
 * matching the appliance layout (/tmp markers, /media/external-hdd storage), so a
 * missing configuration file is not an error.
 *
 * @note Configuration is loaded from a JSON file. Durations are given in seconds
 * (fractions allowed) and stored as std::chrono::milliseconds.
 */

#ifndef VAULT_CONFIG_HPP
#define VAULT_CONFIG_HPP

#include <chrono>
#include <string>
#include <vector>
#include <json/json.h>

/**
 * @brief Configuration class for the UsbVault jobs.
 *
 * Loads settings from a JSON configuration file, falling back to defaults for
 * every missing key.
 */
class VaultConfig {
public:
    /// Default location of the configuration file on the appliance.
    static constexpr const char* kDefaultConfigFile = "/opt/usb-transfer/usbvault.json";

    /**
     * @brief Constructs a configuration with built-in defaults only.
     */
    VaultConfig() = default;

    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * A missing file leaves all defaults in place.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file exists but cannot be read or parsed.
     */
    explicit VaultConfig(const std::string& configFile);

    /// Activity log of the local transfer job.
    std::string transferLogFile() const { return logDir + "/transfer.log"; }
    /// Activity log of the cloud sync job.
    std::string syncLogFile() const { return logDir + "/gdrive-backup.log"; }
    /// Error log shared by all jobs.
    std::string errorLogFile() const { return logDir + "/errors.log"; }

    // Local transfer coordination files
    std::string transferLockFile = "/tmp/usb-transfer.lock";            ///< Exclusive transfer lock.
    std::string statusFile = "/tmp/usb-transfer-status";                ///< Plain-text status marker.
    std::string progressFile = "/tmp/usb-transfer-progress.json";       ///< Transfer progress record.
    std::string decisionRequestFile = "/tmp/usb-transfer-decision-request.json"; ///< Pending question.
    std::string decisionFile = "/tmp/usb-transfer-decision";            ///< Decision response.
    std::string fileListFile = "/tmp/usb-transfer-files.list";          ///< Copy list for skip mode.

    // Storage layout
    std::string mountPoint = "/media/usb-source";                       ///< Self-mount target for the source.
    std::vector<std::string> automountRoots = {"/media/pebl"};          ///< Desktop auto-mount roots to scan.
    std::string storageRoot = "/media/external-hdd";                    ///< Mount point of the backup disk.
    std::string destDir = "/media/external-hdd/incoming";               ///< Backup destination tree.

    // Logging
    std::string logDir = "/var/log/usb-transfer";                       ///< Directory for all log files.
    bool verbose = false;                                               ///< Enables debug log entries.

    // Transfer timing policy
    int deviceWaitAttempts = 8;                                         ///< Checks for the block device node.
    std::chrono::milliseconds deviceWaitInterval{1000};                 ///< Delay between device checks.
    std::chrono::milliseconds settleDelay{2000};                        ///< Wait before probing mounts.
    int mountAttempts = 5;                                              ///< Self-mount attempts.
    std::chrono::milliseconds mountRetryDelay{2000};                    ///< Delay between mount attempts.
    std::chrono::milliseconds decisionTimeout{300000};                  ///< User decision window.
    std::chrono::milliseconds decisionPollInterval{1000};               ///< Decision response polling.
    std::chrono::milliseconds progressInterval{1000};                   ///< Minimum gap between progress writes.
    std::chrono::milliseconds staleAfter{30000};                        ///< Record age considered stale by readers.
    std::size_t fileTypeTopN = 5;                                       ///< Extensions kept in the histogram.
    std::size_t currentFileDisplayLength = 40;                          ///< Current file length in messages.

    // External copy tool
    std::string copyTool = "rsync";                                     ///< Copy tool executable.
    std::vector<int> partialSuccessCodes = {23};                        ///< Exit codes treated as success.

    // Cloud sync
    std::string syncLockFile = "/tmp/gdrive-sync.lock";                 ///< Sync liveness lock.
    std::string syncStatusFile = "/tmp/gdrive-sync-status.json";        ///< Sync status record.
    std::string scheduleFile = "/opt/usb-transfer/sync-config.json";    ///< Sync schedule record.
    std::string syncTool = "rclone";                                    ///< Sync tool executable.
    std::string rcloneConfig = "/home/pebl/.config/rclone/rclone.conf"; ///< Remote credentials.
    std::string remoteName = "gdrive";                                  ///< Remote name in the rclone config.
    std::string deviceName = "RaPi-PEBL";                               ///< Prefix of the remote folder.
    std::string bandwidthLimit = "10M";                                 ///< Upload bandwidth cap.
    int syncTransfers = 4;                                              ///< Parallel transfers.
    int syncCheckers = 8;                                               ///< Parallel checkers.
    std::vector<std::string> syncExcludes = {".Trash-*/**", ".lost+found/**", "*.tmp", "*.partial"};
    std::chrono::milliseconds syncPollInterval{5000};                   ///< Remote progress sampling.

    // Notifications
    std::string notifyCommand;                                          ///< External notifier, empty to disable.
    std::string notificationLog = "/var/log/usb-transfer/notifications.json"; ///< JSON-lines notification log.
    Json::Value telegramConfig;                                         ///< Telegram configuration (bot_token, chat_id).

private:
    void applyJson(const Json::Value& configJson);
};

#endif // VAULT_CONFIG_HPP
