#include "vault_config.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

std::chrono::milliseconds seconds(const Json::Value& section, const char* key, std::chrono::milliseconds fallback) {
    if (!section.isMember(key) || !section[key].isNumeric()) {
        return fallback;
    }
    double value = section[key].asDouble();
    if (value < 0) {
        throw std::runtime_error(fmt::format("Negative duration for \"{}\"", key));
    }
    return std::chrono::milliseconds(static_cast<long long>(value * 1000.0));
}

std::vector<std::string> stringList(const Json::Value& section, const char* key, std::vector<std::string> fallback) {
    if (!section.isMember(key) || !section[key].isArray()) {
        return fallback;
    }
    std::vector<std::string> values;
    for (const auto& item : section[key]) {
        values.push_back(item.asString());
    }
    return values;
}

} // namespace

VaultConfig::VaultConfig(const std::string& configFile) {
    if (!fs::exists(configFile)) {
        return;
    }
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &configJson, &errors)) {
        throw std::runtime_error(fmt::format("Failed to parse config file: {} ({})", configFile, errors));
    }
    if (!configJson.isObject()) {
        throw std::runtime_error(fmt::format("Config file is not a JSON object: {}", configFile));
    }
    applyJson(configJson);
}

void VaultConfig::applyJson(const Json::Value& configJson) {
    logDir = configJson.get("log_dir", logDir).asString();
    verbose = configJson.get("verbose", verbose).asBool();
    storageRoot = configJson.get("storage_root", storageRoot).asString();
    destDir = configJson.get("dest_dir", storageRoot + "/incoming").asString();

    const Json::Value& transfer = configJson["transfer"];
    transferLockFile = transfer.get("lock_file", transferLockFile).asString();
    statusFile = transfer.get("status_file", statusFile).asString();
    progressFile = transfer.get("progress_file", progressFile).asString();
    decisionRequestFile = transfer.get("decision_request_file", decisionRequestFile).asString();
    decisionFile = transfer.get("decision_file", decisionFile).asString();
    fileListFile = transfer.get("file_list_file", fileListFile).asString();
    mountPoint = transfer.get("mount_point", mountPoint).asString();
    automountRoots = stringList(transfer, "automount_roots", automountRoots);
    deviceWaitAttempts = transfer.get("device_wait_attempts", deviceWaitAttempts).asInt();
    deviceWaitInterval = seconds(transfer, "device_wait_interval_sec", deviceWaitInterval);
    settleDelay = seconds(transfer, "settle_delay_sec", settleDelay);
    mountAttempts = transfer.get("mount_attempts", mountAttempts).asInt();
    mountRetryDelay = seconds(transfer, "mount_retry_delay_sec", mountRetryDelay);
    decisionTimeout = seconds(transfer, "decision_timeout_sec", decisionTimeout);
    decisionPollInterval = seconds(transfer, "decision_poll_interval_sec", decisionPollInterval);
    progressInterval = seconds(transfer, "progress_interval_sec", progressInterval);
    staleAfter = seconds(transfer, "stale_after_sec", staleAfter);
    fileTypeTopN = transfer.get("file_type_top_n", static_cast<Json::UInt>(fileTypeTopN)).asUInt();
    currentFileDisplayLength = transfer.get("current_file_display_length",
                                            static_cast<Json::UInt>(currentFileDisplayLength)).asUInt();
    copyTool = transfer.get("copy_tool", copyTool).asString();
    if (transfer.isMember("partial_success_codes") && transfer["partial_success_codes"].isArray()) {
        partialSuccessCodes.clear();
        for (const auto& code : transfer["partial_success_codes"]) {
            partialSuccessCodes.push_back(code.asInt());
        }
    }

    if (deviceWaitAttempts < 1 || mountAttempts < 1) {
        throw std::runtime_error("device_wait_attempts and mount_attempts must be at least 1");
    }

    const Json::Value& sync = configJson["sync"];
    syncLockFile = sync.get("lock_file", syncLockFile).asString();
    syncStatusFile = sync.get("status_file", syncStatusFile).asString();
    scheduleFile = sync.get("schedule_file", scheduleFile).asString();
    syncTool = sync.get("tool", syncTool).asString();
    rcloneConfig = sync.get("rclone_config", rcloneConfig).asString();
    remoteName = sync.get("remote_name", remoteName).asString();
    deviceName = sync.get("device_name", deviceName).asString();
    bandwidthLimit = sync.get("bandwidth_limit", bandwidthLimit).asString();
    syncTransfers = sync.get("transfers", syncTransfers).asInt();
    syncCheckers = sync.get("checkers", syncCheckers).asInt();
    syncExcludes = stringList(sync, "excludes", syncExcludes);
    syncPollInterval = seconds(sync, "poll_interval_sec", syncPollInterval);

    const Json::Value& notifications = configJson["notifications"];
    notifyCommand = notifications.get("command", notifyCommand).asString();
    notificationLog = notifications.get("log", logDir + "/notifications.json").asString();
    telegramConfig = notifications["telegram"];
}
