#include "vault_api.hpp"
#include "process_lock.hpp"
#include "text_format.hpp"
#include <cerrno>
#include <cstring>
#include <signal.h>
#include <fmt/format.h>

VaultAPI::VaultAPI(VaultConfig config) : config(std::move(config)) {}

std::expected<void, std::string> VaultAPI::postDecision(Decision decision) const {
    if (!DecisionChannel::isPending(config.decisionRequestFile)) {
        return std::unexpected("No transfer is waiting for a decision");
    }
    return DecisionChannel::respond(config.decisionFile, decision);
}

std::expected<ProgressRecord, std::string> VaultAPI::transferProgress() const {
    return ProgressStore(config.progressFile, config.statusFile).read();
}

bool VaultAPI::isStale(const std::string& timestamp, std::chrono::system_clock::time_point now) const {
    return ::isStale(timestamp, now, config.staleAfter);
}

std::expected<SyncStatusRecord, std::string> VaultAPI::syncStatus() const {
    return SyncStatusStore(config.syncStatusFile).read();
}

SyncSchedule VaultAPI::schedule() const {
    return SyncSchedule::load(config.scheduleFile);
}

std::expected<bool, std::string> VaultAPI::updateSchedule(const SyncSchedule& schedule,
                                                          std::chrono::system_clock::time_point now) const {
    Json::Value scheduleJson(Json::objectValue);
    if (auto existing = readJsonFile(config.scheduleFile); existing && existing->isObject()) {
        scheduleJson = *existing;
    }
    Json::Value update = schedule.toJson();
    for (const auto& key : update.getMemberNames()) {
        scheduleJson[key] = update[key];
    }

    if (auto written = writeJsonAtomically(config.scheduleFile, scheduleJson); !written) {
        return std::unexpected(fmt::format("Failed to update schedule: {}", written.error()));
    }

    int hour = std::stoi(formatLocalTime(now, "%H"));
    if (isSyncActive() && !schedule.allows(hour)) {
        return stopRunningSync();
    }
    return false;
}

std::expected<bool, std::string> VaultAPI::stopRunningSync() const {
    auto owner = ProcessLock::liveOwner(config.syncLockFile);
    if (!owner) {
        return false;
    }
    if (::kill(*owner, SIGTERM) != 0) {
        return std::unexpected(fmt::format("Failed to stop sync process {}: {}",
                                           static_cast<long>(*owner), std::strerror(errno)));
    }
    return true;
}

bool VaultAPI::isTransferActive() const {
    return ProcessLock::isHeld(config.transferLockFile);
}

bool VaultAPI::isSyncActive() const {
    return ProcessLock::liveOwner(config.syncLockFile).has_value();
}
