#include "sync_job.hpp"
#include "duplicate_scanner.hpp"
#include "process_lock.hpp"
#include "subprocess.hpp"
#include "sync_poller.hpp"
#include "sync_schedule.hpp"
#include "text_format.hpp"
#include <filesystem>
#include <fstream>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace fs = std::filesystem;

namespace {

std::string readMarker(const std::string& path) {
    std::ifstream file(path);
    std::string marker;
    if (file.is_open()) {
        std::getline(file, marker);
    }
    return trim(marker);
}

int localHour(std::chrono::system_clock::time_point when) {
    std::string hour = formatLocalTime(when, "%H");
    return hour.empty() ? 0 : std::stoi(hour);
}

} // namespace

SyncJob::SyncJob(const VaultConfig& config, RemoteStore& remote, MountStrategy& mounts, const ActivityLog& log,
                 std::function<bool()> interrupted, Clock clock)
    : config(config), remote(remote), mounts(mounts), log(log), interrupted(std::move(interrupted)),
      clock(std::move(clock)), store(config.syncStatusFile) {}

std::string SyncJob::folderFor(std::chrono::system_clock::time_point when) const {
    return fmt::format("{}-Sync/{}", config.deviceName, formatLocalTime(when, "%d%m%y"));
}

SyncStatusRecord SyncJob::baseRecord() const {
    SyncStatusRecord record;
    record.folder = folderFor(startedAt);
    record.lastSync = formatLocalTime(startedAt, "%Y-%m-%d %H:%M");
    return record;
}

void SyncJob::publish(SyncStatusRecord record) {
    auto result = store.publish(std::move(record));
    if (!result) {
        log.logError(fmt::format("Failed to publish sync status: {}", result.error()));
    }
}

SyncOutcome SyncJob::skip(const char* reason, const std::string& message) {
    log.logError(message);
    SyncStatusRecord record = baseRecord();
    record.active = false;
    record.status = SyncState::Skipped;
    record.reason = reason;
    record.message = message;
    publish(std::move(record));
    return SyncOutcome{SyncState::Skipped, reason, 0};
}

SyncOutcome SyncJob::run(const SyncOptions& options) {
    startedAt = clock();

    auto lock = ProcessLock::acquire(config.syncLockFile);
    if (!lock) {
        if (lock.error().heldByOther()) {
            log.logDebug(fmt::format("Sync already running (PID {}), exiting", static_cast<long>(*lock.error().owner)));
            return SyncOutcome{SyncState::Skipped, SyncReason::kAlreadyRunning, 0};
        }
        log.logError(fmt::format("Cannot acquire sync lock: {}", lock.error().message));
        return SyncOutcome{SyncState::Failed, SyncReason::kLockError, 1};
    }
    return runLocked(options);
}

SyncOutcome SyncJob::runLocked(const SyncOptions& options) {
    if (ProcessLock::isHeld(config.transferLockFile)) {
        log.logDebug(fmt::format("USB transfer in progress (status: {}), skipping sync to prioritize transfer",
                                 readMarker(config.statusFile)));
        return SyncOutcome{SyncState::Skipped, SyncReason::kTransferInProgress, 0};
    }

    SyncSchedule schedule = SyncSchedule::load(config.scheduleFile);
    int hour = localHour(startedAt);
    log.logDebug(fmt::format("Sync schedule: {}, current hour: {}", schedule.describe(), hour));
    if (!options.force && !schedule.allows(hour)) {
        log.logDebug(fmt::format("Outside sync window. Sync will resume at {}:00", schedule.startHour));
        return SyncOutcome{SyncState::Skipped, SyncReason::kOutsideWindow, 0};
    }

    log.logMessage("==========================================");
    log.logMessage("Starting cloud backup");

    if (!remote.hasCredentials()) {
        return skip(SyncReason::kCredentialsMissing, "rclone not configured");
    }
    if (!mounts.isMounted(config.storageRoot)) {
        return skip(SyncReason::kStorageNotMounted, "External HDD not mounted");
    }
    std::error_code ec;
    if (!fs::is_directory(config.destDir, ec)) {
        return skip(SyncReason::kSourceMissing, "Incoming folder not found");
    }
    if (auto probe = remote.probe(); !probe) {
        return skip(SyncReason::kRemoteUnreachable, fmt::format("Cannot connect to remote: {}", probe.error()));
    }
    return sync();
}

SyncOutcome SyncJob::sync() {
    std::string remotePath = remote.remotePath(folderFor(startedAt));
    log.logMessage(fmt::format("Destination: {}", remotePath));

    std::uint64_t localCount = countFiles(config.destDir);
    log.logMessage(fmt::format("Local files to sync: {}", localCount));

    SyncStatusRecord starting = baseRecord();
    starting.active = true;
    starting.status = SyncState::Active;
    starting.filesRemaining = localCount;
    starting.speed = "Starting...";
    starting.message = "Sync started";
    publish(starting);

    auto argv = remote.syncCommand(config.destDir, remotePath);
    log.logDebug(fmt::format("Running: {}", fmt::join(argv, " ")));
    auto process = Subprocess::start(argv);
    if (!process) {
        log.logError(fmt::format("Cannot start sync tool: {}", process.error()));
        SyncStatusRecord failed = baseRecord();
        failed.status = SyncState::Failed;
        failed.reason = SyncReason::kSyncFailed;
        failed.message = "Sync tool could not be started";
        publish(std::move(failed));
        return SyncOutcome{SyncState::Failed, SyncReason::kSyncFailed, 1};
    }

    pid_t childPid = process->pid();
    SyncPoller poller(remote, store, log, remotePath, baseRecord(), localCount, config.syncPollInterval,
                      [childPid] { return ProcessLock::isProcessAlive(childPid); });
    poller.start();

    ProgressParser parser(remote.grammar(), localCount, config.syncPollInterval);
    while (auto line = process->readLine(interrupted)) {
        log.appendRaw(*line);
        if (auto update = parser.feed(*line)) {
            log.logMessage(fmt::format("Sync progress: {}% ({}, ETA {})", update->percent, update->speed, update->eta));
        }
    }

    if (interrupted && interrupted()) {
        process->terminate();
        poller.stop();
        log.logError("Sync interrupted by signal");
        SyncStatusRecord stopped = baseRecord();
        stopped.status = SyncState::Failed;
        stopped.reason = SyncReason::kInterrupted;
        stopped.message = "Sync stopped";
        publish(std::move(stopped));
        return SyncOutcome{SyncState::Failed, SyncReason::kInterrupted, 1};
    }

    auto exitCode = process->wait();
    poller.stop();

    if (exitCode && *exitCode == 0) {
        log.logMessage("Backup completed successfully!");
        SyncStatusRecord done = baseRecord();
        done.status = SyncState::Complete;
        done.percent = 100;
        done.message = "Backup completed successfully";
        if (auto totals = remote.size(remotePath)) {
            done.filesSynced = totals->count;
            done.totalFiles = totals->count;
            done.totalSize = formatBytesIec(totals->bytes);
            log.logMessage(fmt::format("Cloud files: {} ({})", totals->count, *done.totalSize));
        } else {
            done.filesSynced = localCount;
            log.logError(fmt::format("Cannot read remote totals: {}", totals.error()));
        }
        publish(std::move(done));
        log.logMessage("==========================================");
        return SyncOutcome{SyncState::Complete, "", 0};
    }

    std::string detail = exitCode ? fmt::format("exit code {}", *exitCode) : exitCode.error();
    log.logError(fmt::format("Backup failed with {}", detail));
    SyncStatusRecord failed = baseRecord();
    failed.status = SyncState::Failed;
    failed.reason = SyncReason::kSyncFailed;
    failed.message = fmt::format("Sync failed ({})", detail);
    publish(std::move(failed));
    log.logMessage("==========================================");
    return SyncOutcome{SyncState::Failed, SyncReason::kSyncFailed, 1};
}
