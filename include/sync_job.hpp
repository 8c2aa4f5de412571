/**
 * @file sync_job.hpp
 * @brief Cloud sync job: mirrors the backup disk to the cloud remote.
 *
 * One process per scheduler tick. The job passes a fixed sequence of gates before
 * it touches the remote and yields to a running local transfer, so the two jobs
 * never compete for the backup disk.
 */

#ifndef SYNC_JOB_HPP
#define SYNC_JOB_HPP

#include <chrono>
#include <functional>
#include <string>
#include "activity_log.hpp"
#include "mount_strategy.hpp"
#include "progress_store.hpp"
#include "remote_store.hpp"
#include "vault_config.hpp"

/// Skip and failure reasons recorded in the sync status.
namespace SyncReason {
inline constexpr const char* kAlreadyRunning = "sync-already-running";
inline constexpr const char* kTransferInProgress = "transfer-in-progress";
inline constexpr const char* kOutsideWindow = "outside-window";
inline constexpr const char* kCredentialsMissing = "credentials-missing";
inline constexpr const char* kStorageNotMounted = "storage-not-mounted";
inline constexpr const char* kSourceMissing = "source-missing";
inline constexpr const char* kRemoteUnreachable = "remote-unreachable";
inline constexpr const char* kInterrupted = "interrupted";
inline constexpr const char* kSyncFailed = "sync-failed";
inline constexpr const char* kLockError = "lock-error";
}

struct SyncOptions {
    bool force = false; ///< Ignore the schedule window.
};

struct SyncOutcome {
    SyncState status = SyncState::Skipped;
    std::string reason;
    int exitCode = 0;
};

class SyncJob {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @param config Paths and sync settings.
     * @param remote Cloud remote.
     * @param mounts Used to check that the backup disk is mounted.
     * @param log Sync activity log.
     * @param interrupted Returns true once the job must stop.
     * @param clock Wall clock used for the schedule window and folder naming.
     */
    SyncJob(const VaultConfig& config, RemoteStore& remote, MountStrategy& mounts, const ActivityLog& log,
            std::function<bool()> interrupted, Clock clock = std::chrono::system_clock::now);

    /**
     * @brief Runs the gates and, if they all pass, the sync.
     *
     * @return SyncOutcome Skipped and Complete map to exit code 0, Failed to 1.
     */
    SyncOutcome run(const SyncOptions& options);

    /// Remote folder name for a date: "<device>-Sync/DDMMYY".
    std::string folderFor(std::chrono::system_clock::time_point when) const;

private:
    SyncOutcome runLocked(const SyncOptions& options);
    SyncOutcome skip(const char* reason, const std::string& message);
    SyncOutcome sync();
    SyncStatusRecord baseRecord() const;
    void publish(SyncStatusRecord record);

    const VaultConfig& config;
    RemoteStore& remote;
    MountStrategy& mounts;
    const ActivityLog& log;
    std::function<bool()> interrupted;
    Clock clock;
    SyncStatusStore store;
    std::chrono::system_clock::time_point startedAt;
};

#endif // SYNC_JOB_HPP
