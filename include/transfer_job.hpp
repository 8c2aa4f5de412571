/**
 * @file transfer_job.hpp
 * @brief Local transfer job: copies a freshly inserted USB medium to the backup disk.
 *
 * The job runs as one process per insertion and walks the states
 * Detecting -> Mounting -> Scanning -> Checking -> [PendingDecision] -> Transferring
 * -> Complete, with AllDuplicates and Failed as the other terminal states. Every
 * state change is published to the progress store before the work of that state
 * starts, and a terminal record is published on every exit path except lock
 * contention, where the store belongs to the job already running.
 */

#ifndef TRANSFER_JOB_HPP
#define TRANSFER_JOB_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "activity_log.hpp"
#include "copy_tool.hpp"
#include "decision_channel.hpp"
#include "duplicate_scanner.hpp"
#include "mount_strategy.hpp"
#include "notification.hpp"
#include "progress_store.hpp"
#include "vault_config.hpp"

/// Exit code of a transfer job that found another transfer running.
inline constexpr int kExitLockContention = 2;

/**
 * @brief Arguments of the device trigger.
 */
struct TransferRequest {
    std::string device;  ///< "sdb1" or "/dev/sdb1".
    std::string label;   ///< Volume label, USB_DRIVE when empty.
};

/**
 * @brief Final state of a job and the process exit code it maps to.
 */
struct TransferOutcome {
    TransferStatus status = TransferStatus::Failed;
    int exitCode = 1;
    std::string message;
};

class TransferJob {
public:
    /**
     * @brief Constructs a job; nothing is touched until run() is called.
     *
     * @param config Paths, timing and tool settings.
     * @param request Device and label from the trigger.
     * @param mounts Device and mount access.
     * @param copyTool External copy tool.
     * @param notifier User notifications.
     * @param log Activity log of the transfer job.
     * @param interrupted Returns true once the job must stop (termination signal).
     */
    TransferJob(const VaultConfig& config, TransferRequest request, MountStrategy& mounts, CopyTool& copyTool,
                NotificationDispatcher& notifier, const ActivityLog& log,
                std::function<bool()> interrupted);

    /**
     * @brief Runs the job to a terminal state.
     *
     * Holds the transfer lock for the whole run and removes the decision and file
     * list files before returning.
     */
    TransferOutcome run();

    /// Statuses published by this job, in order.
    const std::vector<TransferStatus>& history() const { return statusHistory; }

    const std::string& device() const { return devicePath; }
    const std::string& label() const { return volumeLabel; }
    const std::string& sourcePath() const { return source; }
    const std::string& destPath() const { return destination; }
    std::size_t fileCount() const { return inventory.fileCount; }
    std::size_t existingCount() const { return duplicates.existingCount; }
    std::optional<Decision> decision() const { return chosen; }

    /// "sdb1" becomes "/dev/sdb1"; absolute paths are kept.
    static std::string normalizeDevice(const std::string& device);

    /// Empty labels become USB_DRIVE; path separators are replaced.
    static std::string sanitizeLabel(const std::string& label);

private:
    TransferOutcome runLocked();
    bool mountSource();
    bool scanSource();
    bool resolveDecision();
    TransferOutcome transfer();

    ProgressRecord record(TransferStatus status, std::string message) const;
    void publish(ProgressRecord record);
    TransferOutcome fail(std::string message);
    bool sleepFor(std::chrono::milliseconds duration) const;
    std::expected<std::string, std::string> writeFileList() const;

    const VaultConfig& config;
    MountStrategy& mounts;
    CopyTool& copyTool;
    NotificationDispatcher& notifier;
    const ActivityLog& log;
    std::function<bool()> interrupted;

    ProgressStore store;
    DecisionChannel decisionChannel;

    std::string devicePath;
    std::string volumeLabel;
    std::string source;
    std::string destination;
    SourceInventory inventory;
    DuplicateReport duplicates;
    std::optional<Decision> chosen;
    std::vector<TransferStatus> statusHistory;
    std::optional<TransferOutcome> earlyExit;
};

#endif // TRANSFER_JOB_HPP
