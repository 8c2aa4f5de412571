/**
 * @file vault_api.hpp
 * @brief High-level API for the UI side of UsbVault.
 *
 * Provides the operations the touch UI, the status server and usbvault-ctl need:
 * answering a duplicate question, reading the published progress of both jobs,
 * changing the cloud sync schedule and stopping a running sync. All interaction
 * with the jobs goes through their files and lock owners.
 */

#ifndef VAULT_API_HPP
#define VAULT_API_HPP

#include <chrono>
#include <expected>
#include <string>
#include "decision_channel.hpp"
#include "progress_store.hpp"
#include "sync_schedule.hpp"
#include "vault_config.hpp"

/**
 * @brief API for observing and steering the UsbVault jobs.
 */
class VaultAPI {
public:
    explicit VaultAPI(VaultConfig config);

    /**
     * @brief Answers the pending duplicate question.
     *
     * @param decision Overwrite or skip.
     * @return std::expected<void, std::string> Success, or an error if no question is pending.
     */
    std::expected<void, std::string> postDecision(Decision decision) const;

    /**
     * @brief Reads the transfer progress record.
     *
     * @return std::expected<ProgressRecord, std::string> The record or why it is unreadable.
     */
    std::expected<ProgressRecord, std::string> transferProgress() const;

    /// Whether a record is older than the staleness threshold at the given time.
    bool isStale(const std::string& timestamp,
                 std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    std::expected<SyncStatusRecord, std::string> syncStatus() const;

    /// Schedule currently in effect.
    SyncSchedule schedule() const;

    /**
     * @brief Rewrites the sync schedule record.
     *
     * Other keys in the schedule file are preserved. If a sync is running and the
     * new schedule does not allow the current hour, the sync is stopped.
     *
     * @param schedule New schedule.
     * @param now Current time, used for the window check.
     * @return std::expected<bool, std::string> Whether a running sync was stopped, or an error.
     */
    std::expected<bool, std::string> updateSchedule(const SyncSchedule& schedule,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    /**
     * @brief Sends SIGTERM to the live owner of the sync lock.
     *
     * @return std::expected<bool, std::string> false if no sync was running, or an error.
     */
    std::expected<bool, std::string> stopRunningSync() const;

    bool isTransferActive() const;
    bool isSyncActive() const;

private:
    VaultConfig config;
};

#endif // VAULT_API_HPP
