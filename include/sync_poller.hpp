/**
 * @file sync_poller.hpp
 * @brief Background sampler of remote progress while a cloud sync runs.
 */

#ifndef SYNC_POLLER_HPP
#define SYNC_POLLER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include "activity_log.hpp"
#include "progress_store.hpp"
#include "remote_store.hpp"

/**
 * @brief Percent of the local files present remotely, clamped to [0, 100].
 *
 * An empty local tree counts as fully synced.
 */
int syncPercent(std::uint64_t remoteCount, std::uint64_t localCount);

/**
 * @brief Formats a byte delta over an interval as "12.3 Mbps".
 */
std::string formatMbps(std::uint64_t byteDelta, std::chrono::duration<double> elapsed);

/**
 * @brief Samples the remote folder size at a fixed interval and publishes the sync status.
 *
 * The poller owns one thread. It ends when stop() is called or when the sync
 * process is no longer running, and it is joined by stop() and by the destructor.
 * While it runs it is the only writer of the sync status store.
 */
class SyncPoller {
public:
    /**
     * @param remote Remote to query.
     * @param store Sync status store.
     * @param log Sync activity log.
     * @param remotePath Remote folder being synced.
     * @param base Record carrying folder and last_sync, copied into every sample.
     * @param localCount Files in the local tree.
     * @param interval Delay between samples.
     * @param syncRunning Returns false once the sync process has exited.
     */
    SyncPoller(RemoteStore& remote, SyncStatusStore& store, const ActivityLog& log, std::string remotePath,
               SyncStatusRecord base, std::uint64_t localCount, std::chrono::milliseconds interval,
               std::function<bool()> syncRunning);
    ~SyncPoller();

    SyncPoller(const SyncPoller&) = delete;
    SyncPoller& operator=(const SyncPoller&) = delete;

    void start();

    /// Signals the thread and joins it. Idempotent.
    void stop();

    /// Samples published so far.
    std::size_t samples() const;

private:
    void loop();
    void sample(std::uint64_t& lastBytes, std::chrono::steady_clock::time_point& lastTime);

    RemoteStore& remote;
    SyncStatusStore& store;
    const ActivityLog& log;
    std::string remotePath;
    SyncStatusRecord base;
    std::uint64_t localCount;
    std::chrono::milliseconds interval;
    std::function<bool()> syncRunning;

    std::thread worker;
    mutable std::mutex mutex;
    std::condition_variable wakeUp;
    bool stopRequested = false;
    std::size_t published = 0;
};

#endif // SYNC_POLLER_HPP
