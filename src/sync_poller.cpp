#include "sync_poller.hpp"
#include <algorithm>
#include <fmt/format.h>

int syncPercent(std::uint64_t remoteCount, std::uint64_t localCount) {
    if (localCount == 0) {
        return 100;
    }
    return static_cast<int>(std::min<std::uint64_t>(remoteCount * 100 / localCount, 100));
}

std::string formatMbps(std::uint64_t byteDelta, std::chrono::duration<double> elapsed) {
    if (elapsed.count() <= 0) {
        return "calculating...";
    }
    double mbps = static_cast<double>(byteDelta) * 8.0 / elapsed.count() / 1000000.0;
    return fmt::format("{:.1f} Mbps", mbps);
}

SyncPoller::SyncPoller(RemoteStore& remote, SyncStatusStore& store, const ActivityLog& log, std::string remotePath,
                       SyncStatusRecord base, std::uint64_t localCount, std::chrono::milliseconds interval,
                       std::function<bool()> syncRunning)
    : remote(remote), store(store), log(log), remotePath(std::move(remotePath)), base(std::move(base)),
      localCount(localCount), interval(interval), syncRunning(std::move(syncRunning)) {}

SyncPoller::~SyncPoller() {
    stop();
}

void SyncPoller::start() {
    {
        std::lock_guard<std::mutex> guard(mutex);
        stopRequested = false;
    }
    worker = std::thread(&SyncPoller::loop, this);
}

void SyncPoller::stop() {
    {
        std::lock_guard<std::mutex> guard(mutex);
        stopRequested = true;
    }
    wakeUp.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
}

std::size_t SyncPoller::samples() const {
    std::lock_guard<std::mutex> guard(mutex);
    return published;
}

void SyncPoller::loop() {
    std::uint64_t lastBytes = 0;
    auto lastTime = std::chrono::steady_clock::now();
    while (true) {
        {
            std::unique_lock<std::mutex> guard(mutex);
            if (wakeUp.wait_for(guard, interval, [this] { return stopRequested; })) {
                return;
            }
        }
        sample(lastBytes, lastTime);
        if (syncRunning && !syncRunning()) {
            return;
        }
    }
}

void SyncPoller::sample(std::uint64_t& lastBytes, std::chrono::steady_clock::time_point& lastTime) {
    auto size = remote.size(remotePath);
    if (!size) {
        log.logDebug(fmt::format("Remote size unavailable: {}", size.error()));
        return;
    }
    auto now = std::chrono::steady_clock::now();

    SyncStatusRecord record = base;
    record.active = true;
    record.status = SyncState::Active;
    record.percent = syncPercent(size->count, localCount);
    record.filesSynced = size->count;
    record.filesRemaining = localCount > size->count ? localCount - size->count : 0;
    if (lastBytes > 0) {
        std::uint64_t delta = size->bytes > lastBytes ? size->bytes - lastBytes : 0;
        record.speed = formatMbps(delta, now - lastTime);
    } else {
        record.speed = "calculating...";
    }
    record.message = fmt::format("Syncing {} of {} files", size->count, localCount);
    lastBytes = size->bytes;
    lastTime = now;

    auto result = store.publish(std::move(record));
    if (!result) {
        log.logError(fmt::format("Failed to publish sync status: {}", result.error()));
        return;
    }
    std::lock_guard<std::mutex> guard(mutex);
    ++published;
}
