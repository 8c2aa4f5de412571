/**
 * @file process_lock.hpp
 * @brief Inter-process exclusive locks backed by PID files.
 *
 * The local transfer lock and the cloud sync liveness lock are both files that
 * record the owner's PID. Ownership is an exclusive flock() on the file, held for
 * the lifetime of the handle, so the kernel drops it when the owner dies even
 * after SIGKILL. The recorded PID serves diagnostics, and a file naming a live
 * process also counts as held for writers that never take the flock.
 */

#ifndef PROCESS_LOCK_HPP
#define PROCESS_LOCK_HPP

#include <expected>
#include <optional>
#include <string>
#include <sys/types.h>

/**
 * @brief Reason a lock could not be acquired.
 */
struct LockError {
    std::optional<pid_t> owner; ///< Live owner holding the lock, empty for I/O failures.
    std::string message;        ///< Human-readable description.

    bool heldByOther() const { return owner.has_value(); }
};

/**
 * @brief Owned handle on a PID lock file, released when destroyed.
 *
 * Move-only. Release removes the file while the flock is still held, so a handle
 * never deletes a lock that was reclaimed by someone else.
 */
class ProcessLock {
public:
    /**
     * @brief Acquires the lock at the given path without waiting.
     *
     * @param path Lock file path.
     * @return std::expected<ProcessLock, LockError> The handle, or who holds the lock.
     */
    static std::expected<ProcessLock, LockError> acquire(const std::string& path);

    /**
     * @brief Returns the PID of the live owner of a lock, without modifying it.
     *
     * @param path Lock file path.
     * @return The owner PID, or std::nullopt if the lock is absent or stale.
     */
    static std::optional<pid_t> liveOwner(const std::string& path);

    /**
     * @brief Returns whether the lock is currently held by a live process.
     *
     * Unlike liveOwner(), a lock file that is flocked but does not record a PID yet
     * counts as held.
     */
    static bool isHeld(const std::string& path);

    /**
     * @brief Probes whether a process with the given PID exists.
     */
    static bool isProcessAlive(pid_t pid);

    ProcessLock(const ProcessLock&) = delete;
    ProcessLock& operator=(const ProcessLock&) = delete;
    ProcessLock(ProcessLock&& other) noexcept;
    ProcessLock& operator=(ProcessLock&& other) noexcept;
    ~ProcessLock();

    /// Removes the lock file if this handle still owns it. Idempotent.
    void release();

    const std::string& path() const { return lockPath; }

private:
    ProcessLock(std::string path, int fd);

    std::string lockPath; ///< Lock file path.
    int lockFd = -1;      ///< Descriptor carrying the flock, -1 once released.
};

#endif // PROCESS_LOCK_HPP
