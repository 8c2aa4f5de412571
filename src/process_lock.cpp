#include "process_lock.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <thread>
#include <fcntl.h>
#include <signal.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fmt/format.h>

namespace {

constexpr int kAcquireAttempts = 5;
constexpr auto kRetryDelay = std::chrono::milliseconds(50);

struct OwnerRecord {
    bool exists = false;
    std::optional<pid_t> pid;
};

OwnerRecord readOwner(const std::string& path) {
    OwnerRecord record;
    std::ifstream file(path);
    if (!file) {
        return record;
    }
    record.exists = true;
    long value = 0;
    if (file >> value && value > 0) {
        record.pid = static_cast<pid_t>(value);
    }
    return record;
}

// Whether some open file description holds a flock on the file
bool isFlocked(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    bool locked = ::flock(fd, LOCK_SH | LOCK_NB) != 0 && errno == EWOULDBLOCK;
    ::close(fd);
    return locked;
}

// The descriptor still names the file at path, not one unlinked by its last owner
bool isCurrentFile(int fd, const std::string& path) {
    struct stat opened {};
    struct stat linked {};
    if (::fstat(fd, &opened) != 0 || ::stat(path.c_str(), &linked) != 0) {
        return false;
    }
    return opened.st_dev == linked.st_dev && opened.st_ino == linked.st_ino;
}

} // namespace

ProcessLock::ProcessLock(std::string path, int fd) : lockPath(std::move(path)), lockFd(fd) {}

ProcessLock::ProcessLock(ProcessLock&& other) noexcept : lockPath(std::move(other.lockPath)), lockFd(other.lockFd) {
    other.lockFd = -1;
}

ProcessLock& ProcessLock::operator=(ProcessLock&& other) noexcept {
    if (this != &other) {
        release();
        lockPath = std::move(other.lockPath);
        lockFd = other.lockFd;
        other.lockFd = -1;
    }
    return *this;
}

ProcessLock::~ProcessLock() {
    release();
}

bool ProcessLock::isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    return ::kill(pid, 0) == 0 || errno == EPERM;
}

std::expected<ProcessLock, LockError> ProcessLock::acquire(const std::string& path) {
    for (int attempt = 0; attempt < kAcquireAttempts; ++attempt) {
        int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
        if (fd < 0) {
            return std::unexpected(LockError{std::nullopt,
                fmt::format("Failed to create lock file {} (error: {})", path, std::strerror(errno))});
        }
        if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
            int error = errno;
            ::close(fd);
            if (error != EWOULDBLOCK) {
                return std::unexpected(LockError{std::nullopt,
                    fmt::format("Failed to lock {} (error: {})", path, std::strerror(error))});
            }
            auto owner = readOwner(path).pid;
            if (owner && isProcessAlive(*owner)) {
                return std::unexpected(LockError{owner,
                    fmt::format("Lock {} is held by process {}", path, static_cast<long>(*owner))});
            }
            // The new owner has the flock but has not replaced the stale PID yet
            std::this_thread::sleep_for(kRetryDelay);
            continue;
        }
        if (!isCurrentFile(fd, path)) {
            ::close(fd);
            continue;
        }

        // Lock files written without a flock still name a live owner
        OwnerRecord owner = readOwner(path);
        if (owner.pid && isProcessAlive(*owner.pid)) {
            ::close(fd);
            return std::unexpected(LockError{owner.pid,
                fmt::format("Lock {} is held by process {}", path, static_cast<long>(*owner.pid))});
        }

        std::string content = fmt::format("{}\n", static_cast<long>(::getpid()));
        if (::ftruncate(fd, 0) != 0 ||
            ::pwrite(fd, content.data(), content.size(), 0) != static_cast<ssize_t>(content.size())) {
            int error = errno;
            ::unlink(path.c_str());
            ::close(fd);
            return std::unexpected(LockError{std::nullopt,
                fmt::format("Failed to write lock file {} (error: {})", path, std::strerror(error))});
        }
        return ProcessLock(path, fd);
    }
    return std::unexpected(LockError{std::nullopt, fmt::format("Could not acquire lock {}", path)});
}

std::optional<pid_t> ProcessLock::liveOwner(const std::string& path) {
    OwnerRecord owner = readOwner(path);
    if (owner.pid && isProcessAlive(*owner.pid)) {
        return owner.pid;
    }
    return std::nullopt;
}

bool ProcessLock::isHeld(const std::string& path) {
    OwnerRecord owner = readOwner(path);
    if (!owner.exists) {
        return false;
    }
    if (owner.pid && isProcessAlive(*owner.pid)) {
        return true;
    }
    return isFlocked(path);
}

void ProcessLock::release() {
    if (lockFd < 0) {
        return;
    }
    ::unlink(lockPath.c_str());
    ::close(lockFd);
    lockFd = -1;
}
