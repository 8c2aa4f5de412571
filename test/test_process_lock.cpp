#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include "process_lock.hpp"
#include "test_utils.hpp"

namespace {

// PID of a process that has already exited and been reaped
pid_t dead_pid() {
    pid_t pid = ::fork();
    if (pid == 0) {
        ::_exit(0);
    }
    int status = 0;
    ::waitpid(pid, &status, 0);
    return pid;
}

enum ContenderResult { kHeldAlone = 0, kRefused = 1, kLostWhileHeld = 2 };

// Forked contender: waits for the barrier pipe to close, then tries to take the lock
pid_t spawn_contender(const std::string& path, const int barrier[2]) {
    pid_t pid = ::fork();
    if (pid != 0) {
        return pid;
    }
    ::close(barrier[1]);
    char byte = 0;
    while (::read(barrier[0], &byte, 1) > 0) {
    }
    auto lock = ProcessLock::acquire(path);
    if (!lock) {
        ::_exit(kRefused);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    bool stillMine = read_file(path) == std::to_string(::getpid()) + "\n";
    lock->release();
    ::_exit(stillMine ? kHeldAlone : kLostWhileHeld);
}

} // namespace

TEST(process_lock_test, acquire_and_release) {
    TempDir dir;
    std::string path = dir.str("job.lock");
    {
        auto lock = ProcessLock::acquire(path);
        ASSERT_TRUE(lock);
        EXPECT_EQ(read_file(path), std::to_string(::getpid()) + "\n");
        EXPECT_TRUE(ProcessLock::isHeld(path));
        EXPECT_EQ(ProcessLock::liveOwner(path), ::getpid());

        auto second = ProcessLock::acquire(path);
        ASSERT_FALSE(second);
        EXPECT_TRUE(second.error().heldByOther());
        EXPECT_EQ(second.error().owner, ::getpid());
    }
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_FALSE(ProcessLock::isHeld(path));
}

TEST(process_lock_test, stale_lock_is_reclaimed) {
    TempDir dir;
    std::string path = dir.str("job.lock");
    write_file(path, std::to_string(dead_pid()) + "\n");
    EXPECT_FALSE(ProcessLock::liveOwner(path));
    EXPECT_FALSE(ProcessLock::isHeld(path));

    auto lock = ProcessLock::acquire(path);
    ASSERT_TRUE(lock);
    EXPECT_EQ(ProcessLock::liveOwner(path), ::getpid());
}

TEST(process_lock_test, release_is_idempotent_and_moves_transfer_ownership) {
    TempDir dir;
    std::string path = dir.str("job.lock");
    auto lock = ProcessLock::acquire(path);
    ASSERT_TRUE(lock);

    ProcessLock moved = std::move(*lock);
    lock->release();
    EXPECT_TRUE(std::filesystem::exists(path));

    moved.release();
    moved.release();
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(process_lock_test, unwritable_directory_is_an_io_error) {
    TempDir dir;
    auto lock = ProcessLock::acquire(dir.str("missing/dir/job.lock"));
    ASSERT_FALSE(lock);
    EXPECT_FALSE(lock.error().heldByOther());
    EXPECT_FALSE(lock.error().message.empty());
}

TEST(process_lock_test, process_probe) {
    EXPECT_TRUE(ProcessLock::isProcessAlive(::getpid()));
    EXPECT_FALSE(ProcessLock::isProcessAlive(dead_pid()));
    EXPECT_FALSE(ProcessLock::isProcessAlive(0));
}

TEST(process_lock_test, concurrent_stale_takeover_has_one_winner) {
    TempDir dir;
    std::string path = dir.str("job.lock");
    for (int round = 0; round < 4; ++round) {
        write_file(path, std::to_string(dead_pid()) + "\n");

        int barrier[2];
        ASSERT_EQ(::pipe(barrier), 0);
        std::vector<pid_t> contenders;
        for (int i = 0; i < 6; ++i) {
            contenders.push_back(spawn_contender(path, barrier));
        }
        ::close(barrier[0]);
        ::close(barrier[1]);

        int winners = 0;
        for (pid_t pid : contenders) {
            int status = 0;
            ASSERT_EQ(::waitpid(pid, &status, 0), pid);
            ASSERT_TRUE(WIFEXITED(status));
            EXPECT_NE(WEXITSTATUS(status), kLostWhileHeld) << "round " << round;
            if (WEXITSTATUS(status) == kHeldAlone) {
                ++winners;
            }
        }
        EXPECT_EQ(winners, 1) << "round " << round;
        EXPECT_FALSE(std::filesystem::exists(path));
    }
}

TEST(process_lock_test, lock_of_a_killed_owner_is_reclaimed) {
    TempDir dir;
    std::string path = dir.str("job.lock");
    int ready[2];
    ASSERT_EQ(::pipe(ready), 0);
    pid_t owner = ::fork();
    if (owner == 0) {
        ::close(ready[0]);
        auto lock = ProcessLock::acquire(path);
        char byte = lock ? 1 : 0;
        ssize_t sent = ::write(ready[1], &byte, 1);
        (void)sent;
        ::pause();
        ::_exit(0);
    }
    ::close(ready[1]);
    char byte = 0;
    ASSERT_EQ(::read(ready[0], &byte, 1), 1);
    ::close(ready[0]);
    ASSERT_EQ(byte, 1);

    EXPECT_TRUE(ProcessLock::isHeld(path));
    auto refused = ProcessLock::acquire(path);
    ASSERT_FALSE(refused);
    EXPECT_EQ(refused.error().owner, owner);

    ::kill(owner, SIGKILL);
    int status = 0;
    ::waitpid(owner, &status, 0);

    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_FALSE(ProcessLock::isHeld(path));
    auto lock = ProcessLock::acquire(path);
    ASSERT_TRUE(lock);
    EXPECT_EQ(read_file(path), std::to_string(::getpid()) + "\n");
}
