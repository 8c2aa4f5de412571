/**
 * @file subprocess.hpp
 * @brief Child process runner for the external copy, sync and mount tools.
 *
 * Children are started with fork/execvp (no shell), stdin from /dev/null and
 * stdout/stderr merged into one pipe read line by line by the parent.
 */

#ifndef SUBPROCESS_HPP
#define SUBPROCESS_HPP

#include <chrono>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

/**
 * @brief Output and exit code of a command run to completion.
 */
struct CommandResult {
    int exitCode = 0;   ///< Exit code, or 128 + signal number if the child was killed.
    std::string output; ///< Combined stdout/stderr, lines joined with '\n'.
};

/**
 * @brief A running child process with a line-oriented view of its output.
 *
 * Move-only. Destroying a handle whose child is still running terminates and
 * reaps the child, so no code path leaves an orphaned tool behind.
 */
class Subprocess {
public:
    /**
     * @brief Starts a child process.
     *
     * @param argv Program and arguments; argv[0] is resolved through PATH.
     * @return std::expected<Subprocess, std::string> The running child or an error message.
     */
    static std::expected<Subprocess, std::string> start(const std::vector<std::string>& argv);

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;
    Subprocess(Subprocess&& other) noexcept;
    Subprocess& operator=(Subprocess&& other) noexcept;
    ~Subprocess();

    /**
     * @brief Reads the next output line.
     *
     * Both '\n' and '\r' end a line (progress meters redraw with '\r'); empty lines
     * are skipped.
     *
     * @param interrupted Polled while waiting; returning true aborts the read.
     * @return The line, or std::nullopt at end of output or when interrupted.
     */
    std::optional<std::string> readLine(const std::function<bool()>& interrupted = {});

    /**
     * @brief Waits for the child to exit.
     *
     * @return std::expected<int, std::string> Exit code (128 + signal if killed) or an error.
     */
    std::expected<int, std::string> wait();

    /**
     * @brief Sends SIGTERM, escalating to SIGKILL after the grace period, and reaps the child.
     */
    void terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    pid_t pid() const { return childPid; }

private:
    Subprocess(pid_t pid, int outputFd);
    void closeOutput();
    std::optional<std::string> takeLine();

    pid_t childPid = -1;   ///< Child PID, -1 once reaped or moved from.
    int outputFd = -1;     ///< Read end of the output pipe.
    std::string buffer;    ///< Bytes read but not yet returned as lines.
    bool outputClosed = false;
};

/**
 * @brief Runs a command to completion and captures its output.
 *
 * @param argv Program and arguments.
 * @return std::expected<CommandResult, std::string> Exit code and output, or a start error.
 */
std::expected<CommandResult, std::string> runCommand(const std::vector<std::string>& argv);

#endif // SUBPROCESS_HPP
