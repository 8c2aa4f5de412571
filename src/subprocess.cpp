#include "subprocess.hpp"
#include <cerrno>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/format.h>

namespace {

constexpr int kPollSliceMs = 200;

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

Subprocess::Subprocess(pid_t pid, int outputFd) : childPid(pid), outputFd(outputFd) {}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : childPid(other.childPid), outputFd(other.outputFd), buffer(std::move(other.buffer)), outputClosed(other.outputClosed) {
    other.childPid = -1;
    other.outputFd = -1;
}

Subprocess& Subprocess::operator=(Subprocess&& other) noexcept {
    if (this != &other) {
        if (childPid > 0) {
            terminate();
        }
        closeOutput();
        childPid = other.childPid;
        outputFd = other.outputFd;
        buffer = std::move(other.buffer);
        outputClosed = other.outputClosed;
        other.childPid = -1;
        other.outputFd = -1;
    }
    return *this;
}

Subprocess::~Subprocess() {
    if (childPid > 0) {
        terminate();
    }
    closeOutput();
}

std::expected<Subprocess, std::string> Subprocess::start(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return std::unexpected("Empty command line");
    }
    // Everything the child touches is prepared before fork: the sync job forks
    // while its poller thread is running
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return std::unexpected(fmt::format("Failed to create pipe for {}: {}", argv[0], std::strerror(errno)));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return std::unexpected(fmt::format("Failed to fork for {}: {}", argv[0], std::strerror(err)));
    }
    if (pid == 0) {
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        ::execvp(args[0], args.data());
        static const char message[] = "exec failed\n";
        ssize_t ignored = ::write(STDERR_FILENO, message, sizeof(message) - 1);
        (void)ignored;
        ::_exit(127);
    }

    ::close(fds[1]);
    return Subprocess(pid, fds[0]);
}

void Subprocess::closeOutput() {
    if (outputFd >= 0) {
        ::close(outputFd);
        outputFd = -1;
    }
    outputClosed = true;
}

std::optional<std::string> Subprocess::takeLine() {
    while (true) {
        auto pos = buffer.find_first_of("\r\n");
        if (pos == std::string::npos) {
            return std::nullopt;
        }
        std::string line = buffer.substr(0, pos);
        buffer.erase(0, pos + 1);
        if (!line.empty()) {
            return line;
        }
    }
}

std::optional<std::string> Subprocess::readLine(const std::function<bool()>& interrupted) {
    while (true) {
        if (auto line = takeLine()) {
            return line;
        }
        if (outputClosed || outputFd < 0) {
            if (buffer.empty()) {
                return std::nullopt;
            }
            std::string rest;
            rest.swap(buffer);
            return rest;
        }
        if (interrupted && interrupted()) {
            return std::nullopt;
        }

        pollfd pfd{outputFd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, kPollSliceMs);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            closeOutput();
            continue;
        }
        if (rc == 0) {
            continue;
        }

        char chunk[4096];
        ssize_t n = ::read(outputFd, chunk, sizeof(chunk));
        if (n > 0) {
            buffer.append(chunk, static_cast<std::size_t>(n));
        } else if (n == 0) {
            closeOutput();
        } else if (errno != EINTR && errno != EAGAIN) {
            closeOutput();
        }
    }
}

std::expected<int, std::string> Subprocess::wait() {
    if (childPid <= 0) {
        return std::unexpected("No child process to wait for");
    }
    closeOutput();
    int status = 0;
    while (::waitpid(childPid, &status, 0) < 0) {
        if (errno != EINTR) {
            int err = errno;
            childPid = -1;
            return std::unexpected(fmt::format("waitpid failed: {}", std::strerror(err)));
        }
    }
    childPid = -1;
    return decodeStatus(status);
}

void Subprocess::terminate(std::chrono::milliseconds grace) {
    if (childPid <= 0) {
        return;
    }
    ::kill(childPid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + grace;
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t reaped = ::waitpid(childPid, &status, WNOHANG);
        if (reaped == childPid || (reaped < 0 && errno != EINTR)) {
            childPid = -1;
            closeOutput();
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    ::kill(childPid, SIGKILL);
    while (::waitpid(childPid, &status, 0) < 0 && errno == EINTR) {
    }
    childPid = -1;
    closeOutput();
}

std::expected<CommandResult, std::string> runCommand(const std::vector<std::string>& argv) {
    auto process = Subprocess::start(argv);
    if (!process) {
        return std::unexpected(process.error());
    }
    CommandResult result;
    while (auto line = process->readLine()) {
        if (!result.output.empty()) {
            result.output.push_back('\n');
        }
        result.output += *line;
    }
    auto exitCode = process->wait();
    if (!exitCode) {
        return std::unexpected(exitCode.error());
    }
    result.exitCode = *exitCode;
    return result;
}
