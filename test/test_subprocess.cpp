#include <chrono>
#include <signal.h>
#include <gtest/gtest.h>
#include "subprocess.hpp"

using namespace std::chrono_literals;

TEST(subprocess_test, collects_output_and_exit_code) {
    auto result = runCommand({"sh", "-c", "printf 'one\\rtwo\\n\\nthree\\n'; echo oops >&2; exit 3"});
    ASSERT_TRUE(result);
    EXPECT_EQ(result->exitCode, 3);
    EXPECT_EQ(result->output, "one\ntwo\nthree\noops");
}

TEST(subprocess_test, missing_program_exits_127) {
    auto result = runCommand({"/nonexistent/usbvault-tool"});
    ASSERT_TRUE(result);
    EXPECT_EQ(result->exitCode, 127);
}

TEST(subprocess_test, empty_command_is_an_error) {
    EXPECT_FALSE(Subprocess::start({}));
}

TEST(subprocess_test, read_line_stops_when_interrupted) {
    auto process = Subprocess::start({"sleep", "30"});
    ASSERT_TRUE(process);
    pid_t pid = process->pid();
    EXPECT_EQ(::kill(pid, 0), 0);

    auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(process->readLine([] { return true; }));
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);

    process->terminate(500ms);
    EXPECT_NE(::kill(pid, 0), 0);
    EXPECT_EQ(process->pid(), -1);
}

TEST(subprocess_test, terminated_child_reports_signal) {
    auto process = Subprocess::start({"sh", "-c", "echo ready; exec sleep 30"});
    ASSERT_TRUE(process);
    EXPECT_EQ(process->readLine(), "ready");
    pid_t pid = process->pid();
    ASSERT_GT(pid, 0);
    process->terminate(500ms);
    EXPECT_NE(::kill(pid, 0), 0);
}
