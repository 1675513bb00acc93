#include <gtest/gtest.h>
#include <platform/process.hpp>
#include <transfer/command_runner.hpp>
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;

TEST(Process, CapturesStdout) {
    auto r = platform::run_command("echo hello");
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_data, "hello\n");
    EXPECT_TRUE(r.stderr_data.empty());
    EXPECT_FALSE(r.timed_out);
    EXPECT_TRUE(r.success());
}

TEST(Process, CapturesStderrSeparately) {
    auto r = platform::run_command("echo out; echo err 1>&2");
    EXPECT_EQ(r.stdout_data, "out\n");
    EXPECT_EQ(r.stderr_data, "err\n");
    EXPECT_EQ(r.combined_output(), "out\nerr\n");
}

TEST(Process, ReportsExitCode) {
    auto r = platform::run_command("exit 54");
    EXPECT_EQ(r.exit_code, 54);
    EXPECT_TRUE(r.failed());

    auto missing = platform::run_command("/nonexistent/xrdcp --version");
    EXPECT_EQ(missing.exit_code, 127);
}

TEST(Process, LargeOutputIsDrained) {
    auto r = platform::run_command("i=0; while [ $i -lt 20000 ]; do echo 0123456789; i=$((i+1)); done");
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_data.size(), 20000u * 11u);
}

TEST(Process, TimeoutKillsChild) {
    auto start = std::chrono::steady_clock::now();
    auto r = platform::run_command("echo started; sleep 30", 1);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(r.timed_out);
    EXPECT_TRUE(r.failed());
    EXPECT_EQ(r.stdout_data, "started\n");
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(Process, RunsInWorkingDirectory) {
    fs::path dir = fs::canonical(fs::temp_directory_path());
    auto r = platform::run_command("pwd", 0, dir.string());
    EXPECT_EQ(r.stdout_data, dir.string() + "\n");

    auto bad = platform::run_command("pwd", 0, "/nonexistent/xstage");
    EXPECT_EQ(bad.exit_code, -1);
    EXPECT_TRUE(bad.stdout_data.empty());
    EXPECT_NE(bad.stderr_data.find("working directory /nonexistent/xstage"), std::string::npos);
    EXPECT_EQ(bad.stderr_data.find("No such file"), std::string::npos);
}

TEST(Process, HandleWait) {
    auto proc = platform::spawn_shell("exit 3");
    ASSERT_TRUE(proc.valid());
    auto code = proc.wait();
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 3);
    EXPECT_FALSE(proc.running());

    auto slow = platform::spawn_shell("sleep 30");
    ASSERT_TRUE(slow.valid());
    EXPECT_FALSE(slow.wait(200).has_value());
    slow.terminate();
    EXPECT_FALSE(slow.running());
}

TEST(Process, ShellRunnerQuotesSafely) {
    ShellCommandRunner runner;
    auto r = runner.run("printf '%s\\n' " + shell_quote("it's a $HOME test"));
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_data, "it's a $HOME test\n");
}
