#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>

namespace platform {

// Handle to a spawned `/bin/sh -c` child running in its own process group,
// with its stdout and stderr connected to pipes owned by the handle.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running.
    bool running();

    // Wait for the process to exit. Returns the exit code (128 + signal if it
    // was killed), or nullopt if timeout_ms elapsed first.
    // timeout_ms = -1 means indefinite wait.
    std::optional<int> wait(int timeout_ms = -1);

    // Terminate the whole process group (SIGTERM, then SIGKILL after a grace period).
    void terminate();

    int stdout_fd() const { return out_fd_; }
    int stderr_fd() const { return err_fd_; }

    // Close our end of a pipe once it reports EOF.
    void close_stdout();
    void close_stderr();

private:
    int pid_ = -1;
    int out_fd_ = -1;
    int err_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    void record_status(int status);

    friend ProcessHandle spawn_shell(const std::string& command, const std::string& cwd);
};

// Spawn `/bin/sh -c command`, optionally in cwd. stdin is /dev/null.
ProcessHandle spawn_shell(const std::string& command, const std::string& cwd = "");

// Run a shell command to completion, capturing stdout and stderr.
// A cwd that is not an existing directory fails with exit_code -1 and no child.
// timeout_secs <= 0 waits indefinitely; otherwise the process group is
// killed at the deadline and the result is flagged timed_out.
CommandResult run_command(const std::string& command, int timeout_secs = 0,
                          const std::string& cwd = "");

} // namespace platform
