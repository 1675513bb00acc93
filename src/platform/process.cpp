#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <filesystem>
#include <fmt/format.h>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_stdout();
    close_stderr();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    out_fd_ = other.out_fd_;
    err_fd_ = other.err_fd_;
    reaped_ = other.reaped_;
    exit_code_ = other.exit_code_;
    other.pid_ = -1;
    other.out_fd_ = -1;
    other.err_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_stdout();
        close_stderr();
        pid_ = other.pid_;
        out_fd_ = other.out_fd_;
        err_fd_ = other.err_fd_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.out_fd_ = -1;
        other.err_fd_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

void ProcessHandle::record_status(int status) {
    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = -1;
    }
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        record_status(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

std::optional<int> ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;
    if (timeout_ms < 0) {
        int status;
        while (waitpid(pid_, &status, 0) < 0) {
            if (errno != EINTR) return -1;
        }
        record_status(status);
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    while (elapsed <= timeout_ms) {
        if (!running()) return reaped_ ? exit_code_ : -1;
        sleep_ms(PROCESS_POLL_MS);
        elapsed += PROCESS_POLL_MS;
    }
    return std::nullopt;  // timed out
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || reaped_) return;
    kill(-pid_, SIGTERM);
    // Wait for graceful exit
    for (int waited = 0; waited < PROCESS_TERM_GRACE_MS; waited += PROCESS_POLL_MS) {
        if (!running()) return;
        sleep_ms(PROCESS_POLL_MS);
    }
    kill(-pid_, SIGKILL);
    int status;
    if (waitpid(pid_, &status, 0) == pid_) record_status(status);
}

void ProcessHandle::close_stdout() {
    if (out_fd_ >= 0) {
        close(out_fd_);
        out_fd_ = -1;
    }
}

void ProcessHandle::close_stderr() {
    if (err_fd_ >= 0) {
        close(err_fd_);
        err_fd_ = -1;
    }
}

// ── spawn_shell ──────────────────────────────────────────────

ProcessHandle spawn_shell(const std::string& command, const std::string& cwd) {
    ProcessHandle handle;

    int out_pipe[2];
    int err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) return handle;
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        return handle;
    }

    pid_t pid = fork();
    if (pid < 0) {  // fork failed
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return handle;
    }

    if (pid == 0) {
        // Child process: own process group so a timeout kills the whole pipeline
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            // errno as a number: its text would read like a copy tool diagnostic
            std::string msg = fmt::format("cannot enter working directory {} (errno {})\n", cwd, errno);
            ssize_t ignored = write(STDERR_FILENO, msg.data(), msg.size());
            (void)ignored;
            _exit(126);
        }

        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);  // exec failed
    }

    // Parent
    close(out_pipe[1]);
    close(err_pipe[1]);
    handle.pid_ = pid;
    handle.out_fd_ = out_pipe[0];
    handle.err_fd_ = err_pipe[0];
    return handle;
}

// ── run_command ──────────────────────────────────────────────

CommandResult run_command(const std::string& command, int timeout_secs,
                          const std::string& cwd) {
    using clock = std::chrono::steady_clock;

    CommandResult result;
    std::error_code ec;
    if (!cwd.empty() && !std::filesystem::is_directory(cwd, ec)) {
        result.exit_code = -1;
        result.stderr_data = fmt::format("working directory {} is not available", cwd);
        return result;
    }

    ProcessHandle proc = spawn_shell(command, cwd);
    if (!proc.valid()) {
        result.exit_code = -1;
        result.stderr_data = fmt::format("failed to spawn /bin/sh: {}", std::strerror(errno));
        return result;
    }

    const bool bounded = timeout_secs > 0;
    const auto deadline = clock::now() + std::chrono::seconds(bounded ? timeout_secs : 0);
    char buf[PROCESS_READ_BUF_SIZE];

    // Drain both pipes until EOF (or the deadline)
    while (proc.stdout_fd() >= 0 || proc.stderr_fd() >= 0) {
        if (bounded && clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }

        struct pollfd fds[2];
        fds[0].fd = proc.stdout_fd();
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = proc.stderr_fd();
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int n = poll(fds, 2, PROCESS_POLL_MS);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) continue;

        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t got = read(fds[i].fd, buf, sizeof(buf));
            if (got > 0) {
                (i == 0 ? result.stdout_data : result.stderr_data).append(buf, static_cast<size_t>(got));
            } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
                if (i == 0) proc.close_stdout();
                else proc.close_stderr();
            }
        }
    }

    if (!result.timed_out) {
        int wait_ms = -1;
        if (bounded) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            wait_ms = left.count() > 0 ? static_cast<int>(left.count()) : 0;
        }
        auto code = proc.wait(wait_ms);
        if (code) {
            result.exit_code = *code;
            return result;
        }
        result.timed_out = true;
    }

    proc.terminate();
    result.exit_code = -1;
    return result;
}

} // namespace platform
