#pragma once

#include <string>
#include <core/types.hpp>

// ". <setup>; <command>" (POSIX source), or the command unchanged when setup is empty.
std::string with_setup(const std::string& setup, const std::string& command);

// Single-quote an argument if it contains characters the shell would interpret.
std::string shell_quote(const std::string& arg);

// Executes a shell command line and captures (exit code, stdout, stderr).
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // timeout_secs <= 0 means no deadline.
    virtual CommandResult run(const std::string& command, int timeout_secs = 0) = 0;
};

// Runs commands through /bin/sh on this host.
class ShellCommandRunner : public CommandRunner {
public:
    explicit ShellCommandRunner(std::string cwd = "");

    CommandResult run(const std::string& command, int timeout_secs = 0) override;

private:
    std::string cwd_;
};
