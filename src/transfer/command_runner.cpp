#include "command_runner.hpp"
#include <platform/process.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

std::string with_setup(const std::string& setup, const std::string& command) {
    if (setup.empty()) return command;
    return fmt::format(". {}; {}", setup, command);
}

std::string shell_quote(const std::string& arg) {
    if (arg.empty()) return "''";
    if (arg.find_first_of(" \t\n'\"\\$`&;|<>()*?[]{}!#~") == std::string::npos) return arg;
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

ShellCommandRunner::ShellCommandRunner(std::string cwd) : cwd_(std::move(cwd)) {}

CommandResult ShellCommandRunner::run(const std::string& command, int timeout_secs) {
    auto result = platform::run_command(command, timeout_secs, cwd_);
    xstage_log_command("shell", command, result);
    return result;
}
