#include "stage_file.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

std::string build_copy_command(const StageRequest& req) {
    std::string cmd = fmt::format("{} -np -f", req.copy_command);
    if (!req.coption.empty()) cmd += " " + req.coption.option;
    cmd += " " + shell_quote(req.source);
    cmd += " " + shell_quote(req.destination);
    return with_setup(req.setup, cmd);
}

StageResult stage_file(CommandRunner& runner, const ErrorClassifier& classifier,
                       const StageRequest& req) {
    std::string cmd = build_copy_command(req);
    xstage_log(fmt::format("Executing command: {}, timeout={}", cmd, req.timeout_secs));

    auto r = runner.run(cmd, req.timeout_secs);
    xstage_log(fmt::format("rcode={}, stdout={}, stderr={}", r.exit_code,
                           r.stdout_data, r.stderr_data));

    if (r.timed_out) {
        std::string output = r.combined_output();
        output += fmt::format("\ncopy command timed out after {} seconds", req.timeout_secs);
        auto err = classifier.classify(output, req.is_stagein);
        xstage_error(fmt::format("copy of {} failed: {}", req.source, err.describe()));
        return StageResult::Err(err);
    }

    if (r.exit_code != 0) {
        auto err = classifier.classify(r.combined_output(), req.is_stagein);
        xstage_error(fmt::format("copy of {} failed: {}", req.source, err.describe()));
        return StageResult::Err(err);
    }

    TransferOutcome outcome;
    if (!req.coption.empty()) {
        outcome = parse_copy_output(r.stdout_data);
    }
    return StageResult::Ok(outcome);
}
