#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T, typename E = std::string>
struct Result {
    bool success;
    T value;
    E error;

    static Result<T, E> Ok(T val) {
        return {true, std::move(val), E{}};
    }

    static Result<T, E> Err(E err) {
        return {false, T{}, std::move(err)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <typename E>
struct Result<void, E> {
    bool success;
    E error;

    static Result<void, E> Ok() {
        return {true, E{}};
    }

    static Result<void, E> Err(E err) {
        return {false, std::move(err)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Local shell command execution result
struct CommandResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out = false;

    bool success() const { return exit_code == 0 && !timed_out; }
    bool failed() const { return !success(); }

    // stdout followed by stderr, the way the copy tool's diagnostics are read
    std::string combined_output() const {
        return stdout_data + stderr_data;
    }
};

// What to do with the rest of a batch once one file failed
enum class FailurePolicy {
    ABORT,      // stop at the first failed file
    CONTINUE,   // record the failure, keep going, report the first error at the end
};

struct TraceSettings {
    bool enabled = true;
    std::string event_type = "get_sm";
    std::string path;                            // trace record file, empty = <tmp>/xstage_traces.log
};

// Configuration for one engine instance (one batch / process run)
struct StagingConfig {
    std::string copy_command = "xrdcp";
    std::string checksum_type = "adler32";       // adler32 or md5
    std::string setup;                           // script sourced before every copy tool call
    std::string workdir = ".";                   // default stage-in destination directory
    std::string local_site;                      // falls back to DQ2_LOCAL_SITE_ID
    bool allow_direct_access = false;
    bool enforce_timeout = true;
    int probe_timeout_secs = PROBE_TIMEOUT_SECS;
    bool verify_checksum = true;
    bool ignore_checksum_unsupported = false;    // stage-out only
    FailurePolicy failure_policy = FailurePolicy::ABORT;
    TraceSettings trace;
    std::string log_path;                        // empty = <tmp>/xstage_debug.log
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
