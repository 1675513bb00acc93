#pragma once

#include <cstdint>

// ── Transfer timeouts ───────────────────────────────────────
// Per-file copy deadline: floor + size / throughput, capped.
constexpr int TRANSFER_TIMEOUT_MIN_SECS  = 300;          // 5 minutes
constexpr int TRANSFER_TIMEOUT_MAX_SECS  = 3 * 3600;     // 3 hours
constexpr int64_t TRANSFER_BYTES_PER_SEC = 500000;       // approx 0.5 MB/s sustained

// ── Subprocess handling ─────────────────────────────────────
constexpr int PROCESS_POLL_MS            = 100;   // pipe poll granularity
constexpr int PROCESS_TERM_GRACE_MS      = 2000;  // SIGTERM → SIGKILL window
constexpr int PROCESS_READ_BUF_SIZE      = 4096;
constexpr int PROBE_TIMEOUT_SECS         = 120;   // copy tool --version / -h

// ── Logging ─────────────────────────────────────────────────
constexpr int LOG_OUTPUT_TRUNCATE        = 500;   // chars of stdout/stderr kept per log line
constexpr int LOG_PARSE_TRUNCATE         = 2000;  // chars of copy output kept in parse warnings

// ── Checksums ───────────────────────────────────────────────
constexpr int ADLER32_HEX_LENGTH         = 8;

// ── CLI exit codes ──────────────────────────────────────────
constexpr int EXIT_OK                    = 0;
constexpr int EXIT_GENERAL_ERROR         = 1;
constexpr int EXIT_NO_LFNS               = 4;
constexpr int EXIT_TRANSFER_ERROR        = 12;

// ── File names ──────────────────────────────────────────────
constexpr const char* PROJECT_CONFIG_FILE   = "xstage.yaml";
constexpr const char* STAGEIN_DICTIONARY    = "stagein_dictionary.yaml";
constexpr const char* STAGEOUT_DICTIONARY   = "stageout_dictionary.yaml";
constexpr const char* DEFAULT_LOG_FILE      = "xstage_debug.log";
constexpr const char* DEFAULT_TRACE_FILE    = "xstage_traces.log";
