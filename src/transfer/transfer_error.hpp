#pragma once

#include <string>
#include <vector>
#include <regex>

// Stable numeric transfer error codes reported as per-file status codes.
enum class ErrorCode : int {
    OK                   = 0,
    GENERALERROR         = 1008,
    NOLOCALSPACE         = 1098,
    STAGEINFAILED        = 1099,
    REPLICANOTFOUND      = 1100,
    NOSUCHFILE           = 1103,
    STAGEOUTFAILED       = 1137,
    STAGEINTIMEOUT       = 1151,
    STAGEOUTTIMEOUT      = 1152,
    NOPROXY              = 1163,
    GETADMISMATCH        = 1171,
    PUTADMISMATCH        = 1172,
    GETGLOBUSSYSERR      = 1180,
    PUTGLOBUSSYSERR      = 1181,
    MISSINGINPUTFILE     = 1211,
    FILEEXISTS           = 1221,
    NOREMOTESPACE        = 1223,
    CHKSUMNOTSUP         = 1224,
    SERVICENOTAVAILABLE  = 1227,
    UNREACHABLENETWORK   = 1230,
    PERMISSIONDENIED     = 1236,
};

inline int to_int(ErrorCode code) { return static_cast<int>(code); }

// Symbolic name of a code ("STAGEINFAILED") for progress and log lines.
const char* error_code_name(ErrorCode code);

// Classified transfer failure. Immutable once built.
class TypedError {
public:
    TypedError() = default;
    TypedError(ErrorCode code, std::string state, std::string message, bool retriable = false)
        : code_(code), state_(std::move(state)), message_(std::move(message)), retriable_(retriable) {}

    ErrorCode code() const { return code_; }
    int numeric_code() const { return to_int(code_); }
    const std::string& state() const { return state_; }
    const std::string& message() const { return message_; }
    bool retriable() const { return retriable_; }

    // Same code and message with a different state label.
    TypedError with_state(const std::string& state) const {
        return TypedError(code_, state, message_, retriable_);
    }

    // "[1099] STAGEIN_ATTEMPT_FAILED: ..." for logs and CLI output
    std::string describe() const;

    // Copy finished but the returned checksum or size disagrees with the catalog.
    static TypedError ad_mismatch(bool is_stagein, const std::string& message);

    // Fallback when nothing more specific is known.
    static TypedError generic(bool is_stagein, const std::string& message);

private:
    ErrorCode code_ = ErrorCode::GENERALERROR;
    std::string state_;
    std::string message_;
    bool retriable_ = false;
};

enum class Direction { ANY, STAGE_IN, STAGE_OUT };

// One classification rule: first rule whose pattern matches the copy output wins.
struct ErrorRule {
    std::string pattern;            // ECMAScript regex, searched anywhere in the output
    Direction direction;
    ErrorCode stagein_code;
    ErrorCode stageout_code;
    std::string state;
    std::string prefix;             // prepended to the raw output in the diagnostic
    bool retriable = false;
    bool icase = false;
};

// Default rule set, in priority order.
std::vector<ErrorRule> default_transfer_error_rules();

// Maps raw copy tool output onto a TypedError using an ordered rule table.
class ErrorClassifier {
public:
    ErrorClassifier();
    explicit ErrorClassifier(const std::vector<ErrorRule>& rules);

    // Never throws. Falls back to STAGEINFAILED / STAGEOUTFAILED with state COPY_ERROR.
    TypedError classify(const std::string& output, bool is_stagein) const;

    // Append a rule at lowest priority.
    void add_rule(const ErrorRule& rule);

    // Insert a rule ahead of all existing ones.
    void add_rule_front(const ErrorRule& rule);

    size_t size() const { return rules_.size(); }

private:
    struct CompiledRule {
        ErrorRule rule;
        std::regex re;
    };

    std::vector<CompiledRule> rules_;

    static CompiledRule compile(const ErrorRule& rule);
};
