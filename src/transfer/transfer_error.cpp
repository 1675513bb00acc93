#include "transfer_error.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                  return "OK";
        case ErrorCode::GENERALERROR:        return "GENERALERROR";
        case ErrorCode::NOLOCALSPACE:        return "NOLOCALSPACE";
        case ErrorCode::STAGEINFAILED:       return "STAGEINFAILED";
        case ErrorCode::REPLICANOTFOUND:     return "REPLICANOTFOUND";
        case ErrorCode::NOSUCHFILE:          return "NOSUCHFILE";
        case ErrorCode::STAGEOUTFAILED:      return "STAGEOUTFAILED";
        case ErrorCode::STAGEINTIMEOUT:      return "STAGEINTIMEOUT";
        case ErrorCode::STAGEOUTTIMEOUT:     return "STAGEOUTTIMEOUT";
        case ErrorCode::NOPROXY:             return "NOPROXY";
        case ErrorCode::GETADMISMATCH:       return "GETADMISMATCH";
        case ErrorCode::PUTADMISMATCH:       return "PUTADMISMATCH";
        case ErrorCode::GETGLOBUSSYSERR:     return "GETGLOBUSSYSERR";
        case ErrorCode::PUTGLOBUSSYSERR:     return "PUTGLOBUSSYSERR";
        case ErrorCode::MISSINGINPUTFILE:    return "MISSINGINPUTFILE";
        case ErrorCode::FILEEXISTS:          return "FILEEXISTS";
        case ErrorCode::NOREMOTESPACE:       return "NOREMOTESPACE";
        case ErrorCode::CHKSUMNOTSUP:        return "CHKSUMNOTSUP";
        case ErrorCode::SERVICENOTAVAILABLE: return "SERVICENOTAVAILABLE";
        case ErrorCode::UNREACHABLENETWORK:  return "UNREACHABLENETWORK";
        case ErrorCode::PERMISSIONDENIED:    return "PERMISSIONDENIED";
    }
    return "UNKNOWN";
}

// ── TypedError ───────────────────────────────────────────────

std::string TypedError::describe() const {
    return fmt::format("[{}] {}: {}", numeric_code(), state_, message_);
}

TypedError TypedError::ad_mismatch(bool is_stagein, const std::string& message) {
    return TypedError(is_stagein ? ErrorCode::GETADMISMATCH : ErrorCode::PUTADMISMATCH,
                      "AD_MISMATCH", message);
}

TypedError TypedError::generic(bool is_stagein, const std::string& message) {
    return TypedError(is_stagein ? ErrorCode::STAGEINFAILED : ErrorCode::STAGEOUTFAILED,
                      "COPY_ERROR", message);
}

// ── Rule table ───────────────────────────────────────────────

std::vector<ErrorRule> default_transfer_error_rules() {
    using D = Direction;
    using C = ErrorCode;
    return {
        {"timeout|timed out|operation expired", D::ANY, C::STAGEINTIMEOUT, C::STAGEOUTTIMEOUT,
         "CP_TIMEOUT", "Copy command timed out: ", true, true},
        {"does not match the checksum of the local file", D::STAGE_OUT, C::GETADMISMATCH, C::PUTADMISMATCH,
         "AD_MISMATCH", "", false, false},
        {"Could not establish context", D::ANY, C::NOPROXY, C::NOPROXY,
         "CONTEXT_FAIL", "Could not establish context: Proxy / VO extension of proxy has probably expired: ",
         false, false},
        {"File exists|SRM_FILE_BUSY|file already exists", D::ANY, C::FILEEXISTS, C::FILEEXISTS,
         "FILE_EXISTS", "File already exists in the destination: ", false, false},
        {"No such file or directory", D::STAGE_IN, C::MISSINGINPUTFILE, C::MISSINGINPUTFILE,
         "MISSING_INPUT", "", false, false},
        {"query chksum is not supported|Unable to checksum", D::ANY, C::CHKSUMNOTSUP, C::CHKSUMNOTSUP,
         "CHKSUM_NOTSUP", "", false, false},
        {"globus_xio:", D::ANY, C::GETGLOBUSSYSERR, C::PUTGLOBUSSYSERR,
         "GLOBUS_FAIL", "Globus system error: ", true, false},
        {"No space left on device|quota exceeded", D::ANY, C::NOLOCALSPACE, C::NOREMOTESPACE,
         "NO_SPACE", "No available space left on disk: ", false, true},
        {"No such file or directory", D::STAGE_OUT, C::NOSUCHFILE, C::NOSUCHFILE,
         "NO_FILE", "", false, false},
        {"service is not available at the moment|Connection refused", D::ANY,
         C::SERVICENOTAVAILABLE, C::SERVICENOTAVAILABLE, "SERVICE_ERROR", "", true, false},
        {"Network is unreachable", D::ANY, C::UNREACHABLENETWORK, C::UNREACHABLENETWORK,
         "NETWORK_UNREACHABLE", "", true, false},
        {"permission denied", D::ANY, C::PERMISSIONDENIED, C::PERMISSIONDENIED,
         "PERMISSION_DENIED", "Permission denied: ", false, true},
    };
}

// ── ErrorClassifier ──────────────────────────────────────────

ErrorClassifier::ErrorClassifier() : ErrorClassifier(default_transfer_error_rules()) {}

ErrorClassifier::ErrorClassifier(const std::vector<ErrorRule>& rules) {
    rules_.reserve(rules.size());
    for (const auto& r : rules) rules_.push_back(compile(r));
}

ErrorClassifier::CompiledRule ErrorClassifier::compile(const ErrorRule& rule) {
    auto flags = std::regex::ECMAScript;
    if (rule.icase) flags |= std::regex::icase;
    return CompiledRule{rule, std::regex(rule.pattern, flags)};
}

void ErrorClassifier::add_rule(const ErrorRule& rule) {
    rules_.push_back(compile(rule));
}

void ErrorClassifier::add_rule_front(const ErrorRule& rule) {
    rules_.insert(rules_.begin(), compile(rule));
}

TypedError ErrorClassifier::classify(const std::string& output, bool is_stagein) const {
    std::string text = output;
    trim(text);

    for (const auto& cr : rules_) {
        const auto& r = cr.rule;
        if (r.direction == Direction::STAGE_IN && !is_stagein) continue;
        if (r.direction == Direction::STAGE_OUT && is_stagein) continue;
        if (text.empty() || !std::regex_search(text, cr.re)) continue;

        return TypedError(is_stagein ? r.stagein_code : r.stageout_code,
                          r.state, r.prefix + text, r.retriable);
    }

    if (text.empty()) {
        return TypedError::generic(is_stagein,
            fmt::format("Copy operation failed [is_stagein={}] (consult log)", is_stagein));
    }
    return TypedError::generic(is_stagein,
        fmt::format("Copy operation failed [is_stagein={}]: {}", is_stagein, text));
}
