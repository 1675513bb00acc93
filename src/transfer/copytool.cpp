#include "copytool.hpp"
#include "timeout.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

CopyTool::CopyTool(const StagingConfig& config, CommandRunner& runner, TraceReport& trace)
    : config_(config), runner_(runner), trace_(trace) {}

const ChecksumOption& CopyTool::checksum_option() {
    if (!coption_) {
        coption_ = resolve_checksum_option(runner_, config_.copy_command, config_.setup,
                                           config_.checksum_type, config_.probe_timeout_secs);
    }
    return *coption_;
}

fs::path CopyTool::stagein_destination(const FileSpec& file) const {
    fs::path dir = !file.workdir.empty() ? fs::path(file.workdir)
                 : !config_.workdir.empty() ? fs::path(config_.workdir)
                 : fs::path(".");
    return dir / file.lfn;
}

void CopyTool::emit(const std::string& msg) const {
    xstage_log(msg);
    if (progress_) progress_(msg);
}

// ── Stage-in ─────────────────────────────────────────────────

BatchResult CopyTool::copy_in(std::vector<FileSpec>& files) {
    checksum_option();

    std::string localsite = config_.local_site;
    std::optional<TypedError> first_error;

    for (auto& file : files) {
        if (file.status == FileStatus::TRANSFERRED || file.status == FileStatus::REMOTE_IO) {
            xstage_debug(fmt::format("{} already {}, skipping", file.lfn, file_status_name(file.status)));
            continue;
        }

        if (localsite.empty()) localsite = file.ddmendpoint;
        trace_.update("localSite", localsite)
              .update("remoteSite", file.ddmendpoint)
              .update("filesize", file.filesize);
        trace_.update("filename", file.lfn).update("guid", strip_dashes(file.guid));
        trace_.update("scope", file.scope).update("dataset", file.dataset);

        // Files read in place by the payload are not copied
        if (config_.allow_direct_access && file.is_directaccess(false)) {
            file.status_code = 0;
            file.status = FileStatus::REMOTE_IO;
            trace_.update("url", file.turl)
                  .update("clientState", "FOUND_ROOT")
                  .update("stateReason", "direct_access");
            trace_.send();
            emit(fmt::format("{}: direct access, not staged", file.lfn));
            continue;
        }

        trace_.update("catStart", now_epoch()).update("url", file.turl);

        auto error = transfer_one(file, true);
        if (error) {
            file.status = FileStatus::FAILED;
            file.status_code = error->numeric_code();
            trace_.update("clientState", "STAGEIN_ATTEMPT_FAILED")
                  .update("stateReason", error->message())
                  .update("timeEnd", now_epoch());
            trace_.send();

            auto propagated = error->with_state("STAGEIN_ATTEMPT_FAILED");
            emit(fmt::format("{}: stage-in failed {} {}", file.lfn,
                             error_code_name(propagated.code()), propagated.describe()));
            if (config_.failure_policy == FailurePolicy::ABORT) {
                return BatchResult::Err(propagated);
            }
            if (!first_error) first_error = propagated;
            continue;
        }

        file.status_code = 0;
        file.status = FileStatus::TRANSFERRED;
        trace_.update("clientState", "DONE").update("stateReason", "OK").update("timeEnd", now_epoch());
        trace_.send();
        emit(fmt::format("{}: transferred", file.lfn));
    }

    if (first_error) return BatchResult::Err(*first_error);
    return BatchResult::Ok();
}

// ── Stage-out ────────────────────────────────────────────────

BatchResult CopyTool::copy_out(std::vector<FileSpec>& files) {
    checksum_option();

    std::string localsite = config_.local_site;
    std::optional<TypedError> first_error;

    for (auto& file : files) {
        if (file.status == FileStatus::TRANSFERRED) {
            xstage_debug(fmt::format("{} already transferred, skipping", file.lfn));
            continue;
        }

        if (localsite.empty()) localsite = file.ddmendpoint;
        trace_.update("localSite", localsite).update("remoteSite", file.ddmendpoint);
        trace_.update("scope", file.scope)
              .update("dataset", file.dataset)
              .update("url", file.surl)
              .update("filesize", file.filesize);
        trace_.update("catStart", now_epoch())
              .update("filename", file.lfn)
              .update("guid", strip_dashes(file.guid));

        auto error = transfer_one(file, false);
        if (error) {
            file.status = FileStatus::FAILED;
            file.status_code = error->numeric_code();
            trace_.update("clientState", error->state().empty() ? "STAGEOUT_ATTEMPT_FAILED" : error->state())
                  .update("stateReason", error->message())
                  .update("timeEnd", now_epoch());
            trace_.send();

            emit(fmt::format("{}: stage-out failed {} {}", file.lfn,
                             error_code_name(error->code()), error->describe()));
            if (config_.failure_policy == FailurePolicy::ABORT) {
                return BatchResult::Err(*error);
            }
            if (!first_error) first_error = error;
            continue;
        }

        file.status_code = 0;
        file.status = FileStatus::TRANSFERRED;
        trace_.update("clientState", "DONE").update("stateReason", "OK").update("timeEnd", now_epoch());
        trace_.send();
        emit(fmt::format("{}: transferred", file.lfn));
    }

    if (first_error) return BatchResult::Err(*first_error);
    return BatchResult::Ok();
}

// ── Per-file transfer ────────────────────────────────────────

std::optional<TypedError> CopyTool::transfer_one(FileSpec& file, bool is_stagein) {
    try {
        StageRequest req;
        req.copy_command = config_.copy_command;
        req.coption = checksum_option();
        req.filesize = file.filesize;
        req.is_stagein = is_stagein;
        req.setup = config_.setup;
        if (is_stagein) {
            req.source = file.turl;
            req.destination = stagein_destination(file).string();
        } else {
            req.source = file.surl;
            req.destination = file.turl;
        }

        int timeout = estimate_timeout(file.filesize);
        req.timeout_secs = config_.enforce_timeout ? timeout : 0;
        emit(fmt::format("{}: copying {} -> {} (timeout {}s)", file.lfn, req.source,
                         req.destination, timeout));

        auto r = stage_file(runner_, classifier_, req);
        if (r.is_err()) {
            if (!is_stagein && config_.ignore_checksum_unsupported &&
                r.error.code() == ErrorCode::CHKSUMNOTSUP) {
                xstage_warn(fmt::format("{}: on-the-fly checksum not supported, accepting upload "
                                        "for out-of-band verification", file.lfn));
                return std::nullopt;
            }
            return r.error;
        }

        outcomes_[file.lfn] = r.value;
        return check_outcome(file, r.value, is_stagein);
    } catch (const std::exception& e) {
        xstage_error(fmt::format("{}: exception while staging: {}", file.lfn, e.what()));
        return TypedError::generic(is_stagein, "(consult log)");
    }
}

std::optional<TypedError> CopyTool::check_outcome(FileSpec& file, const TransferOutcome& outcome,
                                                  bool is_stagein) const {
    std::optional<std::string> expected;
    if (outcome.has_checksum()) {
        expected = file.expected_checksum(*outcome.checksum_type);
        if (!expected && !is_stagein) {
            file.checksum[*outcome.checksum_type] = *outcome.checksum;
        }
    }

    if (!config_.verify_checksum) return std::nullopt;

    if (outcome.filesize && file.filesize > 0 && *outcome.filesize != file.filesize) {
        return TypedError::ad_mismatch(is_stagein,
            fmt::format("file size mismatch for {}: expected {}, copy reported {}",
                        file.lfn, file.filesize, *outcome.filesize));
    }

    if (expected) {
        std::string want = to_lower(zfill(*expected, ADLER32_HEX_LENGTH));
        std::string got = to_lower(*outcome.checksum);
        if (want != got) {
            return TypedError::ad_mismatch(is_stagein,
                fmt::format("{} checksum mismatch for {}: expected {}, copy reported {}",
                            *outcome.checksum_type, file.lfn, want, got));
        }
        xstage_log(fmt::format("{}: {} checksum verified ({})", file.lfn, *outcome.checksum_type, got));
    }
    return std::nullopt;
}
