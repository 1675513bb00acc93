#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <trace/trace_report.hpp>
#include "checksum_option.hpp"
#include "command_runner.hpp"
#include "file_spec.hpp"
#include "stage_file.hpp"
#include "transfer_error.hpp"

namespace fs = std::filesystem;

using BatchResult = Result<void, TypedError>;

// Drives a batch of files through the external copy tool, one at a time and in
// order, updating each FileSpec's status and emitting trace records around
// every transfer. One instance per batch run; not thread safe.
class CopyTool {
public:
    CopyTool(const StagingConfig& config, CommandRunner& runner, TraceReport& trace);

    // Download remote files (turl) into the working directory. Files already
    // transferred or read remotely are left alone. Under FailurePolicy::ABORT
    // the first failure ends the batch; later files stay PENDING.
    BatchResult copy_in(std::vector<FileSpec>& files);

    // Upload local files (surl) to their remote targets (turl).
    BatchResult copy_out(std::vector<FileSpec>& files);

    // Probes the copy tool on first use, cached for the lifetime of the instance.
    const ChecksumOption& checksum_option();

    ErrorClassifier& classifier() { return classifier_; }

    // What the copy tool reported for each transferred lfn.
    const std::map<std::string, TransferOutcome>& outcomes() const { return outcomes_; }

    void set_progress_callback(StatusCallback cb) { progress_ = std::move(cb); }

    // <file workdir | batch workdir | .>/<lfn>
    fs::path stagein_destination(const FileSpec& file) const;

private:
    const StagingConfig& config_;
    CommandRunner& runner_;
    TraceReport& trace_;
    ErrorClassifier classifier_;
    std::optional<ChecksumOption> coption_;
    std::map<std::string, TransferOutcome> outcomes_;
    StatusCallback progress_;

    std::optional<TypedError> transfer_one(FileSpec& file, bool is_stagein);
    std::optional<TypedError> check_outcome(FileSpec& file, const TransferOutcome& outcome,
                                            bool is_stagein) const;
    void emit(const std::string& msg) const;
};
