#pragma once

#include <string>
#include <cstdint>
#include <core/types.hpp>
#include "checksum_option.hpp"
#include "command_runner.hpp"
#include "output_parser.hpp"
#include "transfer_error.hpp"

// What a finished copy reported about the destination file.
using TransferOutcome = CopyFileInfo;

using StageResult = Result<TransferOutcome, TypedError>;

struct StageRequest {
    std::string copy_command = "xrdcp";
    ChecksumOption coption;
    std::string source;
    std::string destination;
    int64_t filesize = 0;
    bool is_stagein = true;
    std::string setup;
    int timeout_secs = 0;        // hard deadline for the copy, 0 = none
};

// "<tool> -np -f <checksum flag> <source> <destination>", setup-prefixed.
std::string build_copy_command(const StageRequest& req);

// Copy one file. A nonzero exit (or a timeout) is classified into a TypedError;
// on success the output is parsed for size/checksum only if a checksum flag was
// passed. A missing checksum is not a failure here: callers verify.
StageResult stage_file(CommandRunner& runner, const ErrorClassifier& classifier,
                       const StageRequest& req);
