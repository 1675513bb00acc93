#pragma once

#include <string>
#include "command_runner.hpp"

// Copy tool flag requesting an on-the-fly checksum, and the algorithm it yields.
struct ChecksumOption {
    std::string option;          // e.g. "--cksum adler32:print"; empty if unsupported
    std::string checksum_type;   // "" when option is empty

    bool empty() const { return option.empty(); }
};

// Probe `<tool> --version` and `<tool> -h` and pick the checksum flag the tool
// understands, in priority order: --cksum, -adler (adler32 only), -md5 (md5 only).
// A failing probe is logged and yields an empty option.
ChecksumOption resolve_checksum_option(CommandRunner& runner,
                                       const std::string& copy_command,
                                       const std::string& setup,
                                       const std::string& checksum_type = "adler32",
                                       int probe_timeout_secs = 0);
