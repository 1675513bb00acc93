#pragma once

#include <string>
#include <optional>
#include <cstdint>

// Size and checksum reported by the copy tool for a finished transfer.
struct CopyFileInfo {
    std::optional<int64_t> filesize;
    std::optional<std::string> checksum;        // zero-padded to 8 hex digits
    std::optional<std::string> checksum_type;   // "adler32" or "md5"

    bool has_checksum() const { return checksum.has_value() && checksum_type.has_value(); }
};

// Expected shape: "<type>: <checksum> <anything> <filesize>".
extern const char* const COPY_OUTPUT_PATTERN;

// Extract size / checksum from copy tool output. Never throws: empty or
// unrecognised output yields an all-empty CopyFileInfo and a log warning.
CopyFileInfo parse_copy_output(const std::string& output);

// Shorten long output for a log line, keeping the checksum region if present.
std::string abbreviate_output(const std::string& output, size_t limit);
