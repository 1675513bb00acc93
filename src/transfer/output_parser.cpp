#include "output_parser.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <regex>

const char* const COPY_OUTPUT_PATTERN = R"((md5|adler32): ([a-zA-Z0-9]+) \S+ ([0-9]+))";

std::string abbreviate_output(const std::string& output, size_t limit) {
    if (output.size() <= limit) return output;

    size_t mark = output.find("adler32:");
    if (mark == std::string::npos) mark = output.find("md5:");
    if (mark != std::string::npos) {
        size_t start = mark > limit / 4 ? mark - limit / 4 : 0;
        return fmt::format("...{}...", output.substr(start, limit));
    }
    // xrdcp prints the checksum line last
    return fmt::format("...{}", output.substr(output.size() - limit));
}

CopyFileInfo parse_copy_output(const std::string& output) {
    CopyFileInfo info;

    if (output.empty()) {
        xstage_warn("no copy output to extract checksum from");
        return info;
    }

    if (output.find("xrootd") == std::string::npos &&
        output.find("XRootD") == std::string::npos &&
        output.find("adler32") == std::string::npos &&
        output.find("md5:") == std::string::npos) {
        xstage_warn(fmt::format("failed to extract checksum, unexpected output: {}",
                                abbreviate_output(output, LOG_PARSE_TRUNCATE)));
        return info;
    }

    static const std::regex re(COPY_OUTPUT_PATTERN);
    std::smatch m;
    if (!std::regex_search(output, m, re)) {
        xstage_warn(fmt::format("checksum/file size not found: failed to match pattern={} in output={}",
                                COPY_OUTPUT_PATTERN, abbreviate_output(output, LOG_PARSE_TRUNCATE)));
        return info;
    }

    info.checksum_type = m[1].str();
    // xrdcp drops leading zeros from adler32 values
    info.checksum = zfill(m[2].str(), ADLER32_HEX_LENGTH);

    auto size = parse_int64(m[3].str());
    if (size) {
        info.filesize = *size;
    } else {
        xstage_warn(fmt::format("failed to convert filesize '{}' to an integer", m[3].str()));
    }
    return info;
}
