#include "checksum_option.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

ChecksumOption resolve_checksum_option(CommandRunner& runner,
                                       const std::string& copy_command,
                                       const std::string& setup,
                                       const std::string& checksum_type,
                                       int probe_timeout_secs) {
    ChecksumOption coption;

    std::string cmd = with_setup(setup, fmt::format("{} --version", copy_command));
    xstage_log(fmt::format("Execute command ({}) to check {} client version", cmd, copy_command));
    auto version = runner.run(cmd, probe_timeout_secs);
    xstage_log(fmt::format("return code: {}", version.exit_code));
    xstage_log(fmt::format("return output: {}", version.combined_output()));
    if (version.failed()) {
        xstage_error(fmt::format("FAILED to execute command={}: {}", cmd, version.combined_output()));
        return coption;
    }

    cmd = with_setup(setup, fmt::format("{} -h", copy_command));
    xstage_log(fmt::format("Execute command ({}) to decide which option should be used to calc/verify file checksum", cmd));
    auto help = runner.run(cmd, probe_timeout_secs);
    std::string output = help.combined_output();
    xstage_log(fmt::format("return code: {}", help.exit_code));
    xstage_debug(fmt::format("return output: {}", output));
    if (help.failed()) {
        xstage_error(fmt::format("FAILED to execute command={}: {}", cmd, output));
        return coption;
    }

    if (output.find("--cksum") != std::string::npos) {
        coption.option = fmt::format("--cksum {}:print", checksum_type);
    } else if (output.find("-adler") != std::string::npos && checksum_type == "adler32") {
        coption.option = "-adler";
    } else if (output.find("-md5") != std::string::npos && checksum_type == "md5") {
        coption.option = "-md5";
    }

    if (!coption.empty()) {
        coption.checksum_type = checksum_type;
        xstage_log(fmt::format("Use {} option to get the checksum for {} command", coption.option, copy_command));
    }
    return coption;
}
