#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <fmt/format.h>
#include "cli/theme.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/log.hpp"
#include "platform/platform.hpp"
#include "trace/trace_report.hpp"
#include "transfer/batch_file.hpp"
#include "transfer/command_runner.hpp"
#include "transfer/copytool.hpp"

struct CliOptions {
    std::string direction;          // "in" or "out"
    std::string batch_path;
    std::string config_path;
    std::string workdir;
    std::string lfns;
    std::string scopes;
    std::string turls;
    std::string localsite;
    std::string remotesite;
    std::string eventtype;
    std::string summary_path;
    bool debug = false;
    bool direct_access = false;
    JobInfo job;
};

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << "    xstage [options] in  <batch.yaml>\n"
              << "    xstage [options] in  --lfns a,b --scopes s1,s2 --turls u1,u2\n"
              << "    xstage [options] out <batch.yaml>\n";
    std::cout << theme::section("Options");
    std::cout << theme::kv("-c <file>", "Configuration file (default ./xstage.yaml, ~/.xstage/config.yaml)")
              << theme::kv("-w <dir>", "Working directory for downloaded files")
              << theme::kv("-q <queue>", "Queue name recorded in traces")
              << theme::kv("-d", "Echo the debug log to stderr")
              << theme::kv("--direct-access", "Leave directly readable inputs in place")
              << theme::kv("--localsite", "Local site name")
              << theme::kv("--remotesite", "Storage endpoint for files that do not name one")
              << theme::kv("--eventtype", "Trace event type")
              << theme::kv("--produserid", "Production user id")
              << theme::kv("--jobid", "Job id")
              << theme::kv("--taskid", "Task id")
              << theme::kv("--summary", "Where to write the per-file status dictionary")
              << "\n";
    std::cout << theme::dim("    xstage --version        Show version\n"
                            "    xstage --help           Show this help") << "\n\n";
}

// Returns an error message, or nullopt on success.
static std::optional<std::string> parse_args(int argc, char** argv, CliOptions& opts) {
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto value = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };

        bool ok = true;
        if (arg == "-c") ok = value(opts.config_path);
        else if (arg == "-w") ok = value(opts.workdir);
        else if (arg == "-q") ok = value(opts.job.pq);
        else if (arg == "-d") opts.debug = true;
        else if (arg == "--direct-access") opts.direct_access = true;
        else if (arg == "--lfns") ok = value(opts.lfns);
        else if (arg == "--scopes") ok = value(opts.scopes);
        else if (arg == "--turls") ok = value(opts.turls);
        else if (arg == "--localsite") ok = value(opts.localsite);
        else if (arg == "--remotesite") ok = value(opts.remotesite);
        else if (arg == "--eventtype") ok = value(opts.eventtype);
        else if (arg == "--produserid") ok = value(opts.job.produserid);
        else if (arg == "--jobid") ok = value(opts.job.jobid);
        else if (arg == "--taskid") ok = value(opts.job.taskid);
        else if (arg == "--jobdefinitionid") ok = value(opts.job.jobdefinitionid);
        else if (arg == "--summary") ok = value(opts.summary_path);
        else if (!arg.empty() && arg[0] == '-') return "unknown option " + arg;
        else positional.push_back(arg);

        if (!ok) return "missing value for " + arg;
    }

    if (positional.empty()) return std::string("missing direction (in or out)");
    opts.direction = positional[0];
    if (opts.direction != "in" && opts.direction != "out") {
        return "unknown direction " + opts.direction;
    }
    if (positional.size() > 1) opts.batch_path = positional[1];
    if (positional.size() > 2) return "unexpected argument " + positional[2];
    if (opts.batch_path.empty() && opts.lfns.empty()) {
        return std::string("no batch file or --lfns given");
    }
    if (opts.direction == "out" && opts.batch_path.empty()) {
        return std::string("stage-out needs a batch file");
    }
    return std::nullopt;
}

static int run(const CliOptions& opts) {
    auto cfg = opts.config_path.empty() ? Config::load_default()
                                        : Config::load(opts.config_path);
    if (cfg.is_err()) {
        std::cerr << theme::fail(cfg.error);
        return EXIT_GENERAL_ERROR;
    }

    StagingConfig staging = cfg.value.staging();
    if (!opts.workdir.empty()) staging.workdir = opts.workdir;
    if (!opts.localsite.empty()) staging.local_site = opts.localsite;
    if (opts.direct_access) staging.allow_direct_access = true;
    // the copy tool runs inside workdir, so destinations must not be relative to it
    staging.workdir = fs::absolute(staging.workdir.empty() ? "." : staging.workdir).lexically_normal().string();
    std::error_code ec;
    fs::create_directories(staging.workdir, ec);
    if (ec || !fs::is_directory(staging.workdir)) {
        std::cerr << theme::fail(fmt::format("cannot use working directory {}: {}",
                                             staging.workdir, ec ? ec.message() : "not a directory"));
        return EXIT_GENERAL_ERROR;
    }

    if (!staging.log_path.empty()) set_xstage_log_path(staging.log_path);
    xstage_log_settings().echo_all = opts.debug;

    bool is_stagein = opts.direction == "in";
    auto batch = opts.batch_path.empty()
        ? files_from_lists(opts.lfns, opts.scopes, opts.turls)
        : load_batch_file(opts.batch_path);
    if (batch.is_err()) {
        std::cerr << theme::fail(batch.error);
        return EXIT_GENERAL_ERROR;
    }
    std::vector<FileSpec> files = std::move(batch.value);
    if (files.empty()) {
        std::cerr << theme::fail("LFNs not set");
        return EXIT_NO_LFNS;
    }
    for (auto& f : files) {
        if (f.ddmendpoint.empty()) f.ddmendpoint = opts.remotesite;
    }

    std::shared_ptr<TraceSink> sink;
    if (staging.trace.enabled) {
        std::string trace_path = staging.trace.path.empty()
            ? (platform::temp_dir() / DEFAULT_TRACE_FILE).string()
            : staging.trace.path;
        sink = std::make_shared<FileTraceSink>(trace_path);
    }
    TraceReport trace(sink);
    trace.init(opts.job, opts.eventtype.empty() ? staging.trace.event_type : opts.eventtype);
    if (!staging.local_site.empty()) trace.update("localSite", staging.local_site);
    if (!opts.remotesite.empty()) trace.update("remoteSite", opts.remotesite);

    ShellCommandRunner runner(staging.workdir);
    CopyTool tool(staging, runner, trace);
    tool.set_progress_callback([](const std::string& msg) { std::cout << theme::step(msg); });

    std::cout << theme::section(is_stagein ? "Stage-in" : "Stage-out");
    xstage_log(fmt::format("xstage {}: {} file(s), workdir={}, policy={}", opts.direction,
                           files.size(), staging.workdir, failure_policy_name(staging.failure_policy)));

    auto result = is_stagein ? tool.copy_in(files) : tool.copy_out(files);
    std::optional<TypedError> error;
    if (result.is_err()) error = result.error;

    fs::path summary = opts.summary_path.empty()
        ? fs::path(staging.workdir) / (is_stagein ? STAGEIN_DICTIONARY : STAGEOUT_DICTIONARY)
        : fs::path(opts.summary_path);
    auto written = write_summary(summary, files, error);

    std::cout << theme::section("Summary");
    for (const auto& f : files) {
        std::string line = fmt::format("{}  status={} status_code={}", f.lfn,
                                       file_status_name(f.status), f.status_code);
        auto it = tool.outcomes().find(f.lfn);
        if (it != tool.outcomes().end() && it->second.has_checksum()) {
            line += fmt::format(" {}={}", *it->second.checksum_type, *it->second.checksum);
        }
        std::cout << (f.status == FileStatus::FAILED ? theme::fail(line)
                    : f.status == FileStatus::PENDING ? theme::info(line)
                    : theme::ok(line));
    }

    if (written.is_err()) {
        std::cerr << theme::fail(written.error);
    } else {
        std::cout << theme::kv("wrote", summary.string());
    }

    if (error) {
        std::cerr << theme::fail(fmt::format("file transfers failed: {}", error->describe()));
        return EXIT_TRANSFER_ERROR;
    }
    std::cout << theme::ok("file transfers finished");
    return EXIT_OK;
}

int main(int argc, char** argv) {
    try {
        if (argc >= 2) {
            std::string first = argv[1];
            if (first == "--version") {
                std::cout << theme::bold("xstage") << theme::dim(" version 0.3.0") << "\n";
                return EXIT_OK;
            } else if (first == "--help" || first == "-h") {
                print_usage();
                return EXIT_OK;
            }
        }

        CliOptions opts;
        if (auto err = parse_args(argc, argv, opts)) {
            std::cerr << theme::fail(*err);
            print_usage();
            return EXIT_GENERAL_ERROR;
        }
        return run(opts);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_GENERAL_ERROR;
    }
}
