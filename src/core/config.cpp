#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

// Fills a Config from a parsed YAML document.
class ConfigBuilder {
public:
    static Result<Config> build(const YAML::Node& root);

private:
    static Result<void> apply_copytool(const YAML::Node& node, StagingConfig& s);
    static Result<void> apply_transfer(const YAML::Node& node, StagingConfig& s);
    static void apply_trace(const YAML::Node& node, TraceSettings& t);
};

Result<FailurePolicy> parse_failure_policy(const std::string& value) {
    if (value == "abort") return Result<FailurePolicy>::Ok(FailurePolicy::ABORT);
    if (value == "continue") return Result<FailurePolicy>::Ok(FailurePolicy::CONTINUE);
    return Result<FailurePolicy>::Err(
        fmt::format("invalid failure_policy '{}' (expected abort or continue)", value));
}

const char* failure_policy_name(FailurePolicy policy) {
    return policy == FailurePolicy::CONTINUE ? "continue" : "abort";
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".xstage";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / PROJECT_CONFIG_FILE;
}

// DQ2_LOCAL_SITE_ID names the site when the config does not
static void apply_environment(StagingConfig& s) {
    if (s.local_site.empty()) {
        s.local_site = platform::env("DQ2_LOCAL_SITE_ID");
    }
}

Result<void> ConfigBuilder::apply_copytool(const YAML::Node& node, StagingConfig& s) {
    s.copy_command = node["command"].as<std::string>(s.copy_command);
    s.setup = node["setup"].as<std::string>(s.setup);
    s.checksum_type = node["checksum_type"].as<std::string>(s.checksum_type);
    s.probe_timeout_secs = node["probe_timeout"].as<int>(s.probe_timeout_secs);

    if (s.copy_command.empty()) {
        return Result<void>::Err("copytool.command must not be empty");
    }
    if (s.checksum_type != "adler32" && s.checksum_type != "md5") {
        return Result<void>::Err(fmt::format(
            "unsupported checksum_type '{}' (expected adler32 or md5)", s.checksum_type));
    }
    return Result<void>::Ok();
}

Result<void> ConfigBuilder::apply_transfer(const YAML::Node& node, StagingConfig& s) {
    s.workdir = node["workdir"].as<std::string>(s.workdir);
    s.local_site = node["local_site"].as<std::string>(s.local_site);
    s.allow_direct_access = node["allow_direct_access"].as<bool>(s.allow_direct_access);
    s.enforce_timeout = node["enforce_timeout"].as<bool>(s.enforce_timeout);
    s.verify_checksum = node["verify_checksum"].as<bool>(s.verify_checksum);
    s.ignore_checksum_unsupported =
        node["ignore_checksum_unsupported"].as<bool>(s.ignore_checksum_unsupported);

    if (node["failure_policy"]) {
        auto policy = parse_failure_policy(node["failure_policy"].as<std::string>(""));
        if (policy.is_err()) return Result<void>::Err(policy.error);
        s.failure_policy = policy.value;
    }
    return Result<void>::Ok();
}

void ConfigBuilder::apply_trace(const YAML::Node& node, TraceSettings& t) {
    t.enabled = node["enabled"].as<bool>(t.enabled);
    t.event_type = node["event_type"].as<std::string>(t.event_type);
    t.path = node["path"].as<std::string>(t.path);
}

Result<Config> ConfigBuilder::build(const YAML::Node& root) {
    Config config = Config::defaults();
    StagingConfig& s = config.staging_;

    if (!root || root.IsNull()) {
        return Result<Config>::Ok(config);
    }
    if (!root.IsMap()) {
        return Result<Config>::Err("config root must be a mapping");
    }

    if (root["copytool"]) {
        auto r = apply_copytool(root["copytool"], s);
        if (r.is_err()) return Result<Config>::Err(r.error);
    }
    if (root["transfer"]) {
        auto r = apply_transfer(root["transfer"], s);
        if (r.is_err()) return Result<Config>::Err(r.error);
    }
    if (root["trace"]) {
        apply_trace(root["trace"], s.trace);
    }
    if (root["log"]) {
        s.log_path = root["log"]["path"].as<std::string>(s.log_path);
    }

    apply_environment(s);
    return Result<Config>::Ok(config);
}

Config Config::defaults() {
    Config config;
    apply_environment(config.staging_);
    return config;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        return ConfigBuilder::build(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("invalid config: {}", e.what()));
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("config file not found: " + path.string());
    }
    try {
        auto result = ConfigBuilder::build(YAML::LoadFile(path.string()));
        if (result.is_ok()) result.value.source_path_ = path;
        return result;
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("invalid config {}: {}", path.string(), e.what()));
    }
}

Result<Config> Config::load_default(const fs::path& dir) {
    if (project_config_exists(dir)) {
        return load(get_project_config_path(dir));
    }
    if (global_config_exists()) {
        return load(get_global_config_path());
    }
    return Result<Config>::Ok(defaults());
}
