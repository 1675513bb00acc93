#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from a YAML file
    static Result<Config> load(const fs::path& path);

    // ./xstage.yaml, then ~/.xstage/config.yaml, else built-in defaults
    static Result<Config> load_default(const fs::path& dir = fs::current_path());

    // Parse YAML text (used by load and by tests)
    static Result<Config> parse(const std::string& yaml_text);

    // Built-in defaults plus environment fallbacks
    static Config defaults();

    // Accessors
    const StagingConfig& staging() const { return staging_; }
    StagingConfig& staging() { return staging_; }
    const fs::path& source_path() const { return source_path_; }

public:
    Config() = default;

private:
    StagingConfig staging_;
    fs::path source_path_;

    friend class ConfigBuilder;
};

// Helper to check if configs exist
bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

// "abort" / "continue"
Result<FailurePolicy> parse_failure_policy(const std::string& value);
const char* failure_policy_name(FailurePolicy policy);
