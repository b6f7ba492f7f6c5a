#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.prettify/config.yaml
    static Result<Config> load_global();

    // Load a specific YAML file
    static Result<Config> load(const fs::path& path);

    // Parse YAML text (same keys as the config file)
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const PrettifierConfig& prettifier() const { return prettifier_; }
    PrettifierConfig& prettifier() { return prettifier_; }
    std::optional<std::string> log_path() const { return log_path_; }

    Config() = default;

private:
    PrettifierConfig prettifier_;
    std::optional<std::string> log_path_;
};

// Helper to check if the global config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config (never overwrites)
Result<void> create_default_global_config();
