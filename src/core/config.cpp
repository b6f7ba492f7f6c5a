#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

std::optional<DetectionScope> parse_detection_scope(const std::string& name) {
    if (name == "all") return DetectionScope::All;
    if (name == "command_output") return DetectionScope::CommandOutput;
    if (name == "manual_only") return DetectionScope::ManualOnly;
    return std::nullopt;
}

const char* detection_scope_name(DetectionScope scope) {
    switch (scope) {
        case DetectionScope::All:           return "all";
        case DetectionScope::CommandOutput: return "command_output";
        case DetectionScope::ManualOnly:    return "manual_only";
    }
    return "all";
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".prettify";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# prettify configuration

prettifier:
  enabled: true
  respect_alternate_screen: true   # flush pending output on alt-screen switches

detection:
  scope: "all"                     # all | command_output | manual_only
  confidence_threshold: 0.6
  max_scan_lines: 500
  debounce_ms: 100
  blank_line_threshold: 2

cache:
  max_entries: 64

max_active_blocks: 128

claude_code:
  auto_detect: true
  render_markdown: true
  render_diffs: true
  auto_render_on_expand: true
  show_format_badges: true

renderers:
  json:
    enabled: true
    priority: 50
  diff:
    enabled: true
    priority: 60

# Optional: debug log file ("" disables logging)
# log_path: "/tmp/prettify_debug.log"
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static ClaudeCodeConfig parse_claude_code_config(const YAML::Node& node) {
    ClaudeCodeConfig cc;
    cc.auto_detect = node["auto_detect"].as<bool>(true);
    cc.render_markdown = node["render_markdown"].as<bool>(true);
    cc.render_diffs = node["render_diffs"].as<bool>(true);
    cc.auto_render_on_expand = node["auto_render_on_expand"].as<bool>(true);
    cc.show_format_badges = node["show_format_badges"].as<bool>(true);
    return cc;
}

static FormatToggle parse_format_toggle(const YAML::Node& node, FormatToggle defaults) {
    FormatToggle t = defaults;
    if (!node) return t;
    if (node.IsScalar()) {
        // Bare shorthand: `json: false`
        t.enabled = node.as<bool>(defaults.enabled);
        return t;
    }
    t.enabled = node["enabled"].as<bool>(defaults.enabled);
    t.priority = node["priority"].as<int>(defaults.priority);
    return t;
}

static Result<PrettifierConfig> parse_prettifier_config(const YAML::Node& root) {
    PrettifierConfig pc;

    if (const YAML::Node p = root["prettifier"]) {
        pc.enabled = p["enabled"].as<bool>(pc.enabled);
        pc.respect_alternate_screen = p["respect_alternate_screen"].as<bool>(pc.respect_alternate_screen);
    }

    if (const YAML::Node d = root["detection"]) {
        if (d["scope"]) {
            std::string name = d["scope"].as<std::string>();
            auto scope = parse_detection_scope(name);
            if (!scope) {
                return Result<PrettifierConfig>::Err("Unknown detection scope: " + name);
            }
            pc.detection_scope = *scope;
        }
        pc.confidence_threshold = d["confidence_threshold"].as<float>(pc.confidence_threshold);
        pc.max_scan_lines = d["max_scan_lines"].as<size_t>(pc.max_scan_lines);
        pc.debounce_ms = d["debounce_ms"].as<uint64_t>(pc.debounce_ms);
        pc.blank_line_threshold = d["blank_line_threshold"].as<size_t>(pc.blank_line_threshold);
    }

    if (pc.confidence_threshold < 0.0f || pc.confidence_threshold > 1.0f) {
        return Result<PrettifierConfig>::Err("confidence_threshold must be within 0.0-1.0");
    }
    if (pc.max_scan_lines == 0) {
        return Result<PrettifierConfig>::Err("max_scan_lines must be at least 1");
    }

    if (const YAML::Node c = root["cache"]) {
        pc.cache_max_entries = c["max_entries"].as<size_t>(pc.cache_max_entries);
    }
    pc.max_active_blocks = root["max_active_blocks"].as<size_t>(pc.max_active_blocks);

    if (root["claude_code"] && root["claude_code"].IsMap()) {
        pc.claude_code = parse_claude_code_config(root["claude_code"]);
    }

    if (const YAML::Node r = root["renderers"]) {
        pc.formats.json = parse_format_toggle(r["json"], pc.formats.json);
        pc.formats.diff = parse_format_toggle(r["diff"], pc.formats.diff);
    }

    return Result<PrettifierConfig>::Ok(pc);
}

static Result<Config> config_from_root(const YAML::Node& root) {
    Config config;
    // An empty document is a valid, all-defaults config.
    if (!root || root.IsNull()) {
        return Result<Config>::Ok(config);
    }
    if (!root.IsMap()) {
        return Result<Config>::Err("Config root must be a mapping");
    }

    auto pc = parse_prettifier_config(root);
    if (pc.is_err()) {
        return Result<Config>::Err(pc.error);
    }
    config.prettifier() = pc.value;
    return Result<Config>::Ok(config);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        auto result = config_from_root(root);
        if (result.is_ok() && root.IsMap() && root["log_path"]) {
            result.value.log_path_ = root["log_path"].as<std::string>("");
        }
        return result;
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Failed to open config at " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_err()) {
        return Result<Config>::Err(path.string() + ": " + result.error);
    }
    return result;
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Err("Global config not found at " + get_global_config_path().string());
    }
    return load(get_global_config_path());
}
