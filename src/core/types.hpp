#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>
#include <cstddef>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// When the boundary detector is allowed to cut blocks.
enum class DetectionScope {
    CommandOutput,   // only between command start/end markers
    All,             // everything; blank-line heuristic + debounce
    ManualOnly,      // never auto-emit; only flush() produces blocks
};

// Configuration structures
struct BoundaryConfig {
    DetectionScope scope = DetectionScope::All;
    size_t max_scan_lines = DEFAULT_MAX_SCAN_LINES;
    uint64_t debounce_ms = DEFAULT_DEBOUNCE_MS;
    size_t blank_line_threshold = DEFAULT_BLANK_THRESHOLD;
};

struct ClaudeCodeConfig {
    bool auto_detect = true;
    bool render_markdown = true;
    bool render_diffs = true;
    bool auto_render_on_expand = true;
    bool show_format_badges = true;
};

struct FormatToggle {
    bool enabled = true;
    int priority = 50;
};

struct BuiltinFormatsConfig {
    FormatToggle json{true, 50};
    FormatToggle diff{true, 60};
};

struct PrettifierConfig {
    bool enabled = true;
    bool respect_alternate_screen = true;
    float confidence_threshold = 0.6f;
    DetectionScope detection_scope = DetectionScope::All;
    size_t max_scan_lines = DEFAULT_MAX_SCAN_LINES;
    uint64_t debounce_ms = DEFAULT_DEBOUNCE_MS;
    size_t blank_line_threshold = DEFAULT_BLANK_THRESHOLD;
    size_t cache_max_entries = DEFAULT_CACHE_SIZE;
    size_t max_active_blocks = MAX_ACTIVE_BLOCKS;
    ClaudeCodeConfig claude_code;
    BuiltinFormatsConfig formats;

    BoundaryConfig boundary() const {
        return {detection_scope, max_scan_lines, debounce_ms, blank_line_threshold};
    }
};

// Parse "all" / "command_output" / "manual_only". Empty optional on anything else.
std::optional<DetectionScope> parse_detection_scope(const std::string& name);
const char* detection_scope_name(DetectionScope scope);
