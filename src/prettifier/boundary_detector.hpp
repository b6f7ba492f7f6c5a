#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <core/types.hpp>
#include "content_block.hpp"

// Segments the terminal output stream into ContentBlocks.
//
// A block is emitted on: command end, a run of blank lines (All scope only,
// not inside a ``` / ~~~ fence), max_scan_lines reached, an alt-screen or
// foreground-process change, or the debounce timeout polled via
// check_debounce(). Trailing blank lines are never part of an emitted block.
class BoundaryDetector {
public:
    using Clock = std::chrono::steady_clock;

    explicit BoundaryDetector(BoundaryConfig config = BoundaryConfig{});

    std::optional<ContentBlock> push_line(const std::string& line, size_t row);

    // Shell-integration markers (OSC 133 C / D).
    void on_command_start(const std::string& command);
    std::optional<ContentBlock> on_command_end();

    // Content before and after an alt-screen switch is never merged.
    std::optional<ContentBlock> on_alt_screen_change(bool entering);
    std::optional<ContentBlock> on_process_change();

    // Emit the pending block if nothing was accumulated for debounce_ms.
    std::optional<ContentBlock> check_debounce();
    std::optional<ContentBlock> check_debounce(Clock::time_point now);

    // Emit regardless of scope (ManualOnly included).
    std::optional<ContentBlock> flush();

    // Drop everything accumulated so far.
    void reset();

    DetectionScope scope() const { return config_.scope; }
    const BoundaryConfig& config() const { return config_; }
    bool has_pending_lines() const { return !current_lines_.empty(); }
    size_t pending_line_count() const { return current_lines_.size(); }
    bool in_command_output() const { return in_command_output_; }

private:
    BoundaryConfig config_;
    std::vector<std::string> current_lines_;
    std::optional<std::string> current_command_;
    size_t block_start_row_ = 0;
    Clock::time_point last_output_time_;
    bool in_command_output_ = false;
    size_t consecutive_blank_lines_ = 0;
    bool in_fenced_block_ = false;
    char fence_char_ = 0;

    void update_fence_state(const std::string& line);
    std::optional<ContentBlock> emit_block();
};
