#include "boundary_detector.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <cctype>

BoundaryDetector::BoundaryDetector(BoundaryConfig config)
    : config_(config), last_output_time_(Clock::now()) {}

std::optional<ContentBlock> BoundaryDetector::push_line(const std::string& line, size_t row) {
    switch (config_.scope) {
        case DetectionScope::CommandOutput:
            if (!in_command_output_) return std::nullopt;
            break;
        case DetectionScope::ManualOnly:
            last_output_time_ = Clock::now();
            if (current_lines_.empty()) block_start_row_ = row;
            current_lines_.push_back(line);
            consecutive_blank_lines_ = 0;
            return std::nullopt;
        case DetectionScope::All:
            break;
    }

    last_output_time_ = Clock::now();

    if (current_lines_.empty()) {
        block_start_row_ = row;
    }

    update_fence_state(line);

    if (config_.scope == DetectionScope::All && is_blank(line) && !in_fenced_block_) {
        consecutive_blank_lines_++;
        if (consecutive_blank_lines_ >= config_.blank_line_threshold) {
            prettify_log(fmt::format("boundary: blank-line boundary at row={} (blanks={})",
                                     row, consecutive_blank_lines_));
            // The blank run itself is dropped; emit_block trims it off.
            auto block = emit_block();
            consecutive_blank_lines_ = 0;
            return block;
        }
        current_lines_.push_back(line);
        return std::nullopt;
    }

    if (!in_fenced_block_) {
        consecutive_blank_lines_ = 0;
    }
    current_lines_.push_back(line);

    if (current_lines_.size() >= config_.max_scan_lines) {
        prettify_log(fmt::format("boundary: max_scan_lines reached at row={} (lines={})",
                                 row, current_lines_.size()));
        return emit_block();
    }

    return std::nullopt;
}

void BoundaryDetector::on_command_start(const std::string& command) {
    prettify_log("boundary: command start: " + preview(command, LOG_PREVIEW_CHARS));
    current_command_ = command;
    in_command_output_ = true;
    current_lines_.clear();
    consecutive_blank_lines_ = 0;
}

std::optional<ContentBlock> BoundaryDetector::on_command_end() {
    prettify_log(fmt::format("boundary: command end, {} lines pending", current_lines_.size()));
    in_command_output_ = false;
    if (config_.scope == DetectionScope::ManualOnly) return std::nullopt;
    return emit_block();
}

std::optional<ContentBlock> BoundaryDetector::on_alt_screen_change(bool entering) {
    if (config_.scope == DetectionScope::ManualOnly) return std::nullopt;
    prettify_log(fmt::format("boundary: alt screen {}", entering ? "enter" : "exit"));
    return emit_block();
}

std::optional<ContentBlock> BoundaryDetector::on_process_change() {
    if (config_.scope == DetectionScope::ManualOnly) return std::nullopt;
    return emit_block();
}

std::optional<ContentBlock> BoundaryDetector::check_debounce() {
    return check_debounce(Clock::now());
}

std::optional<ContentBlock> BoundaryDetector::check_debounce(Clock::time_point now) {
    if (config_.scope == DetectionScope::ManualOnly) return std::nullopt;
    if (current_lines_.empty()) return std::nullopt;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - last_output_time_).count();
    if (elapsed < 0 || static_cast<uint64_t>(elapsed) < config_.debounce_ms) {
        return std::nullopt;
    }

    prettify_log(fmt::format("boundary: debounce fired after {}ms, {} lines pending",
                             elapsed, current_lines_.size()));
    return emit_block();
}

std::optional<ContentBlock> BoundaryDetector::flush() {
    return emit_block();
}

void BoundaryDetector::reset() {
    current_lines_.clear();
    current_command_.reset();
    block_start_row_ = 0;
    in_command_output_ = false;
    consecutive_blank_lines_ = 0;
    in_fenced_block_ = false;
    fence_char_ = 0;
}

// Opening fence: ``` or ~~~ (3+), optionally followed by a language tag made
// of alphanumerics, '-', '_' or '+'. Closing fence: the same character 3+
// times with nothing but whitespace after it.
void BoundaryDetector::update_fence_state(const std::string& line) {
    std::string t = trimmed(line);

    if (in_fenced_block_) {
        size_t run = t.find_first_not_of(fence_char_);
        if (run == std::string::npos) run = t.size();
        if (run >= MIN_FENCE_LENGTH && is_blank(t.substr(run))) {
            in_fenced_block_ = false;
            fence_char_ = 0;
        }
        return;
    }

    char ch = 0;
    if (t.rfind("```", 0) == 0) {
        ch = '`';
    } else if (t.rfind("~~~", 0) == 0) {
        ch = '~';
    } else {
        return;
    }

    size_t run = t.find_first_not_of(ch);
    std::string rest = run == std::string::npos ? "" : trimmed(t.substr(run));
    for (unsigned char c : rest) {
        if (!std::isalnum(c) && c != '-' && c != '_' && c != '+') return;
    }

    in_fenced_block_ = true;
    fence_char_ = ch;
}

std::optional<ContentBlock> BoundaryDetector::emit_block() {
    if (current_lines_.empty()) return std::nullopt;

    size_t original_count = current_lines_.size();
    std::vector<std::string> lines;
    lines.swap(current_lines_);
    std::optional<std::string> command;
    command.swap(current_command_);
    size_t start_row = block_start_row_;

    while (!lines.empty() && is_blank(lines.back())) {
        lines.pop_back();
    }

    block_start_row_ = 0;
    consecutive_blank_lines_ = 0;

    if (lines.empty()) {
        prettify_log(fmt::format("boundary: all {} pending lines blank, nothing emitted",
                                 original_count));
        return std::nullopt;
    }

    prettify_log(fmt::format("boundary: emit rows={}..{} ({} lines, {} before trim)",
                             start_row, start_row + lines.size(), lines.size(), original_count));

    return make_content_block(std::move(lines), start_row, std::move(command));
}
