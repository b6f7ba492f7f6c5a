#pragma once

#include <string>
#include <map>
#include <optional>
#include <cstdint>
#include <core/types.hpp>
#include "content_block.hpp"

// Summary shown on a collapsed block.
struct RenderedPreview {
    std::string format_badge;
    std::optional<std::string> first_header;
    std::string content_summary;            // "N lines"
};

struct ExpandState {
    enum Kind { Collapsed, Expanded };

    Kind kind = Collapsed;
    std::optional<RenderedPreview> preview;     // Collapsed only
    bool prettified = false;                    // Expanded only

    static ExpandState collapsed(std::optional<RenderedPreview> p = std::nullopt) {
        ExpandState s;
        s.kind = Collapsed;
        s.preview = std::move(p);
        return s;
    }

    static ExpandState expanded() {
        ExpandState s;
        s.kind = Expanded;
        return s;
    }
};

struct ClaudeCodeEvent {
    enum Kind { ContentExpanded, ContentCollapsed, FormatDetected };

    Kind kind = ContentCollapsed;
    RowRange row_range;
    std::string format;                         // FormatDetected only

    bool operator==(const ClaudeCodeEvent& o) const {
        return kind == o.kind && row_range == o.row_range && format == o.format;
    }
};

// Recognizes a Claude Code session and tracks its Ctrl+O expand/collapse
// markers by row.
class ClaudeCodeIntegration {
public:
    explicit ClaudeCodeIntegration(ClaudeCodeConfig config = ClaudeCodeConfig{});

    // CLAUDE_CODE in the environment, or "claude" in the process name.
    bool detect_session(const std::map<std::string, std::string>& env_vars,
                        const std::string& process_name);
    void mark_active() { active_ = true; }
    bool is_active() const { return active_; }

    const ClaudeCodeConfig& config() const { return config_; }

    std::optional<ClaudeCodeEvent> process_line(const std::string& line, size_t row);

    std::optional<ClaudeCodeEvent> on_expand(uint64_t marker_id, RowRange row_range);
    std::optional<ClaudeCodeEvent> on_collapse(uint64_t marker_id, RowRange row_range,
                                               std::optional<RenderedPreview> preview);
    void mark_prettified(uint64_t marker_id);

    bool is_collapsed(size_t row) const;
    std::optional<uint64_t> marker_at_row(size_t row) const;
    const ExpandState* state(uint64_t marker_id) const;
    const RenderedPreview* preview(uint64_t marker_id) const;
    size_t tracked_rows() const { return row_to_marker_.size(); }
    size_t tracked_states() const { return states_.size(); }

    // Forget markers on rows below min_row.
    void cleanup_stale_entries(size_t min_row);

    static RenderedPreview generate_preview(const ContentBlock& content,
                                            const DetectionResult& detection,
                                            bool show_badges);

private:
    ClaudeCodeConfig config_;
    bool active_ = false;
    std::map<uint64_t, ExpandState> states_;
    std::map<size_t, uint64_t> row_to_marker_;
    uint64_t next_marker_id_ = 0;
};
