#include "claude_code_integration.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>

ClaudeCodeIntegration::ClaudeCodeIntegration(ClaudeCodeConfig config)
    : config_(config) {}

bool ClaudeCodeIntegration::detect_session(const std::map<std::string, std::string>& env_vars,
                                           const std::string& process_name) {
    if (!config_.auto_detect) return false;

    if (env_vars.count("CLAUDE_CODE")) {
        prettify_log("claude_code: session detected via CLAUDE_CODE");
        active_ = true;
        return true;
    }

    if (to_lower(process_name).find("claude") != std::string::npos) {
        prettify_log("claude_code: session detected via process name " + process_name);
        active_ = true;
        return true;
    }

    return false;
}

std::optional<ClaudeCodeEvent> ClaudeCodeIntegration::process_line(const std::string& line,
                                                                   size_t row) {
    if (!active_) return std::nullopt;
    if (to_lower(line).find("ctrl+o") == std::string::npos) return std::nullopt;

    // A redraw of a tracked row keeps its marker; only expanded state is reset.
    auto tracked = row_to_marker_.find(row);
    if (tracked != row_to_marker_.end()) {
        ExpandState& existing = states_[tracked->second];
        if (existing.kind == ExpandState::Expanded) existing = ExpandState::collapsed();
    } else {
        uint64_t id = next_marker_id_++;
        states_[id] = ExpandState::collapsed();
        row_to_marker_[row] = id;
    }

    ClaudeCodeEvent ev;
    ev.kind = ClaudeCodeEvent::ContentCollapsed;
    ev.row_range = {row, row + 1};
    return ev;
}

std::optional<ClaudeCodeEvent> ClaudeCodeIntegration::on_expand(uint64_t marker_id,
                                                                RowRange row_range) {
    auto it = states_.find(marker_id);
    if (it == states_.end()) return std::nullopt;
    it->second = ExpandState::expanded();

    ClaudeCodeEvent ev;
    ev.kind = ClaudeCodeEvent::ContentExpanded;
    ev.row_range = row_range;
    return ev;
}

std::optional<ClaudeCodeEvent> ClaudeCodeIntegration::on_collapse(
    uint64_t marker_id, RowRange row_range, std::optional<RenderedPreview> preview) {
    auto it = states_.find(marker_id);
    if (it == states_.end()) return std::nullopt;
    it->second = ExpandState::collapsed(std::move(preview));

    ClaudeCodeEvent ev;
    ev.kind = ClaudeCodeEvent::ContentCollapsed;
    ev.row_range = row_range;
    return ev;
}

void ClaudeCodeIntegration::mark_prettified(uint64_t marker_id) {
    auto it = states_.find(marker_id);
    if (it != states_.end() && it->second.kind == ExpandState::Expanded) {
        it->second.prettified = true;
    }
}

bool ClaudeCodeIntegration::is_collapsed(size_t row) const {
    auto id = marker_at_row(row);
    if (!id) return false;
    auto* s = state(*id);
    return s && s->kind == ExpandState::Collapsed;
}

std::optional<uint64_t> ClaudeCodeIntegration::marker_at_row(size_t row) const {
    auto it = row_to_marker_.find(row);
    if (it == row_to_marker_.end()) return std::nullopt;
    return it->second;
}

const ExpandState* ClaudeCodeIntegration::state(uint64_t marker_id) const {
    auto it = states_.find(marker_id);
    return it == states_.end() ? nullptr : &it->second;
}

const RenderedPreview* ClaudeCodeIntegration::preview(uint64_t marker_id) const {
    auto* s = state(marker_id);
    if (!s || s->kind != ExpandState::Collapsed || !s->preview) return nullptr;
    return &*s->preview;
}

void ClaudeCodeIntegration::cleanup_stale_entries(size_t min_row) {
    auto end = row_to_marker_.lower_bound(min_row);
    size_t removed = 0;
    for (auto it = row_to_marker_.begin(); it != end; ) {
        states_.erase(it->second);
        it = row_to_marker_.erase(it);
        removed++;
    }
    if (removed > 0) {
        prettify_log(fmt::format("claude_code: dropped {} markers below row {}", removed, min_row));
    }
}

RenderedPreview ClaudeCodeIntegration::generate_preview(const ContentBlock& content,
                                                        const DetectionResult& detection,
                                                        bool show_badges) {
    RenderedPreview p;

    if (show_badges) {
        const std::string& id = detection.format_id;
        if (id == "markdown")       p.format_badge = "MD Markdown";
        else if (id == "json")      p.format_badge = "{} JSON";
        else if (id == "diagrams")  p.format_badge = "Diagram";
        else if (id == "yaml")      p.format_badge = "YAML";
        else if (id == "diff")      p.format_badge = "\xc2\xb1 Diff";
        else                        p.format_badge = id;
    }

    for (const auto& line : content.lines) {
        if (!line.empty() && line[0] == '#') {
            auto pos = line.find_first_not_of('#');
            p.first_header = pos == std::string::npos ? "" : trimmed(line.substr(pos));
            break;
        }
    }

    p.content_summary = fmt::format("{} lines", content.lines.size());
    return p;
}
