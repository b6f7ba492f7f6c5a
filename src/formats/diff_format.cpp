#include "diff_format.hpp"

std::unique_ptr<RegexDetector> make_diff_detector() {
    return RegexDetectorBuilder("diff", "Diff")
        .rule(DetectionRule("diff_git_header", R"(^diff --git\s+)", 0.9f,
                            RuleScope::first_lines(5), RuleStrength::Definitive))
        .rule(DetectionRule("diff_unified_header", R"((^|\n)---\s+\S+.*\n\+\+\+\s+\S+)", 0.9f,
                            RuleScope::full_block(), RuleStrength::Definitive))
        .rule(DetectionRule("diff_hunk_header", R"(^@@\s+-\d+,?\d*\s+\+\d+,?\d*\s+@@)", 0.8f,
                            RuleScope::any_line(), RuleStrength::Definitive))
        .rule(DetectionRule("diff_add_line", R"(^\+[^+])", 0.1f,
                            RuleScope::any_line(), RuleStrength::Supporting))
        .rule(DetectionRule("diff_remove_line", R"(^-[^-])", 0.1f,
                            RuleScope::any_line(), RuleStrength::Supporting))
        .rule(DetectionRule("diff_git_context", R"(^git\s+(diff|log|show))", 0.3f,
                            RuleScope::preceding_command(), RuleStrength::Supporting))
        .confidence_threshold(0.6f)
        .min_matching_rules(1)
        .definitive_rule_shortcircuit(true)
        .build();
}

namespace {

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

StyledLine style_diff_line(const std::string& line, const ThemeColors& theme) {
    StyledLine out;
    if (starts_with(line, "diff --git") || starts_with(line, "index ") ||
        starts_with(line, "--- ") || starts_with(line, "+++ ") ||
        starts_with(line, "new file mode") || starts_with(line, "deleted file mode")) {
        out.segments.push_back(StyledSegment::colored(line, theme.header, true));
    } else if (starts_with(line, "@@")) {
        // "@@ -a,b +c,d @@ context": color the range, leave the context plain.
        size_t close = line.find("@@", 2);
        if (close != std::string::npos) {
            out.segments.push_back(StyledSegment::colored(line.substr(0, close + 2), theme.hunk));
            if (close + 2 < line.size()) {
                out.segments.push_back(StyledSegment::plain(line.substr(close + 2)));
            }
        } else {
            out.segments.push_back(StyledSegment::colored(line, theme.hunk));
        }
    } else if (!line.empty() && line[0] == '+') {
        out.segments.push_back(StyledSegment::colored(line, theme.added));
    } else if (!line.empty() && line[0] == '-') {
        out.segments.push_back(StyledSegment::colored(line, theme.removed));
    } else {
        out.segments.push_back(StyledSegment::plain(line));
    }
    return out;
}

} // namespace

Result<RenderedContent> DiffRenderer::render(const ContentBlock& block,
                                             const RendererConfig& config) const {
    if (block.lines.empty()) {
        return Result<RenderedContent>::Err("empty diff");
    }

    RenderedContent out;
    out.format_badge = format_badge();
    out.lines.reserve(block.lines.size());
    for (size_t i = 0; i < block.lines.size(); i++) {
        out.lines.push_back(style_diff_line(block.lines[i], config.theme));
        out.line_mapping.push_back({i, i});
    }
    return Result<RenderedContent>::Ok(std::move(out));
}
