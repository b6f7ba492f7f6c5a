#include "json_format.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <nlohmann/json.hpp>

using ordered_json = nlohmann::ordered_json;

std::unique_ptr<RegexDetector> make_json_detector() {
    return RegexDetectorBuilder("json", "JSON")
        .rule(DetectionRule("json_open_brace", R"(^\s*\{\s*$)", 0.4f,
                            RuleScope::first_lines(3), RuleStrength::Strong))
        .rule(DetectionRule("json_open_bracket", R"(^\s*\[\s*$)", 0.35f,
                            RuleScope::first_lines(3), RuleStrength::Strong))
        .rule(DetectionRule("json_key_value", R"(^\s*"[^"]+"\s*:\s*)", 0.3f,
                            RuleScope::any_line(), RuleStrength::Strong))
        .rule(DetectionRule("json_close_brace", R"(^\s*\}\s*,?\s*$)", 0.2f,
                            RuleScope::last_lines(3), RuleStrength::Supporting))
        .rule(DetectionRule("json_curl_context", R"(^(curl|http|httpie|wget)\s+)", 0.3f,
                            RuleScope::preceding_command(), RuleStrength::Supporting))
        .rule(DetectionRule("json_jq_context", R"(^(jq|gron|fx)\s+)", 0.3f,
                            RuleScope::preceding_command(), RuleStrength::Supporting))
        .confidence_threshold(0.6f)
        .min_matching_rules(1)
        .definitive_rule_shortcircuit(false)
        .build();
}

namespace {

bool is_fence(const std::string& line) {
    std::string t = trimmed(line);
    return t.rfind("```", 0) == 0 || t.rfind("~~~", 0) == 0;
}

class JsonPrinter {
public:
    explicit JsonPrinter(const ThemeColors& theme) : theme_(theme) {}

    std::vector<StyledLine> print(const ordered_json& root) {
        value(root, 0);
        finish_line();
        return std::move(lines_);
    }

private:
    const ThemeColors& theme_;
    std::vector<StyledLine> lines_;
    StyledLine current_;

    void emit(std::string text, Rgb color, bool bold = false) {
        current_.segments.push_back(StyledSegment::colored(std::move(text), color, bold));
    }

    void punct(const std::string& text) { emit(text, theme_.punctuation); }

    void indent(int depth) {
        if (depth > 0) current_.segments.push_back(
            StyledSegment::plain(std::string(static_cast<size_t>(depth * JSON_INDENT), ' ')));
    }

    void finish_line() {
        if (!current_.segments.empty()) lines_.push_back(std::move(current_));
        current_ = StyledLine{};
    }

    void scalar(const ordered_json& v) {
        if (v.is_string()) {
            emit(v.dump(), theme_.string);
        } else if (v.is_number()) {
            emit(v.dump(), theme_.number);
        } else {
            emit(v.dump(), theme_.literal);     // true / false / null
        }
    }

    void value(const ordered_json& v, int depth) {
        if (v.is_object()) {
            if (v.empty()) { punct("{}"); return; }
            punct("{");
            finish_line();
            size_t i = 0;
            for (auto it = v.begin(); it != v.end(); ++it, ++i) {
                indent(depth + 1);
                emit(ordered_json(it.key()).dump(), theme_.key, true);
                punct(": ");
                value(it.value(), depth + 1);
                if (i + 1 < v.size()) punct(",");
                finish_line();
            }
            indent(depth);
            punct("}");
        } else if (v.is_array()) {
            if (v.empty()) { punct("[]"); return; }
            punct("[");
            finish_line();
            for (size_t i = 0; i < v.size(); i++) {
                indent(depth + 1);
                value(v[i], depth + 1);
                if (i + 1 < v.size()) punct(",");
                finish_line();
            }
            indent(depth);
            punct("]");
        } else {
            scalar(v);
        }
    }
};

} // namespace

Result<RenderedContent> JsonRenderer::render(const ContentBlock& block,
                                             const RendererConfig& config) const {
    size_t begin = 0;
    size_t end = block.lines.size();
    if (end - begin >= 2 && is_fence(block.lines[begin]) && is_fence(block.lines[end - 1])) {
        begin++;
        end--;
    }

    std::string text;
    for (size_t i = begin; i < end; i++) {
        text += block.lines[i];
        text += '\n';
    }
    if (is_blank(text)) {
        return Result<RenderedContent>::Err("empty JSON document");
    }

    ordered_json doc;
    try {
        doc = ordered_json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<RenderedContent>::Err(std::string("invalid JSON: ") + e.what());
    }

    RenderedContent out;
    out.lines = JsonPrinter(config.theme).print(doc);
    out.format_badge = format_badge();
    return Result<RenderedContent>::Ok(std::move(out));
}
