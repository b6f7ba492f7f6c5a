#pragma once

#include <memory>
#include <string>
#include <prettifier/format_registry.hpp>
#include <prettifier/regex_detector.hpp>

// Rules: opening brace/bracket near the top, "key": lines, closing brace
// near the bottom, plus curl/jq style preceding commands.
std::unique_ptr<RegexDetector> make_json_detector();

// Re-indents and colors JSON. Surrounding ``` / ~~~ fences are stripped
// before parsing; anything that fails to parse is a render error.
class JsonRenderer : public ContentRenderer {
public:
    const std::string& format_id() const override { return id_; }
    const std::string& display_name() const override { return name_; }
    std::string format_badge() const override { return "{} JSON"; }

    Result<RenderedContent> render(const ContentBlock& block,
                                   const RendererConfig& config) const override;

private:
    std::string id_ = "json";
    std::string name_ = "JSON";
};
