#pragma once

#include <memory>
#include <string>
#include <prettifier/format_registry.hpp>
#include <prettifier/regex_detector.hpp>

// Unified / git diff. Any definitive rule (git header, ---/+++ pair, hunk
// header) decides on its own.
std::unique_ptr<RegexDetector> make_diff_detector();

// Colors file headers, hunk headers, additions and removals. One rendered
// line per source line.
class DiffRenderer : public ContentRenderer {
public:
    const std::string& format_id() const override { return id_; }
    const std::string& display_name() const override { return name_; }
    std::string format_badge() const override { return "\xc2\xb1 Diff"; }

    Result<RenderedContent> render(const ContentBlock& block,
                                   const RendererConfig& config) const override;

private:
    std::string id_ = "diff";
    std::string name_ = "Diff";
};
