#pragma once

#include <prettifier/format_registry.hpp>
#include <prettifier/content_block.hpp>
#include <memory>
#include <string>
#include <vector>
#include <utility>

// Matches every block (or only blocks containing `needle`) at a fixed
// confidence.
class StubDetector : public ContentDetector {
public:
    StubDetector(std::string id, float confidence, std::string needle = "",
                 bool quick = true)
        : id_(std::move(id)), confidence_(confidence), needle_(std::move(needle)),
          quick_(quick) {}

    const std::string& format_id() const override { return id_; }
    const std::string& display_name() const override { return id_; }

    std::optional<DetectionResult> detect(const ContentBlock& block) const override {
        if (!needle_.empty() && block.full_text().find(needle_) == std::string::npos) {
            return std::nullopt;
        }
        DetectionResult r;
        r.format_id = id_;
        r.confidence = confidence_;
        r.matched_rules = {"stub"};
        return r;
    }

    bool quick_match(const std::vector<std::string>&) const override { return quick_; }

private:
    std::string id_;
    float confidence_;
    std::string needle_;
    bool quick_;
};

// Counts render calls. Fails on any block containing `fail_on`.
class CountingRenderer : public ContentRenderer {
public:
    CountingRenderer(std::string id, std::shared_ptr<int> calls, std::string fail_on = "")
        : id_(std::move(id)), calls_(std::move(calls)), fail_on_(std::move(fail_on)) {}

    const std::string& format_id() const override { return id_; }
    const std::string& display_name() const override { return id_; }
    std::string format_badge() const override { return "[" + id_ + "]"; }

    Result<RenderedContent> render(const ContentBlock& block,
                                   const RendererConfig& config) const override {
        (*calls_)++;
        if (!fail_on_.empty() && block.full_text().find(fail_on_) != std::string::npos) {
            return Result<RenderedContent>::Err("stub failure");
        }
        RenderedContent out;
        out.format_badge = format_badge();
        for (const auto& line : block.lines) {
            out.lines.push_back(StyledLine::plain(">" + line.substr(0, config.terminal_width)));
        }
        return Result<RenderedContent>::Ok(std::move(out));
    }

private:
    std::string id_;
    std::shared_ptr<int> calls_;
    std::string fail_on_;
};

// (text, row) pairs for consecutive rows starting at first_row.
inline std::vector<std::pair<std::string, size_t>> rows_from(const std::vector<std::string>& lines,
                                                             size_t first_row) {
    std::vector<std::pair<std::string, size_t>> out;
    for (size_t i = 0; i < lines.size(); i++) out.emplace_back(lines[i], first_row + i);
    return out;
}
