#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <utility>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "content_block.hpp"

// Palette handed to renderers. Defaults follow the CLI theme.
struct ThemeColors {
    Rgb foreground{220, 220, 220};
    Rgb key{62, 120, 178};
    Rgb string{152, 195, 121};
    Rgb number{209, 154, 102};
    Rgb literal{198, 120, 221};
    Rgb punctuation{128, 128, 128};
    Rgb added{80, 200, 120};
    Rgb removed{224, 108, 117};
    Rgb hunk{86, 182, 194};
    Rgb header{128, 99, 58};
};

// Environment passed to every render call.
struct RendererConfig {
    size_t terminal_width = DEFAULT_TERMINAL_WIDTH;
    size_t terminal_height = DEFAULT_TERMINAL_HEIGHT;
    std::optional<float> cell_width_px;
    std::optional<float> cell_height_px;
    ThemeColors theme;
};

class ContentDetector {
public:
    virtual ~ContentDetector() = default;

    virtual const std::string& format_id() const = 0;
    virtual const std::string& display_name() const = 0;

    // Full scoring pass. Empty when the detector's own threshold isn't met.
    virtual std::optional<DetectionResult> detect(const ContentBlock& block) const = 0;

    // Cheap pre-filter over the first QUICK_MATCH_LINES lines.
    virtual bool quick_match(const std::vector<std::string>& first_lines) const = 0;
};

class ContentRenderer {
public:
    virtual ~ContentRenderer() = default;

    virtual const std::string& format_id() const = 0;
    virtual const std::string& display_name() const = 0;
    virtual std::string format_badge() const = 0;

    virtual Result<RenderedContent> render(const ContentBlock& block,
                                           const RendererConfig& config) const = 0;
};

// Detectors ordered by priority (highest first) and renderers keyed by
// format id.
class FormatRegistry {
public:
    explicit FormatRegistry(float confidence_threshold = 0.6f);

    void register_detector(int priority, std::unique_ptr<ContentDetector> detector);
    void register_renderer(const std::string& format_id, std::unique_ptr<ContentRenderer> renderer);

    // Best-confidence result among detectors whose quick_match passes,
    // returned only if it meets the registry threshold.
    std::optional<DetectionResult> detect(const ContentBlock& block) const;

    const ContentRenderer* get_renderer(const std::string& format_id) const;

    // (format id, display name) of every registered renderer.
    std::vector<std::pair<std::string, std::string>> registered_formats() const;

    void set_confidence_threshold(float threshold) { confidence_threshold_ = threshold; }
    float confidence_threshold() const { return confidence_threshold_; }
    size_t detector_count() const { return detectors_.size(); }
    size_t renderer_count() const { return renderers_.size(); }

private:
    std::vector<std::pair<int, std::unique_ptr<ContentDetector>>> detectors_;
    std::map<std::string, std::unique_ptr<ContentRenderer>> renderers_;
    float confidence_threshold_;
};
