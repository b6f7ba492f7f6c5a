#include "format_registry.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <algorithm>

FormatRegistry::FormatRegistry(float confidence_threshold)
    : confidence_threshold_(confidence_threshold) {}

void FormatRegistry::register_detector(int priority, std::unique_ptr<ContentDetector> detector) {
    // Equal priorities keep registration order.
    auto pos = std::find_if(detectors_.begin(), detectors_.end(),
                            [priority](const auto& d) { return d.first < priority; });
    detectors_.emplace(pos, priority, std::move(detector));
}

void FormatRegistry::register_renderer(const std::string& format_id,
                                       std::unique_ptr<ContentRenderer> renderer) {
    renderers_[format_id] = std::move(renderer);
}

std::optional<DetectionResult> FormatRegistry::detect(const ContentBlock& block) const {
    auto first_lines = block.first_lines(QUICK_MATCH_LINES);
    std::optional<DetectionResult> best;

    prettify_log(fmt::format("registry: running {} detectors on rows={}..{} first_line=\"{}\"",
                             detectors_.size(), block.start_row, block.end_row,
                             block.lines.empty() ? "" : preview(block.lines.front(), LOG_PREVIEW_CHARS)));

    for (const auto& [priority, detector] : detectors_) {
        if (!detector->quick_match(first_lines)) continue;

        auto result = detector->detect(block);
        if (!result) continue;

        prettify_log(fmt::format("registry: {} (priority={}) confidence={:.3}",
                                 detector->format_id(), priority, result->confidence));
        if (!best || result->confidence > best->confidence) {
            best = std::move(result);
        }
    }

    if (best && best->confidence >= confidence_threshold_) {
        prettify_log(fmt::format("registry: winner format={} confidence={:.3} (threshold={:.3})",
                                 best->format_id, best->confidence, confidence_threshold_));
        return best;
    }

    prettify_log(fmt::format("registry: no format met threshold {:.3}", confidence_threshold_));
    return std::nullopt;
}

const ContentRenderer* FormatRegistry::get_renderer(const std::string& format_id) const {
    auto it = renderers_.find(format_id);
    if (it == renderers_.end()) return nullptr;
    return it->second.get();
}

std::vector<std::pair<std::string, std::string>> FormatRegistry::registered_formats() const {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& [id, renderer] : renderers_) {
        out.emplace_back(id, renderer->display_name());
    }
    return out;
}
