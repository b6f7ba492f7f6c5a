#include "builtin_formats.hpp"
#include "json_format.hpp"
#include "diff_format.hpp"
#include <core/log.hpp>

void register_builtin_formats(FormatRegistry& registry, const BuiltinFormatsConfig& formats) {
    if (formats.json.enabled) {
        registry.register_detector(formats.json.priority, make_json_detector());
        registry.register_renderer("json", std::make_unique<JsonRenderer>());
    }
    if (formats.diff.enabled) {
        registry.register_detector(formats.diff.priority, make_diff_detector());
        registry.register_renderer("diff", std::make_unique<DiffRenderer>());
    }
    prettify_log(fmt::format("formats: {} detectors, {} renderers registered",
                             registry.detector_count(), registry.renderer_count()));
}
