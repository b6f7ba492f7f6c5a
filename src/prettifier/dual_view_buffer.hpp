#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "content_block.hpp"

// 64-bit FNV-1a over the line count, then each line's length and bytes.
// Row range is not part of the hash so identical content shares cache entries.
uint64_t content_fingerprint(const std::vector<std::string>& lines);

enum class ViewMode {
    Rendered,
    Source,
};

const char* view_mode_name(ViewMode mode);

// One content block plus at most one rendering of it, tagged with the
// width it was produced for.
class DualViewBuffer {
public:
    explicit DualViewBuffer(ContentBlock source);

    const ContentBlock& source() const { return source_; }
    uint64_t fingerprint() const { return fingerprint_; }
    ViewMode view_mode() const { return view_mode_; }
    void toggle_view();

    void set_rendered(RenderedContent content, size_t width);
    const std::optional<RenderedContent>& rendered() const { return rendered_; }
    std::optional<size_t> rendered_width() const { return rendered_width_; }
    bool has_rendered() const { return rendered_.has_value(); }

    // True when there is no rendering for this exact width.
    bool needs_render(size_t width) const;

    // Rendered lines in Rendered mode when available, else source lines.
    std::vector<StyledLine> display_lines() const;
    size_t display_line_count() const;

    std::string source_text() const { return source_.full_text(); }
    std::optional<std::string> rendered_text() const;

private:
    ContentBlock source_;
    uint64_t fingerprint_;
    std::optional<RenderedContent> rendered_;
    std::optional<size_t> rendered_width_;
    ViewMode view_mode_ = ViewMode::Rendered;
};
