#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>
#include <cstddef>

// Half-open range of logical terminal rows: [start, end).
struct RowRange {
    size_t start = 0;
    size_t end = 0;

    size_t size() const { return end > start ? end - start : 0; }
    bool empty() const { return end <= start; }

    // Partial overlaps count. Touching ranges ([0,2) and [2,4)) do not overlap.
    bool overlaps(const RowRange& other) const {
        return start < other.end && end > other.start;
    }

    bool contains(const RowRange& inner) const {
        return start <= inner.start && end >= inner.end;
    }

    bool contains_row(size_t row) const { return start <= row && row < end; }

    bool operator==(const RowRange& o) const { return start == o.start && end == o.end; }
    bool operator!=(const RowRange& o) const { return !(*this == o); }
};

// A contiguous span of output lines treated as one formatting unit.
// Superseded rather than mutated when the content at its rows changes.
struct ContentBlock {
    std::vector<std::string> lines;
    std::optional<std::string> preceding_command;
    size_t start_row = 0;
    size_t end_row = 0;                              // exclusive
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    RowRange row_range() const { return {start_row, end_row}; }
    size_t line_count() const { return lines.size(); }

    std::vector<std::string> first_lines(size_t n) const;
    std::vector<std::string> last_lines(size_t n) const;

    // Lines joined with '\n'.
    std::string full_text() const;
};

// Build a block from literal lines starting at start_row.
ContentBlock make_content_block(std::vector<std::string> lines, size_t start_row,
                                std::optional<std::string> command = std::nullopt);

enum class DetectionSource {
    HeuristicScan,      // regular detection pass
    TriggerInvoked,     // explicit bypass, confidence fixed at 1.0
    ExpansionReplay,    // re-detection after an expand event
};

struct DetectionResult {
    std::string format_id;
    float confidence = 0.0f;
    std::vector<std::string> matched_rules;
    DetectionSource source = DetectionSource::HeuristicScan;
};

const char* detection_source_name(DetectionSource source);

// ── Rendered output ─────────────────────────────────────────

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Rgb& o) const { return !(*this == o); }
};

struct StyledSegment {
    std::string text;
    std::optional<Rgb> fg;
    std::optional<Rgb> bg;
    bool bold = false;
    bool italic = false;
    bool underline = false;
    bool strikethrough = false;

    static StyledSegment plain(std::string text) {
        StyledSegment s;
        s.text = std::move(text);
        return s;
    }

    static StyledSegment colored(std::string text, Rgb color, bool bold = false) {
        StyledSegment s;
        s.text = std::move(text);
        s.fg = color;
        s.bold = bold;
        return s;
    }
};

struct StyledLine {
    std::vector<StyledSegment> segments;

    static StyledLine plain(const std::string& text) {
        StyledLine line;
        line.segments.push_back(StyledSegment::plain(text));
        return line;
    }

    // Concatenated segment text.
    std::string text() const;
};

// Which source line a rendered line came from (none for decoration lines).
struct SourceLineMapping {
    size_t rendered_line = 0;
    std::optional<size_t> source_line;
};

struct RenderedContent {
    std::vector<StyledLine> lines;
    std::vector<SourceLineMapping> line_mapping;
    std::string format_badge;
};
