#include "content_block.hpp"
#include <algorithm>

std::vector<std::string> ContentBlock::first_lines(size_t n) const {
    size_t count = std::min(n, lines.size());
    return std::vector<std::string>(lines.begin(), lines.begin() + count);
}

std::vector<std::string> ContentBlock::last_lines(size_t n) const {
    size_t count = std::min(n, lines.size());
    return std::vector<std::string>(lines.end() - count, lines.end());
}

std::string ContentBlock::full_text() const {
    std::string out;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

ContentBlock make_content_block(std::vector<std::string> lines, size_t start_row,
                                std::optional<std::string> command) {
    ContentBlock block;
    block.start_row = start_row;
    block.end_row = start_row + lines.size();
    block.lines = std::move(lines);
    block.preceding_command = std::move(command);
    return block;
}

const char* detection_source_name(DetectionSource source) {
    switch (source) {
        case DetectionSource::HeuristicScan:   return "heuristic";
        case DetectionSource::TriggerInvoked:  return "trigger";
        case DetectionSource::ExpansionReplay: return "expansion";
    }
    return "unknown";
}

std::string StyledLine::text() const {
    std::string out;
    for (const auto& seg : segments) out += seg.text;
    return out;
}
