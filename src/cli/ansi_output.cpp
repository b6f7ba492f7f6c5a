#include "ansi_output.hpp"
#include "theme.hpp"
#include <fmt/format.h>

namespace AnsiOutput {

std::string sgr_for(const StyledSegment& segment) {
    std::string params;
    auto add = [&params](const std::string& p) {
        if (!params.empty()) params += ';';
        params += p;
    };

    if (segment.bold) add("1");
    if (segment.italic) add("3");
    if (segment.underline) add("4");
    if (segment.strikethrough) add("9");
    if (segment.fg) add(fmt::format("38;2;{};{};{}", segment.fg->r, segment.fg->g, segment.fg->b));
    if (segment.bg) add(fmt::format("48;2;{};{};{}", segment.bg->r, segment.bg->g, segment.bg->b));

    if (params.empty()) return "";
    return "\033[" + params + "m";
}

std::string render_line(const StyledLine& line) {
    std::string out;
    for (const auto& seg : line.segments) {
        std::string sgr = sgr_for(seg);
        if (sgr.empty()) {
            out += seg.text;
        } else {
            out += sgr + seg.text + theme::color::RESET;
        }
    }
    return out;
}

std::string render_lines(const std::vector<StyledLine>& lines) {
    std::string out;
    for (const auto& line : lines) {
        out += render_line(line);
        out += '\n';
    }
    return out;
}

} // namespace AnsiOutput
