#pragma once

#include <string>
#include <vector>
#include <prettifier/content_block.hpp>

// Turns rendered StyledLines into ANSI truecolor text for a plain terminal.
namespace AnsiOutput {

// SGR prefix for a segment's style ("" for an unstyled segment).
std::string sgr_for(const StyledSegment& segment);

// One styled line, reset at the end. No trailing newline.
std::string render_line(const StyledLine& line);

std::string render_lines(const std::vector<StyledLine>& lines);

} // namespace AnsiOutput
