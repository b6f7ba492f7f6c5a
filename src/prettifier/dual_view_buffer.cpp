#include "dual_view_buffer.hpp"

namespace {

constexpr uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME  = 0x100000001b3ULL;

void fnv_mix_u64(uint64_t& h, uint64_t v) {
    for (int i = 0; i < 8; i++) {
        h ^= static_cast<uint8_t>(v >> (i * 8));
        h *= FNV_PRIME;
    }
}

} // namespace

uint64_t content_fingerprint(const std::vector<std::string>& lines) {
    uint64_t h = FNV_OFFSET;
    fnv_mix_u64(h, lines.size());
    for (const auto& line : lines) {
        fnv_mix_u64(h, line.size());
        for (unsigned char c : line) {
            h ^= c;
            h *= FNV_PRIME;
        }
    }
    return h;
}

const char* view_mode_name(ViewMode mode) {
    return mode == ViewMode::Rendered ? "rendered" : "source";
}

DualViewBuffer::DualViewBuffer(ContentBlock source)
    : source_(std::move(source)),
      fingerprint_(content_fingerprint(source_.lines)) {}

void DualViewBuffer::toggle_view() {
    view_mode_ = view_mode_ == ViewMode::Rendered ? ViewMode::Source : ViewMode::Rendered;
}

void DualViewBuffer::set_rendered(RenderedContent content, size_t width) {
    rendered_ = std::move(content);
    rendered_width_ = width;
}

bool DualViewBuffer::needs_render(size_t width) const {
    return !rendered_ || rendered_width_ != width;
}

std::vector<StyledLine> DualViewBuffer::display_lines() const {
    if (view_mode_ == ViewMode::Rendered && rendered_) {
        return rendered_->lines;
    }
    std::vector<StyledLine> out;
    out.reserve(source_.lines.size());
    for (const auto& line : source_.lines) {
        out.push_back(StyledLine::plain(line));
    }
    return out;
}

size_t DualViewBuffer::display_line_count() const {
    if (view_mode_ == ViewMode::Rendered && rendered_) {
        return rendered_->lines.size();
    }
    return source_.lines.size();
}

std::optional<std::string> DualViewBuffer::rendered_text() const {
    if (!rendered_) return std::nullopt;
    std::string out;
    for (size_t i = 0; i < rendered_->lines.size(); i++) {
        if (i > 0) out += '\n';
        out += rendered_->lines[i].text();
    }
    return out;
}
