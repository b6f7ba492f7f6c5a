#include "pipeline.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <algorithm>

PrettifierPipeline::PrettifierPipeline(PrettifierConfig config, FormatRegistry registry,
                                       RendererConfig renderer_config)
    : boundary_(config.boundary()),
      registry_(std::move(registry)),
      enabled_(config.enabled),
      respect_alternate_screen_(config.respect_alternate_screen),
      max_active_blocks_(config.max_active_blocks),
      renderer_config_(std::move(renderer_config)),
      cache_(config.cache_max_entries),
      claude_code_(config.claude_code) {
    registry_.set_confidence_threshold(config.confidence_threshold);
}

// ── Output stream ───────────────────────────────────────────

void PrettifierPipeline::process_output(const std::string& line, size_t row) {
    if (!is_enabled()) return;
    handle_emitted(boundary_.push_line(line, row));
}

void PrettifierPipeline::on_command_start(const std::string& command) {
    boundary_.on_command_start(command);
}

void PrettifierPipeline::on_command_end() {
    handle_emitted(boundary_.on_command_end());
}

void PrettifierPipeline::on_alt_screen_change(bool entering) {
    if (!respect_alternate_screen_) return;
    handle_emitted(boundary_.on_alt_screen_change(entering));
}

void PrettifierPipeline::on_process_change() {
    handle_emitted(boundary_.on_process_change());
}

void PrettifierPipeline::check_debounce() {
    handle_emitted(boundary_.check_debounce());
}

void PrettifierPipeline::check_debounce(BoundaryDetector::Clock::time_point now) {
    handle_emitted(boundary_.check_debounce(now));
}

void PrettifierPipeline::flush() {
    handle_emitted(boundary_.flush());
}

void PrettifierPipeline::handle_emitted(std::optional<ContentBlock> block) {
    if (block) handle_block(std::move(*block));
}

void PrettifierPipeline::submit_command_output(
    const std::vector<std::pair<std::string, size_t>>& lines,
    std::optional<std::string> command) {
    boundary_.reset();
    if (lines.empty()) {
        prettify_log("pipeline: submit_command_output with no lines, skipping");
        return;
    }

    std::vector<std::string> text;
    text.reserve(lines.size());
    for (const auto& [line, row] : lines) text.push_back(line);

    ContentBlock block;
    block.lines = std::move(text);
    block.preceding_command = std::move(command);
    block.start_row = lines.front().second;
    block.end_row = lines.back().second + 1;
    handle_block(std::move(block));
}

void PrettifierPipeline::trigger_prettify(const std::string& format_id, ContentBlock content) {
    prettify_log(fmt::format("pipeline: trigger_prettify format={} rows={}..{}",
                             format_id, content.start_row, content.end_row));

    DetectionResult detection;
    detection.format_id = format_id;
    detection.confidence = 1.0f;
    detection.source = DetectionSource::TriggerInvoked;

    DualViewBuffer buffer(std::move(content));
    render_into_buffer(buffer, format_id);
    insert_block(std::move(detection), std::move(buffer));
    evict_excess_blocks();
}

// ── Enable state / blocks ───────────────────────────────────

void PrettifierPipeline::toggle_global() {
    session_override_ = !is_enabled();
}

void PrettifierPipeline::toggle_block(uint64_t block_id) {
    for (auto& block : active_blocks_) {
        if (block.block_id == block_id) {
            block.buffer.toggle_view();
            return;
        }
    }
}

const PrettifiedBlock* PrettifierPipeline::block_at_row(size_t row) const {
    auto it = std::upper_bound(active_blocks_.begin(), active_blocks_.end(), row,
                               [](size_t r, const PrettifiedBlock& b) {
                                   return r < b.content().start_row;
                               });
    if (it == active_blocks_.begin()) return nullptr;
    const PrettifiedBlock& candidate = *std::prev(it);
    if (candidate.content().row_range().contains_row(row)) return &candidate;
    return nullptr;
}

// ── Suppression ─────────────────────────────────────────────

void PrettifierPipeline::suppress_detection(RowRange range) {
    if (std::find(suppressed_ranges_.begin(), suppressed_ranges_.end(), range) !=
        suppressed_ranges_.end()) {
        return;
    }
    suppressed_ranges_.push_back(range);
}

bool PrettifierPipeline::is_suppressed(RowRange range) const {
    return std::any_of(suppressed_ranges_.begin(), suppressed_ranges_.end(),
                       [&range](const RowRange& s) { return s.contains(range); });
}

// ── Claude Code ─────────────────────────────────────────────

bool PrettifierPipeline::detect_claude_code_session(
    const std::map<std::string, std::string>& env_vars, const std::string& process_name) {
    return claude_code_.detect_session(env_vars, process_name);
}

std::optional<ClaudeCodeEvent> PrettifierPipeline::process_claude_code_line(const std::string& line,
                                                                            size_t row) {
    return claude_code_.process_line(line, row);
}

void PrettifierPipeline::on_claude_code_expand(RowRange range) {
    if (!claude_code_.config().auto_render_on_expand) return;

    ContentBlock block = extract_content_block(range);
    auto detection = registry_.detect(block);
    if (!detection) {
        prettify_log(fmt::format("pipeline: expand rows={}..{} matched no format",
                                 range.start, range.end));
        return;
    }
    const ClaudeCodeConfig& cc = claude_code_.config();
    if ((detection->format_id == "diff" && !cc.render_diffs) ||
        (detection->format_id == "markdown" && !cc.render_markdown)) {
        prettify_log("pipeline: expand skipped, rendering disabled for format=" + detection->format_id);
        return;
    }
    detection->source = DetectionSource::ExpansionReplay;

    DualViewBuffer buffer(std::move(block));
    if (!render_into_buffer(buffer, detection->format_id)) return;

    uint64_t id = insert_block(std::move(*detection), std::move(buffer));
    prettify_log(fmt::format("pipeline: expand rows={}..{} stored block_id={}",
                             range.start, range.end, id));

    if (auto marker = claude_code_.marker_at_row(range.start)) {
        claude_code_.mark_prettified(*marker);
    }
    evict_excess_blocks();
}

// Lines of every overlapping active block that fall inside range.
ContentBlock PrettifierPipeline::extract_content_block(RowRange range) const {
    std::vector<std::string> lines;
    for (const auto& block : active_blocks_) {
        const ContentBlock& c = block.content();
        if (!c.row_range().overlaps(range)) continue;

        size_t from = range.start > c.start_row ? range.start - c.start_row : 0;
        size_t to = std::min(range.end - c.start_row, c.lines.size());
        for (size_t i = from; i < to; i++) lines.push_back(c.lines[i]);
    }

    ContentBlock out;
    out.lines = std::move(lines);
    out.start_row = range.start;
    out.end_row = range.end;
    return out;
}

// ── Rendering ───────────────────────────────────────────────

void PrettifierPipeline::update_cell_dims(float width_px, float height_px) {
    renderer_config_.cell_width_px = width_px;
    renderer_config_.cell_height_px = height_px;
}

void PrettifierPipeline::re_render_if_needed() {
    size_t width = renderer_config_.terminal_width;
    for (auto& block : active_blocks_) {
        if (!block.buffer.needs_render(width)) continue;
        render_into_buffer(block.buffer, block.detection.format_id);
    }
}

bool PrettifierPipeline::render_into_buffer(DualViewBuffer& buffer, const std::string& format_id) {
    size_t width = renderer_config_.terminal_width;
    uint64_t fp = buffer.fingerprint();

    if (const RenderedContent* cached = cache_.get(fp, width, format_id)) {
        prettify_log(fmt::format("pipeline: cache hit fp={:016x} width={} ({} lines)",
                                 fp, width, cached->lines.size()));
        buffer.set_rendered(*cached, width);
        return true;
    }

    const ContentRenderer* renderer = registry_.get_renderer(format_id);
    if (!renderer) {
        prettify_log("pipeline: no renderer for format=" + format_id);
        return false;
    }

    auto result = renderer->render(buffer.source(), renderer_config_);
    if (result.is_err()) {
        prettify_log(fmt::format("pipeline: render failed format={}: {}", format_id, result.error));
        return false;
    }

    prettify_log(fmt::format("pipeline: rendered format={} {} -> {} lines",
                             format_id, buffer.source().lines.size(), result.value.lines.size()));
    cache_.put(fp, width, format_id, result.value);
    buffer.set_rendered(std::move(result.value), width);
    return true;
}

// ── Consistency ─────────────────────────────────────────────

void PrettifierPipeline::handle_block(ContentBlock content) {
    RowRange range = content.row_range();
    if (is_suppressed(range)) {
        prettify_log(fmt::format("pipeline: rows={}..{} suppressed, skipping", range.start, range.end));
        return;
    }

    auto detection = registry_.detect(content);

    if (!detection) {
        uint64_t fp = content_fingerprint(content.lines);
        auto stale = std::find_if(active_blocks_.begin(), active_blocks_.end(),
                                  [&range, fp](const PrettifiedBlock& b) {
                                      return b.content().row_range().overlaps(range) &&
                                             b.buffer.fingerprint() != fp;
                                  });
        if (stale != active_blocks_.end()) {
            prettify_log(fmt::format("pipeline: removing stale block id={} rows={}..{}",
                                     stale->block_id, stale->content().start_row,
                                     stale->content().end_row));
            active_blocks_.erase(stale);
        }
        return;
    }

    DualViewBuffer buffer(std::move(content));

    uint64_t fp = buffer.fingerprint();
    auto overlaps = [&range](const PrettifiedBlock& b) {
        return b.content().row_range().overlaps(range);
    };
    bool unchanged = std::any_of(active_blocks_.begin(), active_blocks_.end(),
                                 [&overlaps, fp](const PrettifiedBlock& b) {
                                     return overlaps(b) && b.buffer.fingerprint() == fp;
                                 });
    if (unchanged) {
        return;
    }

    prettify_log(fmt::format("pipeline: detected format={} confidence={:.2} rows={}..{}",
                             detection->format_id, detection->confidence, range.start, range.end));

    if (!render_into_buffer(buffer, detection->format_id)) {
        return;
    }

    // Every overlapping block is superseded, not just the first.
    for (auto it = active_blocks_.begin(); it != active_blocks_.end(); ) {
        if (overlaps(*it)) {
            prettify_log(fmt::format("pipeline: replacing block id={}", it->block_id));
            it = active_blocks_.erase(it);
        } else {
            ++it;
        }
    }

    uint64_t id = insert_block(std::move(*detection), std::move(buffer));
    prettify_log(fmt::format("pipeline: stored block_id={}", id));
    evict_excess_blocks();
}

uint64_t PrettifierPipeline::insert_block(DetectionResult detection, DualViewBuffer buffer) {
    uint64_t id = next_block_id_++;
    size_t start = buffer.source().start_row;
    auto pos = std::upper_bound(active_blocks_.begin(), active_blocks_.end(), start,
                                [](size_t s, const PrettifiedBlock& b) {
                                    return s < b.content().start_row;
                                });
    active_blocks_.insert(pos, PrettifiedBlock{id, std::move(detection), std::move(buffer)});
    return id;
}

void PrettifierPipeline::evict_excess_blocks() {
    size_t evicted = 0;
    while (active_blocks_.size() > max_active_blocks_) {
        active_blocks_.pop_front();
        evicted++;
    }
    if (evicted == 0 || active_blocks_.empty()) return;

    size_t min_row = active_blocks_.front().content().start_row;
    size_t before = suppressed_ranges_.size();
    suppressed_ranges_.erase(
        std::remove_if(suppressed_ranges_.begin(), suppressed_ranges_.end(),
                       [min_row](const RowRange& r) { return r.end <= min_row; }),
        suppressed_ranges_.end());
    claude_code_.cleanup_stale_entries(min_row);

    prettify_log(fmt::format("pipeline: evicted {} blocks, dropped {} suppression ranges below row {}",
                             evicted, before - suppressed_ranges_.size(), min_row));
}
