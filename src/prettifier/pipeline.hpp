#pragma once

#include <string>
#include <vector>
#include <deque>
#include <map>
#include <optional>
#include <utility>
#include <cstdint>
#include <core/types.hpp>
#include "content_block.hpp"
#include "boundary_detector.hpp"
#include "dual_view_buffer.hpp"
#include "render_cache.hpp"
#include "format_registry.hpp"
#include "claude_code_integration.hpp"

struct PrettifiedBlock {
    uint64_t block_id;
    DetectionResult detection;
    DualViewBuffer buffer;

    const ContentBlock& content() const { return buffer.source(); }
    ViewMode view_mode() const { return buffer.view_mode(); }
    bool has_rendered() const { return buffer.has_rendered(); }
};

// Boundary detection -> format detection -> cached rendering.
//
// The active block list stays sorted by start_row. Blocks detected through
// process_output / submit_command_output replace any overlapping block
// whose content differs and are dropped when the content is unchanged.
// Not thread-safe; one pipeline per terminal session.
class PrettifierPipeline {
public:
    PrettifierPipeline(PrettifierConfig config, FormatRegistry registry,
                       RendererConfig renderer_config = RendererConfig{});

    // ── Output stream ───────────────────────────────────────

    void process_output(const std::string& line, size_t row);
    void on_command_start(const std::string& command);
    void on_command_end();
    void on_alt_screen_change(bool entering);
    void on_process_change();
    void check_debounce();
    void check_debounce(BoundaryDetector::Clock::time_point now);
    void flush();

    // Pre-assembled (text, row) lines, e.g. read back from scrollback.
    void submit_command_output(const std::vector<std::pair<std::string, size_t>>& lines,
                               std::optional<std::string> command = std::nullopt);

    // Render under format_id with no detection and no dedup.
    void trigger_prettify(const std::string& format_id, ContentBlock content);

    void reset_boundary() { boundary_.reset(); }
    void clear_blocks() { active_blocks_.clear(); }

    // ── Enable state ────────────────────────────────────────

    void toggle_global();
    bool is_enabled() const { return session_override_.value_or(enabled_); }

    // ── Blocks ──────────────────────────────────────────────

    void toggle_block(uint64_t block_id);
    const PrettifiedBlock* block_at_row(size_t row) const;
    const std::deque<PrettifiedBlock>& active_blocks() const { return active_blocks_; }

    // ── Suppression ─────────────────────────────────────────

    void suppress_detection(RowRange range);
    bool is_suppressed(RowRange range) const;
    const std::vector<RowRange>& suppressed_ranges() const { return suppressed_ranges_; }

    // ── Claude Code ─────────────────────────────────────────

    bool detect_claude_code_session(const std::map<std::string, std::string>& env_vars,
                                    const std::string& process_name);
    void mark_claude_code_active() { claude_code_.mark_active(); }
    std::optional<ClaudeCodeEvent> process_claude_code_line(const std::string& line, size_t row);
    void on_claude_code_expand(RowRange range);
    const ClaudeCodeIntegration& claude_code() const { return claude_code_; }
    ClaudeCodeIntegration& claude_code() { return claude_code_; }

    // ── Rendering environment ───────────────────────────────

    void update_renderer_config(RendererConfig config) { renderer_config_ = std::move(config); }
    void update_cell_dims(float width_px, float height_px);
    const RendererConfig& renderer_config() const { return renderer_config_; }

    // Re-render blocks whose rendering was made for a different width.
    void re_render_if_needed();

    const RenderCache& render_cache() const { return cache_; }
    const FormatRegistry& registry() const { return registry_; }
    DetectionScope detection_scope() const { return boundary_.scope(); }

private:
    BoundaryDetector boundary_;
    FormatRegistry registry_;
    std::deque<PrettifiedBlock> active_blocks_;
    bool enabled_;
    std::optional<bool> session_override_;
    bool respect_alternate_screen_;
    size_t max_active_blocks_;
    uint64_t next_block_id_ = 0;
    RendererConfig renderer_config_;
    RenderCache cache_;
    std::vector<RowRange> suppressed_ranges_;
    ClaudeCodeIntegration claude_code_;

    void handle_block(ContentBlock content);
    void handle_emitted(std::optional<ContentBlock> block);
    bool render_into_buffer(DualViewBuffer& buffer, const std::string& format_id);
    uint64_t insert_block(DetectionResult detection, DualViewBuffer buffer);
    void evict_excess_blocks();
    ContentBlock extract_content_block(RowRange range) const;
};
