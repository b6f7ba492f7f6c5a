#include "prettify_cli.hpp"
#include "ansi_output.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <formats/builtin_formats.hpp>
#include <platform/platform.hpp>
#include <prettifier/pipeline.hpp>
#include <algorithm>
#include <iostream>

static const char* VERSION = "0.1.0";

Result<CliOptions> parse_cli_args(const std::vector<std::string>& args) {
    CliOptions opts;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= args.size()) return std::nullopt;
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--version") {
            opts.version = true;
        } else if (arg == "--raw") {
            opts.raw = true;
        } else if (arg == "--stats") {
            opts.stats = true;
        } else if (arg == "--config") {
            auto v = value();
            if (!v) return Result<CliOptions>::Err("--config requires a path");
            opts.config_path = *v;
        } else if (arg == "--width") {
            auto v = value();
            if (!v) return Result<CliOptions>::Err("--width requires a number");
            int w = safe_stoi(*v, 0);
            if (w <= 0) return Result<CliOptions>::Err("Invalid width: " + *v);
            opts.width = static_cast<size_t>(w);
        } else if (arg == "--scope") {
            auto v = value();
            if (!v) return Result<CliOptions>::Err("--scope requires a value");
            auto scope = parse_detection_scope(*v);
            if (!scope) return Result<CliOptions>::Err("Unknown scope: " + *v);
            opts.scope = *scope;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            return Result<CliOptions>::Err("Unknown option: " + arg);
        } else {
            if (opts.input_path) return Result<CliOptions>::Err("Only one input file may be given");
            if (arg != "-") opts.input_path = arg;
        }
    }

    return Result<CliOptions>::Ok(opts);
}

void print_usage(std::ostream& out) {
    out << theme::section("Usage");
    out << theme::color::BLUE << "    prettify " << theme::color::RESET
        << theme::color::BROWN << "[options] [FILE]" << theme::color::RESET << "\n\n";
    out << theme::kv("--config PATH", "YAML config (default ~/.prettify/config.yaml)");
    out << theme::kv("--width N", "Render width (default: terminal width)");
    out << theme::kv("--scope S", "all | command_output | manual_only");
    out << theme::kv("--raw", "Pass input through unchanged");
    out << theme::kv("--stats", "Print block and cache statistics to stderr");
    out << theme::kv("--version", "Show version");
    out << "\n";
}

PrettifyCLI::PrettifyCLI(CliOptions options) : options_(std::move(options)) {}

Result<void> PrettifyCLI::load_config() {
    if (options_.config_path) {
        auto result = Config::load(*options_.config_path);
        if (result.is_err()) return Result<void>::Err(result.error);
        config_ = result.value;
    } else if (global_config_exists()) {
        auto result = Config::load_global();
        if (result.is_err()) return Result<void>::Err(result.error);
        config_ = result.value;
    }

    if (auto path = config_.log_path()) {
        set_prettify_log_path(*path);
    }

    PrettifierConfig& pc = config_.prettifier();
    if (options_.scope) pc.detection_scope = *options_.scope;
    if (options_.raw) pc.enabled = false;
    return Result<void>::Ok();
}

int PrettifyCLI::run(std::istream& in, std::ostream& out, std::ostream& err) {
    const PrettifierConfig& pc = config_.prettifier();

    FormatRegistry registry(pc.confidence_threshold);
    register_builtin_formats(registry, pc.formats);

    RendererConfig rc;
    rc.terminal_width = options_.width ? *options_.width : static_cast<size_t>(platform::term_width());
    rc.terminal_height = static_cast<size_t>(platform::term_height());

    PrettifierPipeline pipeline(pc, std::move(registry), rc);
    if (pipeline.detect_claude_code_session(platform::environment(), platform::parent_process_name())) {
        prettify_log("cli: Claude Code session detected");
    }

    std::vector<std::string> rows;
    bool in_command = false;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        size_t row = rows.size();
        rows.push_back(line);

        if (line.rfind("$ ", 0) == 0) {
            // Starting a command discards pending lines, so close them out first.
            if (in_command) {
                pipeline.on_command_end();
            } else {
                pipeline.flush();
            }
            pipeline.on_command_start(trimmed(line.substr(2)));
            in_command = true;
            continue;
        }

        pipeline.process_claude_code_line(line, row);
        pipeline.process_output(line, row);
    }
    if (in_command) pipeline.on_command_end();
    pipeline.flush();

    size_t row = 0;
    while (row < rows.size()) {
        const PrettifiedBlock* block = pipeline.block_at_row(row);
        if (block && block->content().start_row == row && block->has_rendered() &&
            block->view_mode() == ViewMode::Rendered) {
            const auto& rendered = *block->buffer.rendered();
            if (pc.claude_code.show_format_badges && !rendered.format_badge.empty()) {
                out << theme::badge(rendered.format_badge);
            }
            out << AnsiOutput::render_lines(block->buffer.display_lines());
            row = std::max(row + 1, block->content().end_row);
            continue;
        }
        out << rows[row] << "\n";
        row++;
    }

    if (options_.stats) {
        CacheStats stats = pipeline.render_cache().stats();
        err << theme::section("prettify");
        err << theme::kv("rows", std::to_string(rows.size()));
        err << theme::kv("blocks", std::to_string(pipeline.active_blocks().size()));
        err << theme::kv("scope", detection_scope_name(pipeline.detection_scope()));
        err << theme::kv("width", std::to_string(pipeline.renderer_config().terminal_width));
        err << theme::kv("cache", fmt::format("{}/{} entries, {} hits, {} misses",
                                              stats.entries, stats.capacity, stats.hits, stats.misses));
        for (const auto& b : pipeline.active_blocks()) {
            err << theme::info(fmt::format("#{} {} rows {}..{} ({}, {:.2})",
                                           b.block_id, b.detection.format_id,
                                           b.content().start_row, b.content().end_row,
                                           detection_source_name(b.detection.source),
                                           b.detection.confidence));
        }
    }

    return 0;
}

std::string prettify_version() {
    return VERSION;
}
