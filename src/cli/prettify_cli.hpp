#pragma once

#include <string>
#include <vector>
#include <optional>
#include <iosfwd>
#include <core/types.hpp>
#include <core/config.hpp>

struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<size_t> width;
    std::optional<DetectionScope> scope;
    bool raw = false;
    bool stats = false;
    bool help = false;
    bool version = false;
    std::optional<std::string> input_path;      // stdin when empty
};

Result<CliOptions> parse_cli_args(const std::vector<std::string>& args);

// Reads a text stream, runs it through the pipeline and writes the raw
// rows with every rendered block substituted in place.
//
// Lines of the form "$ <command>" close the previous command and open a new
// one, standing in for shell-integration markers.
class PrettifyCLI {
public:
    explicit PrettifyCLI(CliOptions options);

    // Resolve the config (--config, then the global file, then defaults).
    Result<void> load_config();

    // Returns the process exit code.
    int run(std::istream& in, std::ostream& out, std::ostream& err);

    const PrettifierConfig& prettifier_config() const { return config_.prettifier(); }

private:
    CliOptions options_;
    Config config_;
};

void print_usage(std::ostream& out);
std::string prettify_version();
