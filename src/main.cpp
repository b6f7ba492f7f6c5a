#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include "cli/prettify_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        auto parsed = parse_cli_args(args);
        if (parsed.is_err()) {
            std::cerr << theme::fail(parsed.error);
            print_usage(std::cerr);
            return 1;
        }

        CliOptions opts = parsed.value;
        if (opts.help) {
            print_usage(std::cout);
            return 0;
        }
        if (opts.version) {
            std::cout << theme::color::BROWN << theme::color::BOLD << "prettify"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << prettify_version() << theme::color::RESET << "\n";
            return 0;
        }

        PrettifyCLI cli(opts);
        auto loaded = cli.load_config();
        if (loaded.is_err()) {
            std::cerr << theme::fail(loaded.error);
            return 1;
        }

        if (opts.input_path) {
            std::ifstream in(*opts.input_path);
            if (!in) {
                std::cerr << theme::fail("Cannot open " + *opts.input_path);
                return 1;
            }
            return cli.run(in, std::cout, std::cerr);
        }
        return cli.run(std::cin, std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
