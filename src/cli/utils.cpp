//! # CLI Utilities
//!
//! Help text and argument helpers shared by the commands.

#include "utils.hpp"

#include "build/config.hpp"
#include "common.hpp"
#include "log/log.hpp"

#include <iostream>

namespace stylebook::cli {

void print_usage() {
    std::cout << "stylebook " << VERSION << "\n\n";
    std::cout << "Usage: stylebook [config.json] [options]\n";
    std::cout << "       stylebook init\n\n";
    std::cout << "Commands:\n";
    std::cout << "  init             Create a starter config, header, footer and templates\n";
    std::cout << "  (none)           Build the style guide described by the config file\n";
    std::cout << "                   (default: " << build::CONFIG_FILE_NAME << ")\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h           Show this help\n";
    std::cout << "  --version, -V        Show version\n";
    std::cout << "  --log-level=<level>  trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>  Per-module levels, e.g. parse=debug,*=warn\n";
    std::cout << "  --log-file=<path>    Also write log records to a file\n";
    std::cout << "  --log-format=json    Emit log records as JSON lines\n";
    std::cout << "  -v, -vv, --verbose   More output\n";
    std::cout << "  -q, --quiet          Errors only\n";
    std::cout << "  --<plugin>           Activate a plugin (e.g. --search_index)\n";
}

void print_version() {
    std::cout << "stylebook " << VERSION << "\n";
}

void print_errors(const std::vector<std::string>& errors) {
    for (const auto& error : errors) {
        std::cerr << error << "\n";
    }
}

CommandLine split_arguments(int argc, char* argv[], int first) {
    CommandLine line;
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (log::is_log_option(arg)) {
            continue;
        }
        if (arg.starts_with("-")) {
            line.flags.push_back(arg);
        } else {
            line.positional.push_back(arg);
        }
    }
    return line;
}

} // namespace stylebook::cli
