//! # CLI Command Dispatcher
//!
//! ```text
//! stylebook_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ init           → run_init()
//!   └─ [config.json]  → run_build()
//! ```
//!
//! Logging options (`--log-level=`, `-v`, `-q`, ...) are accepted anywhere
//! on the command line. Every other `--flag` is handed to the plugin system.

#include "driver.hpp"

#include "build/config.hpp"
#include "commands/cmd_build.hpp"
#include "commands/cmd_init.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <filesystem>
#include <iostream>

using namespace stylebook;

/// ## Return Codes
///
/// | Code | Meaning                                        |
/// |------|------------------------------------------------|
/// | 0    | Success                                        |
/// | 1    | Config, validation or build failure            |
int stylebook_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    cli::CommandLine line = cli::split_arguments(argc, argv, 1);

    for (const auto& flag : line.flags) {
        if (flag == "--help" || flag == "-h") {
            cli::print_usage();
            return 0;
        }
        if (flag == "--version" || flag == "-V") {
            cli::print_version();
            return 0;
        }
    }

    if (!line.positional.empty() && line.positional.front() == "init") {
        if (line.positional.size() > 1) {
            std::cerr << "Usage: stylebook init\n";
            return 1;
        }
        std::error_code ec;
        auto cwd = std::filesystem::current_path(ec);
        if (ec) {
            std::cerr << "Could not determine the current directory: " << ec.message() << "\n";
            return 1;
        }
        return cli::run_init(cwd);
    }

    if (line.positional.size() > 1) {
        std::cerr << "Usage: stylebook [config.json] [options]\n";
        return 1;
    }

    std::string config_path =
        line.positional.empty() ? std::string(build::CONFIG_FILE_NAME) : line.positional.front();
    int code = cli::run_build(config_path, line.flags);
    log::Logger::instance().flush();
    return code;
}
