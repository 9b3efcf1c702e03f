//! # Init Command
//!
//! Thin wrapper over `build::setup_dir()`. An existing config file is left
//! untouched and reported as a warning.

#include "cmd_init.hpp"

#include "build/diagnostics.hpp"
#include "build/scaffold.hpp"
#include "log/log.hpp"

#include <iostream>

namespace stylebook::cli {

int run_init(const std::filesystem::path& target_dir) {
    build::DiagnosticSink diagnostics;
    auto created = build::setup_dir(target_dir, diagnostics);
    if (is_err(created)) {
        std::cerr << unwrap_err(created).message << "\n";
        return 1;
    }
    STYLEBOOK_LOG_DEBUG("cli", "init created " << unwrap(created).size() << " file(s) in "
                                               << target_dir.string());
    return 0;
}

} // namespace stylebook::cli
