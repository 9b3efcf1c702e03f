//! # Build Command
//!
//! Loads the config file, wires the default source parser and the plugins
//! selected by config and arguments, then runs `DocBuilder`.
//!
//! ```bash
//! stylebook                          # uses ./stylebook_config.json
//! stylebook site/config.json -v      # explicit config, debug logging
//! stylebook --search_index           # also emit search_index.json
//! ```

#include "cmd_build.hpp"

#include "build/config.hpp"
#include "build/diagnostics.hpp"
#include "build/doc_builder.hpp"
#include "cli/utils.hpp"
#include "doc/doc_parser.hpp"
#include "doc/plugin.hpp"
#include "log/log.hpp"
#include "markdown/renderer.hpp"

#include <filesystem>
#include <iostream>
#include <utility>

namespace fs = std::filesystem;

namespace stylebook::cli {

int run_build(const std::string& config_path, const std::vector<std::string>& extra_args) {
    std::error_code ec;
    fs::path path = fs::absolute(config_path, ec);
    if (ec) {
        std::cerr << "Could not resolve config path " << config_path << ": " << ec.message()
                  << "\n";
        return 1;
    }
    STYLEBOOK_LOG_DEBUG("cli", "Loading config " << path.string());

    markdown::MarkdownRendererRegistry renderers;
    auto config = build::load_config_file(path, renderers);
    if (is_err(config)) {
        std::cerr << unwrap_err(config).message << "\n";
        return 1;
    }

    build::DiagnosticSink diagnostics;
    auto registry = doc::PluginRegistry::with_builtins();
    doc::Plugins plugins(registry, unwrap(config).plugins, extra_args, diagnostics);
    doc::DocParser parser;

    build::DocBuilder builder(std::move(unwrap(config)), diagnostics, parser, plugins);
    if (!builder.is_valid()) {
        print_errors(builder.errors());
        return 1;
    }
    return builder.build() ? 0 : 1;
}

} // namespace stylebook::cli
