//! # Build Orchestrator Implementation

#include "build/doc_builder.hpp"

#include "build/materializer.hpp"
#include "build/render_pipeline.hpp"
#include "build/template_loader.hpp"
#include "build/validator.hpp"
#include "log/log.hpp"
#include "markdown/code_example.hpp"
#include "markdown/renderer.hpp"

#include <filesystem>
#include <utility>

namespace stylebook::build {

namespace fs = std::filesystem;

namespace {

/// Resolves an optional override directory, warning when it is configured
/// but missing.
auto resolve_override(const BuildConfig& config, const std::optional<std::string>& path,
                      std::string_view what, DiagnosticSink& diagnostics)
    -> std::optional<fs::path> {
    if (!path) {
        return std::nullopt;
    }
    auto resolved = config.resolve(*path);
    if (!resolved) {
        diagnostics.warning("build", "Could not find " + std::string(what) + " at " + *path);
    }
    return resolved;
}

} // namespace

DocBuilder::DocBuilder(BuildConfig config, DiagnosticSink& diagnostics,
                       const doc::SourceParser& parser, doc::Plugins& plugins)
    : config_(std::move(config)), diagnostics_(diagnostics), parser_(parser), plugins_(plugins) {}

auto DocBuilder::is_valid() -> bool {
    config_.resolve_dirs();
    errors_ = validate(config_);
    return errors_.empty();
}

auto DocBuilder::build() -> bool {
    warnings_at_start_ = diagnostics_.count(DiagnosticLevel::Warning);
    stopped_ = false;
    parsed_ = ParseResult{};

    if (!is_valid()) {
        for (const auto& error : errors_) {
            diagnostics_.error("build", error);
        }
        return false;
    }

    auto result = run();
    if (is_err(result)) {
        const auto& error = unwrap_err(result);
        diagnostics_.error("build", std::string(build_error_kind_name(error.kind)) + " error: " +
                                        error.message);
        return false;
    }
    if (stopped_) {
        return false;
    }

    diagnostics_.success("build", "Build completed. (-: ");
    return true;
}

auto DocBuilder::stop_after(std::string_view stage) -> bool {
    if (!config_.exit_on_warnings ||
        diagnostics_.count(DiagnosticLevel::Warning) == warnings_at_start_) {
        return false;
    }
    diagnostics_.error("build", "Stopping after " + std::string(stage) +
                                    ": warnings were reported and exit_on_warnings is set");
    stopped_ = true;
    return true;
}

auto DocBuilder::prepare_destination() -> Result<Unit, BuildError> {
    if (config_.output_dir) {
        return Unit{};
    }

    fs::path destination = config_.absolute(*config_.destination);
    std::error_code ec;
    fs::create_directories(destination, ec);
    if (ec) {
        return BuildError{BuildErrorKind::Io, "Could not create destination directory " +
                                                  destination.string() + ": " + ec.message()};
    }
    STYLEBOOK_LOG_INFO("build", "Created destination " << destination.string());

    config_.resolve_dirs();
    if (!config_.output_dir) {
        return BuildError{BuildErrorKind::Io,
                          "Destination directory " + destination.string() + " is not usable"};
    }
    return Unit{};
}

auto DocBuilder::run() -> Result<Unit, BuildError> {
    // Layout
    auto layout = load_header_footer(config_.doc_assets_dir, diagnostics_);
    if (is_err(layout)) {
        return unwrap_err(layout);
    }
    if (stop_after("loading the header and footer")) {
        return Unit{};
    }

    auto prepared = prepare_destination();
    if (is_err(prepared)) {
        return unwrap_err(prepared);
    }
    const fs::path output_dir = *config_.output_dir;

    // Parse
    doc::ParseOptions options;
    options.nav_level = config_.nav_level;
    options.custom_extensions = config_.custom_extensions;
    options.ignore_paths = config_.ignore_paths;

    auto parsed = parser_.parse(config_.input_dirs, config_.index, plugins_, options, diagnostics_);
    if (is_err(parsed)) {
        return unwrap_err(parsed);
    }
    parsed_ = std::move(unwrap(parsed));

    // The index category's own page, not index.html: a standalone index page
    // does not stand in for a missing category.
    if (config_.index && parsed_.pages.count(*config_.index + ".html") == 0) {
        diagnostics_.warning("build", "Could not generate index.html, there was no content "
                                      "generated for the category " +
                                          *config_.index + ".");
    }
    if (!config_.doc_assets_dir) {
        diagnostics_.warning("build", "Could not find documentation assets at " +
                                          config_.documentation_assets.value_or(""));
    }
    if (stop_after("parsing")) {
        return Unit{};
    }

    // Render
    auto templates_dir = resolve_override(config_, config_.code_example_templates,
                                          "code example templates", diagnostics_);
    auto renderers_dir = resolve_override(config_, config_.code_example_renderers,
                                          "code example renderers", diagnostics_);
    auto examples = markdown::CodeExampleRenderer::load(templates_dir, renderers_dir, diagnostics_);
    if (is_err(examples)) {
        return unwrap_err(examples);
    }

    markdown::LinkHelper links = build_link_helper(parsed_.pages);
    Box<markdown::MarkdownRenderer> renderer;
    if (config_.renderer_factory) {
        renderer = config_.renderer_factory(links, unwrap(examples));
    } else {
        renderer = make_box<markdown::HtmlRenderer>(links, unwrap(examples));
    }

    const json::JsonValue no_config = json::json_object();
    const json::JsonValue& raw = config_.raw ? *config_.raw : no_config;

    auto written = render_all(parsed_.pages, parsed_.categories, raw, unwrap(layout), *renderer,
                              output_dir);
    if (is_err(written)) {
        return unwrap_err(written);
    }
    STYLEBOOK_LOG_INFO("build", "Wrote " << unwrap(written) << " page(s) to "
                                         << output_dir.string());
    if (stop_after("rendering")) {
        return Unit{};
    }

    // Copy
    size_t dependencies = copy_dependencies(config_, output_dir, diagnostics_);
    auto assets = copy_assets(config_.doc_assets_dir, output_dir);
    if (is_err(assets)) {
        return unwrap_err(assets);
    }
    STYLEBOOK_LOG_DEBUG("build", "Copied " << dependencies << " dependency(ies) and "
                                           << unwrap(assets) << " asset(s)");
    stop_after("copying");
    return Unit{};
}

} // namespace stylebook::build
