#include "build/template_loader.hpp"

#include "build/file_io.hpp"
#include "log/log.hpp"

#include <initializer_list>

namespace stylebook::build {

namespace fs = std::filesystem;

namespace {

/// Compiles the first existing candidate in `assets_dir`, or nullopt.
auto load_first(const std::optional<fs::path>& assets_dir,
                std::initializer_list<const char*> candidates)
    -> Result<std::optional<Template>, BuildError> {
    if (!assets_dir) {
        return std::optional<Template>();
    }
    for (const char* name : candidates) {
        fs::path path = *assets_dir / name;
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            continue;
        }
        auto source = read_file(path);
        if (is_err(source)) {
            return BuildError{BuildErrorKind::Io, unwrap_err(source).message};
        }
        auto tpl = Template::compile(unwrap(source), name);
        if (is_err(tpl)) {
            return BuildError::from_template(unwrap_err(tpl));
        }
        STYLEBOOK_LOG_DEBUG("build", "Loaded " << path.string());
        return std::optional<Template>(std::move(unwrap(tpl)));
    }
    return std::optional<Template>();
}

} // namespace

auto load_header_footer(const std::optional<fs::path>& assets_dir, DiagnosticSink& diagnostics)
    -> Result<HeaderFooter, BuildError> {
    HeaderFooter result;

    auto header = load_first(assets_dir, {"_header.html", "header.html"});
    if (is_err(header)) {
        return unwrap_err(header);
    }
    result.header = std::move(unwrap(header));
    if (!result.header) {
        diagnostics.warning("build", "No _header.html found in documentation assets. Without this "
                                     "your css/header will not be included on the generated "
                                     "pages.");
    }

    auto footer = load_first(assets_dir, {"_footer.html", "footer.html"});
    if (is_err(footer)) {
        return unwrap_err(footer);
    }
    result.footer = std::move(unwrap(footer));
    if (!result.footer) {
        diagnostics.warning("build", "No _footer.html found in documentation assets. This might "
                                     "be okay to ignore...");
    }

    return result;
}

} // namespace stylebook::build
