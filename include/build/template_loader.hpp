//! # Header and Footer Loading
//!
//! Locates and compiles the page header and footer in the documentation
//! assets directory. `_header.html` is preferred over `header.html`, and
//! likewise for the footer. Both are optional; a missing one is a warning.

#ifndef STYLEBOOK_BUILD_TEMPLATE_LOADER_HPP
#define STYLEBOOK_BUILD_TEMPLATE_LOADER_HPP

#include "build/diagnostics.hpp"
#include "build/errors.hpp"
#include "build/template.hpp"
#include "common.hpp"

#include <filesystem>
#include <optional>

namespace stylebook::build {

struct HeaderFooter {
    std::optional<Template> header;
    std::optional<Template> footer;
};

/// Loads the header and footer once per build. A template that does not
/// compile is a fatal `Template` error.
[[nodiscard]] auto load_header_footer(const std::optional<std::filesystem::path>& assets_dir,
                                      DiagnosticSink& diagnostics)
    -> Result<HeaderFooter, BuildError>;

} // namespace stylebook::build

#endif // STYLEBOOK_BUILD_TEMPLATE_LOADER_HPP
