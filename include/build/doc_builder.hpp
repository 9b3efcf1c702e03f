//! # Build Orchestrator
//!
//! Runs one documentation build from a resolved `BuildConfig`.
//!
//! ## Stages
//!
//! | Stage | Work | Failure |
//! |-------|------|---------|
//! | validate | source, destination and assets checks | `errors()`, no output |
//! | layout | header and footer templates | fatal Template error |
//! | prepare | create the destination, re-resolve directories | fatal Io error |
//! | parse | source parser, index and assets warnings | fatal Parse/Plugin error |
//! | render | code examples, link index, every page | fatal Template/Io error |
//! | copy | dependencies, then documentation assets | warnings / fatal Io error |
//!
//! With `exit_on_warnings` set, a warning recorded during a stage stops the
//! build at the end of that stage. Files already written stay in place.

#ifndef STYLEBOOK_BUILD_DOC_BUILDER_HPP
#define STYLEBOOK_BUILD_DOC_BUILDER_HPP

#include "build/config.hpp"
#include "build/diagnostics.hpp"
#include "build/errors.hpp"
#include "build/page.hpp"
#include "common.hpp"
#include "doc/plugin.hpp"
#include "doc/source_parser.hpp"

#include <string_view>

namespace stylebook::build {

class DocBuilder {
public:
    DocBuilder(BuildConfig config, DiagnosticSink& diagnostics, const doc::SourceParser& parser,
               doc::Plugins& plugins);

    /// Re-resolves directories and runs validation. Errors are kept in `errors()`.
    [[nodiscard]] auto is_valid() -> bool;

    [[nodiscard]] auto errors() const -> const ErrorList& {
        return errors_;
    }

    /// Runs every stage. Returns false on validation errors, a fatal stage
    /// error (recorded as an Error diagnostic) or a warning under
    /// `exit_on_warnings`.
    auto build() -> bool;

    [[nodiscard]] auto config() const -> const BuildConfig& {
        return config_;
    }

    [[nodiscard]] auto diagnostics() const -> const DiagnosticSink& {
        return diagnostics_;
    }

    /// Pages produced by the last build's parse stage.
    [[nodiscard]] auto pages() const -> const PageMap& {
        return parsed_.pages;
    }

private:
    auto run() -> Result<Unit, BuildError>;
    auto prepare_destination() -> Result<Unit, BuildError>;

    /// True when the build must stop after `stage` because of warnings.
    auto stop_after(std::string_view stage) -> bool;

    BuildConfig config_;
    DiagnosticSink& diagnostics_;
    const doc::SourceParser& parser_;
    doc::Plugins& plugins_;
    ErrorList errors_;
    ParseResult parsed_;
    size_t warnings_at_start_ = 0;
    bool stopped_ = false;
};

} // namespace stylebook::build

#endif // STYLEBOOK_BUILD_DOC_BUILDER_HPP
