//! # Build Error Types
//!
//! Error values returned through `Result<T, E>` by the build stages.
//!
//! | Type | Raised by | Effect |
//! |------|-----------|--------|
//! | `ConfigError` | config loading / resolution | build never starts |
//! | `ErrorList` | validation | build aborts, nothing written |
//! | `TemplateError` | template compile / render | converted to `BuildError` |
//! | `BuildError` | parse, render, copy, plugins | build aborts |

#ifndef STYLEBOOK_BUILD_ERRORS_HPP
#define STYLEBOOK_BUILD_ERRORS_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace stylebook::build {

/// Ordered, human-readable validation errors. Empty means valid.
using ErrorList = std::vector<std::string>;

/// Malformed or unusable configuration document.
struct ConfigError {
    std::string message;
};

/// Message used for every unreadable configuration document.
inline constexpr std::string_view CONFIG_LOAD_ERROR =
    "Could not load config file, check the syntax or try 'stylebook init' to get started";

/// A template that failed to compile or render.
struct TemplateError {
    std::string message;
    size_t line = 0;   ///< 1-based source line, 0 when unknown
    std::string name;  ///< Template name (file name or builtin id)

    [[nodiscard]] auto to_string() const -> std::string {
        std::string out = name.empty() ? std::string("template") : name;
        if (line > 0) {
            out += ":" + std::to_string(line);
        }
        return out + ": " + message;
    }
};

/// Kind of fatal build failure.
enum class BuildErrorKind {
    ParserContract, ///< Parser produced a page without a file name
    Template,       ///< Header, footer, page or example template failed
    Io,             ///< Filesystem operation failed
    Parse,          ///< Source files could not be read or parsed
    Plugin,         ///< A plugin hook reported an error
};

[[nodiscard]] inline auto build_error_kind_name(BuildErrorKind kind) -> std::string_view {
    switch (kind) {
    case BuildErrorKind::ParserContract:
        return "parser contract";
    case BuildErrorKind::Template:
        return "template";
    case BuildErrorKind::Io:
        return "io";
    case BuildErrorKind::Parse:
        return "parse";
    case BuildErrorKind::Plugin:
        return "plugin";
    }
    return "unknown";
}

/// A fatal failure that aborts the whole build.
struct BuildError {
    BuildErrorKind kind;
    std::string message;

    [[nodiscard]] static auto from_template(const TemplateError& err) -> BuildError {
        return BuildError{BuildErrorKind::Template, err.to_string()};
    }
};

} // namespace stylebook::build

#endif // STYLEBOOK_BUILD_ERRORS_HPP
