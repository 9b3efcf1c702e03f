//! # Source Parser Interface
//!
//! Turns source directories into the page map and category index consumed
//! by the render pipeline. The parser guarantees that every page key is a
//! non-empty output file name.

#ifndef STYLEBOOK_DOC_SOURCE_PARSER_HPP
#define STYLEBOOK_DOC_SOURCE_PARSER_HPP

#include "build/config.hpp"
#include "build/diagnostics.hpp"
#include "build/errors.hpp"
#include "build/page.hpp"
#include "common.hpp"
#include "doc/plugin.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stylebook::doc {

struct ParseOptions {
    build::NavLevel nav_level = build::NavLevel::Page;
    std::vector<std::string> custom_extensions; ///< Extra scanned extensions, with '.'
    std::vector<std::string> ignore_paths;      ///< Paths relative to an input directory
};

class SourceParser {
public:
    virtual ~SourceParser() = default;

    [[nodiscard]] virtual auto parse(const std::vector<std::filesystem::path>& input_dirs,
                                     const std::optional<std::string>& index_name,
                                     Plugins& plugins, const ParseOptions& options,
                                     build::DiagnosticSink& diagnostics) const
        -> Result<build::ParseResult, build::BuildError> = 0;
};

} // namespace stylebook::doc

#endif // STYLEBOOK_DOC_SOURCE_PARSER_HPP
