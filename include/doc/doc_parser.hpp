//! # Documentation Comment Parser
//!
//! The default `SourceParser`. Scans stylesheets and scripts for
//! documentation comments and groups the documented components into
//! category pages.
//!
//! ## Comment Format
//!
//! ```css
//! /*doc
//! ---
//! title: Buttons
//! name: buttons
//! category: Base CSS
//! ---
//!
//! Use `.btn` for every clickable element.
//! */
//! ```
//!
//! | Header key | Meaning |
//! |------------|---------|
//! | `title` | Display title, used as heading |
//! | `name` | Anchor and link target; defaults to the title in snake case |
//! | `category` | Page label(s), comma separated |
//! | `parent` | Name of the block this one nests under |
//!
//! ## Files
//!
//! - `.css .scss .sass .less .styl .js .jsx` and custom extensions: scanned
//!   for `/*doc ... */` comments
//! - `.md`: a stand-alone markdown page named after the file
//! - `.html`: a template page named after the file

#ifndef STYLEBOOK_DOC_DOC_PARSER_HPP
#define STYLEBOOK_DOC_DOC_PARSER_HPP

#include "doc/source_parser.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace stylebook::doc {

/// A documentation comment after header parsing.
struct ParsedComment {
    std::string title;
    std::string name;
    std::vector<std::string> categories;
    std::string parent;
    std::string markdown;
    bool has_header = false;
};

/// Extracts the bodies of every `/*doc ... */` comment in `source`, in order.
/// `unterminated` is set when the last comment has no closing `*/`.
[[nodiscard]] auto extract_doc_comments(std::string_view source, bool& unterminated)
    -> std::vector<std::string>;

/// Parses one comment body into header fields and markdown. Header lines
/// that are not `key: value` are returned in `bad_lines`.
[[nodiscard]] auto parse_doc_comment(std::string_view body, std::vector<std::string>& bad_lines)
    -> ParsedComment;

/// Output file of a category: lower case, spaces as `_`, plus `.html`.
[[nodiscard]] auto category_file_name(std::string_view category) -> std::string;

/// Default component name for a title: lower case, spaces as `_`.
[[nodiscard]] auto default_block_name(std::string_view title) -> std::string;

class DocParser : public SourceParser {
public:
    [[nodiscard]] auto parse(const std::vector<std::filesystem::path>& input_dirs,
                             const std::optional<std::string>& index_name, Plugins& plugins,
                             const ParseOptions& options, build::DiagnosticSink& diagnostics) const
        -> Result<build::ParseResult, build::BuildError> override;

    /// Extensions scanned for documentation comments by default.
    [[nodiscard]] static auto comment_extensions() -> const std::vector<std::string>&;
};

} // namespace stylebook::doc

#endif // STYLEBOOK_DOC_DOC_PARSER_HPP
