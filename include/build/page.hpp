//! # Page Model
//!
//! Data produced by the source parser and consumed, read-only, by the render
//! pipeline.
//!
//! ## Architecture
//!
//! - `ContentBlock`: one documented component
//! - `Page`: tagged variant of `TemplatePage` (raw template source, written
//!   verbatim after templating) and `MarkdownPage` (markdown wrapped in
//!   header and footer)
//! - `PageMap`: output file name to page, iterated in key order
//! - `CategoryIndex`: ordered category label to file name association

#ifndef STYLEBOOK_BUILD_PAGE_HPP
#define STYLEBOOK_BUILD_PAGE_HPP

#include "json/json_value.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace stylebook::build {

// ============================================================================
// Content Blocks
// ============================================================================

/// One documented component extracted from a source comment.
struct ContentBlock {
    std::string name;                    ///< Component identifier, used as anchor
    std::string title;                   ///< Display title
    std::vector<std::string> categories; ///< Category labels, in declaration order
    std::string parent;                  ///< Parent component name, empty at top level
    std::string markdown;                ///< Documentation body
    std::vector<ContentBlock> children;  ///< Filled only for `section` navigation

    /// Template representation: `{name, title, categories, parent, markdown, children}`.
    [[nodiscard]] auto to_json() const -> json::JsonValue;
};

// ============================================================================
// Pages
// ============================================================================

/// A page rendered directly as a template, without header or footer.
struct TemplatePage {
    std::string source;
};

/// A page whose markdown is rendered to HTML and wrapped in header and footer.
struct MarkdownPage {
    std::vector<ContentBlock> blocks; ///< Empty for stand-alone markdown files
    std::string markdown;
};

using Page = std::variant<TemplatePage, MarkdownPage>;

/// Blocks carried by a page; nullptr for template pages.
[[nodiscard]] inline auto page_blocks(const Page& page) -> const std::vector<ContentBlock>* {
    if (const auto* md = std::get_if<MarkdownPage>(&page)) {
        return &md->blocks;
    }
    return nullptr;
}

[[nodiscard]] inline auto page_kind_name(const Page& page) -> const char* {
    return std::holds_alternative<TemplatePage>(page) ? "template" : "markdown";
}

/// Output file name (with extension) to page.
using PageMap = std::map<std::string, Page>;

// ============================================================================
// Category Index
// ============================================================================

/// Ordered association between category labels and output files.
///
/// Several categories may share a file; reverse lookup returns the first.
class CategoryIndex {
public:
    using Entry = std::pair<std::string, std::string>; ///< (label, file name)

    /// Records `label -> file`. A label already present keeps its first file.
    void add(std::string label, std::string file);

    [[nodiscard]] auto entries() const -> const std::vector<Entry>& {
        return entries_;
    }

    [[nodiscard]] auto empty() const -> bool {
        return entries_.empty();
    }

    [[nodiscard]] auto size() const -> size_t {
        return entries_.size();
    }

    /// First category label whose file equals `file_name`.
    [[nodiscard]] auto category_for(const std::string& file_name) const
        -> std::optional<std::string>;

    /// File name of the category `label`.
    [[nodiscard]] auto file_for(const std::string& label) const -> std::optional<std::string>;

    /// Template representation: `[{name, file}, ...]` in category order.
    [[nodiscard]] auto to_json() const -> json::JsonValue;

private:
    std::vector<Entry> entries_;
};

/// Result of running the source parser.
struct ParseResult {
    PageMap pages;
    CategoryIndex categories;
};

/// Template representation of a page map: `[{file_name, kind, components}, ...]`.
[[nodiscard]] auto pages_to_json(const PageMap& pages) -> json::JsonValue;

} // namespace stylebook::build

#endif // STYLEBOOK_BUILD_PAGE_HPP
