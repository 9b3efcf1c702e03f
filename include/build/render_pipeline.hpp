//! # Render Pipeline
//!
//! Renders every page of a `PageMap` and writes it to the destination.
//!
//! ## Per-page Flow
//!
//! 1. Title: empty for a markdown page without blocks, otherwise the first
//!    category mapped to the page's file
//! 2. A fresh `RenderContext` over the shared page and category data
//! 3. `TemplatePage`: the page source is rendered as a template and written
//!    as-is. `MarkdownPage`: header, rendered markdown, footer.
//!
//! Pages are rendered in `PageMap` order. No page depends on another page's
//! output; cross-page links come from the `LinkHelper` built beforehand.

#ifndef STYLEBOOK_BUILD_RENDER_PIPELINE_HPP
#define STYLEBOOK_BUILD_RENDER_PIPELINE_HPP

#include "build/errors.hpp"
#include "build/page.hpp"
#include "build/template.hpp"
#include "build/template_loader.hpp"
#include "common.hpp"
#include "json/json_value.hpp"
#include "markdown/link_resolver.hpp"
#include "markdown/renderer.hpp"

#include <filesystem>
#include <string>

namespace stylebook::build {

/// Title of `page`: "" for a markdown page with no blocks, else the first
/// category whose file is `file_name` ("" when none).
[[nodiscard]] auto page_title(const std::string& file_name, const Page& page,
                              const CategoryIndex& categories) -> std::string;

/// Link index with one entry per page and the names of its blocks.
[[nodiscard]] auto build_link_helper(const PageMap& pages) -> markdown::LinkHelper;

/// Template data of one page. Shared data is borrowed from `TemplateVariables`.
struct RenderContext {
    std::string title;
    std::string file_name;
    TemplateData blocks = TemplateData::array(); ///< Empty for template pages
    const TemplateData* shared = nullptr;        ///< `categories`, `pages`, `config`

    /// Bindings for `title`, `file_name`, `blocks`, `categories`, `pages`
    /// and `config`.
    [[nodiscard]] auto bindings() const -> TemplateContext;
};

/// Template data computed once per build and shared by every page.
class TemplateVariables {
public:
    TemplateVariables(const PageMap& pages, const CategoryIndex& categories,
                      const json::JsonValue& config);

    [[nodiscard]] auto for_page(std::string title, const std::string& file_name,
                                const Page& page) const -> RenderContext;

private:
    TemplateData shared_;
};

/// Renders one page to its final HTML.
[[nodiscard]] auto render_page(const std::string& file_name, const Page& page,
                               const RenderContext& context, const HeaderFooter& layout,
                               const markdown::MarkdownRenderer& renderer)
    -> Result<std::string, BuildError>;

/// Renders and writes every page into `output_dir`. Returns the page count.
/// A page keyed by an empty file name is a `ParserContract` error.
[[nodiscard]] auto render_all(const PageMap& pages, const CategoryIndex& categories,
                              const json::JsonValue& config, const HeaderFooter& layout,
                              const markdown::MarkdownRenderer& renderer,
                              const std::filesystem::path& output_dir)
    -> Result<size_t, BuildError>;

} // namespace stylebook::build

#endif // STYLEBOOK_BUILD_RENDER_PIPELINE_HPP
