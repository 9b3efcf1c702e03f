//! # Markdown Rendering
//!
//! Converts documentation markdown into HTML fragments.
//!
//! ## Architecture
//!
//! - `MarkdownRenderer`: the capability the render pipeline consumes
//! - `HtmlRenderer`: built-in implementation (headings, paragraphs, emphasis,
//!   inline code, links, lists, blockquotes, rules, raw HTML, fenced code
//!   blocks and pipe tables)
//! - `MarkdownRendererRegistry`: named factories, selected through the
//!   `custom_markdown` configuration key
//!
//! Renderers are constructed with the build's `LinkResolver` and
//! `CodeExampleRenderer`; both must outlive the renderer.

#ifndef STYLEBOOK_MARKDOWN_RENDERER_HPP
#define STYLEBOOK_MARKDOWN_RENDERER_HPP

#include "build/errors.hpp"
#include "common.hpp"
#include "markdown/code_example.hpp"
#include "markdown/link_resolver.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace stylebook::markdown {

/// Markdown to HTML capability.
class MarkdownRenderer {
public:
    virtual ~MarkdownRenderer() = default;

    /// Renders a markdown document. Fails only when a code example template fails.
    [[nodiscard]] virtual auto render(std::string_view markdown) const
        -> Result<std::string, build::TemplateError> = 0;
};

/// The built-in renderer.
class HtmlRenderer : public MarkdownRenderer {
public:
    HtmlRenderer(const LinkResolver& links, const CodeExampleRenderer& examples)
        : links_(links), examples_(examples) {}

    [[nodiscard]] auto render(std::string_view markdown) const
        -> Result<std::string, build::TemplateError> override;

    /// Renders span-level markdown (emphasis, code, links, `[[component]]`).
    [[nodiscard]] auto render_inline(std::string_view text) const -> std::string;

private:
    const LinkResolver& links_;
    const CodeExampleRenderer& examples_;

    auto render_lines(const std::vector<std::string>& lines) const
        -> Result<std::string, build::TemplateError>;
    auto render_table(const std::vector<std::string>& rows) const -> std::string;
    auto render_list(const std::vector<std::string>& lines, bool ordered) const
        -> Result<std::string, build::TemplateError>;
    auto render_component_link(std::string_view reference) const -> std::string;
};

using MarkdownRendererFactory =
    std::function<Box<MarkdownRenderer>(const LinkResolver&, const CodeExampleRenderer&)>;

/// Named markdown renderer factories. `default` is always registered.
class MarkdownRendererRegistry {
public:
    MarkdownRendererRegistry();

    /// Registers or replaces `name`.
    void register_renderer(std::string name, MarkdownRendererFactory factory);

    [[nodiscard]] auto find(const std::string& name) const -> const MarkdownRendererFactory*;

    [[nodiscard]] auto names() const -> std::vector<std::string>;

    static constexpr const char* DEFAULT_RENDERER = "default";

private:
    std::map<std::string, MarkdownRendererFactory> factories_;
};

} // namespace stylebook::markdown

#endif // STYLEBOOK_MARKDOWN_RENDERER_HPP
