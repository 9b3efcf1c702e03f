//! # Code Example Rendering
//!
//! Turns fenced code blocks into HTML. Blocks tagged with an example type
//! (`html_example`, `js_example`, ...) render both the live example and its
//! highlighted source through an example template; any other language
//! renders as an escaped `<pre><code>` block.
//!
//! ## Example Types
//!
//! | Type | Live output | Lexer |
//! |------|-------------|-------|
//! | `html_example` | code inserted as HTML | `html` |
//! | `js_example` | code inside `<script>` | `js` |
//! | `jsx_example` | code inside `<script type="text/babel">` | `jsx` |
//! | `markdown_example` | code rendered as markdown | `markdown` |
//! | `markdown_table` | each blank-line separated chunk rendered as markdown | `html` |
//!
//! Templates are looked up as `<type>_template.html` in the custom templates
//! directory, falling back to the built-in defaults. Every `*.json` file in
//! the custom renderers directory adds a type:
//!
//! ```json
//! {"example_type": "haml_example", "lexer": "haml", "rendered": "escaped",
//!  "template": "haml_example_template"}
//! ```

#ifndef STYLEBOOK_MARKDOWN_CODE_EXAMPLE_HPP
#define STYLEBOOK_MARKDOWN_CODE_EXAMPLE_HPP

#include "build/diagnostics.hpp"
#include "build/errors.hpp"
#include "build/template.hpp"
#include "common.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stylebook::markdown {

class MarkdownRenderer;

/// How an example's live output is produced from its code.
enum class ExampleOutput {
    Raw,           ///< Code as-is
    Escaped,       ///< Code HTML-escaped
    Script,        ///< Code wrapped in `<script>`
    BabelScript,   ///< Code wrapped in `<script type="text/babel">`
    Markdown,      ///< Code rendered as markdown
    MarkdownTable, ///< Each chunk rendered as markdown, one table row per chunk
};

/// Parses the `rendered` field of a custom renderer ("raw", "escaped", "script").
[[nodiscard]] auto parse_example_output(std::string_view name) -> std::optional<ExampleOutput>;

/// A registered example type with its compiled template.
struct ExampleType {
    std::string name;
    std::string lexer;
    ExampleOutput output;
    build::Template tpl;
};

class CodeExampleRenderer {
public:
    /// Built-in example types with their default templates.
    [[nodiscard]] static auto builtin() -> Result<CodeExampleRenderer, build::BuildError>;

    /// Built-in types with overrides from `templates_dir` plus the custom
    /// types described in `renderers_dir`.
    [[nodiscard]] static auto load(const std::optional<std::filesystem::path>& templates_dir,
                                   const std::optional<std::filesystem::path>& renderers_dir,
                                   build::DiagnosticSink& diagnostics)
        -> Result<CodeExampleRenderer, build::BuildError>;

    [[nodiscard]] auto find(std::string_view language) const -> const ExampleType*;

    /// Renders one fenced block. `markdown` renders markdown-based examples.
    [[nodiscard]] auto render(std::string_view language, std::string_view code,
                              const MarkdownRenderer& markdown) const
        -> Result<std::string, build::TemplateError>;

    [[nodiscard]] auto example_types() const -> std::vector<std::string>;

private:
    std::vector<ExampleType> types_;

    void add(ExampleType type);
};

} // namespace stylebook::markdown

#endif // STYLEBOOK_MARKDOWN_CODE_EXAMPLE_HPP
