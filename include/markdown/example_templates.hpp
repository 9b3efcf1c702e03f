//! # Built-in Code Example Templates
//!
//! Default templates for the built-in example types. `stylebook init` writes
//! them into `code_example_templates/` so projects can customize them.

#ifndef STYLEBOOK_MARKDOWN_EXAMPLE_TEMPLATES_HPP
#define STYLEBOOK_MARKDOWN_EXAMPLE_TEMPLATES_HPP

#include <optional>
#include <string_view>
#include <vector>

namespace stylebook::markdown {

/// Source of the built-in template `name` (e.g. "js_example_template").
[[nodiscard]] auto builtin_example_template(std::string_view name)
    -> std::optional<std::string_view>;

/// Template used by custom example types that name no template.
[[nodiscard]] auto generic_example_template() -> std::string_view;

/// Names of the templates written by the scaffold, in creation order.
[[nodiscard]] auto scaffold_example_templates() -> std::vector<std::string_view>;

} // namespace stylebook::markdown

#endif // STYLEBOOK_MARKDOWN_EXAMPLE_TEMPLATES_HPP
