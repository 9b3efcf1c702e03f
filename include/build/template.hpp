//! # Page Templates
//!
//! Header, footer, raw-template pages and code-example templates are inja
//! templates. Each is parsed once by `Template::compile` and rendered against
//! an `nlohmann::json` object. Configuration stays a `json::JsonValue` and
//! is converted with `to_template_data` when it is bound.
//!
//! ## Syntax
//!
//! | Construct | Meaning |
//! |-----------|---------|
//! | `{{ title }}`, `{{ config.title }}`, `{{ blocks.0.name }}` | Substitute a value |
//! | `{{ escape(title) }}` | Substitute HTML-escaped |
//! | `{% if title %}..{% else %}..{% endif %}` | Conditional on truthiness |
//! | `{% for block in blocks %}..{% endfor %}` | Loop; `loop.index` is 0-based, `loop.is_last` |
//! | `{% for key, value in config %}` | Loop over an object in key order |
//! | `{# ... #}` | Comment |
//!
//! Strings render as-is, null as nothing, other values as compact JSON.
//! Referencing a name that is not bound is a render error.
//!
//! ## Example
//!
//! ```cpp
//! auto tpl = Template::compile("<title>{{ escape(title) }}</title>", "_header.html");
//! TemplateContext ctx;
//! ctx.bind("title", "Base CSS");
//! auto html = unwrap(tpl).render(ctx);
//! ```

#ifndef STYLEBOOK_BUILD_TEMPLATE_HPP
#define STYLEBOOK_BUILD_TEMPLATE_HPP

#include "build/errors.hpp"
#include "common.hpp"
#include "json/json_value.hpp"

#include <inja/inja.hpp>
#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace stylebook::build {

/// Data a template renders against.
using TemplateData = nlohmann::json;

/// Escapes `& < > " '` for HTML text and attribute values.
[[nodiscard]] auto escape_html(std::string_view text) -> std::string;

/// Converts a configuration value into template data.
[[nodiscard]] auto to_template_data(const json::JsonValue& value) -> TemplateData;

/// Named values visible to a render.
class TemplateContext {
public:
    TemplateContext() = default;

    /// Starts from the keys of `shared`, which must be an object.
    explicit TemplateContext(TemplateData shared) : data_(std::move(shared)) {}

    /// Binds `name`, replacing an earlier binding of the same name.
    void bind(const std::string& name, TemplateData value) {
        data_[name] = std::move(value);
    }

    [[nodiscard]] auto data() const -> const TemplateData& {
        return data_;
    }

private:
    TemplateData data_ = TemplateData::object();
};

/// A parsed template.
class Template {
public:
    /// An empty template; renders as "".
    Template() = default;

    /// Parses `source`. `name` only labels errors.
    [[nodiscard]] static auto compile(std::string_view source, std::string name = "")
        -> Result<Template, TemplateError>;

    [[nodiscard]] auto render(const TemplateContext& context) const
        -> Result<std::string, TemplateError>;

    [[nodiscard]] auto name() const -> const std::string& {
        return name_;
    }

private:
    std::string name_;
    Rc<inja::Environment> env_;
    inja::Template parsed_;
};

} // namespace stylebook::build

#endif // STYLEBOOK_BUILD_TEMPLATE_HPP
