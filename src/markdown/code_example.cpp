//! # Code Example Rendering Implementation

#include "markdown/code_example.hpp"

#include "build/file_io.hpp"
#include "json/json.hpp"
#include "log/log.hpp"
#include "markdown/example_templates.hpp"
#include "markdown/renderer.hpp"

#include <algorithm>

namespace stylebook::markdown {

namespace fs = std::filesystem;

namespace {

struct BuiltinExample {
    std::string_view name;
    std::string_view lexer;
    ExampleOutput output;
};

constexpr BuiltinExample BUILTIN_EXAMPLES[] = {
    {"html_example", "html", ExampleOutput::Raw},
    {"js_example", "js", ExampleOutput::Script},
    {"jsx_example", "jsx", ExampleOutput::BabelScript},
    {"markdown_example", "markdown", ExampleOutput::Markdown},
    {"markdown_table", "html", ExampleOutput::MarkdownTable},
};

/// Compiles template `name`: `<templates_dir>/<name>.html` first, then the
/// built-in of that name. Returns nullopt when neither exists.
auto load_example_template(const std::optional<fs::path>& templates_dir, const std::string& name)
    -> Result<std::optional<build::Template>, build::BuildError> {
    std::string file_name = name + ".html";
    if (templates_dir) {
        fs::path path = *templates_dir / file_name;
        std::error_code ec;
        if (fs::is_regular_file(path, ec)) {
            auto source = build::read_file(path);
            if (is_err(source)) {
                return build::BuildError{build::BuildErrorKind::Io, unwrap_err(source).message};
            }
            auto tpl = build::Template::compile(unwrap(source), file_name);
            if (is_err(tpl)) {
                return build::BuildError::from_template(unwrap_err(tpl));
            }
            STYLEBOOK_LOG_DEBUG("render", "Using custom example template " << path.string());
            return std::optional<build::Template>(std::move(unwrap(tpl)));
        }
    }

    if (auto builtin = builtin_example_template(name)) {
        auto tpl = build::Template::compile(*builtin, file_name);
        if (is_err(tpl)) {
            return build::BuildError::from_template(unwrap_err(tpl));
        }
        return std::optional<build::Template>(std::move(unwrap(tpl)));
    }
    return std::optional<build::Template>();
}

auto trim_trailing_newlines(std::string_view code) -> std::string_view {
    while (!code.empty() && (code.back() == '\n' || code.back() == '\r')) {
        code.remove_suffix(1);
    }
    return code;
}

/// Splits `code` into chunks separated by blank lines.
auto split_chunks(std::string_view code) -> std::vector<std::string> {
    std::vector<std::string> chunks;
    std::string current;
    size_t pos = 0;
    while (pos <= code.size()) {
        size_t end = code.find('\n', pos);
        if (end == std::string_view::npos) {
            end = code.size();
        }
        auto line = code.substr(pos, end - pos);
        bool blank = line.find_first_not_of(" \t\r") == std::string_view::npos;
        if (blank) {
            if (!current.empty()) {
                chunks.push_back(std::move(current));
                current.clear();
            }
        } else {
            if (!current.empty()) {
                current += '\n';
            }
            current += line;
        }
        pos = end + 1;
    }
    if (!current.empty()) {
        chunks.push_back(std::move(current));
    }
    return chunks;
}

auto load_custom_type(const fs::path& path, const std::optional<fs::path>& templates_dir)
    -> Result<ExampleType, build::BuildError> {
    auto fail = [&path](const std::string& why) {
        return build::BuildError{build::BuildErrorKind::Parse,
                                 "Could not load code example renderer " + path.string() + ": " +
                                     why};
    };

    auto source = build::read_file(path);
    if (is_err(source)) {
        return build::BuildError{build::BuildErrorKind::Io, unwrap_err(source).message};
    }
    auto doc = json::parse_json(unwrap(source));
    if (is_err(doc)) {
        return fail(unwrap_err(doc).to_string());
    }
    const auto& def = unwrap(doc);
    if (!def.is_object()) {
        return fail("expected a JSON object");
    }

    auto example_type = json::string_of(def.get("example_type"));
    if (!example_type || example_type->empty()) {
        return fail("missing 'example_type'");
    }

    ExampleType type;
    type.name = *example_type;
    type.lexer = json::string_of(def.get("lexer")).value_or("");
    if (type.lexer.empty()) {
        type.lexer = type.name;
        if (type.lexer.size() > 8 && type.lexer.ends_with("_example")) {
            type.lexer.resize(type.lexer.size() - 8);
        }
    }

    type.output = ExampleOutput::Escaped;
    if (auto rendered = json::string_of(def.get("rendered"))) {
        auto output = parse_example_output(*rendered);
        if (!output) {
            return fail("unknown 'rendered' mode '" + *rendered + "'");
        }
        type.output = *output;
    }

    auto template_name = json::string_of(def.get("template"));
    auto tpl = load_example_template(templates_dir, template_name.value_or(type.name + "_template"));
    if (is_err(tpl)) {
        return unwrap_err(tpl);
    }
    if (unwrap(tpl)) {
        type.tpl = std::move(*unwrap(tpl));
    } else if (template_name) {
        return build::BuildError{build::BuildErrorKind::Template,
                                 "Could not find example template " + *template_name};
    } else {
        auto generic = build::Template::compile(generic_example_template(), "example_template.html");
        if (is_err(generic)) {
            return build::BuildError::from_template(unwrap_err(generic));
        }
        type.tpl = std::move(unwrap(generic));
    }
    return type;
}

} // namespace

auto parse_example_output(std::string_view name) -> std::optional<ExampleOutput> {
    if (name == "raw") {
        return ExampleOutput::Raw;
    }
    if (name == "escaped") {
        return ExampleOutput::Escaped;
    }
    if (name == "script") {
        return ExampleOutput::Script;
    }
    return std::nullopt;
}

auto CodeExampleRenderer::builtin() -> Result<CodeExampleRenderer, build::BuildError> {
    build::DiagnosticSink unused(false);
    return load(std::nullopt, std::nullopt, unused);
}

auto CodeExampleRenderer::load(const std::optional<fs::path>& templates_dir,
                               const std::optional<fs::path>& renderers_dir,
                               build::DiagnosticSink& diagnostics)
    -> Result<CodeExampleRenderer, build::BuildError> {
    CodeExampleRenderer renderer;

    for (const auto& builtin : BUILTIN_EXAMPLES) {
        std::string name(builtin.name);
        auto tpl = load_example_template(templates_dir, name + "_template");
        if (is_err(tpl)) {
            return unwrap_err(tpl);
        }
        if (!unwrap(tpl)) {
            return build::BuildError{build::BuildErrorKind::Template,
                                     "Missing built-in template for " + name};
        }
        renderer.add(ExampleType{name, std::string(builtin.lexer), builtin.output,
                                 std::move(*unwrap(tpl))});
    }

    if (!renderers_dir) {
        return renderer;
    }

    std::error_code ec;
    std::vector<fs::path> definitions;
    for (fs::directory_iterator it(*renderers_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() == ".json") {
            definitions.push_back(it->path());
        }
    }
    if (ec) {
        return build::BuildError{build::BuildErrorKind::Io,
                                 "Could not read code example renderers at " +
                                     renderers_dir->string() + ": " + ec.message()};
    }
    std::sort(definitions.begin(), definitions.end());

    for (const auto& path : definitions) {
        auto type = load_custom_type(path, templates_dir);
        if (is_err(type)) {
            return unwrap_err(type);
        }
        if (renderer.find(unwrap(type).name)) {
            diagnostics.warning("render", "Custom code example renderer " + path.string() +
                                              " replaces example type " + unwrap(type).name);
        }
        STYLEBOOK_LOG_DEBUG("render", "Loaded example type " << unwrap(type).name);
        renderer.add(std::move(unwrap(type)));
    }
    return renderer;
}

void CodeExampleRenderer::add(ExampleType type) {
    auto it = std::find_if(types_.begin(), types_.end(),
                           [&type](const ExampleType& t) { return t.name == type.name; });
    if (it != types_.end()) {
        *it = std::move(type);
    } else {
        types_.push_back(std::move(type));
    }
}

auto CodeExampleRenderer::find(std::string_view language) const -> const ExampleType* {
    for (const auto& type : types_) {
        if (type.name == language) {
            return &type;
        }
    }
    return nullptr;
}

auto CodeExampleRenderer::example_types() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(types_.size());
    for (const auto& type : types_) {
        names.push_back(type.name);
    }
    return names;
}

auto CodeExampleRenderer::render(std::string_view language, std::string_view code,
                                 const MarkdownRenderer& markdown) const
    -> Result<std::string, build::TemplateError> {
    std::string_view source = trim_trailing_newlines(code);

    const ExampleType* type = find(language);
    if (!type) {
        std::string html = "<pre><code";
        if (!language.empty()) {
            html += " class=\"language-" + build::escape_html(language) + "\"";
        }
        html += ">" + build::escape_html(source) + "</code></pre>\n";
        return html;
    }

    std::string rendered;
    build::TemplateData examples = build::TemplateData::array();
    switch (type->output) {
    case ExampleOutput::Raw:
        rendered = std::string(source);
        break;
    case ExampleOutput::Escaped:
        rendered = build::escape_html(source);
        break;
    case ExampleOutput::Script:
        rendered = "<script>" + std::string(source) + "</script>";
        break;
    case ExampleOutput::BabelScript:
        rendered = "<script type=\"text/babel\">" + std::string(source) + "</script>";
        break;
    case ExampleOutput::Markdown: {
        auto html = markdown.render(source);
        if (is_err(html)) {
            return unwrap_err(html);
        }
        rendered = std::move(unwrap(html));
        break;
    }
    case ExampleOutput::MarkdownTable:
        for (const auto& chunk : split_chunks(source)) {
            auto html = markdown.render(chunk);
            if (is_err(html)) {
                return unwrap_err(html);
            }
            examples.push_back(build::TemplateData{{"rendered_example", std::move(unwrap(html))},
                                                   {"code_example", build::escape_html(chunk)}});
        }
        break;
    }

    build::TemplateContext context;
    context.bind("rendered_example", std::move(rendered));
    context.bind("code_example", build::escape_html(source));
    context.bind("language", type->lexer);
    context.bind("examples", std::move(examples));
    return type->tpl.render(context);
}

} // namespace stylebook::markdown
