//! # Template Language Tests
//!
//! Compilation errors with line numbers, value substitution and escaping,
//! conditionals, loops over arrays and objects, and render errors.

#include "build/template.hpp"
#include "json/json.hpp"

#include <gtest/gtest.h>

using namespace stylebook;
using namespace stylebook::build;

namespace {

json::JsonValue parse(std::string_view text) {
    auto result = json::parse_json(text);
    EXPECT_TRUE(is_ok(result));
    return std::move(unwrap(result));
}

/// Compiles and renders `source` against the members of `data`.
std::string render(std::string_view source, const json::JsonValue& data) {
    auto tpl = Template::compile(source, "test.html");
    EXPECT_TRUE(is_ok(tpl)) << (is_err(tpl) ? unwrap_err(tpl).to_string() : "");
    if (is_err(tpl)) {
        return "";
    }

    auto html = unwrap(tpl).render(TemplateContext(to_template_data(data)));
    EXPECT_TRUE(is_ok(html)) << (is_err(html) ? unwrap_err(html).to_string() : "");
    return is_ok(html) ? unwrap(html) : "";
}

TemplateError render_error(std::string_view source, const json::JsonValue& data) {
    auto tpl = Template::compile(source, "page.html");
    EXPECT_TRUE(is_ok(tpl));
    if (is_err(tpl)) {
        return unwrap_err(tpl);
    }
    auto html = unwrap(tpl).render(TemplateContext(to_template_data(data)));
    EXPECT_TRUE(is_err(html));
    return is_err(html) ? unwrap_err(html) : TemplateError{};
}

TemplateError compile_error(std::string_view source) {
    auto tpl = Template::compile(source, "broken.html");
    EXPECT_TRUE(is_err(tpl));
    return is_err(tpl) ? unwrap_err(tpl) : TemplateError{};
}

} // namespace

// ============================================================================
// Escaping
// ============================================================================

TEST(EscapeHtmlTest, EscapesSpecialCharacters) {
    EXPECT_EQ(escape_html(R"(<a href="x">Tom & 'Jerry'</a>)"),
              "&lt;a href=&quot;x&quot;&gt;Tom &amp; &#39;Jerry&#39;&lt;/a&gt;");
    EXPECT_EQ(escape_html("plain"), "plain");
}

// ============================================================================
// Data Conversion
// ============================================================================

TEST(TemplateDataTest, ConvertsConfigValues) {
    auto data = to_template_data(
        parse(R"({"title": "Kit", "count": 3, "ratio": 0.5, "ok": false, "none": null,
                  "dirs": ["./build", "./fonts"]})"));

    ASSERT_TRUE(data.is_object());
    EXPECT_EQ(data["title"], "Kit");
    EXPECT_TRUE(data["count"].is_number_integer());
    EXPECT_EQ(data["count"], 3);
    EXPECT_DOUBLE_EQ(data["ratio"].get<double>(), 0.5);
    EXPECT_EQ(data["ok"], false);
    EXPECT_TRUE(data["none"].is_null());
    ASSERT_EQ(data["dirs"].size(), 2u);
    EXPECT_EQ(data["dirs"][1], "./fonts");
}

// ============================================================================
// Values
// ============================================================================

TEST(TemplateRenderTest, PlainTextPassesThrough) {
    EXPECT_EQ(render("<p>{ not a tag }</p>", parse("{}")), "<p>{ not a tag }</p>");
}

TEST(TemplateRenderTest, SubstitutesValues) {
    auto data = parse(R"({"title": "Base CSS", "count": 3, "ok": true, "none": null})");
    EXPECT_EQ(render("{{ title }}|{{count}}|{{ ok }}|{{ none }}|", data), "Base CSS|3|true||");
}

TEST(TemplateRenderTest, DottedLookup) {
    auto data = parse(R"({"config": {"site": {"name": "Kit"}}, "blocks": [{"name": "btn"}]})");
    EXPECT_EQ(render("{{ config.site.name }} {{ blocks.0.name }}", data), "Kit btn");
}

TEST(TemplateRenderTest, ContainersRenderAsJson) {
    auto data = parse(R"({"list": [1, "a"], "obj": {"k": null}})");
    EXPECT_EQ(render("{{ list }} {{ obj }}", data), R"([1,"a"] {"k":null})");
}

TEST(TemplateRenderTest, EscapeCallback) {
    auto data = parse(R"({"title": "<b>Tables & Lists</b>", "none": null, "count": 2})");
    EXPECT_EQ(render("{{ escape(title) }}", data), "&lt;b&gt;Tables &amp; Lists&lt;/b&gt;");
    EXPECT_EQ(render("{{ title }}", data), "<b>Tables & Lists</b>");
    EXPECT_EQ(render("[{{ escape(none) }}][{{ escape(count) }}]", data), "[][2]");
}

TEST(TemplateRenderTest, CommentsAreDropped) {
    EXPECT_EQ(render("a{# hidden {{ x }} #}b", parse("{}")), "ab");
}

TEST(TemplateRenderTest, LaterBindingReplacesEarlier) {
    TemplateContext context;
    context.bind("title", "first");
    context.bind("title", "second");

    auto tpl = Template::compile("{{ title }}");
    ASSERT_TRUE(is_ok(tpl));
    auto html = unwrap(tpl).render(context);
    ASSERT_TRUE(is_ok(html));
    EXPECT_EQ(unwrap(html), "second");
}

TEST(TemplateRenderTest, DefaultTemplateRendersNothing) {
    Template empty;
    auto html = empty.render(TemplateContext{});
    ASSERT_TRUE(is_ok(html));
    EXPECT_EQ(unwrap(html), "");
}

TEST(TemplateRenderTest, MissingVariableFails) {
    auto error = render_error("ok\n{{ missing }}", parse("{}"));
    EXPECT_EQ(error.line, 2u);
    EXPECT_EQ(error.to_string().rfind("page.html:2: ", 0), 0u) << error.to_string();
    EXPECT_NE(error.message.find("missing"), std::string::npos) << error.message;
}

// ============================================================================
// Conditionals
// ============================================================================

TEST(TemplateRenderTest, IfElse) {
    auto data = parse(R"({"yes": "x", "empty": "", "zero": 0, "list": [], "full": [1]})");
    EXPECT_EQ(render("{% if yes %}Y{% else %}N{% endif %}", data), "Y");
    EXPECT_EQ(render("{% if empty %}Y{% else %}N{% endif %}", data), "N");
    EXPECT_EQ(render("{% if zero %}Y{% else %}N{% endif %}", data), "N");
    EXPECT_EQ(render("{% if list %}Y{% else %}N{% endif %}", data), "N");
    EXPECT_EQ(render("{% if full %}Y{% endif %}", data), "Y");
}

// ============================================================================
// Loops
// ============================================================================

TEST(TemplateRenderTest, ForOverArray) {
    auto data = parse(R"({"categories": [{"name": "Base CSS", "file": "base_css.html"},
                                         {"name": "Forms", "file": "forms.html"}]})");
    EXPECT_EQ(render("{% for c in categories %}<a href=\"{{ c.file }}\">{{ c.name }}</a>"
                     "{% endfor %}",
                     data),
              R"(<a href="base_css.html">Base CSS</a><a href="forms.html">Forms</a>)");
}

TEST(TemplateRenderTest, LoopVariables) {
    auto data = parse(R"({"items": ["a", "b", "c"]})");
    EXPECT_EQ(render("{% for i in items %}{{ loop.index }}{{ i }}{% if loop.is_last %}.{% else %},"
                     "{% endif %}{% endfor %}",
                     data),
              "0a,1b,2c.");
    EXPECT_EQ(render("{% for i in items %}{{ loop.index1 }}{% endfor %}", data), "123");
}

TEST(TemplateRenderTest, NestedLoops) {
    auto data = parse(R"({"rows": [[1, 2], [3]]})");
    EXPECT_EQ(render("{% for i in rows %}[{% for j in i %}{{ j }}{% endfor %}]{% endfor %}", data),
              "[12][3]");
}

TEST(TemplateRenderTest, ForOverObjectInKeyOrder) {
    auto data = parse(R"({"map": {"b": 2, "a": 1}})");
    EXPECT_EQ(render("{% for key, value in map %}{{ key }}={{ value }};{% endfor %}", data),
              "a=1;b=2;");
}

TEST(TemplateRenderTest, ForOverScalarFails) {
    auto error = render_error("line one\n{% for x in title %}{% endfor %}",
                              parse(R"({"title": "Buttons"})"));
    EXPECT_EQ(error.name, "page.html");
    EXPECT_EQ(error.line, 2u);
    EXPECT_FALSE(error.message.empty());
}

// ============================================================================
// Compile Errors
// ============================================================================

TEST(TemplateCompileTest, UnterminatedTag) {
    auto error = compile_error("ok\n{{ title");
    EXPECT_FALSE(error.message.empty());
    EXPECT_EQ(error.line, 2u);
}

TEST(TemplateCompileTest, UnbalancedBlocks) {
    EXPECT_FALSE(compile_error("{% endif %}").message.empty());
    EXPECT_EQ(compile_error("\n\n{% if x %}open").line, 3u);
    EXPECT_FALSE(compile_error("{% for x in y %}{% endif %}").message.empty());
}

TEST(TemplateCompileTest, UnknownFunction) {
    auto error = compile_error("{{ upper(title) }}");
    EXPECT_NE(error.message.find("upper"), std::string::npos) << error.message;
}

TEST(TemplateCompileTest, ErrorCarriesTemplateName) {
    auto error = compile_error("{% bogus %}");
    EXPECT_EQ(error.name, "broken.html");
    EXPECT_EQ(error.to_string().rfind("broken.html:1: ", 0), 0u) << error.to_string();
}
