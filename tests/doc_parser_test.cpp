//! # Documentation Parser Tests
//!
//! Comment extraction, header parsing, and assembly of category pages from
//! source trees.

#include "doc/doc_parser.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace stylebook;
using namespace stylebook::doc;
using stylebook::testing::contains;
using stylebook::testing::TempDirTest;

// ============================================================================
// Comment Extraction
// ============================================================================

TEST(ExtractDocCommentsTest, FindsEveryComment) {
    bool unterminated = true;
    auto bodies = extract_doc_comments("/* plain */ a {} /*doc one */ b {} /*doc\ntwo\n*/",
                                       unterminated);
    ASSERT_EQ(bodies.size(), 2u);
    EXPECT_EQ(bodies[0], " one ");
    EXPECT_EQ(bodies[1], "\ntwo\n");
    EXPECT_FALSE(unterminated);
}

TEST(ExtractDocCommentsTest, Unterminated) {
    bool unterminated = false;
    auto bodies = extract_doc_comments("/*doc done */ /*doc never closed", unterminated);
    EXPECT_EQ(bodies.size(), 1u);
    EXPECT_TRUE(unterminated);
}

// ============================================================================
// Header Parsing
// ============================================================================

TEST(ParseDocCommentTest, HeaderAndBody) {
    std::vector<std::string> bad;
    auto comment = parse_doc_comment(R"(
  ---
  title: Buttons
  name: buttons
  category: "Base CSS", Forms
  parent: controls
  ---

  Use `.btn`:

      indented code
  )",
                                     bad);
    EXPECT_TRUE(comment.has_header);
    EXPECT_EQ(comment.title, "Buttons");
    EXPECT_EQ(comment.name, "buttons");
    EXPECT_EQ(comment.parent, "controls");
    EXPECT_EQ(comment.categories, (std::vector<std::string>{"Base CSS", "Forms"}));
    EXPECT_EQ(comment.markdown, "Use `.btn`:\n\n    indented code");
    EXPECT_TRUE(bad.empty());
}

TEST(ParseDocCommentTest, KeysAreCaseInsensitiveAndUnknownIgnored) {
    std::vector<std::string> bad;
    auto comment = parse_doc_comment("---\nTitle: 'Grid'\nCategories: Layout\nauthor: me\n---\nx",
                                     bad);
    EXPECT_EQ(comment.title, "Grid");
    EXPECT_EQ(comment.categories, (std::vector<std::string>{"Layout"}));
    EXPECT_EQ(comment.markdown, "x");
}

TEST(ParseDocCommentTest, MalformedHeaderLines) {
    std::vector<std::string> bad;
    auto comment = parse_doc_comment("---\ntitle: Tables\njust words\n---\nbody", bad);
    EXPECT_EQ(comment.title, "Tables");
    ASSERT_EQ(bad.size(), 1u);
    EXPECT_EQ(bad[0], "just words");
}

TEST(ParseDocCommentTest, NoHeader) {
    std::vector<std::string> bad;
    auto comment = parse_doc_comment("\n  Only markdown\n  here\n", bad);
    EXPECT_FALSE(comment.has_header);
    EXPECT_TRUE(comment.title.empty());
    EXPECT_EQ(comment.markdown, "Only markdown\nhere");
}

TEST(ParseDocCommentTest, UnclosedHeaderIsBody) {
    std::vector<std::string> bad;
    auto comment = parse_doc_comment("---\ntitle: X\n", bad);
    EXPECT_FALSE(comment.has_header);
    EXPECT_EQ(comment.markdown, "---\ntitle: X");
}

TEST(DocNamingTest, FileAndBlockNames) {
    EXPECT_EQ(category_file_name("Base CSS"), "base_css.html");
    EXPECT_EQ(category_file_name("  Forms "), "forms.html");
    EXPECT_EQ(default_block_name("Button Sizes"), "button_sizes");
}

// ============================================================================
// Parsing Source Trees
// ============================================================================

class DocParserTest : public TempDirTest {
protected:
    DocParser parser;
    Plugins plugins;
    ParseOptions options;
    build::DiagnosticSink diagnostics{false};

    Result<build::ParseResult, build::BuildError>
    parse(const std::optional<std::string>& index = std::nullopt) {
        return parser.parse({root / "src"}, index, plugins, options, diagnostics);
    }

    std::vector<std::string> warnings() const {
        return diagnostics.messages(build::DiagnosticLevel::Warning);
    }

    static const build::MarkdownPage& markdown_page(const build::ParseResult& result,
                                                    const std::string& file) {
        return std::get<build::MarkdownPage>(result.pages.at(file));
    }
};

TEST_F(DocParserTest, CategoryPageFromComments) {
    write("src/buttons.scss", R"(/*doc
---
title: Buttons
name: buttons
category: Base CSS
---
Use `.btn`.
*/
.btn { color: red; }
/*doc
---
title: Tables
category: Base CSS
---
Striped.
*/)");

    auto result = parse();
    ASSERT_TRUE(is_ok(result));
    const auto& r = unwrap(result);

    ASSERT_EQ(r.pages.size(), 1u);
    ASSERT_EQ(r.categories.size(), 1u);
    EXPECT_EQ(r.categories.file_for("Base CSS"), "base_css.html");

    const auto& page = markdown_page(r, "base_css.html");
    EXPECT_EQ(page.markdown, "<h1 id=\"buttons\" class=\"styleguide\">Buttons</h1>\n\nUse `.btn`.\n\n"
                             "<h1 id=\"tables\" class=\"styleguide\">Tables</h1>\n\nStriped.\n\n");
    ASSERT_EQ(page.blocks.size(), 2u);
    EXPECT_EQ(page.blocks[1].name, "tables");
    EXPECT_TRUE(warnings().empty());
}

TEST_F(DocParserTest, BlockInSeveralCategories) {
    write("src/a.css", "/*doc\n---\ntitle: Grid\ncategory: Layout, Base CSS\n---\n*/");
    auto result = parse();
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).pages.count("layout.html"), 1u);
    EXPECT_EQ(unwrap(result).pages.count("base_css.html"), 1u);
    EXPECT_EQ(unwrap(result).categories.entries()[0].first, "Layout");
}

TEST_F(DocParserTest, ChildrenNestUnderParent) {
    write("src/a.css", R"(/*doc
---
title: Button Sizes
parent: buttons
---
Small and large.
*/
/*doc
---
title: Buttons
name: buttons
category: Base CSS
---
*/)");

    auto result = parse();
    ASSERT_TRUE(is_ok(result));
    const auto& page = markdown_page(unwrap(result), "base_css.html");
    EXPECT_EQ(page.markdown,
              "<h1 id=\"buttons\" class=\"styleguide\">Buttons</h1>\n\n"
              "<h2 id=\"button_sizes\" class=\"styleguide\">Button Sizes</h2>\n\nSmall and large.\n\n");
    ASSERT_EQ(page.blocks.size(), 1u);
    EXPECT_TRUE(page.blocks[0].children.empty());
}

TEST_F(DocParserTest, NavLevels) {
    write("src/a.css", "/*doc\n---\ntitle: Forms\ncategory: Forms\n---\n*/\n"
                       "/*doc\n---\ntitle: Inputs\nparent: forms\n---\n*/\n"
                       "/*doc\n---\ntitle: Checkbox\nparent: inputs\n---\n*/");

    options.nav_level = build::NavLevel::Section;
    auto section = parse();
    ASSERT_TRUE(is_ok(section));
    const auto& tree = markdown_page(unwrap(section), "forms.html").blocks;
    ASSERT_EQ(tree.size(), 1u);
    ASSERT_EQ(tree[0].children.size(), 1u);
    EXPECT_EQ(tree[0].children[0].children[0].name, "checkbox");

    options.nav_level = build::NavLevel::All;
    auto all = parse();
    ASSERT_TRUE(is_ok(all));
    const auto& flat = markdown_page(unwrap(all), "forms.html").blocks;
    ASSERT_EQ(flat.size(), 3u);
    EXPECT_EQ(flat[2].name, "checkbox");
    EXPECT_TRUE(flat[0].children.empty());
}

TEST_F(DocParserTest, StandaloneMarkdownAndTemplatePages) {
    write("src/about.md", "# About");
    write("src/basics.md", "# Welcome");
    write("src/sub/raw.html", "<p>{{ title }}</p>");

    auto result = parse(std::string("basics"));
    ASSERT_TRUE(is_ok(result));
    const auto& pages = unwrap(result).pages;
    EXPECT_EQ(markdown_page(unwrap(result), "about.html").markdown, "# About");
    EXPECT_EQ(markdown_page(unwrap(result), "index.html").markdown, "# Welcome");
    EXPECT_EQ(pages.count("basics.html"), 0u);
    ASSERT_EQ(pages.count("raw.html"), 1u);
    EXPECT_EQ(std::get<build::TemplatePage>(pages.at("raw.html")).source, "<p>{{ title }}</p>");
}

TEST_F(DocParserTest, IndexCopiedFromMatchingCategory) {
    write("src/a.css", "/*doc\n---\ntitle: Colors\ncategory: Basics\n---\n*/");
    auto result = parse(std::string("basics"));
    ASSERT_TRUE(is_ok(result));
    const auto& r = unwrap(result);
    ASSERT_EQ(r.pages.count("index.html"), 1u);
    EXPECT_EQ(markdown_page(r, "index.html").markdown, markdown_page(r, "basics.html").markdown);
}

TEST_F(DocParserTest, NoIndexWithoutMatch) {
    write("src/a.css", "/*doc\n---\ntitle: Colors\ncategory: Basics\n---\n*/");
    auto result = parse(std::string("welcome"));
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).pages.count("index.html"), 0u);
}

TEST_F(DocParserTest, UnscannedExtensionsAndCustomExtensions) {
    write("src/notes.txt", "/*doc\n---\ntitle: Hidden\ncategory: X\n---\n*/");
    write("src/widget.vue", "/*doc\n---\ntitle: Widget\ncategory: Vue\n---\n*/");

    auto plain = parse();
    ASSERT_TRUE(is_ok(plain));
    EXPECT_TRUE(unwrap(plain).pages.empty());

    options.custom_extensions = {".vue"};
    auto custom = parse();
    ASSERT_TRUE(is_ok(custom));
    EXPECT_EQ(unwrap(custom).pages.count("vue.html"), 1u);
    EXPECT_EQ(unwrap(custom).pages.count("x.html"), 0u);
}

TEST_F(DocParserTest, IgnorePaths) {
    write("src/keep.css", "/*doc\n---\ntitle: Keep\ncategory: Kept\n---\n*/");
    write("src/vendor/lib.css", "/*doc\n---\ntitle: Lib\ncategory: Vendor\n---\n*/");
    write("src/deep/node_modules/x.css", "/*doc\n---\ntitle: Mod\ncategory: Modules\n---\n*/");

    options.ignore_paths = {"./vendor/", "node_modules"};
    auto result = parse();
    ASSERT_TRUE(is_ok(result));
    const auto& pages = unwrap(result).pages;
    EXPECT_EQ(pages.size(), 1u);
    EXPECT_EQ(pages.count("kept.html"), 1u);
}

TEST_F(DocParserTest, FilesParsedInSortedOrder) {
    write("src/b.css", "/*doc\n---\ntitle: Second\ncategory: Order\n---\n*/");
    write("src/a.css", "/*doc\n---\ntitle: First\ncategory: Order\n---\n*/");
    auto result = parse();
    ASSERT_TRUE(is_ok(result));
    const auto& blocks = markdown_page(unwrap(result), "order.html").blocks;
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].name, "first");
    EXPECT_EQ(blocks[1].name, "second");
}

// ============================================================================
// Warnings
// ============================================================================

TEST_F(DocParserTest, WarningsForProblemBlocks) {
    write("src/a.css", "/*doc\n---\ntitle: Lonely\n---\n*/\n"
                       "/*doc\n---\ncategory: X\n---\nno title\n*/\n"
                       "/*doc\n---\ntitle: Orphan\nparent: ghost\ncategory: X\n---\n*/\n"
                       "/*doc\n---\ntitle: Lonely\ncategory: X\n---\n*/\n"
                       "/*doc\n---\ntitle: Broken\nnonsense\ncategory: X\n---\n*/\n"
                       "/*doc never closed");

    auto result = parse();
    ASSERT_TRUE(is_ok(result));
    auto w = warnings();
    std::string a = (root / "src" / "a.css").string();

    auto has = [&w](const std::string& message) {
        return std::find(w.begin(), w.end(), message) != w.end();
    };
    EXPECT_TRUE(has("Unterminated documentation comment in " + a));
    EXPECT_TRUE(has("Skipping documentation block without name or title in " + a));
    EXPECT_TRUE(has("Could not find parent component ghost for orphan"));
    EXPECT_TRUE(has("Duplicate component name lonely in " + a));
    EXPECT_TRUE(has("Ignoring malformed header line 'nonsense' in " + a));
    EXPECT_TRUE(has("Component lonely in " + a + " has no category and will not be rendered"));
}

TEST_F(DocParserTest, ParentCycleIsReported) {
    write("src/a.css", "/*doc\n---\ntitle: A\nparent: b\ncategory: X\n---\n*/\n"
                       "/*doc\n---\ntitle: B\nparent: a\ncategory: X\n---\n*/");
    auto result = parse();
    ASSERT_TRUE(is_ok(result));
    auto w = warnings();
    ASSERT_EQ(w.size(), 1u);
    EXPECT_EQ(w[0], "Could not find parent component a for b");
    EXPECT_EQ(unwrap(result).pages.count("x.html"), 1u);
}

TEST_F(DocParserTest, DuplicatePages) {
    write("src/one/about.md", "first");
    write("src/two/about.md", "second");
    write("src/forms.html", "<p>custom forms page</p>");
    write("src/a.css", "/*doc\n---\ntitle: Inputs\ncategory: Forms\n---\n*/");

    auto result = parse();
    ASSERT_TRUE(is_ok(result));
    const auto& pages = unwrap(result).pages;
    EXPECT_EQ(markdown_page(unwrap(result), "about.html").markdown, "first");
    EXPECT_TRUE(std::holds_alternative<build::TemplatePage>(pages.at("forms.html")));

    auto w = warnings();
    ASSERT_EQ(w.size(), 2u);
    EXPECT_TRUE(contains(w[0], "Duplicate page about.html")) << w[0];
    EXPECT_EQ(w[1], "Category page forms.html conflicts with a page of the same name, keeping "
                    "the page");
}

TEST_F(DocParserTest, MissingInputDirectoryIsParseError) {
    auto result = parser.parse({root / "nowhere"}, std::nullopt, plugins, options, diagnostics);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, build::BuildErrorKind::Parse);
    EXPECT_TRUE(contains(unwrap_err(result).message, "Could not read source directory"));
}

TEST_F(DocParserTest, SeveralInputDirectories) {
    write("src/a.css", "/*doc\n---\ntitle: A\ncategory: Shared\n---\n*/");
    write("more/b.css", "/*doc\n---\ntitle: B\ncategory: Shared\n---\n*/");

    auto result = parser.parse({root / "more", root / "src"}, std::nullopt, plugins, options,
                               diagnostics);
    ASSERT_TRUE(is_ok(result));
    const auto& blocks = markdown_page(unwrap(result), "shared.html").blocks;
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].name, "b");
    EXPECT_EQ(blocks[1].name, "a");
}
