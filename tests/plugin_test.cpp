//! # Plugin Tests
//!
//! Plugin activation from configuration and command line, hook error
//! propagation, and the built-in search index.

#include "build/template.hpp"
#include "doc/doc_parser.hpp"
#include "doc/search_index.hpp"
#include "json/json.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace stylebook;
using namespace stylebook::doc;
using stylebook::testing::contains;
using stylebook::testing::TempDirTest;

namespace {

/// Records every hook call; fails on a block named "explode".
class RecordingPlugin : public Plugin {
public:
    std::vector<std::string>* seen;

    explicit RecordingPlugin(std::vector<std::string>* seen) : seen(seen) {}

    auto name() const -> std::string_view override {
        return "recording";
    }

    auto on_block(const build::ContentBlock& block, const std::filesystem::path& file)
        -> Result<Unit, std::string> override {
        if (block.name == "explode") {
            return std::string("refusing ") + block.name;
        }
        seen->push_back(block.name + "@" + file.filename().string());
        return Unit{};
    }

    auto finalize(build::PageMap& pages) -> Result<Unit, std::string> override {
        seen->push_back("finalize:" + std::to_string(pages.size()));
        pages.emplace("extra.html", build::TemplatePage{"extra"});
        return Unit{};
    }
};

build::ContentBlock named(std::string name) {
    build::ContentBlock block;
    block.name = name;
    block.title = std::move(name);
    return block;
}

} // namespace

// ============================================================================
// Activation
// ============================================================================

class PluginsTest : public ::testing::Test {
protected:
    std::vector<std::string> seen;
    PluginRegistry registry = PluginRegistry::with_builtins();
    build::DiagnosticSink diagnostics{false};

    void SetUp() override {
        registry.register_plugin("recording",
                                 [this] { return Box<Plugin>(make_box<RecordingPlugin>(&seen)); });
    }
};

TEST_F(PluginsTest, BuiltinsAreRegistered) {
    EXPECT_TRUE(registry.contains(SearchIndexPlugin::NAME));
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"recording", "search_index"}));
    EXPECT_EQ(registry.create("nope").get(), nullptr);
}

TEST_F(PluginsTest, ActivatedFromConfigAndArguments) {
    Plugins plugins(registry, {"search_index"}, {"--recording", "--verbose", "positional"},
                    diagnostics);
    EXPECT_EQ(plugins.active_names(), (std::vector<std::string>{"search_index", "recording"}));
    EXPECT_TRUE(diagnostics.entries().empty());
}

TEST_F(PluginsTest, DuplicatesActivateOnce) {
    Plugins plugins(registry, {"recording", "recording"}, {"--recording"}, diagnostics);
    EXPECT_EQ(plugins.active_names(), (std::vector<std::string>{"recording"}));
}

TEST_F(PluginsTest, UnknownConfiguredPluginWarns) {
    Plugins plugins(registry, {"sitemap"}, {}, diagnostics);
    EXPECT_TRUE(plugins.empty());
    auto warnings = diagnostics.messages(build::DiagnosticLevel::Warning);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0], "Unknown plugin sitemap in config");
}

TEST_F(PluginsTest, HookErrorsBecomePluginErrors) {
    Plugins plugins(registry, {"recording"}, {}, diagnostics);

    ASSERT_TRUE(is_ok(plugins.on_block(named("buttons"), "src/buttons.css")));
    auto failed = plugins.on_block(named("explode"), "src/x.css");
    ASSERT_TRUE(is_err(failed));
    EXPECT_EQ(unwrap_err(failed).kind, build::BuildErrorKind::Plugin);
    EXPECT_EQ(unwrap_err(failed).message,
              "Plugin recording failed on block explode: refusing explode");
    EXPECT_EQ(seen, (std::vector<std::string>{"buttons@buttons.css"}));
}

// ============================================================================
// Parser Integration
// ============================================================================

class PluginParseTest : public TempDirTest {
protected:
    std::vector<std::string> seen;
    PluginRegistry registry = PluginRegistry::with_builtins();
    build::DiagnosticSink diagnostics{false};
    DocParser parser;
    ParseOptions options;

    void SetUp() override {
        TempDirTest::SetUp();
        registry.register_plugin("recording",
                                 [this] { return Box<Plugin>(make_box<RecordingPlugin>(&seen)); });
        write("src/buttons.css", "/*doc\n---\ntitle: Buttons\nname: buttons\ncategory: Base CSS\n"
                                 "---\n*/\n/*doc\n---\ntitle: Sizes\nparent: buttons\n---\n*/");
        write("src/forms.scss", "/*doc\n---\ntitle: {{ Inputs }}\nname: inputs\ncategory: Forms\n"
                                "---\n*/");
    }
};

TEST_F(PluginParseTest, HooksSeeEveryBlockThenFinalize) {
    Plugins plugins(registry, {"recording"}, {}, diagnostics);
    auto result = parser.parse({root / "src"}, std::nullopt, plugins, options, diagnostics);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(seen, (std::vector<std::string>{"buttons@buttons.css", "sizes@buttons.css",
                                              "inputs@forms.scss", "finalize:2"}));
    EXPECT_EQ(unwrap(result).pages.count("extra.html"), 1u);
}

TEST_F(PluginParseTest, FailingHookAbortsParse) {
    write("src/zz.css", "/*doc\n---\ntitle: Explode\ncategory: X\n---\n*/");
    Plugins plugins(registry, {"recording"}, {}, diagnostics);
    auto result = parser.parse({root / "src"}, std::nullopt, plugins, options, diagnostics);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, build::BuildErrorKind::Plugin);
}

// ============================================================================
// Search Index
// ============================================================================

TEST_F(PluginParseTest, SearchIndexListsEveryComponent) {
    Plugins plugins(registry, {}, {"--search_index"}, diagnostics);
    auto result = parser.parse({root / "src"}, std::nullopt, plugins, options, diagnostics);
    ASSERT_TRUE(is_ok(result));

    const auto& pages = unwrap(result).pages;
    ASSERT_EQ(pages.count(SearchIndexPlugin::OUTPUT_FILE), 1u);
    const auto& source = std::get<build::TemplatePage>(pages.at(SearchIndexPlugin::OUTPUT_FILE))
                             .source;

    // The page is rendered as a template, so it must come out unchanged.
    auto tpl = build::Template::compile(source, SearchIndexPlugin::OUTPUT_FILE);
    ASSERT_TRUE(is_ok(tpl));
    auto rendered = unwrap(tpl).render(build::TemplateContext{});
    ASSERT_TRUE(is_ok(rendered));
    EXPECT_EQ(unwrap(rendered), source);

    auto doc = json::parse_json(source);
    ASSERT_TRUE(is_ok(doc));
    const auto& entries = unwrap(doc).as_array();
    ASSERT_EQ(entries.size(), 2u);

    EXPECT_EQ(entries[0].get("name")->as_string(), "buttons");
    EXPECT_EQ(entries[0].get("page")->as_string(), "base_css.html");
    EXPECT_EQ(entries[0].get("url")->as_string(), "base_css.html#buttons");
    EXPECT_EQ(entries[0].get("source")->as_string(), "buttons.css");
    EXPECT_EQ(entries[1].get("title")->as_string(), "{{ Inputs }}");
    EXPECT_EQ(entries[1].get("page")->as_string(), "forms.html");
}

TEST_F(PluginParseTest, SearchIndexIncludesNestedBlocksInSectionMode) {
    options.nav_level = build::NavLevel::Section;
    Plugins plugins(registry, {"search_index"}, {}, diagnostics);
    auto result = parser.parse({root / "src"}, std::nullopt, plugins, options, diagnostics);
    ASSERT_TRUE(is_ok(result));

    const auto& source =
        std::get<build::TemplatePage>(unwrap(result).pages.at(SearchIndexPlugin::OUTPUT_FILE))
            .source;
    EXPECT_TRUE(contains(source, R"("url":"base_css.html#sizes")")) << source;
}

TEST(SearchIndexPluginTest, ExistingPageIsAnError) {
    SearchIndexPlugin plugin;
    build::PageMap pages;
    pages["search_index.json"] = build::TemplatePage{"[]"};
    auto result = plugin.finalize(pages);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), "a page named search_index.json already exists");
}
