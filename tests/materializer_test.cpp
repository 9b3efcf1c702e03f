//! # Output Materialization Tests
//!
//! Page writes, asset and dependency copies, and header/footer loading from
//! the documentation assets directory.

#include "build/materializer.hpp"
#include "build/template_loader.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace stylebook;
using namespace stylebook::build;
using stylebook::testing::contains;
using stylebook::testing::TempDirTest;

class MaterializerTest : public TempDirTest {
protected:
    DiagnosticSink diagnostics{false};
};

// ============================================================================
// Pages
// ============================================================================

TEST_F(MaterializerTest, WritePageCreatesDirectories) {
    auto result = write_page(root / "docs" / "nested", "index.html", "<p>hi</p>");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(read("docs/nested/index.html"), "<p>hi</p>");
}

TEST_F(MaterializerTest, WritePageTruncates) {
    write("docs/index.html", "a much longer previous version");
    ASSERT_TRUE(is_ok(write_page(root / "docs", "index.html", "short")));
    EXPECT_EQ(read("docs/index.html"), "short");
}

TEST_F(MaterializerTest, WritePageIntoFileFails) {
    write("blocked", "not a directory");
    auto result = write_page(root / "blocked", "index.html", "x");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildErrorKind::Io);
}

// ============================================================================
// Assets
// ============================================================================

TEST_F(MaterializerTest, CopyAssetsSkipsUnderscoreEntries) {
    write("assets/_header.html", "header");
    write("assets/_partials/nav.html", "nav");
    write("assets/styleguide.css", "body {}");
    write("assets/images/logo.svg", "<svg/>");

    auto copied = copy_assets(root / "assets", root / "docs");
    ASSERT_TRUE(is_ok(copied));
    EXPECT_EQ(unwrap(copied), 2u);
    EXPECT_EQ(read("docs/styleguide.css"), "body {}");
    EXPECT_EQ(read("docs/images/logo.svg"), "<svg/>");
    EXPECT_FALSE(exists("docs/_header.html"));
    EXPECT_FALSE(exists("docs/_partials"));
}

TEST_F(MaterializerTest, CopyAssetsReplacesInsteadOfMerging) {
    write("assets/images/new.png", "new");
    write("docs/images/old.png", "old");

    ASSERT_TRUE(is_ok(copy_assets(root / "assets", root / "docs")));
    EXPECT_TRUE(exists("docs/images/new.png"));
    EXPECT_FALSE(exists("docs/images/old.png"));
}

TEST_F(MaterializerTest, CopyAssetsWithoutDirectory) {
    auto copied = copy_assets(std::nullopt, root / "docs");
    ASSERT_TRUE(is_ok(copied));
    EXPECT_EQ(unwrap(copied), 0u);
}

TEST_F(MaterializerTest, CopyAssetsFromMissingDirectoryFails) {
    auto copied = copy_assets(root / "nope", root / "docs");
    ASSERT_TRUE(is_err(copied));
    EXPECT_EQ(unwrap_err(copied).kind, BuildErrorKind::Io);
    EXPECT_TRUE(contains(unwrap_err(copied).message, "Could not read documentation assets at"));
}

// ============================================================================
// Dependencies
// ============================================================================

TEST_F(MaterializerTest, CopyDependenciesByBasename) {
    write("build/app.css", ".app {}");
    write("vendor/fonts/a.woff", "font");

    BuildConfig config;
    config.base_path = root;
    config.dependencies = {"./build", "vendor/fonts"};

    EXPECT_EQ(copy_dependencies(config, root / "docs", diagnostics), 2u);
    EXPECT_EQ(read("docs/build/app.css"), ".app {}");
    EXPECT_EQ(read("docs/fonts/a.woff"), "font");
    EXPECT_TRUE(diagnostics.entries().empty());
}

TEST_F(MaterializerTest, MissingDependencyWarnsAndContinues) {
    write("build/app.css", ".app {}");
    write("file.txt", "not a directory");

    BuildConfig config;
    config.base_path = root;
    config.dependencies = {"./missing", "file.txt", "./build"};

    EXPECT_EQ(copy_dependencies(config, root / "docs", diagnostics), 1u);
    EXPECT_TRUE(exists("docs/build/app.css"));

    auto warnings = diagnostics.messages(DiagnosticLevel::Warning);
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0], "Could not copy dependency: ./missing");
    EXPECT_EQ(warnings[1], "Could not copy dependency: file.txt");
}

// ============================================================================
// Header and Footer
// ============================================================================

TEST_F(MaterializerTest, UnderscoreLayoutPreferred) {
    write("assets/_header.html", "A");
    write("assets/header.html", "B");
    write("assets/footer.html", "C");

    auto layout = load_header_footer(root / "assets", diagnostics);
    ASSERT_TRUE(is_ok(layout));
    ASSERT_TRUE(unwrap(layout).header.has_value());
    ASSERT_TRUE(unwrap(layout).footer.has_value());
    EXPECT_EQ(unwrap(layout).header->name(), "_header.html");
    EXPECT_EQ(unwrap(layout).footer->name(), "footer.html");
    EXPECT_TRUE(diagnostics.entries().empty());
}

TEST_F(MaterializerTest, MissingLayoutWarns) {
    mkdir("assets");
    auto layout = load_header_footer(root / "assets", diagnostics);
    ASSERT_TRUE(is_ok(layout));
    EXPECT_FALSE(unwrap(layout).header.has_value());
    EXPECT_FALSE(unwrap(layout).footer.has_value());

    auto warnings = diagnostics.messages(DiagnosticLevel::Warning);
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_TRUE(contains(warnings[0], "No _header.html found in documentation assets"));
    EXPECT_TRUE(contains(warnings[1], "No _footer.html found in documentation assets"));
}

TEST_F(MaterializerTest, NoAssetsDirectoryWarnsTwice) {
    auto layout = load_header_footer(std::nullopt, diagnostics);
    ASSERT_TRUE(is_ok(layout));
    EXPECT_EQ(diagnostics.count(DiagnosticLevel::Warning), 2u);
}

TEST_F(MaterializerTest, BrokenHeaderIsFatal) {
    write("assets/_header.html", "<title>{{ title </title>");
    auto layout = load_header_footer(root / "assets", diagnostics);
    ASSERT_TRUE(is_err(layout));
    EXPECT_EQ(unwrap_err(layout).kind, BuildErrorKind::Template);
    EXPECT_EQ(unwrap_err(layout).message.rfind("_header.html:1: ", 0), 0u)
        << unwrap_err(layout).message;
}
