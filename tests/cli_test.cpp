//! # CLI Tests

#include "cli/commands/cmd_build.hpp"
#include "cli/commands/cmd_init.hpp"
#include "cli/utils.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace stylebook;
using stylebook::testing::TempDirTest;

TEST(SplitArgumentsTest, DropsLoggingOptions) {
    const char* args[] = {"stylebook", "site.json", "-vv",           "--search_index",
                          "--log-level=debug", "--quiet", "extra", "--log-file=out.log"};
    auto line = cli::split_arguments(8, const_cast<char**>(args), 1);
    EXPECT_EQ(line.positional, (std::vector<std::string>{"site.json", "extra"}));
    EXPECT_EQ(line.flags, (std::vector<std::string>{"--search_index"}));
}

TEST(SplitArgumentsTest, StartsAtFirst) {
    const char* args[] = {"stylebook", "init", "--help"};
    auto line = cli::split_arguments(3, const_cast<char**>(args), 2);
    EXPECT_TRUE(line.positional.empty());
    EXPECT_EQ(line.flags, (std::vector<std::string>{"--help"}));
}

class CliCommandTest : public TempDirTest {};

TEST_F(CliCommandTest, InitThenBuild) {
    ASSERT_EQ(cli::run_init(root), 0);
    EXPECT_TRUE(exists("stylebook_config.json"));
    write("sass/type.scss", "/*doc\n---\ntitle: Type\ncategory: Basics\n---\nHeadings.\n*/");

    EXPECT_EQ(cli::run_build((root / "stylebook_config.json").string(), {"--search_index"}), 0);
    EXPECT_TRUE(exists("docs/index.html"));
    EXPECT_TRUE(exists("docs/basics.html"));
    EXPECT_TRUE(exists("docs/search_index.json"));
}

TEST_F(CliCommandTest, InitTwiceSucceeds) {
    write("stylebook_config.json", "{}");
    EXPECT_EQ(cli::run_init(root), 0);
    EXPECT_EQ(read("stylebook_config.json"), "{}");
}

TEST_F(CliCommandTest, MissingConfigFails) {
    EXPECT_EQ(cli::run_build((root / "nope.json").string(), {}), 1);
}

TEST_F(CliCommandTest, InvalidConfigFails) {
    write("stylebook_config.json", R"({"source": "./sass", "destination": "./docs"})");
    EXPECT_EQ(cli::run_build((root / "stylebook_config.json").string(), {}), 1);
    EXPECT_FALSE(exists("docs"));
}
