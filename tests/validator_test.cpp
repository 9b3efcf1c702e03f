//! # Validator Tests

#include "build/validator.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace stylebook::build;
using stylebook::testing::TempDirTest;

class ValidatorTest : public TempDirTest {
protected:
    BuildConfig config;

    void SetUp() override {
        TempDirTest::SetUp();
        config.base_path = root;
    }
};

TEST_F(ValidatorTest, CompleteConfigIsValid) {
    mkdir("sass");
    config.source = {"sass"};
    config.destination = "docs";
    config.documentation_assets = "doc_assets";

    EXPECT_TRUE(validate(config).empty());
}

TEST_F(ValidatorTest, EmptyConfigReportsEverything) {
    auto errors = validate(config);
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[0], "No source directory specified in the config file");
    EXPECT_EQ(errors[1], "No destination directory specified in the config");
    EXPECT_EQ(errors[2], "No documentation assets directory specified");
}

TEST_F(ValidatorTest, OneErrorPerMissingSource) {
    mkdir("present");
    config.source = {"present", "gone", "also_gone"};
    config.destination = "docs";
    config.documentation_assets = "doc_assets";

    auto errors = validate(config);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], "Can not read source directory (gone), does it exist?");
    EXPECT_EQ(errors[1], "Can not read source directory (also_gone), does it exist?");
}

TEST_F(ValidatorTest, SourceMustBeADirectory) {
    write("file.css", "a {}");
    config.source = {"file.css"};
    config.destination = "docs";
    config.documentation_assets = "doc_assets";

    auto errors = validate(config);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "Can not read source directory (file.css), does it exist?");
}

TEST_F(ValidatorTest, DestinationNeedNotExist) {
    mkdir("sass");
    config.source = {"sass"};
    config.destination = "not/yet/created";
    config.documentation_assets = "missing_assets";

    EXPECT_TRUE(validate(config).empty());
}
