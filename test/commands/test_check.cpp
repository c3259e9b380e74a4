#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>
#include <sstream>
#include "test_utils.hpp"
#include "cli/commands/CheckCommand.hpp"

namespace fs = std::filesystem;

using namespace commitcheck;
using namespace commitcheck::test::utils;

class CheckCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    fs::path tempDir;
    AppContext ctx;
    CheckCommand cmd;
};

// Test: -m paragraphs form subject and body
TEST_F(CheckCommandTest, ValidMessageFromParagraphs) {
    CoutCapture out;
    auto result = cmd.execute(ctx, {"-m", "feat(parser): Add footer scan", "-m", "Scan footers backwards."});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(out.str(), "VALID\n");
}

TEST_F(CheckCommandTest, InvalidMessageReportsErrors) {
    CoutCapture out;
    auto result = cmd.execute(ctx, {"-m", "added some stuff"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidMessage);
    EXPECT_NE(out.str().find("INVALID\nerrors:\n"), std::string::npos);
    EXPECT_NE(out.str().find("separated by a colon and space"), std::string::npos);
}

// A single -m has no body, which the default config rejects
TEST_F(CheckCommandTest, BodyRequiredByDefault) {
    {
        CoutCapture out;
        auto result = cmd.execute(ctx, {"-m", "fix: Handle CRLF"});
        ASSERT_FALSE(result.has_value());
        EXPECT_NE(out.str().find("should have a body"), std::string::npos);
    }
    {
        CoutCapture out;
        auto result = cmd.execute(ctx, {"-m", "fix: Handle CRLF", "--no-require-body"});
        EXPECT_TRUE(result.has_value());
        EXPECT_EQ(out.str(), "VALID\n");
    }
}

TEST_F(CheckCommandTest, ReadsFile) {
    fs::path file = createFile(tempDir, "MSG", "docs: Describe config keys\n\nList every key.\n");
    CoutCapture out;
    auto result = cmd.execute(ctx, {"-F", file.string()});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(out.str(), "VALID\n");
}

TEST_F(CheckCommandTest, ReadsStdinWhenNoSource) {
    std::istringstream input("chore: bump deps\n");
    std::streambuf* oldIn = std::cin.rdbuf(input.rdbuf());
    CoutCapture out;
    auto result = cmd.execute(ctx, {"--no-require-body"});
    std::cin.rdbuf(oldIn);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_NE(out.str().find("start with a capital letter"), std::string::npos);
}

// Merge subjects are only skipped by hook and last
TEST_F(CheckCommandTest, IgnorePatternsNotApplied) {
    CoutCapture out;
    auto result = cmd.execute(ctx, {"-m", "Merge branch 'dev'"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidMessage);
}

TEST_F(CheckCommandTest, MissingFile) {
    auto result = cmd.execute(ctx, {"-F", (tempDir / "nope").string()});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::IoError);
}

TEST_F(CheckCommandTest, BadArguments) {
    auto unknown = cmd.execute(ctx, {"--amend"});
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ErrorCode::InvalidArgs);

    auto both = cmd.execute(ctx, {"-m", "feat: X", "-F", "MSG"});
    ASSERT_FALSE(both.has_value());
    EXPECT_EQ(both.error().code, ErrorCode::InvalidArgs);
}
