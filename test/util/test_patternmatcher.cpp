#include <gtest/gtest.h>
#include <regex>
#include <string>
#include <vector>
#include "util/PatternMatcher.hpp"

using namespace commitcheck;

// Test: Convert glob to regex
TEST(PatternMatcherTest, GlobToRegex) {
    std::regex re = PatternMatcher::globToRegex("fixup! *");
    EXPECT_TRUE(std::regex_match("fixup! feat: Add parser", re));
    EXPECT_TRUE(std::regex_match("fixup! ", re));
    EXPECT_FALSE(std::regex_match("fixup!", re));
    EXPECT_FALSE(std::regex_match("prefix fixup! x", re));
}

TEST(PatternMatcherTest, QuestionMarkMatchesOneCharacter) {
    EXPECT_TRUE(PatternMatcher::matches("v?.0", "v1.0"));
    EXPECT_FALSE(PatternMatcher::matches("v?.0", "v10.0"));
}

// Regex metacharacters in the glob are literal
TEST(PatternMatcherTest, SpecialCharactersAreLiteral) {
    EXPECT_TRUE(PatternMatcher::matches("chore(release): *", "chore(release): 1.2.3"));
    EXPECT_FALSE(PatternMatcher::matches("v1.0", "v1x0"));
    EXPECT_TRUE(PatternMatcher::matches("[skip] $*", "[skip] $HOME"));
}

TEST(PatternMatcherTest, StarCrossesSlashes) {
    EXPECT_TRUE(PatternMatcher::matches("Merge *", "Merge branch 'feature/x' into main"));
}

TEST(PatternMatcherTest, RevertQuotes) {
    EXPECT_TRUE(PatternMatcher::matches("Revert \"*\"", "Revert \"feat: Add parser\""));
    EXPECT_FALSE(PatternMatcher::matches("Revert \"*\"", "Revert feat: Add parser"));
}

TEST(PatternMatcherTest, EmptyPatternMatchesNothing) {
    EXPECT_FALSE(PatternMatcher::matches("", ""));
    EXPECT_FALSE(PatternMatcher::matches("", "anything"));
}

TEST(PatternMatcherTest, FirstMatchReturnsPattern) {
    std::vector<std::string> patterns{"Merge *", "squash! *", "*"};
    auto hit = PatternMatcher::firstMatch(patterns, "squash! fix: Typo");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, "squash! *");

    EXPECT_FALSE(PatternMatcher::firstMatch({"Merge *"}, "feat: Add parser").has_value());
    EXPECT_FALSE(PatternMatcher::firstMatch({}, "Merge x").has_value());
}
