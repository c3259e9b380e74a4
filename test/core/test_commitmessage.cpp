#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "core/CommitMessage.hpp"

using namespace commitcheck;

// Test: type, scope, bang and description are split out of the subject
TEST(CommitMessageSubject, FullForm) {
    Subject s = CommitMessage::parseSubject("feat(api)!: Drop v1 endpoints");
    EXPECT_TRUE(s.hasSeparator);
    EXPECT_EQ(s.type, "feat");
    ASSERT_TRUE(s.scope.has_value());
    EXPECT_EQ(*s.scope, "api");
    EXPECT_TRUE(s.breaking);
    EXPECT_EQ(s.description, "Drop v1 endpoints");
    EXPECT_TRUE(s.spaceAfterColon);
}

TEST(CommitMessageSubject, TypeOnly) {
    Subject s = CommitMessage::parseSubject("fix: Handle CRLF");
    EXPECT_EQ(s.type, "fix");
    EXPECT_FALSE(s.scope.has_value());
    EXPECT_FALSE(s.breaking);
    EXPECT_EQ(s.description, "Handle CRLF");
}

TEST(CommitMessageSubject, NoColon) {
    Subject s = CommitMessage::parseSubject("Update things");
    EXPECT_FALSE(s.hasSeparator);
    EXPECT_TRUE(s.type.empty());
}

TEST(CommitMessageSubject, UnmatchedParenthesisDropsScope) {
    Subject s = CommitMessage::parseSubject("feat(core: Add parser");
    EXPECT_EQ(s.type, "feat");
    EXPECT_FALSE(s.scope.has_value());

    Subject t = CommitMessage::parseSubject("feat(core)x: Add parser");
    EXPECT_EQ(t.type, "feat");
    EXPECT_FALSE(t.scope.has_value());
}

TEST(CommitMessageSubject, DescriptionAfterFirstColonOnly) {
    Subject s = CommitMessage::parseSubject("docs: Explain key: value syntax");
    EXPECT_EQ(s.type, "docs");
    EXPECT_EQ(s.description, "Explain key: value syntax");
}

TEST(CommitMessageFooter, RecognizedShapes) {
    auto colon = CommitMessage::parseFooterLine("Reviewed-by: Z");
    ASSERT_TRUE(colon.has_value());
    EXPECT_EQ(colon->token, "Reviewed-by");
    EXPECT_EQ(colon->value, "Z");
    EXPECT_EQ(colon->separator, ':');

    auto hash = CommitMessage::parseFooterLine("Closes #123");
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(hash->token, "Closes");
    EXPECT_EQ(hash->value, "123");
    EXPECT_EQ(hash->separator, '#');

    auto breaking = CommitMessage::parseFooterLine("BREAKING CHANGE: new config format");
    ASSERT_TRUE(breaking.has_value());
    EXPECT_EQ(breaking->token, "BREAKING CHANGE");
}

TEST(CommitMessageFooter, RejectedShapes) {
    EXPECT_FALSE(CommitMessage::parseFooterLine("Refs:").has_value());
    EXPECT_FALSE(CommitMessage::parseFooterLine("Refs: ").has_value());
    EXPECT_FALSE(CommitMessage::parseFooterLine("Refs:#1").has_value());
    EXPECT_FALSE(CommitMessage::parseFooterLine("Some text: here").has_value());
    EXPECT_FALSE(CommitMessage::parseFooterLine("- item: value").has_value());
    EXPECT_FALSE(CommitMessage::parseFooterLine("  Refs: #1").has_value());
    EXPECT_FALSE(CommitMessage::parseFooterLine("").has_value());
}

TEST(CommitMessageParse, StripsOuterBlankLines) {
    CommitMessage msg = CommitMessage::parse("\n\n  \nfeat: Add parser\n\nBody\n\n \n");
    ASSERT_EQ(msg.lines().size(), 3u);
    EXPECT_EQ(msg.lines()[0], "feat: Add parser");
    EXPECT_EQ(msg.lines()[2], "Body");
}

TEST(CommitMessageParse, KeepsTrailingWhitespaceInsideLines) {
    CommitMessage msg = CommitMessage::parse("feat: Add parser\n\nBody line  \nMore");
    EXPECT_EQ(msg.lines()[2], "Body line  ");
}

TEST(CommitMessageParse, EmptyInput) {
    EXPECT_TRUE(CommitMessage::parse("").empty());
    EXPECT_TRUE(CommitMessage::parse(" \n\t\n").empty());
}

TEST(CommitMessageParse, BodyAndFooterSplit) {
    CommitMessage msg = CommitMessage::parse(
        "fix: Prevent racing\n\nIntroduce a request id.\n\nDrop timeouts.\n\nReviewed-by: Z\nRefs: #123");
    EXPECT_TRUE(msg.hasBlankSeparator());
    EXPECT_EQ(msg.body(), (std::vector<std::string>{"Introduce a request id.", "", "Drop timeouts."}));
    ASSERT_EQ(msg.footer().size(), 2u);
    EXPECT_EQ(msg.footer()[0].token, "Reviewed-by");
    EXPECT_EQ(msg.footer()[1].token, "Refs");
}

TEST(CommitMessageParse, FooterDirectlyAfterSeparator) {
    CommitMessage msg = CommitMessage::parse("chore!: Drop Node 6\n\nBREAKING CHANGE: needs Node 8");
    EXPECT_TRUE(msg.body().empty());
    ASSERT_EQ(msg.footer().size(), 1u);
    EXPECT_TRUE(msg.hasBreakingFooter());
}

TEST(CommitMessageParse, ScanStopsAtFirstNonFooterLine) {
    CommitMessage msg = CommitMessage::parse(
        "fix: Retry\n\nRefs: #1\n\nThe loop stops.\n\nCloses #2\nFixes #3");
    ASSERT_EQ(msg.footer().size(), 2u);
    EXPECT_EQ(msg.footer()[0].token, "Closes");
    EXPECT_EQ(msg.body(), (std::vector<std::string>{"Refs: #1", "", "The loop stops."}));
}

// No blank line is needed between the body and the footer run
TEST(CommitMessageParse, FooterDirectlyAfterBodyLine) {
    CommitMessage msg = CommitMessage::parse("fix: Retry\n\nThe loop stops.\nRefs: #1");
    ASSERT_EQ(msg.footer().size(), 1u);
    EXPECT_EQ(msg.footer()[0].token, "Refs");
    EXPECT_EQ(msg.body(), std::vector<std::string>{"The loop stops."});
}

TEST(CommitMessageParse, NoSeparatorLine) {
    CommitMessage msg = CommitMessage::parse("fix: Retry\nRefs: #1");
    EXPECT_FALSE(msg.hasBlankSeparator());
    EXPECT_EQ(msg.contentStart(), 1u);
    ASSERT_EQ(msg.footer().size(), 1u);
}
