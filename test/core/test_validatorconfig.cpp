#include <gtest/gtest.h>
#include "core/ValidatorConfig.hpp"

using namespace commitcheck;

TEST(ValidatorConfigTest, DefaultsPassCheck) {
    ValidatorConfig cfg = ValidatorConfig::defaults();
    EXPECT_TRUE(cfg.check().has_value());
    EXPECT_EQ(cfg.validTypes.size(), 11u);
    EXPECT_TRUE(cfg.requireBody);
    EXPECT_EQ(cfg.subjectMaxLen, 50u);
    EXPECT_EQ(cfg.bodyLineMaxLen, 72u);
    EXPECT_TRUE(cfg.isValidType("revert"));
    EXPECT_FALSE(cfg.isValidType("security"));
}

TEST(ValidatorConfigTest, SecurityVariant) {
    ValidatorConfig cfg = ValidatorConfig::withSecurityType();
    EXPECT_TRUE(cfg.check().has_value());
    EXPECT_TRUE(cfg.isValidType("security"));
    EXPECT_EQ(cfg.validTypes.back(), "security");
}

TEST(ValidatorConfigTest, TypeLookupIsCaseSensitive) {
    ValidatorConfig cfg = ValidatorConfig::defaults();
    EXPECT_FALSE(cfg.isValidType("Feat"));
    EXPECT_FALSE(cfg.isValidType("FIX"));
}

TEST(ValidatorConfigTest, FooterLookupIgnoresCase) {
    ValidatorConfig cfg = ValidatorConfig::defaults();
    EXPECT_TRUE(cfg.isFooterToken("Refs"));
    EXPECT_TRUE(cfg.isFooterToken("refs"));
    EXPECT_TRUE(cfg.isFooterToken("co-authored-by"));
    EXPECT_FALSE(cfg.isFooterToken("Ticket"));
}

TEST(ValidatorConfigTest, RejectsEmptyVocabulary) {
    ValidatorConfig cfg = ValidatorConfig::defaults();
    cfg.validTypes.clear();
    auto res = cfg.check();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::InvalidConfig);
}

TEST(ValidatorConfigTest, RejectsBadTypes) {
    ValidatorConfig upper = ValidatorConfig::defaults();
    upper.validTypes.push_back("Hotfix");
    EXPECT_FALSE(upper.check().has_value());

    ValidatorConfig dup = ValidatorConfig::defaults();
    dup.validTypes.push_back("feat");
    EXPECT_FALSE(dup.check().has_value());

    ValidatorConfig padded = ValidatorConfig::defaults();
    padded.validTypes.push_back(" wip");
    EXPECT_FALSE(padded.check().has_value());
}

TEST(ValidatorConfigTest, RejectsZeroLimits) {
    ValidatorConfig cfg = ValidatorConfig::defaults();
    cfg.subjectMaxLen = 0;
    EXPECT_FALSE(cfg.check().has_value());

    cfg = ValidatorConfig::defaults();
    cfg.bodyLineMaxLen = 0;
    EXPECT_FALSE(cfg.check().has_value());
}

TEST(ValidatorConfigTest, EmptyFooterListIsAllowed) {
    ValidatorConfig cfg = ValidatorConfig::defaults();
    cfg.footerTokens.clear();
    EXPECT_TRUE(cfg.check().has_value());

    cfg.footerTokens.push_back("  ");
    EXPECT_FALSE(cfg.check().has_value());
}

// Tokens the footer scan can never produce would silently never match
TEST(ValidatorConfigTest, RejectsUnmatchableFooterTokens) {
    for (const std::string bad : {"Fixed in", "Refs:", "Issue#", "1st-reviewer", "-by", " Refs"}) {
        ValidatorConfig cfg = ValidatorConfig::defaults();
        cfg.footerTokens.push_back(bad);
        auto res = cfg.check();
        ASSERT_FALSE(res.has_value()) << bad;
        EXPECT_EQ(res.error().code, ErrorCode::InvalidConfig);
        EXPECT_NE(res.error().message.find("'" + bad + "'"), std::string::npos);
    }

    ValidatorConfig ok = ValidatorConfig::defaults();
    ok.footerTokens.push_back("Ticket");
    ok.footerTokens.push_back("Jira_Key-2");
    EXPECT_TRUE(ok.check().has_value());
}
