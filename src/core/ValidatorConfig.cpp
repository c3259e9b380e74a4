#include "core/ValidatorConfig.hpp"

#include <algorithm>
#include <set>

#include "core/CommitMessage.hpp"
#include "core/Constants.hpp"
#include "util/StringUtils.hpp"

namespace commitcheck {

ValidatorConfig ValidatorConfig::defaults() {
    ValidatorConfig cfg;
    cfg.validTypes = {"feat", "fix", "docs", "style", "refactor", "perf",
                      "test", "build", "ci", "chore", "revert"};
    cfg.footerTokens = {"Acked-by", "Closes", "Co-authored-by", "Fixes",
                        "Refs", "Resolves", "Reviewed-by", "Signed-off-by"};
    cfg.requireBody = true;
    cfg.subjectMaxLen = Constants::SUBJECT_MAX_LEN;
    cfg.bodyLineMaxLen = Constants::BODY_LINE_MAX_LEN;
    cfg.ignorePatterns = {"Merge *", "Revert \"*\"", "fixup! *", "squash! *", "amend! *"};
    return cfg;
}

ValidatorConfig ValidatorConfig::withSecurityType() {
    ValidatorConfig cfg = defaults();
    cfg.validTypes.push_back("security");
    return cfg;
}

Expected<void> ValidatorConfig::check() const {
    if (validTypes.empty()) {
        return Error{ErrorCode::InvalidConfig, "types: at least one commit type is required"};
    }
    std::set<std::string> seen;
    for (const auto& t : validTypes) {
        if (t.empty() || StringUtils::trim(t) != t) {
            return Error{ErrorCode::InvalidConfig, "types: empty or padded type '" + t + "'"};
        }
        if (!StringUtils::hasNoUppercase(t)) {
            return Error{ErrorCode::InvalidConfig, "types: type '" + t + "' must be lowercase"};
        }
        if (!seen.insert(t).second) {
            return Error{ErrorCode::InvalidConfig, "types: duplicate type '" + t + "'"};
        }
    }
    for (const auto& tok : footerTokens) {
        if (StringUtils::trim(tok).empty()) {
            return Error{ErrorCode::InvalidConfig, "footer_tokens: empty token"};
        }
        // Must be something the footer scan can actually produce as a token
        auto parsed = CommitMessage::parseFooterLine(tok + Constants::FOOTER_COLON_SEPARATOR + "x");
        if (!parsed || parsed->token != tok) {
            return Error{ErrorCode::InvalidConfig,
                         "footer_tokens: '" + tok + "' is not a footer token "
                         "(letters, digits, '-' and '_', starting with a letter)"};
        }
    }
    if (subjectMaxLen == 0) {
        return Error{ErrorCode::InvalidConfig, "subject_max_len must be greater than zero"};
    }
    if (bodyLineMaxLen == 0) {
        return Error{ErrorCode::InvalidConfig, "body_line_max_len must be greater than zero"};
    }
    return {};
}

bool ValidatorConfig::isValidType(const std::string& type) const {
    return std::find(validTypes.begin(), validTypes.end(), type) != validTypes.end();
}

bool ValidatorConfig::isFooterToken(const std::string& token) const {
    const std::string wanted = StringUtils::toLower(token);
    return std::any_of(footerTokens.begin(), footerTokens.end(),
                       [&](const std::string& t) { return StringUtils::toLower(t) == wanted; });
}

}
