#include "core/Validator.hpp"

#include <cctype>
#include <set>
#include <utility>
#include <vector>

#include "core/Constants.hpp"
#include "util/StringUtils.hpp"

namespace commitcheck {

namespace {

std::string firstWord(const std::string& text) {
    size_t end = text.find(' ');
    return text.substr(0, end);
}

/**
 * @brief Heuristic: "fooBar", "snake_case", "file.cpp", "run()" are code, not prose
 */
bool looksLikeIdentifier(const std::string& word) {
    for (size_t i = 0; i < word.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(word[i]);
        if (c == '_' || c == '.' || c == '/' || c == '(' || c == '`' || std::isdigit(c)) return true;
        if (i > 0 && std::isupper(c)) return true;
    }
    return false;
}

/**
 * @brief Heuristic: "Added", "fixed" read as past tense; "Need", "Embed" do not
 */
bool looksPastTense(const std::string& word) {
    static const std::set<std::string> exceptions = {"embed", "shed", "shred", "bed", "red", "wed"};
    std::string lower = StringUtils::toLower(word);
    if (lower.size() <= 3 || exceptions.count(lower) > 0) return false;
    for (char c : lower) {
        if (!std::isalpha(static_cast<unsigned char>(c))) return false;
    }
    size_t n = lower.size();
    return lower.compare(n - 2, 2, "ed") == 0 && lower.compare(n - 3, 3, "eed") != 0;
}

/// "BREAKING-CHANGE", "breaking_change", "Breaking Change" -> true
bool isBreakingChangeSpelling(const std::string& token) {
    std::string normalized = StringUtils::toUpper(token);
    for (char& c : normalized) {
        if (c == '-' || c == '_') c = ' ';
    }
    return normalized == Constants::BREAKING_CHANGE_TOKEN;
}

}

Validator::Validator(ValidatorConfig config) : cfg(std::move(config)) {}

Verdict Validator::validate(const std::string& raw) const {
    Verdict verdict;
    CommitMessage msg = CommitMessage::parse(raw);

    if (msg.empty()) {
        verdict.errors.push_back(
            "Commit message is empty. Provide a subject line of the form 'type(scope): description'.");
        return verdict;
    }

    checkSubject(msg.subject(), verdict);
    checkBody(msg, verdict);
    checkFooter(msg, verdict);
    return verdict;
}

void Validator::checkSubject(const Subject& subject, Verdict& verdict) const {
    if (!subject.hasSeparator || subject.type.empty()) {
        verdict.errors.push_back(
            "Subject line must contain a type, optional scope, and description separated by a colon and space.");
    } else {
        if (!StringUtils::hasNoUppercase(subject.type)) {
            verdict.errors.push_back("Commit type must be lowercase.");
        }
        if (!cfg.isValidType(subject.type)) {
            verdict.errors.push_back("Invalid commit type '" + subject.type +
                                     "'. Commit type must be one of the allowed types: " +
                                     StringUtils::join(cfg.validTypes, ", ") + ".");
        }
        if (subject.scope) {
            if (subject.scope->empty()) {
                verdict.errors.push_back("Scope must not be empty when parentheses are used.");
            } else if (!StringUtils::hasNoUppercase(*subject.scope)) {
                verdict.errors.push_back("Scope should be lowercase.");
            }
        }
    }

    if (subject.hasSeparator) {
        if (subject.description.empty()) {
            verdict.errors.push_back(
                "Missing commit description. Please provide a clear and concise summary of the changes "
                "made in the commit. The description should briefly explain the purpose and impact of "
                "the modifications.");
        } else if (!subject.spaceAfterColon) {
            verdict.errors.push_back("The colon after the commit type must be followed by a space.");
        }
    }

    size_t length = StringUtils::utf8Length(subject.line);
    if (length > cfg.subjectMaxLen) {
        verdict.errors.push_back("Subject line should be " + std::to_string(cfg.subjectMaxLen) +
                                 " characters or less, currently it is " + std::to_string(length) +
                                 " characters. Consider rephrasing the subject to be more concise "
                                 "whilst still capturing the essence of the changes.");
    }

    checkSubjectStyle(subject, verdict);
}

void Validator::checkSubjectStyle(const Subject& subject, Verdict& verdict) const {
    const std::string& desc = subject.description;
    if (subject.hasSeparator && !desc.empty()) {
        unsigned char lead = static_cast<unsigned char>(desc[0]);
        if (cfg.checkCapitalization && std::isalpha(lead) && std::islower(lead) &&
            !looksLikeIdentifier(firstWord(desc))) {
            verdict.suggestions.push_back("Commit description should start with a capital letter.");
        }
        if (cfg.checkImperativeMood) {
            std::string word = firstWord(desc);
            if (looksPastTense(word)) {
                verdict.suggestions.push_back(
                    "Use the imperative mood in the description, e.g. 'Add' instead of '" + word + "'.");
            }
        }
    }
    if (cfg.checkTrailingPeriod && !subject.line.empty() && subject.line.back() == '.') {
        verdict.suggestions.push_back("Subject line should not end with a full stop.");
    }
}

void Validator::checkBody(const CommitMessage& msg, Verdict& verdict) const {
    const auto& lines = msg.lines();

    if (lines.size() > 1 && !msg.hasBlankSeparator()) {
        verdict.errors.push_back("There must be a blank line between the subject line and body.");
    }

    if (cfg.requireBody && lines.size() < 3) {
        verdict.errors.push_back("Commit message should have a body providing more details about the changes.");
    }

    for (size_t i = msg.contentStart(); i < lines.size(); ++i) {
        if (StringUtils::utf8Length(lines[i]) > cfg.bodyLineMaxLen) {
            verdict.suggestions.push_back("Consider breaking up the line '" + lines[i] +
                                          "' to improve readability.");
        }
    }
}

void Validator::checkFooter(const CommitMessage& msg, Verdict& verdict) const {
    for (const auto& f : msg.footer()) {
        if (f.token == Constants::BREAKING_CHANGE_TOKEN) {
            continue;
        }
        if (isBreakingChangeSpelling(f.token)) {
            verdict.errors.push_back("Breaking changes must use the exact 'BREAKING CHANGE:' footer token, found '" +
                                     f.token + "'.");
            continue;
        }
        if (!cfg.isFooterToken(f.token)) {
            std::vector<std::string> allowed{Constants::BREAKING_CHANGE_TOKEN};
            allowed.insert(allowed.end(), cfg.footerTokens.begin(), cfg.footerTokens.end());
            verdict.errors.push_back("Unrecognized footer token in line '" + f.line +
                                     "'. Footer tokens must be one of: " +
                                     StringUtils::join(allowed, ", ") + ".");
        }
    }
}

}
