#pragma once

#include <optional>
#include <string>
#include <vector>

namespace commitcheck {

/**
 * @brief Fields of the subject line "type(scope)!: description"
 *
 * When hasSeparator is false no other field is meaningful.
 */
struct Subject {
    std::string line;                  // Subject exactly as written
    bool hasSeparator{false};          // A ':' exists on the line
    std::string type;                  // Text before '(' or ':' ('!' excluded)
    std::optional<std::string> scope;  // Only set for a matched "(...)" right after type
    bool breaking{false};              // '!' directly before the colon
    std::string description;           // Text after the first ':', trimmed
    bool spaceAfterColon{false};
};

/**
 * @brief One trailer line, "Token: value" or "Token #value"
 */
struct FooterLine {
    std::string line;
    std::string token;
    std::string value;
    char separator{':'};               // ':' or '#'
};

/**
 * @brief Commit message split into subject, body and footer
 *
 * Parse stages:
 *   1. Tokenize: split on '\n', drop a trailing '\r' per line, strip
 *      whitespace-only lines at both ends of the message.
 *   2. Classify: line 0 is the subject; if line 1 is empty it is the
 *      separator; the footer is the longest run of footer-shaped lines at
 *      the end of the message. The first line that is not footer-shaped,
 *      scanning backwards, ends the run. The rest is body.
 *
 * A parsed message is immutable and holds no reference to its input.
 */
class CommitMessage {
public:
    static CommitMessage parse(const std::string& raw);

    /**
     * @brief Parse the subject line
     *
     * "feat(api)!: Drop v1" -> type "feat", scope "api", breaking, description "Drop v1".
     * "feat(api: Drop v1"   -> unmatched parenthesis, type "feat", no scope.
     */
    static Subject parseSubject(const std::string& line);

    /**
     * @brief Recognize a footer-shaped line
     *
     * The token is a word of letters, digits, '-' and '_' that starts with a
     * letter, or "BREAKING CHANGE" in any case. It must be followed by ": "
     * or " #" and a non-empty value. Token membership is not checked here.
     */
    static std::optional<FooterLine> parseFooterLine(const std::string& line);

    bool empty() const { return lineList.empty(); }
    const std::vector<std::string>& lines() const { return lineList; }
    const Subject& subject() const { return subjectInfo; }
    const std::vector<std::string>& body() const { return bodyLines; }
    const std::vector<FooterLine>& footer() const { return footerLines; }

    /// Line 1 exists and is the empty string
    bool hasBlankSeparator() const { return blankSeparator; }

    /// Index of the first line after the subject (and separator, if any)
    size_t contentStart() const { return contentBegin; }

    bool hasBreakingFooter() const;

private:
    CommitMessage() = default;

    std::vector<std::string> lineList;
    Subject subjectInfo;
    std::vector<std::string> bodyLines;
    std::vector<FooterLine> footerLines;
    bool blankSeparator{false};
    size_t contentBegin{0};
};

}
