#include "core/CommitMessage.hpp"

#include <algorithm>
#include <cctype>

#include "core/Constants.hpp"
#include "util/StringUtils.hpp"

namespace commitcheck {

namespace {

bool isTokenChar(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_';
}

/**
 * @brief Length of the footer token at the start of line, 0 if none
 *
 * "BREAKING CHANGE" is the only token allowed to contain a space.
 */
size_t tokenLength(const std::string& line) {
    const std::string breaking = Constants::BREAKING_CHANGE_TOKEN;
    if (line.size() >= breaking.size() &&
        StringUtils::toUpper(line.substr(0, breaking.size())) == breaking) {
        return breaking.size();
    }
    if (line.empty() || !std::isalpha(static_cast<unsigned char>(line[0]))) {
        return 0;
    }
    size_t len = 1;
    while (len < line.size() && isTokenChar(static_cast<unsigned char>(line[len]))) {
        ++len;
    }
    return len;
}

}

Subject CommitMessage::parseSubject(const std::string& line) {
    Subject s;
    s.line = line;

    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return s;
    }
    s.hasSeparator = true;

    std::string rest = line.substr(colon + 1);
    s.spaceAfterColon = !rest.empty() && rest[0] == ' ';
    s.description = StringUtils::trim(rest);

    std::string prefix = line.substr(0, colon);
    if (!prefix.empty() && prefix.back() == '!') {
        s.breaking = true;
        prefix.pop_back();
    }

    size_t open = prefix.find('(');
    if (open == std::string::npos) {
        s.type = prefix;
        return s;
    }
    s.type = prefix.substr(0, open);

    // Scope only when the first ')' closes the prefix; anything else is unmatched
    size_t close = prefix.find(')', open + 1);
    if (close != std::string::npos && close == prefix.size() - 1) {
        s.scope = prefix.substr(open + 1, close - open - 1);
    }
    return s;
}

std::optional<FooterLine> CommitMessage::parseFooterLine(const std::string& line) {
    size_t len = tokenLength(line);
    if (len == 0) {
        return std::nullopt;
    }

    FooterLine f;
    f.line = line;
    f.token = line.substr(0, len);

    std::string after = line.substr(len);
    if (StringUtils::startsWith(after, Constants::FOOTER_COLON_SEPARATOR)) {
        f.separator = ':';
        f.value = StringUtils::trim(after.substr(2));
    } else if (StringUtils::startsWith(after, Constants::FOOTER_HASH_SEPARATOR)) {
        f.separator = '#';
        f.value = StringUtils::trim(after.substr(2));
    } else {
        return std::nullopt;
    }

    if (f.value.empty()) {
        return std::nullopt;
    }
    return f;
}

CommitMessage CommitMessage::parse(const std::string& raw) {
    CommitMessage msg;

    std::vector<std::string> lines = StringUtils::splitLines(raw);
    auto first = std::find_if(lines.begin(), lines.end(),
                              [](const std::string& l) { return !StringUtils::isBlank(l); });
    auto last = std::find_if(lines.rbegin(), lines.rend(),
                             [](const std::string& l) { return !StringUtils::isBlank(l); });
    if (first == lines.end()) {
        return msg;
    }
    msg.lineList.assign(first, last.base());

    const auto& all = msg.lineList;
    msg.subjectInfo = parseSubject(all[0]);
    msg.blankSeparator = all.size() > 1 && all[1].empty();
    msg.contentBegin = msg.blankSeparator ? 2 : 1;

    // Backward scan: extend the footer run while lines stay footer-shaped
    size_t runStart = all.size();
    while (runStart > msg.contentBegin && parseFooterLine(all[runStart - 1])) {
        --runStart;
    }

    for (size_t i = runStart; i < all.size(); ++i) {
        msg.footerLines.push_back(*parseFooterLine(all[i]));
    }

    size_t bodyEnd = runStart;
    while (bodyEnd > msg.contentBegin && StringUtils::isBlank(all[bodyEnd - 1])) {
        --bodyEnd;
    }
    if (bodyEnd > msg.contentBegin) {
        msg.bodyLines.assign(all.begin() + static_cast<std::ptrdiff_t>(msg.contentBegin),
                             all.begin() + static_cast<std::ptrdiff_t>(bodyEnd));
    }
    return msg;
}

bool CommitMessage::hasBreakingFooter() const {
    return std::any_of(footerLines.begin(), footerLines.end(), [](const FooterLine& f) {
        return f.token == Constants::BREAKING_CHANGE_TOKEN;
    });
}

}
