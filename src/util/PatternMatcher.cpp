#include "util/PatternMatcher.hpp"

namespace commitcheck {
namespace PatternMatcher {

std::regex globToRegex(const std::string& pattern) {
    std::string regexStr = "^";
    for (char c : pattern) {
        if (c == '*') {
            // Subjects are not paths, so * also crosses '/'
            regexStr += ".*";
        } else if (c == '?') {
            regexStr += '.';
        } else if (c == '.' || c == '+' || c == '[' || c == ']' || c == '(' || c == ')' ||
                   c == '{' || c == '}' || c == '^' || c == '$' || c == '|' || c == '\\') {
            regexStr += '\\';
            regexStr += c;
        } else {
            regexStr += c;
        }
    }
    regexStr += "$";
    return std::regex(regexStr);
}

bool matches(const std::string& pattern, const std::string& text) {
    if (pattern.empty()) {
        return false;
    }
    return std::regex_match(text, globToRegex(pattern));
}

std::optional<std::string> firstMatch(const std::vector<std::string>& patterns, const std::string& text) {
    for (const auto& pattern : patterns) {
        if (matches(pattern, text)) {
            return pattern;
        }
    }
    return std::nullopt;
}

}  // namespace PatternMatcher
}  // namespace commitcheck
