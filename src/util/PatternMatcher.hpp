#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace commitcheck {

/**
 * @brief Glob matching for subject-line ignore patterns
 *
 * Commit subjects written by git itself (merges, reverts, fixup/squash
 * markers) are not Conventional Commits and should be skipped by the hook.
 * The config lists them as globs:
 *
 *   *  -> any run of characters (including none)
 *   ?  -> exactly one character
 *
 * Every other character matches itself. Patterns are anchored at both ends.
 *
 * Examples:
 *   "Merge *"        matches "Merge branch 'main' into dev"
 *   "fixup! *"       matches "fixup! feat: Add parser"
 *   "Revert \"*\""   matches "Revert \"feat: Add parser\""
 */
namespace PatternMatcher {

/**
 * @brief Convert a glob pattern to an anchored std::regex
 *
 * Example: "fixup! *" -> "^fixup! .*$"
 */
std::regex globToRegex(const std::string& pattern);

/// True when text matches the glob exactly; empty pattern matches nothing
bool matches(const std::string& pattern, const std::string& text);

/**
 * @brief First pattern in the list matching text
 * @return The matching pattern, or nullopt when none matches
 */
std::optional<std::string> firstMatch(const std::vector<std::string>& patterns, const std::string& text);

}  // namespace PatternMatcher

}  // namespace commitcheck
