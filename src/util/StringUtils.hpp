#pragma once

#include <string>
#include <vector>

namespace commitcheck {

/**
 * @brief Small string helpers shared by the parser, the config loader and the CLI
 *
 * All helpers work on bytes except utf8Length, which counts code points.
 * Case helpers only touch ASCII letters.
 */
namespace StringUtils {

/// Strip leading and trailing spaces, tabs, CR and LF
std::string trim(const std::string& s);

std::string toLower(const std::string& s);
std::string toUpper(const std::string& s);

/// True when s holds no ASCII uppercase letter
bool hasNoUppercase(const std::string& s);

/// True when s is empty or made only of whitespace
bool isBlank(const std::string& s);

/**
 * @brief Number of code points in a UTF-8 string
 *
 * Continuation bytes (10xxxxxx) are not counted, so "é" is one character.
 * Invalid sequences degrade to counting their lead bytes.
 */
size_t utf8Length(const std::string& s);

/**
 * @brief Split on '\n'; one trailing '\r' per line is removed
 *
 * "a\n" yields {"a", ""}, "" yields {""}.
 */
std::vector<std::string> splitLines(const std::string& text);

/// Split on sep, trimming every item and dropping empty ones
std::vector<std::string> splitList(const std::string& text, char sep);

std::string join(const std::vector<std::string>& items, const std::string& sep);

bool startsWith(const std::string& s, const std::string& prefix);

}  // namespace StringUtils

}  // namespace commitcheck
