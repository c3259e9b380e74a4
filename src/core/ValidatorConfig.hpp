#pragma once

#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace commitcheck {

/**
 * @brief Immutable rule configuration injected into the Validator
 *
 * Deployments disagree on the type vocabulary, the footer tokens and whether
 * a body is mandatory, so none of these are hardcoded in the rule set.
 * A config is built once (defaults, or ConfigLoader) and then only read.
 *
 * Defaults:
 *   validTypes     feat fix docs style refactor perf test build ci chore revert
 *   footerTokens   Acked-by Closes Co-authored-by Fixes Refs Resolves
 *                  Reviewed-by Signed-off-by
 *   requireBody    true
 *   subjectMaxLen  50, bodyLineMaxLen 72
 *   all soft checks enabled
 */
struct ValidatorConfig {
    std::vector<std::string> validTypes;    // Ordered; the order is used in error text
    std::vector<std::string> footerTokens;  // BREAKING CHANGE is always accepted on top
    bool requireBody{true};
    size_t subjectMaxLen{0};
    size_t bodyLineMaxLen{0};

    // English-specific soft checks (suggestions only)
    bool checkCapitalization{true};
    bool checkTrailingPeriod{true};
    bool checkImperativeMood{true};

    // Subject globs the CLI skips entirely; not consulted by the Validator
    std::vector<std::string> ignorePatterns;

    /// Built-in configuration
    static ValidatorConfig defaults();

    /// Defaults plus the "security" type used by the extended rule set
    static ValidatorConfig withSecurityType();

    /**
     * @brief Reject configurations that cannot produce meaningful verdicts
     * @return InvalidConfig error naming the first problem found
     *
     * Rejected: empty validTypes, an empty or non-lowercase type, a duplicate
     * type, an empty footer token or one no footer line can carry
     * ("Fixed in", "Refs:", "1st-reviewer"), a zero length limit.
     */
    Expected<void> check() const;

    bool isValidType(const std::string& type) const;

    /// Case-insensitive lookup in footerTokens (BREAKING CHANGE not included)
    bool isFooterToken(const std::string& token) const;
};

}
