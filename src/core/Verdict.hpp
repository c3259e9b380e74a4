#pragma once

#include <string>
#include <vector>

namespace commitcheck {

/**
 * @brief Result of validating one commit message
 *
 * errors invalidate the message, suggestions are advisory only.
 * Validity is derived, never stored, so isValid() == errors.empty() holds
 * for every verdict.
 */
struct Verdict {
    std::vector<std::string> errors;
    std::vector<std::string> suggestions;

    bool isValid() const { return errors.empty(); }

    bool operator==(const Verdict& other) const {
        return errors == other.errors && suggestions == other.suggestions;
    }
    bool operator!=(const Verdict& other) const { return !(*this == other); }
};

/**
 * @brief Render a verdict for terminal output
 *
 * Format:
 *   VALID | INVALID
 *   errors:
 *     - <error>
 *   suggestions:
 *     - <suggestion>
 *
 * Empty sections are omitted.
 */
std::string formatVerdict(const Verdict& verdict);

}
