#pragma once

#include <optional>
#include <string>

#include "core/ValidatorConfig.hpp"
#include "util/Expected.hpp"

namespace commitcheck {

/**
 * @brief Shared tail of the check, hook and last commands
 *
 * Runs the validator on a message, prints the verdict to stdout and turns a
 * rejected message into an InvalidMessage error so the exit code is 1.
 */
namespace VerdictReporter {

/// First non-blank line of a message, trimmed
std::string subjectOf(const std::string& message);

/// Ignore pattern matching the message subject, if any
std::optional<std::string> ignoredBy(const ValidatorConfig& config, const std::string& message);

/**
 * @brief Validate, print and report
 * @param config Rules to apply
 * @param message Candidate commit message
 * @param source Where the message came from, used in log lines
 * @param honorIgnore Skip messages whose subject matches config.ignorePatterns
 */
Expected<void> validateAndReport(const ValidatorConfig& config, const std::string& message,
                                 const std::string& source, bool honorIgnore);

}  // namespace VerdictReporter

}  // namespace commitcheck
