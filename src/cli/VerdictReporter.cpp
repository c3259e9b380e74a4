#include "cli/VerdictReporter.hpp"

#include <iostream>

#include "core/Validator.hpp"
#include "util/Logger.hpp"
#include "util/PatternMatcher.hpp"
#include "util/StringUtils.hpp"

namespace commitcheck {
namespace VerdictReporter {

std::string subjectOf(const std::string& message) {
    for (const auto& line : StringUtils::splitLines(message)) {
        if (!StringUtils::isBlank(line)) {
            return StringUtils::trim(line);
        }
    }
    return std::string();
}

std::optional<std::string> ignoredBy(const ValidatorConfig& config, const std::string& message) {
    std::string subject = subjectOf(message);
    if (subject.empty()) {
        return std::nullopt;
    }
    return PatternMatcher::firstMatch(config.ignorePatterns, subject);
}

Expected<void> validateAndReport(const ValidatorConfig& config, const std::string& message,
                                 const std::string& source, bool honorIgnore) {
    if (honorIgnore) {
        if (auto pattern = ignoredBy(config, message)) {
            Logger::instance().info(source + ": subject matches ignore pattern '" + *pattern + "'");
            std::cout << "SKIPPED (subject matches ignore pattern '" << *pattern << "')\n";
            return {};
        }
    }

    Validator validator(config);
    Verdict verdict = validator.validate(message);
    Logger::instance().debug(source + ": " + std::to_string(verdict.errors.size()) + " error(s), " +
                             std::to_string(verdict.suggestions.size()) + " suggestion(s)");
    std::cout << formatVerdict(verdict);

    if (!verdict.isValid()) {
        return Error{ErrorCode::InvalidMessage, source + " is not a valid conventional commit"};
    }
    return {};
}

}  // namespace VerdictReporter
}  // namespace commitcheck
