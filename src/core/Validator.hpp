#pragma once

#include <string>

#include "core/CommitMessage.hpp"
#include "core/ValidatorConfig.hpp"
#include "core/Verdict.hpp"

namespace commitcheck {

/**
 * @brief Conventional Commits 1.0.0 rule engine
 *
 * Stateless apart from its configuration, which is copied in at
 * construction and never modified, so one instance can serve concurrent
 * callers. The config is expected to have passed ValidatorConfig::check().
 *
 * Rule groups, in the order their findings are reported:
 *   subject   separator, type case, type vocabulary, scope, description,
 *             length (errors); capitalization, full stop, mood (suggestions)
 *   body      blank separator line, required body (errors);
 *             long lines (suggestions)
 *   footer    BREAKING CHANGE spelling, token allow-list (errors)
 *
 * The wording of every message is stable: callers match on it.
 */
class Validator {
public:
    explicit Validator(ValidatorConfig config);

    /**
     * @brief Validate one candidate commit message
     * @param raw Message text, '\n' separated
     * @return Verdict; anomalies are reported in it, never thrown
     */
    Verdict validate(const std::string& raw) const;

    const ValidatorConfig& config() const { return cfg; }

private:
    void checkSubject(const Subject& subject, Verdict& verdict) const;
    void checkSubjectStyle(const Subject& subject, Verdict& verdict) const;
    void checkBody(const CommitMessage& msg, Verdict& verdict) const;
    void checkFooter(const CommitMessage& msg, Verdict& verdict) const;

    const ValidatorConfig cfg;
};

}
