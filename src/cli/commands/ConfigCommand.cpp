#include "cli/commands/ConfigCommand.hpp"

#include <iostream>

#include "util/StringUtils.hpp"

namespace commitcheck {

namespace {
const char* onOff(bool v) { return v ? "true" : "false"; }
}

Expected<void> ConfigCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (!args.empty()) {
        return Error{ErrorCode::InvalidArgs, "config takes no arguments"};
    }
    const ValidatorConfig& c = ctx.config;
    std::cout << "types = " << StringUtils::join(c.validTypes, ", ") << "\n";
    std::cout << "footer_tokens = " << StringUtils::join(c.footerTokens, ", ") << "\n";
    std::cout << "require_body = " << onOff(c.requireBody) << "\n";
    std::cout << "subject_max_len = " << c.subjectMaxLen << "\n";
    std::cout << "body_line_max_len = " << c.bodyLineMaxLen << "\n";
    std::cout << "check_capitalization = " << onOff(c.checkCapitalization) << "\n";
    std::cout << "check_trailing_period = " << onOff(c.checkTrailingPeriod) << "\n";
    std::cout << "check_imperative_mood = " << onOff(c.checkImperativeMood) << "\n";
    std::cout << "ignore = " << StringUtils::join(c.ignorePatterns, ", ") << "\n";
    return {};
}

}
