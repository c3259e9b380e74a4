#include "cli/commands/HookCommand.hpp"

#include <fstream>
#include <sstream>

#include "cli/VerdictReporter.hpp"
#include "core/Constants.hpp"
#include "util/StringUtils.hpp"

namespace commitcheck {

std::string HookCommand::stripComments(const std::string& text) {
    std::string out;
    for (const auto& line : StringUtils::splitLines(text)) {
        if (line == Constants::SCISSORS_LINE) {
            break;
        }
        if (!line.empty() && line[0] == '#') {
            continue;
        }
        out += line;
        out += '\n';
    }
    return out;
}

Expected<void> HookCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return Error{ErrorCode::InvalidArgs, "usage: commitcheck hook <message-file>"};
    }
    const std::string& path = args.front();

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Cannot open message file " + path};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Error reading message file " + path};
    }

    return VerdictReporter::validateAndReport(ctx.config, stripComments(buffer.str()), path, true);
}

}
