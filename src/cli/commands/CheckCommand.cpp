#include "cli/commands/CheckCommand.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include "cli/VerdictReporter.hpp"

namespace commitcheck {

namespace {

Expected<std::string> readAll(std::istream& in, const std::string& what) {
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Error reading " + what};
    }
    return buffer.str();
}

}

Expected<void> CheckCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::vector<std::string> messageParts;
    std::string file;
    bool requireBody = ctx.config.requireBody;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-m" && i + 1 < args.size()) {
            messageParts.push_back(args[++i]);
        } else if (args[i] == "-F" && i + 1 < args.size()) {
            file = args[++i];
        } else if (args[i] == "--no-require-body") {
            requireBody = false;
        } else {
            return Error{ErrorCode::InvalidArgs, "unexpected argument '" + args[i] + "'"};
        }
    }
    if (!messageParts.empty() && !file.empty()) {
        return Error{ErrorCode::InvalidArgs, "-m and -F cannot be combined"};
    }

    std::string message;
    std::string source;
    if (!messageParts.empty()) {
        // Each -m is a paragraph, as with git commit
        for (size_t i = 0; i < messageParts.size(); ++i) {
            if (i > 0) message += "\n\n";
            message += messageParts[i];
        }
        source = "message";
    } else if (!file.empty() && file != "-") {
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            return Error{ErrorCode::IoError, "Cannot open " + file};
        }
        auto text = readAll(in, file);
        if (!text) return text.error();
        message = text.value();
        source = file;
    } else {
        auto text = readAll(std::cin, "stdin");
        if (!text) return text.error();
        message = text.value();
        source = "stdin";
    }

    ValidatorConfig config = ctx.config;
    config.requireBody = requireBody;
    return VerdictReporter::validateAndReport(config, message, source, false);
}

}
