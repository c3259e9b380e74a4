#include "cli/commands/HelpCommand.hpp"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "core/Constants.hpp"

namespace commitcheck {

namespace {

void printTopic(const ICommand& cmd) {
    std::cout << "NAME\n  " << cmd.helpNameLine() << "\n\n";
    std::cout << "SYNOPSIS\n  " << cmd.helpSynopsis() << "\n\n";
    std::cout << "DESCRIPTION\n" << cmd.helpDescription() << "\n";

    auto opts = cmd.helpOptions();
    if (!opts.empty()) {
        size_t width = 0;
        for (const auto& opt : opts) width = std::max(width, opt.first.size());
        std::cout << "\nOPTIONS\n";
        for (const auto& [flag, desc] : opts) {
            std::cout << "  " << std::left << std::setw(static_cast<int>(width)) << flag << "  " << desc << "\n";
        }
    }
}

void printOverview() {
    std::vector<std::unique_ptr<ICommand>> cmds;
    CommandFactory::instance().listCommands(cmds);

    size_t width = 0;
    for (const auto& c : cmds) width = std::max(width, std::strlen(c->name()));

    std::cout << "usage: commitcheck [--config <path>] [--log-level <level>] <command> [args]\n\n";
    std::cout << "Commands:\n";
    for (const auto& c : cmds) {
        std::cout << "  " << std::left << std::setw(static_cast<int>(width)) << c->name()
                  << "  " << c->description() << "\n";
    }
    std::cout << "\nRules are read from ./" << Constants::DEFAULT_CONFIG_FILE
              << " when present ('commitcheck config' shows them).\n";
    std::cout << "Exit status: 0 valid or skipped, 1 invalid message, 2 usage or I/O error.\n";
    std::cout << "As a commit-msg hook: exec commitcheck hook \"$1\"\n";
    std::cout << "\nSee 'commitcheck help <command>' for details.\n";
}

}

Expected<void> HelpCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    if (args.size() > 1) {
        return Error{ErrorCode::InvalidArgs, "usage: commitcheck help [command]"};
    }
    if (args.empty()) {
        printOverview();
        return {};
    }

    auto cmd = CommandFactory::instance().create(args.front());
    if (!cmd) {
        printOverview();
        return Error{ErrorCode::InvalidArgs, "no help topic '" + args.front() + "'"};
    }
    printTopic(*cmd);
    return {};
}

}
