#pragma once

#include "cli/ICommand.hpp"

namespace commitcheck {

/**
 * @brief Execute 'commitcheck help'
 *
 * Without arguments prints the command list, the config file location, the
 * exit statuses and the hook one-liner. With a command name prints that
 * command's NAME / SYNOPSIS / DESCRIPTION / OPTIONS page.
 */
class HelpCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "help"; }
    const char* description() const override { return "List commands and usage"; }
    const char* helpNameLine() const override { return "help - Show the command list or one command's manual"; }
    const char* helpSynopsis() const override { return "commitcheck help [command]"; }
    const char* helpDescription() const override {
        return "Display the list of commands, or detailed help for one command.\n\n"
               "Global options (before the command):\n"
               "  --config <path>      Read rules from <path> instead of ./.commitcheck\n"
               "  --log-level <level>  error, warn, info or debug (default from COMMITCHECK_LOG)";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
