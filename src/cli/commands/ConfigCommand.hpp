#pragma once

#include "cli/ICommand.hpp"

namespace commitcheck {

class ConfigCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "config"; }
    const char* description() const override { return "Show the active rule configuration"; }
    const char* helpNameLine() const override { return "config - Show the active rule configuration"; }
    const char* helpSynopsis() const override { return "commitcheck config"; }
    const char* helpDescription() const override {
        return "Print the configuration in effect, in the same key = value format the\n"
               "config file uses, so the output can be saved as a starting .commitcheck.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
