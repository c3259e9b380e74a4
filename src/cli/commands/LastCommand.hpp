#pragma once

#include "cli/ICommand.hpp"

namespace commitcheck {

/**
 * @brief Execute 'commitcheck last'
 *
 * Validates the message of the commit HEAD points to, read straight from
 * the repository's object store (no git subprocess).
 */
class LastCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "last"; }
    const char* description() const override { return "Validate the message of the last commit"; }
    const char* helpNameLine() const override { return "last - Validate the message of the commit at HEAD"; }
    const char* helpSynopsis() const override { return "commitcheck last [--repo <path>]"; }
    const char* helpDescription() const override {
        return "Locate the git repository containing <path> (default: current directory),\n"
               "resolve HEAD, read the loose commit object and validate its message.\n"
               "Merge and fixup commits matching an ignore pattern are skipped.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"--repo <path>", "Path inside the repository to inspect."} };
    }
};

}
