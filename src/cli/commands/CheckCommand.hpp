#pragma once

#include "cli/ICommand.hpp"

namespace commitcheck {

/**
 * @brief Execute 'commitcheck check'
 *
 * Validates a candidate message and prints the verdict.
 *
 * Usage:
 *   commitcheck check -m "feat: Add parser" -m "Body paragraph"
 *   commitcheck check -F message.txt
 *   echo "fix: Handle CRLF" | commitcheck check --no-require-body
 */
class CheckCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "check"; }
    const char* description() const override { return "Validate a commit message"; }
    const char* helpNameLine() const override { return "check - Validate a candidate commit message"; }
    const char* helpSynopsis() const override {
        return "commitcheck check [-m <msg>]... [-F <file>] [--no-require-body]";
    }
    const char* helpDescription() const override {
        return "Validate a message against the Conventional Commits rules and print errors\n"
               "and suggestions. The message comes from -m (repeatable, paragraphs joined by\n"
               "a blank line), from -F <file> ('-' for stdin), or from stdin when neither is given.\n"
               "Exit status is 1 when the message is invalid.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"-m <msg>", "Use <msg> as the message; multiple -m concatenate paragraphs."},
            {"-F <file>", "Read the message from <file>."},
            {"--no-require-body", "Accept messages without a body for this run."}
        };
    }
};

}
