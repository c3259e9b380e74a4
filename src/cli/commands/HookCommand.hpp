#pragma once

#include "cli/ICommand.hpp"

namespace commitcheck {

/**
 * @brief Execute 'commitcheck hook <file>' from a git commit-msg hook
 *
 * Git passes the path of the message being committed (.git/COMMIT_EDITMSG).
 * The file may still carry the editor template, so comment lines and the
 * verbose diff below the scissors line are removed before validation.
 * Subjects matching an ignore pattern (merges, fixups) pass untouched.
 *
 * Install:
 *   printf '#!/bin/sh\nexec commitcheck hook "$1"\n' > .git/hooks/commit-msg
 */
class HookCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "hook"; }
    const char* description() const override { return "Validate a message file from a commit-msg hook"; }
    const char* helpNameLine() const override { return "hook - Validate the message file passed by git's commit-msg hook"; }
    const char* helpSynopsis() const override { return "commitcheck hook <message-file>"; }
    const char* helpDescription() const override {
        return "Strip git comment lines ('#') and everything below the scissors line, skip\n"
               "subjects matching an ignore pattern, then validate the message. A non-zero\n"
               "exit status makes git abort the commit.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }

    /// Message without comment lines and without the scissors block
    static std::string stripComments(const std::string& text);
};

}
