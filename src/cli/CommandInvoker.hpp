#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace commitcheck {

/**
 * @brief Runs a command and maps its outcome to a process exit code
 *
 * Exit codes:
 *   0  success (message valid, or skipped by an ignore pattern)
 *   1  message rejected by the validator
 *   2  usage, config, I/O or repository error
 */
class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);

    static int exitCode(const Expected<void>& result);
};

}
