#include "cli/CommandInvoker.hpp"

#include "util/Logger.hpp"

namespace commitcheck {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    auto res = cmd.execute(ctx, args);
    if (!res) {
        // A rejected message is a normal outcome; the verdict was already printed
        if (res.error().code == ErrorCode::InvalidMessage) {
            Logger::instance().info(std::string(cmd.name()) + ": " + res.error().message);
        } else {
            Logger::instance().error(std::string(cmd.name()) + ": " + res.error().message +
                                     " [" + errorCodeName(res.error().code) + "]");
        }
        return res;
    }
    return {};
}

int CommandInvoker::exitCode(const Expected<void>& result) {
    if (result) return 0;
    return result.error().code == ErrorCode::InvalidMessage ? 1 : 2;
}

}
