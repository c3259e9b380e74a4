// Conventional Commit checker: global options, config load, command dispatch.

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "core/ConfigLoader.hpp"
#include "util/Logger.hpp"

using namespace commitcheck;

int main(int argc, char** argv) {
    CommandFactory::instance().registerBuiltins();

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    // Global options precede the command name
    std::string configPath;
    size_t pos = 0;
    while (pos < args.size() && args[pos].rfind("--", 0) == 0) {
        if (args[pos] == "--config" && pos + 1 < args.size()) {
            configPath = args[pos + 1];
            pos += 2;
        } else if (args[pos] == "--log-level" && pos + 1 < args.size()) {
            auto level = Logger::parseLevel(args[pos + 1]);
            if (!level) {
                std::cerr << "Invalid log level: " << args[pos + 1] << "\n";
                return 2;
            }
            Logger::instance().setLevel(*level);
            pos += 2;
        } else {
            std::cerr << "Unknown option: " << args[pos] << "\n";
            return 2;
        }
    }
    args.erase(args.begin(), args.begin() + static_cast<std::ptrdiff_t>(pos));

    auto config = configPath.empty()
        ? ConfigLoader::loadDefault(std::filesystem::current_path())
        : ConfigLoader::loadFromFile(configPath);
    if (!config) {
        Logger::instance().error(config.error().message);
        return 2;
    }

    const AppContext ctx{config.value()};
    CommandInvoker invoker;
    if (args.empty()) {
        auto cmd = CommandFactory::instance().create("help");
        invoker.invoke(*cmd, ctx, {});
        return 0;
    }
    std::string cmdName = args.front();
    args.erase(args.begin());
    if (!CommandFactory::instance().has(cmdName)) {
        std::cerr << "Unknown command: " << cmdName << "\n";
        auto help = CommandFactory::instance().create("help");
        invoker.invoke(*help, ctx, {});
        return 2;
    }
    auto cmd = CommandFactory::instance().create(cmdName);
    return CommandInvoker::exitCode(invoker.invoke(*cmd, ctx, args));
}
