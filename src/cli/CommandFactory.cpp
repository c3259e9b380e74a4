#include "cli/CommandFactory.hpp"

#include <algorithm>

#include "cli/commands/CheckCommand.hpp"
#include "cli/commands/ConfigCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/HookCommand.hpp"
#include "cli/commands/LastCommand.hpp"

namespace commitcheck {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

void CommandFactory::registerBuiltins() {
    registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    registerCreator("check", [] { return std::make_unique<CheckCommand>(); });
    registerCreator("hook", [] { return std::make_unique<HookCommand>(); });
    registerCreator("last", [] { return std::make_unique<LastCommand>(); });
    registerCreator("config", [] { return std::make_unique<ConfigCommand>(); });
}

bool CommandFactory::has(const std::string& name) const {
    return creators.find(name) != creators.end();
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

void CommandFactory::listCommands(std::vector<std::unique_ptr<ICommand>>& out) const {
    out.clear();
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return std::string(a->name()) < std::string(b->name());
    });
}

}
