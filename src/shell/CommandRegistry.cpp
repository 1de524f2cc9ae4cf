#include "CommandRegistry.hpp"

void CommandRegistry::add(std::unique_ptr<ICommand> cmd) {
    auto key = cmd->name();
    commands_[std::move(key)] = std::move(cmd);
}

void CommandRegistry::alias(const std::string& alias, const std::string& target) {
    aliases_[alias] = target;
}

ICommand* CommandRegistry::find(const std::string& name) const {
    auto it = commands_.find(name);
    if (it == commands_.end()) {
        auto a = aliases_.find(name);
        if (a == aliases_.end()) return nullptr;
        it = commands_.find(a->second);
        if (it == commands_.end()) return nullptr;
    }
    return it->second.get();
}

std::vector<std::string> CommandRegistry::list() const {
    std::vector<std::string> names;
    names.reserve(commands_.size());
    for (auto& kv : commands_) names.push_back(kv.first);
    return names;
}
