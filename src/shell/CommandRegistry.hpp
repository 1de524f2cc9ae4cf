#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "ICommand.hpp"

class CommandRegistry {
public:
    void add(std::unique_ptr<ICommand> cmd);
    // Make `alias` dispatch to the already registered `target`.
    void alias(const std::string& alias, const std::string& target);
    ICommand* find(const std::string& name) const;
    bool contains(const std::string& name) const { return commands_.count(name) != 0; }
    // Registered names in sorted order; aliases are not listed.
    std::vector<std::string> list() const;
private:
    std::map<std::string, std::unique_ptr<ICommand>> commands_;
    std::map<std::string, std::string> aliases_;
};
