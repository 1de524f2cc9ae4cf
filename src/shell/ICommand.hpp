#pragma once
#include <memory>
#include <string>

#include "Outcome.hpp"

class CommandContext;

class ICommand {
public:
    virtual ~ICommand() = default;
    virtual std::string name() const = 0;
    virtual std::string help() const = 0;
    // Commands that only report host-wide state (cpu, mem, ps, df, uptime)
    // never hand a working directory back to the caller.
    virtual bool reportsSystemState() const { return false; }
    virtual Outcome execute(CommandContext& context) = 0;
};
