#pragma once
#include <ostream>
#include <string>
#include <vector>

class IFileSystem;
class ISystemMetrics;
class Environment;
class CommandRegistry;

class CommandContext {
public:
    CommandContext(const std::vector<std::string>& args,
                   std::ostream& out,
                   std::ostream& err,
                   IFileSystem& fs,
                   ISystemMetrics& metrics,
                   const Environment& env,
                   const CommandRegistry& registry,
                   std::string& cwd)
        : args(args), out(out), err(err), fs(fs), metrics(metrics), env(env), registry(registry), cwd(cwd) {}

    const std::vector<std::string>& args; // args[0] is the verb
    std::ostream& out;
    std::ostream& err;
    IFileSystem& fs;
    ISystemMetrics& metrics;
    const Environment& env;
    const CommandRegistry& registry;
    std::string& cwd; // absolute host path; `cd` rewrites it
};
