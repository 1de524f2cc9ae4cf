#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../core/Environment.hpp"
#include "Helpers.hpp"

#include <pwd.h>
#include <unistd.h>

static std::string home_directory(const Environment& env) {
    auto home = env.get("HOME");
    if (!home.empty()) return home;
    if (auto* pw = getpwuid(getuid())) return pw->pw_dir;
    return "/";
}

class Cd : public ICommand {
public:
    std::string name() const override { return "cd"; }
    std::string help() const override {
        return R"(cd: change the working directory
Synopsis:
  cd [dir]
Notes:
  Without arguments, changes to $HOME. Accepts absolute or relative paths.
Examples:
  cd /tmp/demo
  cd ..
)";
    }
    Outcome execute(CommandContext& ctx) override {
        std::string shown = ctx.args.size() > 1 ? ctx.args[1] : home_directory(ctx.env);
        auto target = resolve_arg(ctx, shown);
        if (!ctx.fs.exists(target)) throw NotFoundError("cd: " + shown + ": No such file or directory");
        if (!ctx.fs.isDirectory(target)) throw TypeMismatchError("cd: " + shown + ": Not a directory");
        ctx.cwd = target;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_cd(){ return std::make_unique<Cd>(); } }
