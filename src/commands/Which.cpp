#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../shell/CommandRegistry.hpp"
#include "../core/Errors.hpp"

class Which : public ICommand {
public:
    std::string name() const override { return "which"; }
    std::string help() const override {
        return R"(which: locate a command
Synopsis:
  which <command>
Notes:
  Every builtin reports /usr/bin/<command>.
Examples:
  which ls
)";
    }
    Outcome execute(CommandContext& ctx) override {
        if (ctx.args.size() < 2) throw OperandError("which: missing command");
        const auto& cmd = ctx.args[1];
        if (!ctx.registry.contains(cmd)) throw NotFoundError("which: no " + cmd + " in built-in commands");
        ctx.out << "/usr/bin/" << cmd << '\n';
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_which(){ return std::make_unique<Which>(); } }
