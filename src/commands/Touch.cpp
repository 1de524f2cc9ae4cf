#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"

class Touch : public ICommand {
public:
    std::string name() const override { return "touch"; }
    std::string help() const override {
        return R"(touch: create files or update their timestamps
Synopsis:
  touch <file>...
Notes:
  Missing parent directories are created.
Examples:
  touch a.txt
  touch logs/today.log
)";
    }
    Outcome execute(CommandContext& ctx) override {
        if (ctx.args.size() < 2) throw OperandError("touch: missing file operand");
        for (size_t i = 1; i < ctx.args.size(); ++i) {
            ctx.fs.touch(resolve_arg(ctx, ctx.args[i]));
        }
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_touch(){ return std::make_unique<Touch>(); } }
