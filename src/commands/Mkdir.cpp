#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"
#include "Options.hpp"

class Mkdir : public ICommand {
public:
    std::string name() const override { return "mkdir"; }
    std::string help() const override {
        return R"(mkdir: create directories
Synopsis:
  mkdir [-p] <dir>...
Options:
  -p   No error if the directory already exists
Notes:
  Missing parent directories are always created.
Examples:
  mkdir demo
  mkdir projects/demo/src
)";
    }
    Outcome execute(CommandContext& ctx) override {
        static const OptionSpec spec{{{"-p", "p"}}, {}, false};
        auto opts = parse_options(ctx.args, spec);
        if (opts.operands.empty()) throw OperandError("mkdir: missing operand");
        for (auto& a : opts.operands) {
            auto p = resolve_arg(ctx, a);
            if (ctx.fs.exists(p)) {
                if (opts.has("p") && ctx.fs.isDirectory(p)) continue;
                throw IOFailure("mkdir: cannot create directory '" + a + "': File exists");
            }
            ctx.fs.mkdir(p, true);
        }
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_mkdir(){ return std::make_unique<Mkdir>(); } }
