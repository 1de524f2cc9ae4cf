#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"

class Rmdir : public ICommand {
public:
    std::string name() const override { return "rmdir"; }
    std::string help() const override {
        return R"(rmdir: remove empty directories
Synopsis:
  rmdir <dir>...
Notes:
  Fails on directories that still have entries; use 'rm -r' for those.
Examples:
  rmdir build
)";
    }
    Outcome execute(CommandContext& ctx) override {
        if (ctx.args.size() < 2) throw OperandError("rmdir: missing operand");
        for (size_t i = 1; i < ctx.args.size(); ++i) {
            const auto& a = ctx.args[i];
            auto p = resolve_arg(ctx, a);
            if (!ctx.fs.exists(p)) throw NotFoundError("rmdir: failed to remove '" + a + "': No such file or directory");
            if (!ctx.fs.isDirectory(p)) throw TypeMismatchError("rmdir: failed to remove '" + a + "': Not a directory");
            if (!ctx.fs.list(p).empty()) throw IOFailure("rmdir: failed to remove '" + a + "': Directory not empty");
            ctx.fs.rmdir(p);
        }
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_rmdir(){ return std::make_unique<Rmdir>(); } }
