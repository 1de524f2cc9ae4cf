#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"
#include "Options.hpp"

class Rm : public ICommand {
public:
    std::string name() const override { return "rm"; }
    std::string help() const override {
        return R"(rm: remove files or directories
Synopsis:
  rm [-r|-rf|-fr] <path>...
Options:
  -r   Remove directories and their contents recursively
Notes:
  Non-recursive remove fails if <path> is a directory. Paths are removed
  in order; the first failure stops the command.
Examples:
  rm file.txt
  rm -r old_project
)";
    }
    Outcome execute(CommandContext& ctx) override {
        if (ctx.args.size() < 2) throw OperandError("rm: missing operand");
        static const OptionSpec spec{{{"-r", "r"}, {"-rf", "r"}, {"-fr", "r"}}, {}, false};
        auto opts = parse_options(ctx.args, spec);
        if (opts.operands.empty()) throw OperandError("rm: missing path");
        bool recursive = opts.has("r");
        for (auto& a : opts.operands) {
            auto p = resolve_arg(ctx, a);
            // a dangling symlink does not "exist" but can still be removed
            if (!ctx.fs.exists(p) && !ctx.fs.isSymlink(p)) {
                throw NotFoundError("rm: cannot remove '" + a + "': No such file or directory");
            }
            bool dir = ctx.fs.isDirectory(p) && !ctx.fs.isSymlink(p);
            if (dir && !recursive) throw TypeMismatchError("rm: cannot remove '" + a + "': Is a directory");
            ctx.fs.remove(p, dir);
        }
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_rm(){ return std::make_unique<Rm>(); } }
