#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"

#include <filesystem>
#include <vector>

class Mv : public ICommand {
public:
    std::string name() const override { return "mv"; }
    std::string help() const override {
        return R"(mv: move or rename files
Synopsis:
  mv <src> <dst>
  mv <src>... <dir>
Notes:
  Overwrites existing files. With several sources the destination must
  be an existing directory. Sources are moved in order; the first
  failure stops the command.
Examples:
  mv a.txt b.txt
  mv a.txt b.txt archive/
)";
    }
    Outcome execute(CommandContext& ctx) override {
        if (ctx.args.size() < 3) throw OperandError("mv: missing file operands");
        std::vector<std::string> srcs;
        for (size_t i = 1; i + 1 < ctx.args.size(); ++i) srcs.push_back(resolve_arg(ctx, ctx.args[i]));
        auto dest = resolve_arg(ctx, ctx.args.back());
        if (srcs.size() > 1 && !ctx.fs.isDirectory(dest)) throw TypeMismatchError("mv: target is not a directory");
        for (auto& s : srcs) {
            if (!ctx.fs.exists(s)) throw NotFoundError("mv: cannot stat '" + s + "': No such file or directory");
            std::filesystem::path to = dest;
            if (ctx.fs.isDirectory(dest)) to /= PathResolver::basename(s);
            try {
                ctx.fs.move(s, to);
            } catch (const std::exception& e) {
                throw IOFailure(std::string("mv error: ") + e.what());
            }
        }
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_mv(){ return std::make_unique<Mv>(); } }
