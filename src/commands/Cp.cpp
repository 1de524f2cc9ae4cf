#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"
#include "Options.hpp"

#include <filesystem>
#include <vector>

// True when `path` is `dir` itself or lies below it, compared component by
// component on the lexically normal forms.
static bool is_within(const std::filesystem::path& path, const std::filesystem::path& dir) {
    auto p = path.lexically_normal();
    auto d = dir.lexically_normal();
    auto pi = p.begin();
    for (auto di = d.begin(); di != d.end(); ++di, ++pi) {
        if (di->empty()) continue; // trailing separator
        if (pi == p.end() || *pi != *di) return false;
    }
    return true;
}

class Cp : public ICommand {
public:
    std::string name() const override { return "cp"; }
    std::string help() const override {
        return R"(cp: copy files and directories
Synopsis:
  cp [-r] <src> <dst>
  cp [-r] <src>... <dir>
Options:
  -r   Copy directories recursively
Notes:
  Overwrites existing files and keeps their mode and modification time.
  With several sources the destination must be an existing directory.
Examples:
  cp a.txt b.txt
  cp -r dir1 dir2
)";
    }
    Outcome execute(CommandContext& ctx) override {
        if (ctx.args.size() < 3) throw OperandError("cp: missing file operands");
        static const OptionSpec spec{{{"-r", "r"}}, {}, false};
        auto opts = parse_options(ctx.args, spec);
        if (opts.operands.size() < 2) throw OperandError("cp: missing destination file operand after source");
        bool recursive = opts.has("r");
        std::vector<std::string> srcs;
        for (size_t i = 0; i + 1 < opts.operands.size(); ++i) srcs.push_back(resolve_arg(ctx, opts.operands[i]));
        auto dest = resolve_arg(ctx, opts.operands.back());
        if (srcs.size() > 1 && !ctx.fs.isDirectory(dest)) throw TypeMismatchError("cp: target is not a directory");
        for (auto& s : srcs) {
            if (!ctx.fs.exists(s)) throw NotFoundError("cp: cannot stat '" + s + "': No such file or directory");
            bool dir = ctx.fs.isDirectory(s);
            if (dir && !recursive) throw TypeMismatchError("cp: -r not specified; omitting directory '" + s + "'");
            std::filesystem::path to = dest;
            if (ctx.fs.isDirectory(dest)) to /= PathResolver::basename(s);
            if (dir && is_within(to, s)) {
                throw ShellError("cp: cannot copy a directory, '" + s + "', into itself, '" + to.string() + "'", 1);
            }
            try {
                ctx.fs.copy(s, to, dir);
            } catch (const std::exception& e) {
                throw IOFailure(std::string("cp error: ") + e.what());
            }
        }
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_cp(){ return std::make_unique<Cp>(); } }
