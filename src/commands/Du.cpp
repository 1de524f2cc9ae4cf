#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"

class Du : public ICommand {
public:
    std::string name() const override { return "du"; }
    std::string help() const override {
        return R"(du: estimate disk usage
Synopsis:
  du [path]
Notes:
  Prints the total apparent size in bytes of the files below path.
  Entries that cannot be read are skipped.
Examples:
  du
  du logs
)";
    }
    Outcome execute(CommandContext& ctx) override {
        std::string shown = ctx.args.size() > 1 ? ctx.args[1] : ctx.cwd;
        auto target = resolve_arg(ctx, shown);
        if (!ctx.fs.exists(target)) throw NotFoundError("du: " + shown + ": No such file or directory");
        uintmax_t total = ctx.fs.isDirectory(target) ? tally(ctx, target) : ctx.fs.fileSize(target);
        ctx.out << total << '\t' << target << '\n';
        return 0;
    }

private:
    static uintmax_t tally(CommandContext& ctx, const std::string& dir) {
        std::vector<DirEntry> entries;
        try {
            entries = ctx.fs.list(dir);
        } catch (const std::exception&) {
            return 0;
        }
        uintmax_t total = 0;
        for (auto& e : entries) {
            auto p = dir == "/" ? dir + e.name : dir + "/" + e.name;
            if (e.is_dir) {
                if (!e.is_symlink) total += tally(ctx, p);
            } else if (e.readable) {
                total += e.size;
            }
        }
        return total;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_du(){ return std::make_unique<Du>(); } }
