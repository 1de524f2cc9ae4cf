#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"

#include <algorithm>
#include <vector>

class Tree : public ICommand {
public:
    std::string name() const override { return "tree"; }
    std::string help() const override {
        return R"(tree: display a directory hierarchy
Synopsis:
  tree [path]
Notes:
  Entries are sorted per directory; symlinked directories are shown but
  not entered.
Examples:
  tree
  tree src
)";
    }
    Outcome execute(CommandContext& ctx) override {
        std::string shown = ctx.args.size() > 1 ? ctx.args[1] : ctx.cwd;
        auto start = resolve_arg(ctx, shown);
        if (!ctx.fs.exists(start)) throw NotFoundError("tree: " + shown + ": No such file or directory");
        ctx.out << start << '\n';
        if (ctx.fs.isDirectory(start)) render(ctx, start, "");
        return 0;
    }

private:
    static void render(CommandContext& ctx, const std::string& dir, const std::string& prefix) {
        std::vector<DirEntry> entries;
        try {
            entries = ctx.fs.list(dir);
        } catch (const std::exception&) {
            ctx.out << prefix << "[Permission Denied]\n";
            return;
        }
        std::sort(entries.begin(), entries.end(),
                  [](const DirEntry& a, const DirEntry& b){ return a.name < b.name; });
        for (size_t i = 0; i < entries.size(); ++i) {
            const auto& e = entries[i];
            bool last = i + 1 == entries.size();
            ctx.out << prefix << (last ? "└── " : "├── ") << e.name << '\n';
            if (e.is_dir && !e.is_symlink) {
                auto sub = dir == "/" ? dir + e.name : dir + "/" + e.name;
                render(ctx, sub, prefix + (last ? "    " : "│   "));
            }
        }
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_tree(){ return std::make_unique<Tree>(); } }
