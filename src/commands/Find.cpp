#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"
#include "Options.hpp"

#include <algorithm>
#include <vector>

class Find : public ICommand {
public:
    std::string name() const override { return "find"; }
    std::string help() const override {
        return R"(find: search for files in a directory hierarchy
Synopsis:
  find [path] [-name TEXT]
Options:
  -name TEXT   Keep entries whose name contains TEXT (plain substring,
               no wildcards)
Notes:
  Prints full paths. Each directory lists its files, then its
  subdirectories, then descends. Symlinked directories are listed but
  not followed.
Examples:
  find . -name .txt
  find /tmp/project
)";
    }
    Outcome execute(CommandContext& ctx) override {
        static const OptionSpec spec{{}, {"-name"}, true};
        auto opts = parse_options(ctx.args, spec);
        std::string start = opts.operands.empty() ? ctx.cwd : resolve_arg(ctx, opts.operands.back());
        auto pattern = opts.value("-name");

        if (!ctx.fs.exists(start)) throw NotFoundError("find: '" + start + "': No such file or directory");
        if (ctx.fs.isDirectory(start)) walk(ctx, start, pattern);
        return 0;
    }

private:
    static std::string join(const std::string& dir, const std::string& name) {
        return dir == "/" ? dir + name : dir + "/" + name;
    }

    static void walk(CommandContext& ctx, const std::string& dir, const std::optional<std::string>& pattern) {
        std::vector<DirEntry> entries;
        try {
            entries = ctx.fs.list(dir);
        } catch (const std::exception&) {
            return; // unreadable directories are skipped silently
        }
        std::vector<std::string> files, dirs;
        for (auto& e : entries) {
            (e.is_dir ? dirs : files).push_back(e.name);
        }
        std::sort(files.begin(), files.end());
        std::sort(dirs.begin(), dirs.end());
        for (auto* group : {&files, &dirs}) {
            for (auto& n : *group) {
                if (!pattern || n.find(*pattern) != std::string::npos) ctx.out << join(dir, n) << '\n';
            }
        }
        for (auto& n : dirs) {
            auto sub = join(dir, n);
            if (!ctx.fs.isSymlink(sub)) walk(ctx, sub, pattern);
        }
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_find(){ return std::make_unique<Find>(); } }
