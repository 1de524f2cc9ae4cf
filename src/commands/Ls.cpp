#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"
#include "Options.hpp"

#include <algorithm>
#include <iomanip>

class Ls : public ICommand {
public:
    std::string name() const override { return "ls"; }
    std::string help() const override {
        return R"(ls: list directory contents
Synopsis:
  ls [-l] [-a] [path]
Options:
  -l   Use a long listing format (type, size, modification time, name)
  -a   Include entries starting with '.'
Notes:
  -la and -al combine both. Entries are sorted by name. A file path
  prints just its name.
Examples:
  ls
  ls -la /etc
)";
    }
    Outcome execute(CommandContext& ctx) override {
        static const OptionSpec spec{{{"-l", "l"}, {"-a", "a"}, {"-la", "la"}, {"-al", "la"}}, {}, true};
        auto opts = parse_options(ctx.args, spec);
        bool opt_l = opts.has("l") || opts.has("la");
        bool opt_a = opts.has("a") || opts.has("la");
        std::string target = opts.operands.empty() ? ctx.cwd : resolve_arg(ctx, opts.operands.back());

        if (!ctx.fs.exists(target)) {
            throw ShellError("ls: cannot access '" + target + "': No such file or directory", 2);
        }
        if (!ctx.fs.isDirectory(target)) {
            ctx.out << PathResolver::basename(target) << '\n';
            return 0;
        }

        auto entries = ctx.fs.list(target);
        if (!opt_a) {
            entries.erase(std::remove_if(entries.begin(), entries.end(),
                                         [](const DirEntry& e){ return !e.name.empty() && e.name[0] == '.'; }),
                          entries.end());
        }
        std::sort(entries.begin(), entries.end(),
                  [](const DirEntry& a, const DirEntry& b){ return a.name < b.name; });

        if (!opt_l) {
            for (size_t i = 0; i < entries.size(); ++i) {
                if (i > 0) ctx.out << "  ";
                ctx.out << entries[i].name;
            }
            ctx.out << '\n';
            return 0;
        }
        // sizes wider than the 10-column field push the rest of the line right
        for (auto& e : entries) {
            if (!e.readable) {
                ctx.out << "?  " << std::setw(10) << '?' << "  " << std::setw(16) << '?' << "  " << e.name << '\n';
                continue;
            }
            ctx.out << (e.is_dir ? 'd' : '-') << "  " << std::setw(10) << e.size << "  "
                    << format_local_time(e.mtime, "%Y-%m-%d %H:%M") << "  " << e.name << '\n';
        }
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_ls(){ return std::make_unique<Ls>(); } }
