#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"

#include <ios>


class Stat : public ICommand {
public:
    std::string name() const override { return "stat"; }
    std::string help() const override {
        return R"(stat: display file status
Synopsis:
  stat <path>
Output:
  File, Size, Mode (octal st_mode), Access, Modify, Change
Examples:
  stat a.txt
)";
    }
    Outcome execute(CommandContext& ctx) override {
        if (ctx.args.size() < 2) throw OperandError("stat: missing file operand");
        const auto& file = ctx.args[1];
        auto p = resolve_arg(ctx, file);
        if (!ctx.fs.exists(p)) throw NotFoundError("stat: " + file + ": No such file or directory");
        auto s = ctx.fs.stat(p);
        const char* fmt = "%Y-%m-%d %H:%M:%S";
        ctx.out << "  File: " << file << '\n'
                << "  Size: " << s.size << '\n'
                << "  Mode: 0o" << std::oct << s.mode << std::dec << '\n'
                << "Access: " << format_local_time(s.atime, fmt) << '\n'
                << "Modify: " << format_local_time(s.mtime, fmt) << '\n'
                << "Change: " << format_local_time(s.ctime, fmt) << '\n';
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_stat(){ return std::make_unique<Stat>(); } }
