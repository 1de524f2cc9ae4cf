#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"
#include "Options.hpp"

class Tail : public ICommand {
public:
    std::string name() const override { return "tail"; }
    std::string help() const override {
        return R"(tail: output the last part of a file
Synopsis:
  tail [-n N] <file>
Options:
  -n N   Print the last N lines (default 10)
Examples:
  tail -n 20 a.txt
)";
    }
    Outcome execute(CommandContext& ctx) override {
        static const OptionSpec spec{{}, {"-n"}, false};
        auto opts = parse_options(ctx.args, spec);
        size_t n = 10;
        if (auto v = opts.value("-n")) {
            auto count = parse_count(*v);
            if (!count) throw ShellError("tail: invalid number of lines", 1);
            n = *count;
        }
        if (opts.operands.empty()) throw OperandError("tail: missing file operand");
        const auto& file = opts.operands.back();
        auto data = ctx.fs.readFile(require_file(ctx, "tail", file));
        if (n == 0 || data.empty()) return 0;

        // walk back over n line starts; a final line without '\n' still counts
        size_t start = data.size();
        if (data.back() == '\n') --start;
        size_t seen = 0;
        while (start > 0) {
            if (data[start - 1] == '\n' && ++seen == n) break;
            --start;
        }
        ctx.out << data.substr(start);
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_tail(){ return std::make_unique<Tail>(); } }
