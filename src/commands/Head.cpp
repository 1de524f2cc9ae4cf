#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"
#include "Options.hpp"

class Head : public ICommand {
public:
    std::string name() const override { return "head"; }
    std::string help() const override {
        return R"(head: output the first part of a file
Synopsis:
  head [-n N] <file>
Options:
  -n N   Print the first N lines (default 10)
Examples:
  head -n 5 a.txt
)";
    }
    Outcome execute(CommandContext& ctx) override {
        static const OptionSpec spec{{}, {"-n"}, false};
        auto opts = parse_options(ctx.args, spec);
        size_t n = 10;
        if (auto v = opts.value("-n")) {
            auto count = parse_count(*v);
            if (!count) throw ShellError("head: invalid number of lines", 1);
            n = *count;
        }
        if (opts.operands.empty()) throw OperandError("head: missing file operand");
        const auto& file = opts.operands.back();
        auto data = ctx.fs.readFile(require_file(ctx, "head", file));

        size_t pos = 0;
        for (size_t line = 0; line < n && pos < data.size(); ++line) {
            auto end = data.find('\n', pos);
            pos = end == std::string::npos ? data.size() : end + 1;
        }
        ctx.out << data.substr(0, pos);
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_head(){ return std::make_unique<Head>(); } }
