#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

class Wc : public ICommand {
public:
    std::string name() const override { return "wc"; }
    std::string help() const override {
        return R"(wc: print newline, word, and character counts
Synopsis:
  wc <file>...
Notes:
  Characters are UTF-8 code points, not bytes.
Examples:
  wc notes.txt
)";
    }
    Outcome execute(CommandContext& ctx) override {
        if (ctx.args.size() < 2) throw OperandError("wc: missing file operand");
        std::string report;
        for (size_t i = 1; i < ctx.args.size(); ++i) {
            const auto& file = ctx.args[i];
            auto data = ctx.fs.readFile(require_file(ctx, "wc", file));
            size_t lines = 0, words = 0, chars = 0;
            bool in_word = false;
            for (char ch : data) {
                unsigned char c = static_cast<unsigned char>(ch);
                if (c == '\n') ++lines;
                if ((c & 0xC0) != 0x80) ++chars;
                if (std::isspace(c)) in_word = false;
                else if (!in_word) { in_word = true; ++words; }
            }
            std::ostringstream line;
            line << std::setw(7) << lines << ' ' << std::setw(7) << words << ' ' << std::setw(7) << chars << ' ' << file << '\n';
            report += line.str();
        }
        ctx.out << report;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_wc(){ return std::make_unique<Wc>(); } }
