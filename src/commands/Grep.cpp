#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"

#include <cctype>

static std::string rstrip(const std::string& s) {
    size_t j = s.size();
    while (j > 0 && std::isspace(static_cast<unsigned char>(s[j-1]))) --j;
    return s.substr(0, j);
}

class Grep : public ICommand {
public:
    std::string name() const override { return "grep"; }
    std::string help() const override {
        return R"(grep: print lines containing a string
Synopsis:
  grep PATTERN <file>
Notes:
  PATTERN is matched literally, not as a regular expression. Each match
  is printed as LINE:TEXT. Exit status is 1 when nothing matches.
Examples:
  grep error app.log
)";
    }
    Outcome execute(CommandContext& ctx) override {
        if (ctx.args.size() < 3) throw OperandError("grep: missing pattern or file");
        const auto& pattern = ctx.args[1];
        const auto& file = ctx.args[2];
        auto data = ctx.fs.readFile(require_file(ctx, "grep", file));

        bool matched = false;
        size_t pos = 0, line_no = 1;
        while (pos < data.size()) {
            size_t end = data.find('\n', pos);
            std::string line = end == std::string::npos ? data.substr(pos) : data.substr(pos, end - pos);
            if (line.find(pattern) != std::string::npos) {
                ctx.out << line_no << ':' << rstrip(line) << '\n';
                matched = true;
            }
            if (end == std::string::npos) break;
            pos = end + 1;
            ++line_no;
        }
        return matched ? 0 : 1;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_grep(){ return std::make_unique<Grep>(); } }
