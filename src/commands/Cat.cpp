#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"
#include "Redirect.hpp"

#include <vector>

static const char* kHeredocUsage = "cat: invalid syntax, use: cat [>>|>] file << EOF";

class Cat : public ICommand {
public:
    std::string name() const override { return "cat"; }
    std::string help() const override {
        return R"(cat: concatenate and print files, or write input to a file
Synopsis:
  cat <file>...
  cat <file>... > target       (>> appends)
  cat > target                 (>> appends)
  cat > target << WORD         (>> appends)
Notes:
  'cat > target' reads the following input lines until an empty line.
  With '<< WORD' input is read until a line equal to WORD (default EOF).
  Files are joined with a newline.
Examples:
  cat a.txt b.txt
  cat a.txt b.txt > both.txt
  cat >> log.txt << EOF
)";
    }
    Outcome execute(CommandContext& ctx) override {
        const auto& args = ctx.args;
        size_t heredoc = 0;
        for (size_t i = 1; i < args.size(); ++i) {
            if (args[i] == "<<") { heredoc = i; break; }
        }
        auto redirect = find_redirect(args);

        if (heredoc) {
            if (!redirect || heredoc < redirect->op_index) throw SyntaxError(kHeredocUsage);
            // exactly: cat >|>> target << [WORD]
            if (redirect->op_index != 1 || heredoc != 3 || args.size() > 5) throw SyntaxError(kHeredocUsage);
            std::string terminator = heredoc + 1 < args.size() ? args[heredoc + 1] : "EOF";
            return CaptureSession::heredoc(name(), resolve_arg(ctx, *redirect->target), redirect->mode, terminator);
        }

        if (redirect) {
            if (!redirect->target || is_redirect_op(*redirect->target)) throw SyntaxError("cat: missing redirection target");
            auto target = resolve_arg(ctx, *redirect->target);
            std::vector<std::string> sources;
            for (size_t i = 1; i < args.size(); ++i) {
                if (i == redirect->op_index || i == redirect->op_index + 1) continue;
                sources.push_back(args[i]);
            }
            if (sources.empty()) return CaptureSession::raw_input(name(), target, redirect->mode);
            auto data = read_all(ctx, sources);
            try {
                ctx.fs.writeFile(target, data, redirect->mode == WriteMode::Append);
            } catch (const std::exception& e) {
                throw IOFailure(std::string(redirect->mode == WriteMode::Append ? "cat: append error: " : "cat: write error: ") + e.what());
            }
            return 0;
        }

        if (args.size() < 2) throw OperandError("cat: missing file operand");
        ctx.out << read_all(ctx, std::vector<std::string>(args.begin() + 1, args.end()));
        return 0;
    }

private:
    static std::string read_all(CommandContext& ctx, const std::vector<std::string>& files) {
        std::string data;
        for (size_t i = 0; i < files.size(); ++i) {
            auto p = require_file(ctx, "cat", files[i]);
            if (i > 0) data += '\n';
            data += ctx.fs.readFile(p);
        }
        return data;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_cat(){ return std::make_unique<Cat>(); } }
