#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"
#include "Redirect.hpp"

class Echo : public ICommand {
public:
    std::string name() const override { return "echo"; }
    std::string help() const override {
        return R"(echo: write arguments to standard output or a file
Synopsis:
  echo [args...]
  echo [args...] > file
  echo [args...] >> file
Notes:
  '>' truncates the file, '>>' appends. The operator may appear anywhere
  among the arguments.
Examples:
  echo hello world
  echo "a b" > notes.txt
)";
    }
    Outcome execute(CommandContext& ctx) override {
        auto redirect = find_redirect(ctx.args);
        std::string text;
        bool first = true;
        for (size_t i = 1; i < ctx.args.size(); ++i) {
            if (redirect && (i == redirect->op_index || i == redirect->op_index + 1)) continue;
            if (!first) text += ' ';
            text += ctx.args[i];
            first = false;
        }
        text += '\n';
        if (!redirect) {
            ctx.out << text;
            return 0;
        }
        if (!redirect->target || is_redirect_op(*redirect->target)) throw SyntaxError("echo: missing redirection target");
        try {
            ctx.fs.writeFile(resolve_arg(ctx, *redirect->target), text, redirect->mode == WriteMode::Append);
        } catch (const std::exception& e) {
            throw IOFailure(std::string("echo: redirection error: ") + e.what());
        }
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_echo(){ return std::make_unique<Echo>(); } }
