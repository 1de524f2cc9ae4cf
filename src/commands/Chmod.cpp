#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"
#include "Options.hpp"

class Chmod : public ICommand {
public:
    std::string name() const override { return "chmod"; }
    std::string help() const override {
        return R"(chmod: change file mode bits
Synopsis:
  chmod <octal-mode> <path>
Notes:
  Only numeric modes are accepted; a leading 0o is allowed.
Examples:
  chmod 755 run.sh
  chmod 0o600 secrets.txt
)";
    }
    Outcome execute(CommandContext& ctx) override {
        if (ctx.args.size() < 3) throw OperandError("chmod: missing operands");
        const auto& mode_text = ctx.args[1];
        const auto& file = ctx.args[2];
        auto mode = parse_octal_mode(mode_text);
        if (!mode) throw ShellError("chmod: invalid mode: '" + mode_text + "'", 1);
        auto p = resolve_arg(ctx, file);
        if (!ctx.fs.exists(p)) throw NotFoundError("chmod: " + file + ": No such file or directory");
        try {
            ctx.fs.chmod(p, *mode);
        } catch (const std::exception& e) {
            throw IOFailure(std::string("chmod: error: ") + e.what());
        }
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_chmod(){ return std::make_unique<Chmod>(); } }
