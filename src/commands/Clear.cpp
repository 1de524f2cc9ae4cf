#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"

#include <string>

class Clear : public ICommand {
public:
    std::string name() const override { return "clear"; }
    std::string help() const override {
        return R"(clear: clear the screen
Synopsis:
  clear
Notes:
  Emits blank lines instead of terminal escape codes, so the output
  works over any transport.
)";
    }
    Outcome execute(CommandContext& ctx) override {
        ctx.out << std::string(50, '\n');
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_clear(){ return std::make_unique<Clear>(); } }
