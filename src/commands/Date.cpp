#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"

class Date : public ICommand {
public:
    std::string name() const override { return "date"; }
    std::string help() const override {
        return R"(date: print the current local date and time
Synopsis:
  date
)";
    }
    Outcome execute(CommandContext& ctx) override {
        ctx.out << format_local_time(std::time(nullptr), "%a %b %d %H:%M:%S %Y") << '\n';
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_date(){ return std::make_unique<Date>(); } }
