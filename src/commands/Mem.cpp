#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../system/ISystemMetrics.hpp"

#include <iomanip>

class Mem : public ICommand {
public:
    std::string name() const override { return "mem"; }
    std::string help() const override {
        return R"(mem: show memory usage
Synopsis:
  mem
Output:
  Memory: USED/TOTAL bytes (PERCENT%)
)";
    }
    bool reportsSystemState() const override { return true; }
    Outcome execute(CommandContext& ctx) override {
        auto m = ctx.metrics.memory();
        ctx.out << "Memory: " << m.used << '/' << m.total << " bytes ("
                << std::fixed << std::setprecision(1) << m.percent << "%)\n";
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_mem(){ return std::make_unique<Mem>(); } }
