#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../system/ISystemMetrics.hpp"

#include <iomanip>

class Cpu : public ICommand {
public:
    std::string name() const override { return "cpu"; }
    std::string help() const override {
        return R"(cpu: show overall CPU utilization
Synopsis:
  cpu
Notes:
  Samples the processor counters over half a second.
)";
    }
    bool reportsSystemState() const override { return true; }
    Outcome execute(CommandContext& ctx) override {
        ctx.out << "CPU: " << std::fixed << std::setprecision(1) << ctx.metrics.cpuPercent() << "%\n";
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_cpu(){ return std::make_unique<Cpu>(); } }
