#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../system/ISystemMetrics.hpp"

#include <ctime>
#include <iomanip>

class Uptime : public ICommand {
public:
    std::string name() const override { return "uptime"; }
    std::string help() const override {
        return R"(uptime: tell how long the system has been running
Synopsis:
  uptime
Output:
  up D days, H:MM
)";
    }
    bool reportsSystemState() const override { return true; }
    Outcome execute(CommandContext& ctx) override {
        long long secs = static_cast<long long>(std::time(nullptr) - ctx.metrics.bootTime());
        if (secs < 0) secs = 0;
        long long days = secs / 86400;
        long long hours = (secs % 86400) / 3600;
        long long minutes = (secs % 3600) / 60;
        ctx.out << "up " << days << " days, " << hours << ':'
                << std::setw(2) << std::setfill('0') << minutes << std::setfill(' ') << '\n';
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_uptime(){ return std::make_unique<Uptime>(); } }
