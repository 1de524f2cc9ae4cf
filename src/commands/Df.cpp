#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../system/ISystemMetrics.hpp"

#include <iomanip>

class Df : public ICommand {
public:
    std::string name() const override { return "df"; }
    std::string help() const override {
        return R"(df: report file system disk space usage
Synopsis:
  df
Notes:
  Reports the root file system, sizes in bytes.
)";
    }
    bool reportsSystemState() const override { return true; }
    Outcome execute(CommandContext& ctx) override {
        auto d = ctx.metrics.diskUsage("/");
        ctx.out << "Filesystem     Size      Used     Avail    Use%\n"
                << "root      " << std::setw(10) << d.total << ' ' << std::setw(10) << d.used << ' '
                << std::setw(10) << d.free << "  " << std::fixed << std::setprecision(0) << std::setw(3) << d.percent
                << "%\n";
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_df(){ return std::make_unique<Df>(); } }
