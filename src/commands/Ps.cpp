#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../system/ISystemMetrics.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

static const size_t kMaxProcesses = 200;

class Ps : public ICommand {
public:
    std::string name() const override { return "ps"; }
    std::string help() const override {
        return R"(ps: list running processes
Synopsis:
  ps
Output:
  PID NAME CPU% MEM%, sorted as text, at most 200 lines
)";
    }
    bool reportsSystemState() const override { return true; }
    Outcome execute(CommandContext& ctx) override {
        std::vector<std::string> rows;
        for (auto& p : ctx.metrics.processes()) {
            std::ostringstream row;
            row << std::setw(6) << p.pid << ' '
                << std::left << std::setw(20) << p.name.substr(0, 20) << std::right
                << " CPU%:" << std::fixed << std::setprecision(1) << std::setw(5) << p.cpu_percent
                << " MEM%:" << std::setw(5) << p.mem_percent;
            rows.push_back(row.str());
        }
        std::sort(rows.begin(), rows.end());
        if (rows.size() > kMaxProcesses) rows.resize(kMaxProcesses);
        for (auto& r : rows) ctx.out << r << '\n';
        if (rows.empty()) ctx.out << '\n';
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_ps(){ return std::make_unique<Ps>(); } }
