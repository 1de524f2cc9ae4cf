#include "LinuxSystemMetrics.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/statvfs.h>
#include <system_error>
#include <thread>
#include <unistd.h>

static std::string read_whole(const std::string& file) {
    std::ifstream ifs(file, std::ios::binary);
    if (!ifs) throw std::runtime_error("cannot read " + file);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

struct CpuTimes {
    unsigned long long idle = 0;
    unsigned long long total = 0;
};

static CpuTimes read_cpu_times() {
    std::istringstream is(read_whole("/proc/stat"));
    std::string label;
    is >> label;
    if (label != "cpu") throw std::runtime_error("unexpected /proc/stat layout");
    CpuTimes t;
    unsigned long long value;
    // user nice system idle iowait irq softirq steal ...
    for (int i = 0; is >> value; ++i) {
        if (i == 3 || i == 4) t.idle += value;
        t.total += value;
        if (i == 7) break;
    }
    return t;
}

static unsigned long long meminfo_kb(const std::string& data, const std::string& key) {
    std::istringstream is(data);
    std::string line;
    while (std::getline(is, line)) {
        if (line.rfind(key + ":", 0) == 0) {
            std::istringstream ls(line.substr(key.size() + 1));
            unsigned long long kb = 0;
            ls >> kb;
            return kb;
        }
    }
    return 0;
}

static double round1(double v) {
    return static_cast<double>(static_cast<long long>(v * 10.0 + 0.5)) / 10.0;
}

LinuxSystemMetrics::LinuxSystemMetrics(std::chrono::milliseconds cpu_interval)
    : cpu_interval_(cpu_interval) {}

double LinuxSystemMetrics::cpuPercent() {
    auto a = read_cpu_times();
    std::this_thread::sleep_for(cpu_interval_);
    auto b = read_cpu_times();
    auto total = b.total - a.total;
    auto idle = b.idle - a.idle;
    if (total == 0) return 0.0;
    return round1(100.0 * static_cast<double>(total - idle) / static_cast<double>(total));
}

MemoryStats LinuxSystemMetrics::memory() {
    auto data = read_whole("/proc/meminfo");
    auto total = meminfo_kb(data, "MemTotal") * 1024ULL;
    auto available = meminfo_kb(data, "MemAvailable") * 1024ULL;
    MemoryStats m;
    m.total = total;
    m.used = total > available ? total - available : 0;
    m.percent = total ? round1(100.0 * static_cast<double>(m.used) / static_cast<double>(total)) : 0.0;
    return m;
}

std::vector<ProcessInfo> LinuxSystemMetrics::processes() {
    namespace fs = std::filesystem;
    const double ticks = static_cast<double>(::sysconf(_SC_CLK_TCK));
    const double page = static_cast<double>(::sysconf(_SC_PAGESIZE));
    double uptime_s = 0.0;
    {
        std::istringstream is(read_whole("/proc/uptime"));
        is >> uptime_s;
    }
    const double mem_total = static_cast<double>(meminfo_kb(read_whole("/proc/meminfo"), "MemTotal")) * 1024.0;

    std::vector<ProcessInfo> out;
    std::error_code ec;
    for (fs::directory_iterator it("/proc", ec), end; it != end; it.increment(ec)) {
        if (ec) break;
        auto name = it->path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(), [](unsigned char c){ return std::isdigit(c); })) continue;
        std::string stat;
        try { stat = read_whole(it->path().string() + "/stat"); }
        catch (const std::exception&) { continue; } // process exited meanwhile
        // "pid (comm) state ..."; comm may itself contain spaces or ')'
        auto open = stat.find('(');
        auto close = stat.rfind(')');
        if (open == std::string::npos || close == std::string::npos || close < open) continue;
        ProcessInfo p;
        p.pid = std::stoi(name);
        p.name = stat.substr(open + 1, close - open - 1);
        std::istringstream rest(stat.substr(close + 1));
        std::vector<std::string> f;
        for (std::string w; rest >> w;) f.push_back(w);
        // fields after comm start at index 3 of stat(5): state=0, utime=11, stime=12, starttime=19, rss=21
        if (f.size() < 22) continue;
        double cpu_s = (std::stod(f[11]) + std::stod(f[12])) / ticks;
        double elapsed = uptime_s - std::stod(f[19]) / ticks;
        p.cpu_percent = elapsed > 0 ? round1(100.0 * cpu_s / elapsed) : 0.0;
        p.mem_percent = mem_total > 0 ? 100.0 * std::stod(f[21]) * page / mem_total : 0.0;
        out.push_back(std::move(p));
    }
    return out;
}

DiskUsage LinuxSystemMetrics::diskUsage(const std::string& path) {
    struct statvfs st;
    if (::statvfs(path.c_str(), &st) != 0) {
        throw std::runtime_error(std::error_code(errno, std::generic_category()).message() + ": '" + path + "'");
    }
    DiskUsage d;
    d.total = static_cast<uint64_t>(st.f_blocks) * st.f_frsize;
    d.free = static_cast<uint64_t>(st.f_bavail) * st.f_frsize;
    d.used = static_cast<uint64_t>(st.f_blocks - st.f_bfree) * st.f_frsize;
    auto denom = d.used + d.free;
    d.percent = denom ? round1(100.0 * static_cast<double>(d.used) / static_cast<double>(denom)) : 0.0;
    return d;
}

std::time_t LinuxSystemMetrics::bootTime() {
    std::istringstream is(read_whole("/proc/stat"));
    std::string line;
    while (std::getline(is, line)) {
        if (line.rfind("btime ", 0) == 0) return static_cast<std::time_t>(std::stoll(line.substr(6)));
    }
    throw std::runtime_error("boot time not available");
}
