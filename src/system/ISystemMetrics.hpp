#pragma once
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

struct MemoryStats {
    uint64_t total;
    uint64_t used;
    double percent;
};

struct ProcessInfo {
    int pid;
    std::string name;
    double cpu_percent;
    double mem_percent;
};

struct DiskUsage {
    uint64_t total;
    uint64_t used;
    uint64_t free;
    double percent;
};

// Source of host-wide figures for cpu, mem, ps, df and uptime. The
// commands only format what this returns.
class ISystemMetrics {
public:
    virtual ~ISystemMetrics() = default;
    virtual double cpuPercent() = 0;
    virtual MemoryStats memory() = 0;
    virtual std::vector<ProcessInfo> processes() = 0;
    virtual DiskUsage diskUsage(const std::string& path) = 0;
    virtual std::time_t bootTime() = 0;
};
