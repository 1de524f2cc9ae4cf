#pragma once
#include "ISystemMetrics.hpp"

#include <chrono>

// Reads /proc and statvfs(3).
class LinuxSystemMetrics : public ISystemMetrics {
public:
    explicit LinuxSystemMetrics(std::chrono::milliseconds cpu_interval = std::chrono::milliseconds(500));

    double cpuPercent() override;
    MemoryStats memory() override;
    std::vector<ProcessInfo> processes() override;
    DiskUsage diskUsage(const std::string& path) override;
    std::time_t bootTime() override;

private:
    std::chrono::milliseconds cpu_interval_;
};
