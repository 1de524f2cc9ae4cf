#pragma once
#include <catch2/catch.hpp>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <unistd.h>

#include "core/Environment.hpp"
#include "fs/HostFileSystem.hpp"
#include "shell/Interpreter.hpp"
#include "system/ISystemMetrics.hpp"

namespace fs = std::filesystem;

namespace test {

struct TempDir {
    fs::path path{};

    explicit TempDir(const std::string& prefix = "pseudoshell") {
        auto now = std::chrono::system_clock::now().time_since_epoch().count();
        std::ostringstream dir_name{};
        dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
        path = fs::weakly_canonical(fs::temp_directory_path()) / dir_name.str();
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec{};
        fs::remove_all(path, ec);
    }

    std::string str() const { return path.string(); }
};

inline void write_file(const fs::path& p, const std::string& data) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    REQUIRE(out.good());
    out << data;
}

inline std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    REQUIRE(in.good());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Fixed figures so the formatting of the system commands can be checked.
class FakeMetrics : public ISystemMetrics {
public:
    double cpu = 12.5;
    MemoryStats mem{8000, 2000, 25.0};
    std::vector<ProcessInfo> procs{{42, "bash", 0.0, 1.5}, {7, "init-with-a-very-long-name", 3.0, 0.5}};
    DiskUsage disk{1000000, 400000, 600000, 40.0};
    std::time_t boot = std::time(nullptr) - (2 * 86400 + 3 * 3600 + 4 * 60 + 30);
    std::string last_disk_path;

    double cpuPercent() override { return cpu; }
    MemoryStats memory() override { return mem; }
    std::vector<ProcessInfo> processes() override { return procs; }
    DiskUsage diskUsage(const std::string& path) override { last_disk_path = path; return disk; }
    std::time_t bootTime() override { return boot; }
};

// One interpreter over a scratch directory; run() feeds lines the way a
// front end does, carrying the working directory between calls.
struct Session {
    TempDir dir;
    Environment env;
    HostFileSystem host;
    FakeMetrics metrics;
    Interpreter interp{host, metrics, env};
    std::string cwd;

    Session() : cwd(dir.str()) {
        env.set("HOME", dir.str());
        env.set("USER", "tester");
    }

    InvocationResult run(const std::string& line) {
        auto r = interp.execute(line, cwd);
        if (r.cwd) cwd = *r.cwd;
        return r;
    }

    fs::path at(const std::string& rel) const { return dir.path / rel; }
};

}
