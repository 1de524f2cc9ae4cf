#include "TestUtils.hpp"

#include "system/LinuxSystemMetrics.hpp"

TEST_CASE("cpu and mem format the sampled figures", "[system]") {
    test::Session sh;
    REQUIRE(sh.run("cpu").out == "CPU: 12.5%\n");
    REQUIRE(sh.run("mem").out == "Memory: 2000/8000 bytes (25.0%)\n");
}

TEST_CASE("ps sorts rows as text and truncates names", "[system]") {
    test::Session sh;
    auto out = sh.run("ps").out;
    REQUIRE(out ==
            "     7 init-with-a-very-lon CPU%:  3.0 MEM%:  0.5\n"
            "    42 bash                 CPU%:  0.0 MEM%:  1.5\n");

    sh.metrics.procs.clear();
    REQUIRE(sh.run("ps").out == "\n");
}

TEST_CASE("ps caps the listing", "[system]") {
    test::Session sh;
    sh.metrics.procs.clear();
    for (int pid = 1; pid <= 250; ++pid) sh.metrics.procs.push_back({pid, "p", 0.0, 0.0});
    auto out = sh.run("ps").out;
    REQUIRE(std::count(out.begin(), out.end(), '\n') == 200);
}

TEST_CASE("df reports the root file system", "[system]") {
    test::Session sh;
    auto out = sh.run("df").out;
    REQUIRE(out ==
            "Filesystem     Size      Used     Avail    Use%\n"
            "root         1000000     400000     600000   40%\n");
    REQUIRE(sh.metrics.last_disk_path == "/");
}

TEST_CASE("uptime", "[system]") {
    test::Session sh;
    REQUIRE(sh.run("uptime").out == "up 2 days, 3:04\n");
    sh.metrics.boot = std::time(nullptr) - 59;
    REQUIRE(sh.run("uptime").out == "up 0 days, 0:00\n");
}

TEST_CASE("whoami prefers the environment", "[system]") {
    test::Session sh;
    REQUIRE(sh.run("whoami").out == "tester\n");
    sh.env.set("LOGNAME", "first");
    REQUIRE(sh.run("whoami").out == "first\n");
}

TEST_CASE("date, hostname and clear", "[system]") {
    test::Session sh;
    auto date = sh.run("date");
    REQUIRE(date.code == 0);
    // e.g. "Mon Oct 19 14:03:07 2026"
    REQUIRE(date.out.size() == 25);
    REQUIRE(date.out[3] == ' ');
    REQUIRE(date.out[13] == ':');

    auto host = sh.run("hostname").out;
    REQUIRE(host.size() > 1);
    REQUIRE(host.back() == '\n');

    REQUIRE(sh.run("clear").out == std::string(50, '\n'));
}

TEST_CASE("host metrics are plausible", "[system][host]") {
    LinuxSystemMetrics host;
    auto mem = host.memory();
    REQUIRE(mem.total > 0);
    REQUIRE(mem.used <= mem.total);
    REQUIRE(mem.percent >= 0.0);
    REQUIRE(mem.percent <= 100.0);

    auto disk = host.diskUsage("/");
    REQUIRE(disk.total > 0);
    REQUIRE(disk.percent <= 100.0);

    REQUIRE(host.bootTime() <= std::time(nullptr));

    auto procs = host.processes();
    REQUIRE_FALSE(procs.empty());
    bool found_self = std::any_of(procs.begin(), procs.end(),
                                  [](const ProcessInfo& p){ return p.pid == static_cast<int>(::getpid()); });
    REQUIRE(found_self);
}
