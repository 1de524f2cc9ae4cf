#include "TestUtils.hpp"

TEST_CASE("blank lines do nothing", "[interpreter]") {
    test::Session sh;
    auto r = sh.run("   ");
    REQUIRE(r.code == 0);
    REQUIRE(r.out.empty());
    REQUIRE(r.err.empty());
    REQUIRE(r.cwd == std::optional<std::string>(sh.dir.str()));
}

TEST_CASE("unknown verbs exit 127", "[interpreter]") {
    test::Session sh;
    auto r = sh.run("frobnicate --now");
    REQUIRE(r.code == 127);
    REQUIRE(r.err == "Command not found: frobnicate\n");
    REQUIRE(r.out.empty());
    REQUIRE(r.cwd == std::optional<std::string>(sh.dir.str()));
}

TEST_CASE("quoting errors exit 2", "[interpreter]") {
    test::Session sh;
    auto r = sh.run("echo \"unterminated");
    REQUIRE(r.code == 2);
    REQUIRE(r.err == "parse error: No closing quotation\n");
}

TEST_CASE("cd carries the working directory forward", "[interpreter]") {
    test::Session sh;
    REQUIRE(sh.run("mkdir -p a/b").code == 0);
    auto r = sh.run("cd a/b");
    REQUIRE(r.code == 0);
    REQUIRE(r.cwd == std::optional<std::string>(sh.at("a/b").string()));
    REQUIRE(sh.run("pwd").out == sh.at("a/b").string() + "\n");
    REQUIRE(sh.run("cd ..").cwd == std::optional<std::string>(sh.at("a").string()));
}

TEST_CASE("failed cd keeps the old directory", "[interpreter]") {
    test::Session sh;
    test::write_file(sh.at("f.txt"), "x");
    auto r = sh.run("cd missing");
    REQUIRE(r.code == 1);
    REQUIRE(r.err == "cd: missing: No such file or directory\n");
    REQUIRE(r.cwd == std::optional<std::string>(sh.dir.str()));
    REQUIRE(sh.run("cd f.txt").err == "cd: f.txt: Not a directory\n");
}

TEST_CASE("cd without arguments goes home", "[interpreter]") {
    test::Session sh;
    sh.run("mkdir sub");
    sh.run("cd sub");
    REQUIRE(sh.run("cd").cwd == std::optional<std::string>(sh.dir.str()));
}

TEST_CASE("heredoc append spans several calls", "[interpreter][capture]") {
    test::Session sh;
    test::write_file(sh.at("log.txt"), "");
    auto open = sh.run("cat >> log.txt << EOF");
    REQUIRE(open.out == "> ");
    REQUIRE(sh.interp.capturing());

    REQUIRE(sh.run("x").out == "> ");
    REQUIRE(sh.run("y").out == "> ");
    auto close = sh.run("EOF");
    REQUIRE(close.code == 0);
    REQUIRE(close.out.empty());
    REQUIRE_FALSE(sh.interp.capturing());
    REQUIRE(test::read_file(sh.at("log.txt")) == "x\ny\n");

    // verbs run normally again once the session is closed
    REQUIRE(sh.run("pwd").out == sh.dir.str() + "\n");
}

TEST_CASE("lines inside a capture are not commands", "[interpreter][capture]") {
    test::Session sh;
    sh.run("cat > notes.txt << STOP");
    sh.run("rm -r /");
    sh.run("exit");
    sh.run("STOP");
    REQUIRE(test::read_file(sh.at("notes.txt")) == "rm -r /\nexit\n");
}

TEST_CASE("raw input ends at a blank line", "[interpreter][capture]") {
    test::Session sh;
    REQUIRE(sh.run("cat > raw.txt").out == "> ");
    sh.run("hello");
    sh.run("EOF");
    auto close = sh.run("");
    REQUIRE(close.code == 0);
    REQUIRE_FALSE(sh.interp.capturing());
    REQUIRE(test::read_file(sh.at("raw.txt")) == "hello\nEOF\n");
}

TEST_CASE("a failed flush reports and still closes the session", "[interpreter][capture]") {
    test::Session sh;
    sh.run("mkdir blocker");
    REQUIRE(sh.run("cat > blocker << EOF").out == "> ");
    sh.run("data");
    auto r = sh.run("EOF");
    REQUIRE(r.code == 1);
    REQUIRE(r.err.rfind("cat: write error: ", 0) == 0);
    REQUIRE_FALSE(sh.interp.capturing());
    REQUIRE(sh.run("pwd").code == 0);
}

TEST_CASE("system state verbs leave cwd unset", "[interpreter]") {
    test::Session sh;
    for (const char* verb : {"cpu", "mem", "ps", "df", "uptime"}) {
        auto r = sh.run(verb);
        INFO(verb);
        REQUIRE(r.code == 0);
        REQUIRE_FALSE(r.cwd);
    }
    // the caller keeps its directory
    REQUIRE(sh.cwd == sh.dir.str());
}

TEST_CASE("help aliases", "[interpreter]") {
    test::Session sh;
    auto plain = sh.run("help").out;
    REQUIRE(plain.rfind("Supported commands:\n", 0) == 0);
    REQUIRE(sh.run("--help").out == plain);
    REQUIRE(sh.run("-h").out == plain);
}
