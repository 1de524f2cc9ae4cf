#include "TestUtils.hpp"

#include <sys/stat.h>

TEST_CASE("mkdir", "[files]") {
    test::Session sh;
    REQUIRE(sh.run("mkdir x").code == 0);
    REQUIRE(fs::is_directory(sh.at("x")));

    SECTION("existing directory fails") {
        auto r = sh.run("mkdir x");
        REQUIRE(r.code == 1);
        REQUIRE(r.err == "mkdir: cannot create directory 'x': File exists\n");
    }
    SECTION("-p tolerates it") {
        REQUIRE(sh.run("mkdir -p x").code == 0);
    }
    SECTION("parents are created") {
        REQUIRE(sh.run("mkdir deep/er/est").code == 0);
        REQUIRE(fs::is_directory(sh.at("deep/er/est")));
    }
    SECTION("no operand") {
        auto r = sh.run("mkdir");
        REQUIRE(r.code == 2);
        REQUIRE(r.err == "mkdir: missing operand\n");
    }
}

TEST_CASE("rmdir", "[files]") {
    test::Session sh;
    sh.run("mkdir empty full");
    test::write_file(sh.at("full/f"), "x");
    REQUIRE(sh.run("rmdir empty").code == 0);
    REQUIRE_FALSE(fs::exists(sh.at("empty")));

    auto r = sh.run("rmdir full");
    REQUIRE(r.code == 1);
    REQUIRE(r.err == "rmdir: failed to remove 'full': Directory not empty\n");
    REQUIRE(sh.run("rmdir full/f").err == "rmdir: failed to remove 'full/f': Not a directory\n");
    REQUIRE(sh.run("rmdir nope").code == 1);
}

TEST_CASE("rm", "[files]") {
    test::Session sh;
    sh.run("mkdir d");
    test::write_file(sh.at("d/inner.txt"), "x");
    test::write_file(sh.at("f.txt"), "x");

    REQUIRE(sh.run("rm f.txt").code == 0);
    REQUIRE_FALSE(fs::exists(sh.at("f.txt")));

    auto r = sh.run("rm d");
    REQUIRE(r.code == 1);
    REQUIRE(r.err == "rm: cannot remove 'd': Is a directory\n");
    REQUIRE(fs::exists(sh.at("d/inner.txt")));

    REQUIRE(sh.run("rm -r d").code == 0);
    REQUIRE_FALSE(fs::exists(sh.at("d")));

    for (const char* flag : {"-rf", "-fr"}) {
        INFO(flag);
        test::write_file(sh.at("e/deep/x.txt"), "x");
        REQUIRE(sh.run(std::string("rm ") + flag + " e").code == 0);
        REQUIRE_FALSE(fs::exists(sh.at("e")));
    }

    REQUIRE(sh.run("rm gone").err == "rm: cannot remove 'gone': No such file or directory\n");
    REQUIRE(sh.run("rm").code == 2);
}

TEST_CASE("rm removes a dangling symlink", "[files]") {
    test::Session sh;
    fs::create_symlink(sh.at("nowhere"), sh.at("link"));
    REQUIRE(sh.run("rm link").code == 0);
    REQUIRE_FALSE(fs::is_symlink(sh.at("link")));
}

TEST_CASE("touch", "[files]") {
    test::Session sh;
    REQUIRE(sh.run("touch a.txt logs/b.log").code == 0);
    REQUIRE(fs::is_regular_file(sh.at("a.txt")));
    REQUIRE(fs::is_regular_file(sh.at("logs/b.log")));

    test::write_file(sh.at("keep.txt"), "content");
    sh.run("touch keep.txt");
    REQUIRE(test::read_file(sh.at("keep.txt")) == "content");
}

TEST_CASE("mv", "[files]") {
    test::Session sh;
    test::write_file(sh.at("a.txt"), "A");
    sh.run("mkdir box");

    REQUIRE(sh.run("mv a.txt b.txt").code == 0);
    REQUIRE(test::read_file(sh.at("b.txt")) == "A");

    REQUIRE(sh.run("mv b.txt box").code == 0);
    REQUIRE(test::read_file(sh.at("box/b.txt")) == "A");

    test::write_file(sh.at("c1"), "1");
    test::write_file(sh.at("c2"), "2");
    REQUIRE(sh.run("mv c1 c2 box").code == 0);
    REQUIRE(fs::exists(sh.at("box/c1")));
    REQUIRE(fs::exists(sh.at("box/c2")));

    test::write_file(sh.at("m1"), "1");
    test::write_file(sh.at("m2"), "2");
    auto not_dir = sh.run("mv m1 m2 nodir");
    REQUIRE(not_dir.code == 1);
    REQUIRE(not_dir.err == "mv: target is not a directory\n");
    REQUIRE(fs::exists(sh.at("m1")));
    REQUIRE(fs::exists(sh.at("m2")));
    REQUIRE_FALSE(fs::exists(sh.at("nodir")));

    auto missing = sh.run("mv ghost x");
    REQUIRE(missing.code == 1);
    REQUIRE(missing.err.find("No such file or directory") != std::string::npos);
    REQUIRE(sh.run("mv only").code == 2);
}

TEST_CASE("cp", "[files]") {
    test::Session sh;
    test::write_file(sh.at("src/one.txt"), "1");
    test::write_file(sh.at("src/sub/two.txt"), "22");
    test::write_file(sh.at("f.txt"), "file");
    ::chmod(sh.at("f.txt").c_str(), 0640);

    SECTION("file to file keeps mode") {
        REQUIRE(sh.run("cp f.txt g.txt").code == 0);
        REQUIRE(test::read_file(sh.at("g.txt")) == "file");
        auto perms = fs::status(sh.at("g.txt")).permissions();
        REQUIRE((perms & fs::perms::all) == (fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read));
    }
    SECTION("file into a directory") {
        REQUIRE(sh.run("cp f.txt src").code == 0);
        REQUIRE(test::read_file(sh.at("src/f.txt")) == "file");
    }
    SECTION("directory needs -r") {
        auto r = sh.run("cp src dst");
        REQUIRE(r.code == 1);
        REQUIRE(r.err.find("-r not specified") != std::string::npos);
    }
    SECTION("recursive copy") {
        REQUIRE(sh.run("cp -r src dst").code == 0);
        REQUIRE(test::read_file(sh.at("dst/sub/two.txt")) == "22");
        REQUIRE(test::read_file(sh.at("src/one.txt")) == "1");
    }
    SECTION("a directory is never copied into itself") {
        auto same = sh.run("cp -r src src");
        REQUIRE(same.code == 1);
        REQUIRE(same.err == "cp: cannot copy a directory, '" + sh.at("src").string() +
                            "', into itself, '" + sh.at("src/src").string() + "'\n");
        REQUIRE_FALSE(fs::exists(sh.at("src/src")));

        auto below = sh.run("cp -r src src/sub/copy");
        REQUIRE(below.code == 1);
        REQUIRE(below.err.find("into itself") != std::string::npos);
        REQUIRE_FALSE(fs::exists(sh.at("src/sub/copy")));

        // a sibling sharing the name prefix is a different directory
        REQUIRE(sh.run("cp -r src srcx").code == 0);
        REQUIRE(test::read_file(sh.at("srcx/sub/two.txt")) == "22");
    }
    SECTION("several sources need a directory") {
        auto r = sh.run("cp f.txt src/one.txt nodir");
        REQUIRE(r.code == 1);
        REQUIRE(r.err == "cp: target is not a directory\n");
    }
}
