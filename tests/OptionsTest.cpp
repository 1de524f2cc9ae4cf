#include <catch2/catch.hpp>

#include "commands/Options.hpp"

TEST_CASE("flags, valued options and operands", "[options]") {
    OptionSpec spec{{{"-r", "r"}, {"-rf", "r"}}, {"-n"}, false};
    auto p = parse_options({"cmd", "-rf", "-n", "5", "a", "b"}, spec);
    REQUIRE(p.has("r"));
    REQUIRE(p.value("-n") == std::optional<std::string>("5"));
    REQUIRE(p.operands == std::vector<std::string>{"a", "b"});
}

TEST_CASE("unknown dash tokens", "[options]") {
    OptionSpec strict{{{"-l", "l"}}, {}, false};
    REQUIRE(parse_options({"ls", "-z", "x"}, strict).operands == std::vector<std::string>{"-z", "x"});

    OptionSpec lenient{{{"-l", "l"}}, {}, true};
    REQUIRE(parse_options({"ls", "-z", "x"}, lenient).operands == std::vector<std::string>{"x"});
}

TEST_CASE("valued option without a value", "[options]") {
    OptionSpec spec{{}, {"-n"}, false};
    auto p = parse_options({"head", "-n"}, spec);
    REQUIRE_FALSE(p.value("-n"));
    REQUIRE(p.operands == std::vector<std::string>{"-n"});
}

TEST_CASE("parse_count", "[options]") {
    REQUIRE(parse_count("10") == std::optional<size_t>(10));
    REQUIRE(parse_count("+3") == std::optional<size_t>(3));
    REQUIRE(parse_count("0") == std::optional<size_t>(0));
    REQUIRE_FALSE(parse_count("-1"));
    REQUIRE_FALSE(parse_count("abc"));
    REQUIRE_FALSE(parse_count(""));
    REQUIRE_FALSE(parse_count("+"));
}

TEST_CASE("parse_octal_mode", "[options]") {
    REQUIRE(parse_octal_mode("755") == std::optional<unsigned>(0755));
    REQUIRE(parse_octal_mode("0o600") == std::optional<unsigned>(0600));
    REQUIRE(parse_octal_mode("4755") == std::optional<unsigned>(04755));
    REQUIRE_FALSE(parse_octal_mode("8"));
    REQUIRE_FALSE(parse_octal_mode("rwx"));
    REQUIRE_FALSE(parse_octal_mode("0o"));
    REQUIRE_FALSE(parse_octal_mode("17777"));
}
