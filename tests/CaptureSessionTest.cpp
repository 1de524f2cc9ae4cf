#include "TestUtils.hpp"

#include "shell/CaptureSession.hpp"

TEST_CASE("heredoc closes on the terminator only", "[capture]") {
    auto s = CaptureSession::heredoc("cat", "/tmp/x", WriteMode::Append, "END");
    REQUIRE_FALSE(s.feed("first"));
    REQUIRE_FALSE(s.feed(""));
    REQUIRE_FALSE(s.feed("  indented"));
    REQUIRE(s.feed("  END  "));
    REQUIRE(s.content() == "first\n\n  indented\n");
    REQUIRE(s.kind() == CaptureKind::Heredoc);
    REQUIRE(s.mode() == WriteMode::Append);
}

TEST_CASE("raw input closes on a blank line", "[capture]") {
    auto s = CaptureSession::raw_input("cat", "/tmp/x", WriteMode::Overwrite);
    REQUIRE_FALSE(s.feed("one\r\n"));
    REQUIRE_FALSE(s.feed("EOF"));
    REQUIRE(s.feed("   "));
    REQUIRE(s.lines() == std::vector<std::string>{"one", "EOF"});
    REQUIRE(s.content() == "one\nEOF\n");
}

TEST_CASE("flush writes or appends the buffer", "[capture]") {
    test::TempDir dir;
    HostFileSystem host;
    auto target = (dir.path / "out.txt").string();
    test::write_file(target, "old\n");

    auto append = CaptureSession::heredoc("cat", target, WriteMode::Append, "EOF");
    append.feed("new");
    append.flush(host);
    REQUIRE(test::read_file(target) == "old\nnew\n");

    auto overwrite = CaptureSession::raw_input("cat", target, WriteMode::Overwrite);
    overwrite.feed("only");
    overwrite.flush(host);
    REQUIRE(test::read_file(target) == "only\n");
}
