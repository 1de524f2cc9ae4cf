#pragma once
#include <string>
#include <vector>

namespace Parser {
    // Split a line into args with POSIX shell quoting: '...' is literal,
    // "..." honors \\ \" \$ \` escapes, a bare backslash escapes the next
    // character. Throws ParseError on an unterminated quote or a trailing
    // backslash.
    std::vector<std::string> split(const std::string& line);
}
