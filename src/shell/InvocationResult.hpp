#pragma once
#include <optional>
#include <string>

// What one call to Interpreter::execute hands back to its front end.
struct InvocationResult {
    std::string out;
    std::string err;
    // Empty when the command only reports system state; the caller then
    // keeps the working directory it already holds.
    std::optional<std::string> cwd;
    int code = 0;
};
