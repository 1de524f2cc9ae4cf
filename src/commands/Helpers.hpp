#pragma once
#include <ctime>
#include <string>

#include "../core/Errors.hpp"
#include "../fs/IFileSystem.hpp"
#include "../fs/PathResolver.hpp"
#include "../shell/CommandContext.hpp"

inline std::string resolve_arg(const CommandContext& ctx, const std::string& arg) {
    return PathResolver::resolve(arg, ctx.cwd);
}

// Resolve `arg` and insist it names an existing non-directory. Errors read
// "<verb>: <arg>: No such file or directory" or "<verb>: <arg>: Is a directory".
inline std::string require_file(const CommandContext& ctx, const std::string& verb, const std::string& arg) {
    auto p = resolve_arg(ctx, arg);
    if (!ctx.fs.exists(p)) throw NotFoundError(verb + ": " + arg + ": No such file or directory");
    if (ctx.fs.isDirectory(p)) throw TypeMismatchError(verb + ": " + arg + ": Is a directory");
    return p;
}

// strftime over local time.
inline std::string format_local_time(std::time_t t, const char* fmt) {
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[128];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}
