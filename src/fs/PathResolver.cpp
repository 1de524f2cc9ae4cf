#include "PathResolver.hpp"

#include <filesystem>

namespace PathResolver {

static std::string normalize(const std::filesystem::path& p) {
    std::string s = p.lexically_normal().generic_string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    if (s.empty()) return ".";
    return s;
}

std::string resolve(const std::string& path, const std::string& cwd) {
    std::filesystem::path p{path};
    if (p.is_absolute()) return normalize(p);
    return normalize(std::filesystem::path(cwd) / p);
}

std::string basename(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) return path;
    if (pos + 1 == path.size()) return path == "/" ? path : basename(path.substr(0, pos));
    return path.substr(pos + 1);
}

}
