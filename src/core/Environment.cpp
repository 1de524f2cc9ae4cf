#include "Environment.hpp"

extern char** environ;

Environment Environment::from_process() {
    Environment env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto pos = entry.find('=');
        if (pos == std::string::npos) continue;
        env.set(entry.substr(0, pos), entry.substr(pos + 1));
    }
    return env;
}

std::string Environment::get(const std::string& key) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return std::string();
    return it->second;
}

void Environment::set(const std::string& key, const std::string& value) {
    kv_[key] = value;
}
