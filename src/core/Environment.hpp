#pragma once
#include <string>
#include <unordered_map>

// Snapshot of environment variables the commands consult (HOME, USER, ...).
// Filled from the process at start-up; tests populate it directly.
class Environment {
public:
    static Environment from_process();

    std::string get(const std::string& key) const;
    void set(const std::string& key, const std::string& value);
private:
    std::unordered_map<std::string, std::string> kv_;
};
