#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

// Per-command description of accepted options.
struct OptionSpec {
    // exact token -> flag name; several spellings may map to one flag
    // (e.g. "-r", "-rf", "-fr" -> "r")
    std::map<std::string, std::string> flags;
    // options that take the following token as their value ("-n 5")
    std::set<std::string> valued;
    // drop unrecognized "-x" tokens instead of treating them as operands
    bool ignore_unknown = false;
};

struct ParsedArgs {
    std::set<std::string> flags;
    std::map<std::string, std::string> values;
    std::vector<std::string> operands;

    bool has(const std::string& flag) const { return flags.count(flag) != 0; }
    std::optional<std::string> value(const std::string& option) const;
};

// Parse args[1..]. A valued option with no following token is handled like
// any other token (operand, or dropped when ignore_unknown is set).
ParsedArgs parse_options(const std::vector<std::string>& args, const OptionSpec& spec);

// Non-negative decimal count ("10", "+3"); nullopt when malformed.
std::optional<size_t> parse_count(const std::string& text);

// Octal permission bits with optional "0o" prefix; nullopt when malformed.
std::optional<unsigned> parse_octal_mode(const std::string& text);
