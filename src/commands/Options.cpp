#include "Options.hpp"

#include <cctype>
#include <limits>

std::optional<std::string> ParsedArgs::value(const std::string& option) const {
    auto it = values.find(option);
    if (it == values.end()) return std::nullopt;
    return it->second;
}

ParsedArgs parse_options(const std::vector<std::string>& args, const OptionSpec& spec) {
    ParsedArgs out;
    for (size_t i = 1; i < args.size(); ++i) {
        const auto& a = args[i];
        auto f = spec.flags.find(a);
        if (f != spec.flags.end()) { out.flags.insert(f->second); continue; }
        if (spec.valued.count(a) && i + 1 < args.size()) { out.values[a] = args[++i]; continue; }
        if (spec.ignore_unknown && a.size() > 1 && a[0] == '-') continue;
        out.operands.push_back(a);
    }
    return out;
}

std::optional<size_t> parse_count(const std::string& text) {
    size_t i = 0;
    if (i < text.size() && text[i] == '+') ++i;
    if (i == text.size()) return std::nullopt;
    size_t n = 0;
    for (; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) return std::nullopt;
        size_t d = c - '0';
        if (n > (std::numeric_limits<size_t>::max() - d) / 10) return std::nullopt;
        n = n * 10 + d;
    }
    return n;
}

std::optional<unsigned> parse_octal_mode(const std::string& text) {
    size_t i = 0;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'o' || text[1] == 'O')) i = 2;
    if (i == text.size()) return std::nullopt;
    unsigned mode = 0;
    for (; i < text.size(); ++i) {
        char c = text[i];
        if (c < '0' || c > '7') return std::nullopt;
        mode = mode * 8 + static_cast<unsigned>(c - '0');
        if (mode > 07777) return std::nullopt;
    }
    return mode;
}
