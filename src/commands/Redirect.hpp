#pragma once
#include <optional>
#include <string>
#include <vector>

#include "../shell/CaptureSession.hpp"

// Output redirection (`> file` or `>> file`) found among a command's args.
struct Redirect {
    size_t op_index;           // index of the operator in args
    WriteMode mode;
    std::optional<std::string> target; // token after the operator, if any
};

inline bool is_redirect_op(const std::string& tok) { return tok == ">" || tok == ">>"; }

// First `>`/`>>` at or after args[from].
inline std::optional<Redirect> find_redirect(const std::vector<std::string>& args, size_t from = 1) {
    for (size_t i = from; i < args.size(); ++i) {
        if (!is_redirect_op(args[i])) continue;
        Redirect r{i, args[i] == ">>" ? WriteMode::Append : WriteMode::Overwrite, std::nullopt};
        if (i + 1 < args.size()) r.target = args[i + 1];
        return r;
    }
    return std::nullopt;
}
