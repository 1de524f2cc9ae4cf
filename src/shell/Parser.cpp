#include "Parser.hpp"

#include "../core/Errors.hpp"

namespace Parser {

static bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

static void push_token(std::vector<std::string>& out, std::string& cur, bool& have) {
    if (have) {
        out.push_back(cur);
        cur.clear();
        have = false;
    }
}

std::vector<std::string> split(const std::string& line) {
    std::vector<std::string> args;
    std::string cur;
    // quoted empty strings ("" or '') still form a token
    bool have = false;
    bool in_single = false, in_double = false, escape = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escape) {
            if (in_double && c != '\\' && c != '"' && c != '$' && c != '`' && c != '\n') cur.push_back('\\');
            cur.push_back(c);
            escape = false;
            continue;
        }
        if (in_single) {
            if (c == '\'') in_single = false; else cur.push_back(c);
            continue;
        }
        if (c == '\\') { escape = true; have = true; continue; }
        if (in_double) {
            if (c == '"') in_double = false; else cur.push_back(c);
            continue;
        }
        if (c == '\'') { in_single = true; have = true; continue; }
        if (c == '"') { in_double = true; have = true; continue; }
        if (is_blank(c)) { push_token(args, cur, have); continue; }
        cur.push_back(c);
        have = true;
    }
    if (in_single || in_double) throw ParseError("parse error: No closing quotation");
    if (escape) throw ParseError("parse error: No escaped character");
    push_token(args, cur, have);
    return args;
}

}
