#include "Interpreter.hpp"

#include <cctype>
#include <sstream>
#include <utility>

#include "CommandContext.hpp"
#include "Parser.hpp"
#include "../commands/Builtins.hpp"
#include "../core/Environment.hpp"
#include "../core/Errors.hpp"
#include "../fs/IFileSystem.hpp"

const char* const Interpreter::kContinuationPrompt = "> ";

static std::string trim(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    size_t j = s.size();
    while (j > i && std::isspace(static_cast<unsigned char>(s[j-1]))) --j;
    return s.substr(i, j - i);
}

Interpreter::Interpreter(IFileSystem& fs, ISystemMetrics& metrics, Environment& env)
    : fs_(fs), metrics_(metrics), env_(env) {
    Builtins::register_all(registry_);
}

InvocationResult Interpreter::execute(const std::string& line, const std::string& cwd) {
    if (session_) return continue_capture(line, cwd);
    return dispatch(line, cwd);
}

InvocationResult Interpreter::continue_capture(const std::string& line, const std::string& cwd) {
    InvocationResult result;
    result.cwd = cwd;
    if (!session_->feed(line)) {
        result.out = kContinuationPrompt;
        return result;
    }
    // the session ends here whether or not the flush succeeds
    CaptureSession session = std::move(*session_);
    session_.reset();
    try {
        session.flush(fs_);
    } catch (const std::exception& e) {
        result.err = session.owner() + ": write error: " + e.what() + "\n";
        result.code = 1;
    }
    return result;
}

InvocationResult Interpreter::dispatch(const std::string& line, const std::string& cwd) {
    InvocationResult result;
    result.cwd = cwd;
    auto raw = trim(line);
    if (raw.empty()) return result;

    std::ostringstream out, err;
    ICommand* cmd = nullptr;
    std::string new_cwd = cwd;
    try {
        auto tokens = Parser::split(raw);
        if (tokens.empty()) return result;
        cmd = registry_.find(tokens[0]);
        if (!cmd) throw UnknownCommandError(tokens[0]);

        CommandContext ctx(tokens, out, err, fs_, metrics_, env_, registry_, new_cwd);
        Outcome outcome = cmd->execute(ctx);
        if (outcome.enters_capture()) {
            session_ = outcome.session();
            result.out = kContinuationPrompt;
            return result;
        }
        result.code = outcome.code();
        result.cwd = new_cwd;
    } catch (const ShellError& e) {
        err << e.what() << '\n';
        result.code = e.code();
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << '\n';
        result.code = 1;
    }
    if (cmd && cmd->reportsSystemState()) result.cwd.reset();
    result.out = out.str();
    result.err = err.str();
    return result;
}
