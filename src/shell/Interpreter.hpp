#pragma once
#include <optional>
#include <string>

#include "CaptureSession.hpp"
#include "CommandRegistry.hpp"
#include "InvocationResult.hpp"

class IFileSystem;
class ISystemMetrics;
class Environment;

// Runs one input line at a time against the builtin verbs. The only state
// carried between calls is an open multi-line capture session, so use one
// Interpreter per independent command stream.
class Interpreter {
public:
    Interpreter(IFileSystem& fs, ISystemMetrics& metrics, Environment& env);

    InvocationResult execute(const std::string& line, const std::string& cwd);

    bool capturing() const { return session_.has_value(); }
    const CommandRegistry& registry() const { return registry_; }

    // Continuation marker returned while a capture session is open.
    static const char* const kContinuationPrompt;

private:
    IFileSystem& fs_;
    ISystemMetrics& metrics_;
    Environment& env_;
    CommandRegistry registry_;
    std::optional<CaptureSession> session_;

    InvocationResult continue_capture(const std::string& line, const std::string& cwd);
    InvocationResult dispatch(const std::string& line, const std::string& cwd);
};
