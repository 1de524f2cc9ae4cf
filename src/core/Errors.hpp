#pragma once
#include <stdexcept>
#include <string>

// Base for every failure a command reports to the user. The message is the
// complete diagnostic line (no trailing newline); code is the exit status.
class ShellError : public std::runtime_error {
public:
    ShellError(const std::string& message, int code)
        : std::runtime_error(message), code_(code) {}
    int code() const { return code_; }
private:
    int code_;
};

// Malformed quoting in the raw line.
class ParseError : public ShellError {
public:
    explicit ParseError(const std::string& message) : ShellError(message, 2) {}
};

// Missing required argument.
class OperandError : public ShellError {
public:
    explicit OperandError(const std::string& message) : ShellError(message, 2) {}
};

class NotFoundError : public ShellError {
public:
    explicit NotFoundError(const std::string& message) : ShellError(message, 1) {}
};

// File given where a directory is required, or the other way round.
class TypeMismatchError : public ShellError {
public:
    explicit TypeMismatchError(const std::string& message) : ShellError(message, 1) {}
};

// Malformed redirection / heredoc token sequence.
class SyntaxError : public ShellError {
public:
    explicit SyntaxError(const std::string& message) : ShellError(message, 2) {}
};

class IOFailure : public ShellError {
public:
    explicit IOFailure(const std::string& message) : ShellError(message, 1) {}
};

class UnknownCommandError : public ShellError {
public:
    explicit UnknownCommandError(const std::string& verb)
        : ShellError("Command not found: " + verb, 127) {}
};
