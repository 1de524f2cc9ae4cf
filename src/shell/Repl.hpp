#pragma once
#include <istream>
#include <ostream>
#include <string>

class Interpreter;

// Interactive front end: prompt, read a line, hand it to the interpreter,
// print what comes back, remember the working directory.
class Repl {
public:
    Repl(std::istream& in, std::ostream& out, std::ostream& err, Interpreter& interpreter, std::string cwd);
    int run();
    const std::string& cwd() const { return cwd_; }
private:
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
    Interpreter& interpreter_;
    std::string cwd_;

    std::string prompt() const;
};
