#include "Repl.hpp"

#include <utility>

#include "Interpreter.hpp"
#include "../core/Interrupt.hpp"

Repl::Repl(std::istream& in, std::ostream& out, std::ostream& err, Interpreter& interpreter, std::string cwd)
    : in_(in), out_(out), err_(err), interpreter_(interpreter), cwd_(std::move(cwd)) {}

std::string Repl::prompt() const {
    if (interpreter_.capturing()) return Interpreter::kContinuationPrompt;
    return cwd_ + " $ ";
}

int Repl::run() {
    Interrupt::SigintGuard sigint;
    Interrupt::clear();

    out_ << "pseudoshell - type 'help' for commands. Ctrl-C or Ctrl-D to quit." << std::endl;

    std::string line;
    while (true) {
        out_ << prompt() << std::flush;
        bool got = static_cast<bool>(std::getline(in_, line));
        // Ctrl+C ends the session, whether it broke the read or not
        if (Interrupt::take()) {
            out_ << "\nExiting." << std::endl;
            break;
        }
        if (!got) {
            out_ << std::endl;
            break;
        }
        if (!interpreter_.capturing() && (line == "exit" || line == "quit")) break;

        auto result = interpreter_.execute(line, cwd_);
        if (result.cwd) cwd_ = *result.cwd;
        // while capturing, the continuation marker becomes the next prompt
        if (!(interpreter_.capturing() && result.out == Interpreter::kContinuationPrompt)) out_ << result.out;
        out_ << std::flush;
        err_ << result.err << std::flush;
    }
    return 0;
}
