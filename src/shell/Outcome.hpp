#pragma once
#include <utility>
#include <variant>

#include "CaptureSession.hpp"

// Result of one command handler: either it finished with an exit code, or
// it asks the interpreter to open a multi-line capture session.
class Outcome {
public:
    struct Completed { int code; };
    struct EnterCapture { CaptureSession session; };

    Outcome(int code) : state_(Completed{code}) {}
    Outcome(CaptureSession session) : state_(EnterCapture{std::move(session)}) {}

    bool enters_capture() const { return std::holds_alternative<EnterCapture>(state_); }
    int code() const { return enters_capture() ? 0 : std::get<Completed>(state_).code; }
    const CaptureSession& session() const { return std::get<EnterCapture>(state_).session; }

private:
    std::variant<Completed, EnterCapture> state_;
};
