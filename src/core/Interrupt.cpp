#include "Interrupt.hpp"

#include <atomic>

namespace {
    std::atomic<bool> g_interrupted{false};
    void on_sigint(int) { g_interrupted.store(true, std::memory_order_relaxed); }
}

namespace Interrupt {
    SigintGuard::SigintGuard() : previous_{} {
        struct sigaction sa{};
        sa.sa_handler = on_sigint;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        ::sigaction(SIGINT, &sa, &previous_);
    }
    SigintGuard::~SigintGuard() { ::sigaction(SIGINT, &previous_, nullptr); }

    bool take() { return g_interrupted.exchange(false, std::memory_order_relaxed); }
    void clear() { g_interrupted.store(false, std::memory_order_relaxed); }
}
