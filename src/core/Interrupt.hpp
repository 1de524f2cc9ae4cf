#pragma once
#include <signal.h>

namespace Interrupt {
    // Installs the Ctrl+C handler for as long as the guard lives, then puts
    // the previous handler back. The handler is installed without
    // SA_RESTART so a blocked read returns with EINTR.
    class SigintGuard {
    public:
        SigintGuard();
        ~SigintGuard();
        SigintGuard(const SigintGuard&) = delete;
        SigintGuard& operator=(const SigintGuard&) = delete;
    private:
        struct sigaction previous_;
    };

    // True if Ctrl+C arrived since the last call; resets the flag.
    bool take();
    // Forget a pending interrupt
    void clear();
}
