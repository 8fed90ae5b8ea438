#include "interrupt.hpp"
#include <unistd.h>

namespace coldsend::infra {

std::atomic<bool> g_interrupted{false};

namespace {

void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        // Only async-signal-safe calls here
        static constexpr char msg[] =
            "\nInterrupt received, finishing the current chunk before stopping...\n";
        [[maybe_unused]] auto n = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

} // namespace

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    // A dying send process must surface as an error from read(), not kill us
    std::signal(SIGPIPE, SIG_IGN);
}

} // namespace coldsend::infra
