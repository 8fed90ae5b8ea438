#pragma once

#include <atomic>
#include <csignal>

namespace coldsend::infra {

extern std::atomic<bool> g_interrupted;

void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

// Used by tests to simulate a signal without raising one
inline void set_interrupted(bool value) {
    g_interrupted.store(value, std::memory_order_relaxed);
}

} // namespace coldsend::infra
