#pragma once

#include <atomic>
#include <csignal>

namespace xferacct::infra {

extern std::atomic<bool> g_interrupted;

// SIGINT/SIGTERM только выставляют флаг; воркеры проверяют его между файлами
void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

inline void request_interrupt() {
    g_interrupted.store(true, std::memory_order_relaxed);
}

inline void clear_interrupt() {
    g_interrupted.store(false, std::memory_order_relaxed);
}

} // namespace xferacct::infra
