// chainseg/cpp/src/stop_signal.cpp
#include "chainseg/stop_signal.h"

#include <csignal>

namespace chainseg {

namespace {
volatile std::sig_atomic_t g_signal_pending = 0;
}

void StopSignal::request_stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stopped_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool StopSignal::wait_for(std::chrono::milliseconds d) {
    // wake up in slices so a signal flag set by a handler is noticed promptly
    constexpr auto kSlice = std::chrono::milliseconds(200);
    const auto deadline = std::chrono::steady_clock::now() + d;

    std::unique_lock<std::mutex> lk(mu_);
    while (!stopped_.load(std::memory_order_acquire)) {
        if (g_signal_pending) {
            stopped_.store(true, std::memory_order_release);
            break;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        cv_.wait_for(lk, left < kSlice ? left : kSlice);
    }
    return stopped_.load(std::memory_order_acquire);
}

void StopSignal::notify_from_signal_handler() {
    g_signal_pending = 1;
}

bool StopSignal::poll_signal() {
    if (g_signal_pending && !stop_requested()) request_stop();
    return stop_requested();
}

} // namespace chainseg
