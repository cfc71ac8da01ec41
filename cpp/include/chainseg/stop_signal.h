// chainseg/cpp/include/chainseg/stop_signal.h
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace chainseg {

// Cooperative shutdown: every sleep in a loop goes through wait_for so that
// request_stop() wakes it immediately.
class StopSignal {
public:
    void request_stop();
    bool stop_requested() const { return stopped_.load(std::memory_order_acquire); }

    // true if stopped (before or during the wait)
    bool wait_for(std::chrono::milliseconds d);

    // Async-signal-safe flag for SIGINT/SIGTERM handlers; picked up by poll_signal().
    static void notify_from_signal_handler();
    // Forward a pending signal flag into this instance. Returns stop_requested().
    bool poll_signal();

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::atomic<bool> stopped_{false};
};

} // namespace chainseg
