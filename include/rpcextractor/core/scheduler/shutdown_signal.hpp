#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace RpcExtractor {

/**
 * @class ShutdownSignal
 * @brief Process-wide, set-once stop request
 *
 * trigger() may be called any number of times from any thread (not from a
 * signal handler); the flag never resets. Waiters wake immediately.
 */
class ShutdownSignal {
public:
    void trigger();
    bool isSet() const { return set_.load(std::memory_order_acquire); }

    // Sleep until deadline or trigger; true if the signal is set
    bool waitUntil(std::chrono::steady_clock::time_point deadline) const;

    template <typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& timeout) const {
        return waitUntil(std::chrono::steady_clock::now() + timeout);
    }

private:
    std::atomic<bool> set_{false};
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
};

} // namespace RpcExtractor
