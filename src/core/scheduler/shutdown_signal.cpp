#include <rpcextractor/core/scheduler/shutdown_signal.hpp>
#include <spdlog/spdlog.h>

namespace RpcExtractor {

void ShutdownSignal::trigger() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (set_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
    }
    cv_.notify_all();
    spdlog::info("[Shutdown] Shutdown requested");
}

bool ShutdownSignal::waitUntil(std::chrono::steady_clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(mtx_);
    return cv_.wait_until(lock, deadline, [this]() {
        return set_.load(std::memory_order_acquire);
    });
}

} // namespace RpcExtractor
