#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <rpcextractor/core/events/publisher.hpp>
#include <rpcextractor/core/methods/method_catalog.hpp>
#include <rpcextractor/core/metrics/recorder.hpp>
#include <rpcextractor/core/rpc/fetcher.hpp>
#include <rpcextractor/core/scheduler/scheduler_state.hpp>
#include <rpcextractor/core/scheduler/shutdown_signal.hpp>
#include <rpcextractor/core/utils/thread_pool.hpp>

namespace RpcExtractor {

/**
 * @class Scheduler
 * @brief Drives the periodic RPC fetch / record / publish cycle
 *
 * Every base interval (steady clock, fixed deadlines) each enabled method's
 * due-counter is advanced; a method with multiplier k fires on every k-th
 * tick, the first time on tick k. Fetches run concurrently on a worker pool
 * sized to the number of enabled methods.
 *
 * A method whose previous fetch is still in flight is skipped for that tick
 * and its counter is left as-is, so it fires on the next tick it is free.
 *
 * Per completed fetch: the duration is always recorded; success publishes one
 * event, failure bumps the error counter. One method's failure never affects
 * another method or the loop.
 */
class Scheduler {
public:
    Scheduler(const MethodCatalog& catalog,
              Fetcher& fetcher,
              Publisher& publisher,
              MetricsRecorder& recorder,
              ShutdownSignal& shutdown,
              std::chrono::milliseconds base_interval);
    ~Scheduler() noexcept;

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Run the tick loop on a background thread
    void start();

    // Tick loop on the calling thread; returns after draining on shutdown
    void run();

    // Trigger shutdown, drain in-flight fetches, join the loop thread.
    // Safe to call from another thread while run() is active; returns once
    // the scheduler is STOPPED.
    void stop();

    /**
     * @brief Execute one tick immediately
     * @return Number of fetches dispatched
     *
     * Dispatches nothing once the shutdown signal is set.
     */
    size_t dispatchTick();

    // Block until no fetch is in flight; false on timeout
    bool waitForIdle(std::chrono::milliseconds timeout);

    SchedulerState state() const { return state_.load(std::memory_order_acquire); }
    uint64_t ticks() const { return ticks_.load(std::memory_order_relaxed); }
    uint64_t skippedOverlaps() const { return skipped_.load(std::memory_order_relaxed); }
    size_t inFlight() const;

    std::chrono::milliseconds baseInterval() const { return base_interval_; }

private:
    void runMethod(size_t index);
    void handleOutcome(const FetchOutcome& outcome);
    void finishMethod(size_t index);
    void drain();
    void setState(SchedulerState next);
    void reportSummary() const;

    const MethodCatalog& catalog_;
    Fetcher& fetcher_;
    Publisher& publisher_;
    MetricsRecorder& recorder_;
    ShutdownSignal& shutdown_;
    const std::chrono::milliseconds base_interval_;

    // Touched only by the ticking thread
    std::vector<uint32_t> due_counters_;
    std::unique_ptr<std::atomic<bool>[]> in_flight_;

    // Guards in_flight_count_ and the DISPATCHING <-> IDLE transitions
    mutable std::mutex idle_mtx_;
    std::condition_variable idle_cv_;
    size_t in_flight_count_{0};

    std::atomic<SchedulerState> state_{SchedulerState::IDLE};
    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> skipped_{0};
    std::mutex stop_mtx_;
    std::once_flag drain_once_;  // run() and stop() may both reach drain()
    std::thread worker_thread_;

    // Declared last: joined first on destruction while the members above are alive
    std::unique_ptr<ThreadPool> pool_;
};

} // namespace RpcExtractor
