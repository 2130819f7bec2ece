#include <rpcextractor/core/scheduler/scheduler.hpp>
#include <rpcextractor/core/events/event_factory.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace RpcExtractor {

namespace {

// Clears a method's in-flight mark however runMethod() exits
class InFlightGuard {
public:
    InFlightGuard(Scheduler* owner, size_t index, void (Scheduler::*finish)(size_t))
        : owner_(owner), index_(index), finish_(finish) {}
    ~InFlightGuard() { (owner_->*finish_)(index_); }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    Scheduler* owner_;
    size_t index_;
    void (Scheduler::*finish_)(size_t);
};

} // namespace

Scheduler::Scheduler(const MethodCatalog& catalog,
                     Fetcher& fetcher,
                     Publisher& publisher,
                     MetricsRecorder& recorder,
                     ShutdownSignal& shutdown,
                     std::chrono::milliseconds base_interval)
    : catalog_(catalog),
      fetcher_(fetcher),
      publisher_(publisher),
      recorder_(recorder),
      shutdown_(shutdown),
      base_interval_(base_interval),
      due_counters_(catalog.size(), 0),
      in_flight_(new std::atomic<bool>[catalog.size()]) {
    if (base_interval_.count() <= 0) {
        throw std::invalid_argument("Scheduler base interval must be positive");
    }
    for (size_t i = 0; i < catalog_.size(); ++i) {
        in_flight_[i].store(false, std::memory_order_relaxed);
    }

    size_t workers = std::max<size_t>(1, catalog_.enabledCount());
    pool_ = std::make_unique<ThreadPool>(workers);

    spdlog::info("[Scheduler] Initialized: {} of {} methods enabled, base interval {} ms, {} workers",
                 catalog_.enabledCount(), catalog_.size(), base_interval_.count(), workers);
}

Scheduler::~Scheduler() noexcept {
    stop();
}

void Scheduler::start() {
    worker_thread_ = std::thread(&Scheduler::run, this);
    spdlog::info("[Scheduler] Started tick loop");
}

void Scheduler::run() {
    using Clock = std::chrono::steady_clock;

    auto next = Clock::now() + base_interval_;
    while (!shutdown_.waitUntil(next)) {
        dispatchTick();

        next += base_interval_;
        auto now = Clock::now();
        if (next <= now) {
            // Host stalled past one or more deadlines: skip them instead of bursting
            auto missed = (now - next) / base_interval_ + 1;
            next += missed * base_interval_;
            spdlog::warn("[Scheduler] Tick loop fell behind, skipped {} tick(s)", missed);
        }
    }
    std::call_once(drain_once_, &Scheduler::drain, this);
}

void Scheduler::stop() {
    shutdown_.trigger();

    std::lock_guard<std::mutex> lock(stop_mtx_);
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    // A loop running on a caller's thread via run() may be draining right now:
    // call_once blocks until that drain has finished
    std::call_once(drain_once_, &Scheduler::drain, this);
}

size_t Scheduler::dispatchTick() {
    if (shutdown_.isSet()) {
        return 0;
    }

    uint64_t tick = ticks_.fetch_add(1, std::memory_order_relaxed) + 1;
    const auto& specs = catalog_.specs();
    size_t dispatched = 0;
    size_t skipped = 0;

    for (size_t i = 0; i < specs.size(); ++i) {
        const auto& spec = specs[i];
        if (!spec.enabled) continue;

        if (++due_counters_[i] < spec.cadence_multiplier) continue;

        if (in_flight_[i].load(std::memory_order_acquire)) {
            // Keep the counter: fire on the next tick this method is free
            ++skipped;
            skipped_.fetch_add(1, std::memory_order_relaxed);
            spdlog::debug("[Scheduler] {} still in flight, skipping tick {}", spec.name, tick);
            continue;
        }
        if (shutdown_.isSet()) break;

        in_flight_[i].store(true, std::memory_order_release);
        {
            std::lock_guard<std::mutex> lock(idle_mtx_);
            ++in_flight_count_;
            if (state() == SchedulerState::IDLE) {
                setState(SchedulerState::DISPATCHING);
            }
        }

        if (!pool_->submit([this, i]() { runMethod(i); })) {
            spdlog::warn("[Scheduler] Worker pool rejected {}, pool is shut down", spec.name);
            finishMethod(i);
            break;
        }
        due_counters_[i] = 0;
        ++dispatched;
    }

    spdlog::debug("[Scheduler] Tick {}: dispatched {}, skipped {}", tick, dispatched, skipped);
    return dispatched;
}

void Scheduler::runMethod(size_t index) {
    InFlightGuard guard(this, index, &Scheduler::finishMethod);
    const auto& spec = catalog_.specs()[index];

    try {
        FetchOutcome outcome = fetcher_.fetch(spec.name);
        handleOutcome(outcome);
    } catch (const std::exception& e) {
        spdlog::error("[Scheduler] Unexpected error while handling {}: {}", spec.name, e.what());
    }
}

void Scheduler::handleOutcome(const FetchOutcome& outcome) {
    recorder_.recordDuration(outcome.method, outcome.elapsed);

    if (!outcome.ok()) {
        recorder_.recordError(outcome.method);
        return;
    }

    Event event = EventFactory::createEvent(outcome.method, *outcome.payload);
    if (auto err = publisher_.publish(event)) {
        spdlog::warn("[Scheduler] Could not publish {} on '{}': {}",
                     outcome.method, err->subject, err->message);
        recorder_.recordPublishError(outcome.method);
    }
}

void Scheduler::finishMethod(size_t index) {
    in_flight_[index].store(false, std::memory_order_release);

    std::lock_guard<std::mutex> lock(idle_mtx_);
    if (in_flight_count_ > 0 && --in_flight_count_ == 0) {
        if (state() == SchedulerState::DISPATCHING) {
            setState(SchedulerState::IDLE);
        }
        idle_cv_.notify_all();
    }
}

size_t Scheduler::inFlight() const {
    std::lock_guard<std::mutex> lock(idle_mtx_);
    return in_flight_count_;
}

bool Scheduler::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(idle_mtx_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return in_flight_count_ == 0; });
}

void Scheduler::drain() {
    {
        std::unique_lock<std::mutex> lock(idle_mtx_);
        setState(SchedulerState::DRAINING);
        if (in_flight_count_ > 0) {
            spdlog::info("[Scheduler] Draining {} in-flight fetch(es)", in_flight_count_);
        }
        // Bounded by the RPC timeout of each in-flight call
        idle_cv_.wait(lock, [this]() { return in_flight_count_ == 0; });
    }

    pool_->shutdown();
    setState(SchedulerState::STOPPED);
    reportSummary();
}

void Scheduler::setState(SchedulerState next) {
    SchedulerState prev = state_.exchange(next, std::memory_order_acq_rel);
    if (prev != next) {
        spdlog::debug("[Scheduler] State {} -> {}", toString(prev), toString(next));
    }
}

void Scheduler::reportSummary() const {
    spdlog::info("[Scheduler] Stopped after {} ticks ({} overlap skips)", ticks(), skippedOverlaps());
    for (const auto& spec : catalog_.specs()) {
        if (!spec.enabled) continue;
        spdlog::info("  {:<18} fetches={} errors={} publish_errors={}",
                     spec.name,
                     recorder_.durationCount(spec.name),
                     recorder_.errorCount(spec.name),
                     recorder_.publishErrorCount(spec.name));
    }
}

} // namespace RpcExtractor
