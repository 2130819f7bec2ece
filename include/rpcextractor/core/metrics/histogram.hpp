#pragma once

#include <atomic>
#include <cstdint>
#include <vector>
#include <memory>
#include <algorithm>

namespace RpcExtractor {

/**
 * @brief Fixed-bucket duration histogram (Prometheus semantics)
 *
 * - Bucket i counts observations <= bounds[i] seconds (non-cumulative
 *   storage, cumulated on read)
 * - One implicit +Inf bucket holds everything above the last bound
 * - Lock-free observe(); sum kept in nanoseconds to stay integral
 *
 * Usage:
 *   DurationHistogram hist({0.001, 0.01, 0.1, 1.0});
 *   auto start = std::chrono::steady_clock::now();
 *   ... do work ...
 *   hist.observeNs(std::chrono::duration_cast<std::chrono::nanoseconds>(
 *       std::chrono::steady_clock::now() - start).count());
 */
class DurationHistogram {
public:
    explicit DurationHistogram(std::vector<double> bounds_seconds)
        : bounds_(std::move(bounds_seconds)),
          buckets_(new std::atomic<uint64_t>[bounds_.size() + 1]) {
        std::sort(bounds_.begin(), bounds_.end());
        for (size_t i = 0; i <= bounds_.size(); ++i) {
            buckets_[i].store(0, std::memory_order_relaxed);
        }
    }

    DurationHistogram(const DurationHistogram&) = delete;
    DurationHistogram& operator=(const DurationHistogram&) = delete;

    void observeNs(uint64_t elapsed_ns) {
        double seconds = static_cast<double>(elapsed_ns) / 1e9;
        size_t bucket = bounds_.size();  // +Inf
        for (size_t i = 0; i < bounds_.size(); ++i) {
            if (seconds <= bounds_[i]) {
                bucket = i;
                break;
            }
        }
        buckets_[bucket].fetch_add(1, std::memory_order_relaxed);
        sum_ns_.fetch_add(elapsed_ns, std::memory_order_relaxed);
        count_.fetch_add(1, std::memory_order_relaxed);
    }

    uint64_t getCount() const {
        return count_.load(std::memory_order_relaxed);
    }

    double getSumSeconds() const {
        return static_cast<double>(sum_ns_.load(std::memory_order_relaxed)) / 1e9;
    }

    const std::vector<double>& bounds() const { return bounds_; }

    /**
     * @brief Cumulative counts, one per bound plus the trailing +Inf bucket
     */
    std::vector<uint64_t> cumulativeCounts() const {
        std::vector<uint64_t> out(bounds_.size() + 1);
        uint64_t running = 0;
        for (size_t i = 0; i <= bounds_.size(); ++i) {
            running += buckets_[i].load(std::memory_order_relaxed);
            out[i] = running;
        }
        return out;
    }

private:
    std::vector<double> bounds_;
    std::unique_ptr<std::atomic<uint64_t>[]> buckets_;
    std::atomic<uint64_t> sum_ns_{0};
    std::atomic<uint64_t> count_{0};
};

/**
 * @brief Monotonic counter
 */
class Counter {
public:
    void inc(uint64_t n = 1) { value_.fetch_add(n, std::memory_order_relaxed); }
    uint64_t get() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<uint64_t> value_{0};
};

} // namespace RpcExtractor
