#pragma once
#include <rpcextractor/core/metrics/registry.hpp>
#include <array>
#include <chrono>
#include <string>
#include <string_view>

namespace RpcExtractor {

// Metric and label names as exposed to Prometheus
namespace MetricNames {
    constexpr std::string_view NAMESPACE = "rpcextractor";
    constexpr std::string_view LABEL_RPC_METHOD = "rpc_method";
    constexpr std::string_view RPC_FETCH_DURATION = "rpc_fetch_duration_seconds";
    constexpr std::string_view RPC_FETCH_ERRORS = "rpc_fetch_errors_total";
    constexpr std::string_view NATS_PUBLISH_ERRORS = "nats_publish_errors_total";
}

/**
 * @class MetricsRecorder
 * @brief Per-method RPC call metrics, labeled by rpc_method only
 *
 * Registers its three families on the registry it is given; constructing
 * two recorders on the same registry throws (duplicate registration).
 * All record* calls are thread-safe and never fail.
 */
class MetricsRecorder {
public:
    static constexpr std::array<double, 12> DURATION_BUCKETS = {
        0.001, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0
    };

    explicit MetricsRecorder(MetricRegistry& registry);

    void recordDuration(const std::string& method, std::chrono::nanoseconds elapsed);
    void recordError(const std::string& method);
    void recordPublishError(const std::string& method);

    // Read-back for tests and the shutdown summary
    uint64_t durationCount(const std::string& method) const;
    uint64_t errorCount(const std::string& method) const;
    uint64_t publishErrorCount(const std::string& method) const;

private:
    HistogramFamily& fetch_duration_;
    CounterFamily& fetch_errors_;
    CounterFamily& publish_errors_;
};

} // namespace RpcExtractor
