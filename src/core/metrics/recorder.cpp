#include <rpcextractor/core/metrics/recorder.hpp>

namespace RpcExtractor {

MetricsRecorder::MetricsRecorder(MetricRegistry& registry)
    : fetch_duration_(registry.registerHistogram(
          std::string(MetricNames::RPC_FETCH_DURATION),
          "Time it took to fetch data from the RPC endpoint.",
          std::string(MetricNames::LABEL_RPC_METHOD),
          std::vector<double>(DURATION_BUCKETS.begin(), DURATION_BUCKETS.end()))),
      fetch_errors_(registry.registerCounter(
          std::string(MetricNames::RPC_FETCH_ERRORS),
          "Number of errors while fetching data from the RPC endpoint.",
          std::string(MetricNames::LABEL_RPC_METHOD))),
      publish_errors_(registry.registerCounter(
          std::string(MetricNames::NATS_PUBLISH_ERRORS),
          "Number of errors while publishing events to NATS.",
          std::string(MetricNames::LABEL_RPC_METHOD))) {}

void MetricsRecorder::recordDuration(const std::string& method, std::chrono::nanoseconds elapsed) {
    auto ns = elapsed.count() < 0 ? 0 : static_cast<uint64_t>(elapsed.count());
    fetch_duration_.withLabel(method).observeNs(ns);
}

void MetricsRecorder::recordError(const std::string& method) {
    fetch_errors_.withLabel(method).inc();
}

void MetricsRecorder::recordPublishError(const std::string& method) {
    publish_errors_.withLabel(method).inc();
}

uint64_t MetricsRecorder::durationCount(const std::string& method) const {
    const DurationHistogram* h = fetch_duration_.find(method);
    return h ? h->getCount() : 0;
}

uint64_t MetricsRecorder::errorCount(const std::string& method) const {
    return fetch_errors_.value(method);
}

uint64_t MetricsRecorder::publishErrorCount(const std::string& method) const {
    return publish_errors_.value(method);
}

} // namespace RpcExtractor
