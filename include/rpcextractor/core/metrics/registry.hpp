#pragma once
#include <rpcextractor/core/metrics/histogram.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace RpcExtractor {

/**
 * @brief Histograms sharing one name, keyed by the value of a single label
 */
class HistogramFamily {
public:
    HistogramFamily(std::string name, std::string help, std::string label,
                    std::vector<double> bounds);

    // Child for a label value, created on first access
    DurationHistogram& withLabel(const std::string& value);

    // Existing child only (no creation); nullptr if never observed
    const DurationHistogram* find(const std::string& value) const;

    const std::string& name() const { return name_; }
    void render(std::string& out) const;

private:
    const std::string name_;
    const std::string help_;
    const std::string label_;
    const std::vector<double> bounds_;

    mutable std::mutex mtx_;
    std::map<std::string, std::unique_ptr<DurationHistogram>> children_;
};

/**
 * @brief Counters sharing one name, keyed by the value of a single label
 */
class CounterFamily {
public:
    CounterFamily(std::string name, std::string help, std::string label);

    Counter& withLabel(const std::string& value);
    const Counter* find(const std::string& value) const;

    // Convenience for tests and health reports; 0 if never incremented
    uint64_t value(const std::string& labelValue) const;

    const std::string& name() const { return name_; }
    void render(std::string& out) const;

private:
    const std::string name_;
    const std::string help_;
    const std::string label_;

    mutable std::mutex mtx_;
    std::map<std::string, std::unique_ptr<Counter>> children_;
};

/**
 * @class MetricRegistry
 * @brief Instance-owned metric registry
 *
 * Constructed once at startup and handed by reference to whatever records
 * or exposes metrics; tests construct their own isolated instances.
 * Registration is a startup-time operation and throws std::invalid_argument
 * on an invalid or duplicate name. Recording and render() are thread-safe.
 */
class MetricRegistry {
public:
    // `ns` is prepended to every metric name as "<ns>_<name>"
    explicit MetricRegistry(std::string ns = "");

    MetricRegistry(const MetricRegistry&) = delete;
    MetricRegistry& operator=(const MetricRegistry&) = delete;

    HistogramFamily& registerHistogram(const std::string& name, const std::string& help,
                                       const std::string& label, std::vector<double> bounds);
    CounterFamily& registerCounter(const std::string& name, const std::string& help,
                                   const std::string& label);

    // Prometheus text exposition format (version 0.0.4)
    std::string render() const;

    size_t familyCount() const;

private:
    std::string qualify(const std::string& name) const;
    void ensureUnique(const std::string& fullName) const;

    const std::string namespace_;

    mutable std::mutex mtx_;
    // Families keep registration order in the rendering
    std::vector<std::unique_ptr<HistogramFamily>> histograms_;
    std::vector<std::unique_ptr<CounterFamily>> counters_;
    std::vector<std::string> names_;
};

} // namespace RpcExtractor
