#include <rpcextractor/core/metrics/registry.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace RpcExtractor {

namespace {

bool isValidName(const std::string& name) {
    if (name.empty()) return false;
    for (size_t i = 0; i < name.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(name[i]);
        bool ok = std::isalpha(c) || c == '_' || c == ':' || (i > 0 && std::isdigit(c));
        if (!ok) return false;
    }
    return true;
}

std::string escapeLabelValue(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            default:   out += c;      break;
        }
    }
    return out;
}

void renderHeader(std::string& out, const std::string& name, const std::string& help,
                  const char* type) {
    out += fmt::format("# HELP {} {}\n", name, help);
    out += fmt::format("# TYPE {} {}\n", name, type);
}

} // namespace

// ============================================================================
// HistogramFamily
// ============================================================================

HistogramFamily::HistogramFamily(std::string name, std::string help, std::string label,
                                 std::vector<double> bounds)
    : name_(std::move(name)), help_(std::move(help)), label_(std::move(label)),
      bounds_(std::move(bounds)) {}

DurationHistogram& HistogramFamily::withLabel(const std::string& value) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = children_.find(value);
    if (it == children_.end()) {
        it = children_.emplace(value, std::make_unique<DurationHistogram>(bounds_)).first;
    }
    return *it->second;
}

const DurationHistogram* HistogramFamily::find(const std::string& value) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = children_.find(value);
    return it == children_.end() ? nullptr : it->second.get();
}

void HistogramFamily::render(std::string& out) const {
    renderHeader(out, name_, help_, "histogram");

    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& [value, hist] : children_) {
        const std::string labelPair = fmt::format("{}=\"{}\"", label_, escapeLabelValue(value));
        const auto cumulative = hist->cumulativeCounts();
        const auto& bounds = hist->bounds();

        for (size_t i = 0; i < bounds.size(); ++i) {
            out += fmt::format("{}_bucket{{{},le=\"{}\"}} {}\n",
                               name_, labelPair, bounds[i], cumulative[i]);
        }
        out += fmt::format("{}_bucket{{{},le=\"+Inf\"}} {}\n",
                           name_, labelPair, cumulative.back());
        out += fmt::format("{}_sum{{{}}} {}\n", name_, labelPair, hist->getSumSeconds());
        // Same snapshot as the +Inf bucket so a concurrent observe() cannot split them
        out += fmt::format("{}_count{{{}}} {}\n", name_, labelPair, cumulative.back());
    }
}

// ============================================================================
// CounterFamily
// ============================================================================

CounterFamily::CounterFamily(std::string name, std::string help, std::string label)
    : name_(std::move(name)), help_(std::move(help)), label_(std::move(label)) {}

Counter& CounterFamily::withLabel(const std::string& value) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto [it, inserted] = children_.try_emplace(value);
    if (inserted) {
        it->second = std::make_unique<Counter>();
    }
    return *it->second;
}

const Counter* CounterFamily::find(const std::string& value) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = children_.find(value);
    return it == children_.end() ? nullptr : it->second.get();
}

uint64_t CounterFamily::value(const std::string& labelValue) const {
    const Counter* c = find(labelValue);
    return c ? c->get() : 0;
}

void CounterFamily::render(std::string& out) const {
    renderHeader(out, name_, help_, "counter");

    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& [value, counter] : children_) {
        out += fmt::format("{}{{{}=\"{}\"}} {}\n",
                           name_, label_, escapeLabelValue(value), counter->get());
    }
}

// ============================================================================
// MetricRegistry
// ============================================================================

MetricRegistry::MetricRegistry(std::string ns) : namespace_(std::move(ns)) {}

std::string MetricRegistry::qualify(const std::string& name) const {
    return namespace_.empty() ? name : namespace_ + "_" + name;
}

void MetricRegistry::ensureUnique(const std::string& fullName) const {
    if (!isValidName(fullName)) {
        throw std::invalid_argument("Invalid metric name: " + fullName);
    }
    if (std::find(names_.begin(), names_.end(), fullName) != names_.end()) {
        throw std::invalid_argument("Duplicate metric registration: " + fullName);
    }
}

HistogramFamily& MetricRegistry::registerHistogram(const std::string& name, const std::string& help,
                                                   const std::string& label,
                                                   std::vector<double> bounds) {
    std::lock_guard<std::mutex> lock(mtx_);
    const std::string full = qualify(name);
    ensureUnique(full);
    if (!isValidName(label)) {
        throw std::invalid_argument("Invalid label name: " + label);
    }
    if (bounds.empty()) {
        throw std::invalid_argument("Histogram " + full + " needs at least one bucket");
    }

    histograms_.push_back(std::make_unique<HistogramFamily>(full, help, label, std::move(bounds)));
    names_.push_back(full);
    return *histograms_.back();
}

CounterFamily& MetricRegistry::registerCounter(const std::string& name, const std::string& help,
                                               const std::string& label) {
    std::lock_guard<std::mutex> lock(mtx_);
    const std::string full = qualify(name);
    ensureUnique(full);
    if (!isValidName(label)) {
        throw std::invalid_argument("Invalid label name: " + label);
    }

    counters_.push_back(std::make_unique<CounterFamily>(full, help, label));
    names_.push_back(full);
    return *counters_.back();
}

std::string MetricRegistry::render() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::string out;
    out.reserve(4096);
    for (const auto& h : histograms_) h->render(out);
    for (const auto& c : counters_) c->render(out);
    return out;
}

size_t MetricRegistry::familyCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return names_.size();
}

} // namespace RpcExtractor
