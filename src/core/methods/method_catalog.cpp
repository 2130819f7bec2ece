#include <rpcextractor/core/methods/method_catalog.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace RpcExtractor {

MethodCatalog::MethodCatalog() : MethodCatalog(std::unordered_set<std::string>{}) {}

MethodCatalog::MethodCatalog(const std::unordered_set<std::string>& disabled) {
    specs_.reserve(SUPPORTED.size());
    for (const auto& entry : SUPPORTED) {
        MethodSpec spec;
        spec.name = std::string(entry.name);
        spec.enabled = disabled.count(spec.name) == 0;
        spec.cadence_multiplier = entry.cadence_multiplier;
        specs_.push_back(std::move(spec));
    }

    for (const auto& spec : specs_) {
        spdlog::debug("[MethodCatalog] {:18} enabled={} cadence={}",
                      spec.name, spec.enabled, spec.cadence_multiplier);
    }
}

MethodCatalog::MethodCatalog(std::vector<MethodSpec> specs) : specs_(std::move(specs)) {
    for (auto& spec : specs_) {
        if (spec.cadence_multiplier == 0) {
            spdlog::warn("[MethodCatalog] {} has cadence 0, using 1", spec.name);
            spec.cadence_multiplier = 1;
        }
    }
}

size_t MethodCatalog::enabledCount() const {
    return static_cast<size_t>(std::count_if(specs_.begin(), specs_.end(),
        [](const MethodSpec& s) { return s.enabled; }));
}

std::optional<MethodSpec> MethodCatalog::find(std::string_view name) const {
    auto idx = indexOf(name);
    if (!idx) return std::nullopt;
    return specs_[*idx];
}

std::optional<size_t> MethodCatalog::indexOf(std::string_view name) const {
    for (size_t i = 0; i < specs_.size(); ++i) {
        if (specs_[i].name == name) return i;
    }
    return std::nullopt;
}

bool MethodCatalog::isSupported(std::string_view name) {
    return std::any_of(SUPPORTED.begin(), SUPPORTED.end(),
        [name](const Entry& e) { return e.name == name; });
}

} // namespace RpcExtractor
