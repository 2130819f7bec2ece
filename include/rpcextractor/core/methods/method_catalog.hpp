#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace RpcExtractor {

/**
 * @brief One supported RPC diagnostic
 *
 * cadence_multiplier: number of base ticks between two fires (>= 1).
 */
struct MethodSpec {
    std::string name;
    bool enabled = true;
    uint32_t cadence_multiplier = 1;
};

// Compile-time method names (also used as metric labels and bus subjects)
namespace MethodNames {
    constexpr std::string_view GETPEERINFO = "getpeerinfo";
    constexpr std::string_view GETMEMPOOLINFO = "getmempoolinfo";
    constexpr std::string_view UPTIME = "uptime";
    constexpr std::string_view GETNETTOTALS = "getnettotals";
    constexpr std::string_view GETMEMORYINFO = "getmemoryinfo";
    constexpr std::string_view GETADDRMANINFO = "getaddrmaninfo";
    constexpr std::string_view GETCHAINTXSTATS = "getchaintxstats";
    constexpr std::string_view GETNETWORKINFO = "getnetworkinfo";
    constexpr std::string_view GETBLOCKCHAININFO = "getblockchaininfo";
}

/**
 * @class MethodCatalog
 * @brief Ordered, immutable table of the RPC methods the extractor queries
 *
 * Built once from the set of disabled method names. The order of specs()
 * is stable and doubles as the index used by the scheduler's per-method
 * counters.
 */
class MethodCatalog {
public:
    struct Entry {
        std::string_view name;
        uint32_t cadence_multiplier;
    };

    // Chain-wide statistics walk the block index; query them 10x less often
    static constexpr uint32_t EXPENSIVE_CADENCE = 10;

    static constexpr std::array<Entry, 9> SUPPORTED = {{
        {MethodNames::GETPEERINFO, 1},
        {MethodNames::GETMEMPOOLINFO, 1},
        {MethodNames::UPTIME, 1},
        {MethodNames::GETNETTOTALS, 1},
        {MethodNames::GETMEMORYINFO, 1},
        {MethodNames::GETADDRMANINFO, 1},
        {MethodNames::GETCHAINTXSTATS, EXPENSIVE_CADENCE},
        {MethodNames::GETNETWORKINFO, 1},
        {MethodNames::GETBLOCKCHAININFO, EXPENSIVE_CADENCE},
    }};

    // All supported methods enabled
    MethodCatalog();

    // Every method whose name is in `disabled` is marked disabled
    explicit MethodCatalog(const std::unordered_set<std::string>& disabled);

    // Arbitrary table (tests, alternative deployments); multipliers of 0 become 1
    explicit MethodCatalog(std::vector<MethodSpec> specs);

    const std::vector<MethodSpec>& specs() const { return specs_; }
    size_t size() const { return specs_.size(); }
    size_t enabledCount() const;

    std::optional<MethodSpec> find(std::string_view name) const;
    std::optional<size_t> indexOf(std::string_view name) const;

    static bool isSupported(std::string_view name);

private:
    std::vector<MethodSpec> specs_;
};

} // namespace RpcExtractor
