#include <rpcextractor/core/rpc/fetcher.hpp>
#include <spdlog/spdlog.h>

namespace RpcExtractor {

FetchOutcome Fetcher::fetch(const std::string& method) {
    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [start]() {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - start);
    };

    try {
        std::string result = client_.call(method);
        auto took = elapsed();
        spdlog::trace("[Fetcher] {} ok in {} us ({} bytes)", method,
                      std::chrono::duration_cast<std::chrono::microseconds>(took).count(),
                      result.size());
        return FetchOutcome::success(method, std::move(result), took);
    } catch (const RpcError& e) {
        auto took = elapsed();
        spdlog::warn("[Fetcher] {} failed ({}): {}", method, toString(e.kind()), e.what());
        return FetchOutcome::failed(method, e.kind(), e.what(), took);
    } catch (const std::exception& e) {
        // Anything the transport did not classify is treated as a network fault
        auto took = elapsed();
        spdlog::warn("[Fetcher] {} failed (unclassified): {}", method, e.what());
        return FetchOutcome::failed(method, RpcFailureKind::NETWORK, e.what(), took);
    }
}

} // namespace RpcExtractor
