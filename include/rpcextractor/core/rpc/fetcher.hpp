#pragma once

#include <rpcextractor/core/rpc/rpc_client.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace RpcExtractor {

/**
 * @struct FetchOutcome
 * @brief Result of one RPC call: Success{payload} or Failure{kind}
 *
 * elapsed is set in both cases. Consumed immediately by the scheduler.
 */
struct FetchOutcome {
    std::string method;
    std::chrono::nanoseconds elapsed{0};

    // Set on success: serialized JSON of the RPC `result`
    std::optional<std::string> payload;

    // Set on failure
    RpcFailureKind failure{RpcFailureKind::NETWORK};
    std::string error;

    bool ok() const { return payload.has_value(); }

    static FetchOutcome success(std::string method, std::string payload,
                                std::chrono::nanoseconds elapsed) {
        FetchOutcome o;
        o.method = std::move(method);
        o.payload = std::move(payload);
        o.elapsed = elapsed;
        return o;
    }

    static FetchOutcome failed(std::string method, RpcFailureKind kind, std::string error,
                               std::chrono::nanoseconds elapsed) {
        FetchOutcome o;
        o.method = std::move(method);
        o.failure = kind;
        o.error = std::move(error);
        o.elapsed = elapsed;
        return o;
    }
};

/**
 * @class Fetcher
 * @brief Times one RPC call and folds every error into a FetchOutcome
 *
 * fetch() never throws.
 */
class Fetcher {
public:
    explicit Fetcher(RpcClient& client) : client_(client) {}

    FetchOutcome fetch(const std::string& method);

private:
    RpcClient& client_;
};

} // namespace RpcExtractor
