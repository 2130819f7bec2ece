#include <rpcextractor/core/rpc/rpc_client.hpp>

namespace RpcExtractor {

const char* toString(RpcFailureKind kind) {
    switch (kind) {
        case RpcFailureKind::NETWORK: return "NETWORK";
        case RpcFailureKind::AUTH:    return "AUTH";
        case RpcFailureKind::DECODE:  return "DECODE";
        case RpcFailureKind::TIMEOUT: return "TIMEOUT";
        default:                      return "UNKNOWN";
    }
}

} // namespace RpcExtractor
