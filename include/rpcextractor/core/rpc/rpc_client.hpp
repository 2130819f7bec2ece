#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace RpcExtractor {

/**
 * @brief Failure categories of a single RPC call
 */
enum class RpcFailureKind : uint8_t {
    NETWORK = 0,   // connection refused/reset, DNS, transport errors
    AUTH = 1,      // credentials rejected by the node
    DECODE = 2,    // malformed or unexpected response body, JSON-RPC error member
    TIMEOUT = 3    // call exceeded the configured timeout
};

const char* toString(RpcFailureKind kind);

class RpcError : public std::runtime_error {
public:
    RpcError(RpcFailureKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    RpcFailureKind kind() const { return kind_; }

private:
    RpcFailureKind kind_;
};

class NetworkError : public RpcError {
public:
    explicit NetworkError(const std::string& msg) : RpcError(RpcFailureKind::NETWORK, msg) {}
};

class AuthError : public RpcError {
public:
    explicit AuthError(const std::string& msg) : RpcError(RpcFailureKind::AUTH, msg) {}
};

class DecodeError : public RpcError {
public:
    explicit DecodeError(const std::string& msg) : RpcError(RpcFailureKind::DECODE, msg) {}
};

class TimeoutError : public RpcError {
public:
    explicit TimeoutError(const std::string& msg) : RpcError(RpcFailureKind::TIMEOUT, msg) {}
};

/**
 * @class RpcClient
 * @brief Transport to the node's JSON-RPC interface
 *
 * call() returns the serialized JSON of the response's `result` member and
 * throws an RpcError subclass on failure. Implementations must allow
 * concurrent calls for different methods; calls for the same method are
 * never issued concurrently by the scheduler.
 */
class RpcClient {
public:
    virtual ~RpcClient() = default;
    virtual std::string call(const std::string& method) = 0;
};

} // namespace RpcExtractor
