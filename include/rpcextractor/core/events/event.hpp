#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace RpcExtractor {

/**
 * @brief One successful RPC result, ready to be published
 *
 * payload is the serialized JSON `result` of the call; the core treats it
 * as opaque. timestamp_ns is wall-clock time since the unix epoch.
 */
struct Event {
    uint64_t id = 0;
    std::string method;
    std::string payload;
    uint64_t timestamp_ns = 0;

    Event() = default;
    Event(uint64_t id, std::string m, std::string p, uint64_t ts)
        : id(id), method(std::move(m)), payload(std::move(p)), timestamp_ns(ts) {}
};

} // namespace RpcExtractor
