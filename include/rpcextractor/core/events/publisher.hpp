#pragma once
#include <rpcextractor/core/bus/bus_client.hpp>
#include <rpcextractor/core/events/event.hpp>
#include <atomic>
#include <optional>
#include <string>

namespace RpcExtractor {

/**
 * @class Publisher
 * @brief Serializes events and sends each on its method's subject
 *
 * The subject is the lowercased method name, so consumers can subscribe to
 * a single RPC. No retry, no acknowledgment wait.
 */
class Publisher {
public:
    explicit Publisher(BusClient& bus) : bus_(bus) {}

    std::optional<PublishError> publish(const Event& event);

    static std::string subjectFor(const std::string& method);

    uint64_t totalPublished() const { return total_published_.load(std::memory_order_relaxed); }
    uint64_t totalFailed() const { return total_failed_.load(std::memory_order_relaxed); }

private:
    BusClient& bus_;
    std::atomic<uint64_t> total_published_{0};
    std::atomic<uint64_t> total_failed_{0};
};

} // namespace RpcExtractor
