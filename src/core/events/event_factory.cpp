#include <rpcextractor/core/events/event_factory.hpp>
#include <rpcextractor/core/utils/clock.hpp>
#include <nlohmann/json.hpp>

namespace RpcExtractor {

std::atomic<uint64_t> EventFactory::global_event_id{0};

Event EventFactory::createEvent(std::string method, std::string payload) {
    return Event(global_event_id.fetch_add(1, std::memory_order_relaxed),
                 std::move(method), std::move(payload), Clock::unix_ns());
}

std::string EventFactory::toEnvelope(const Event& event) {
    nlohmann::json envelope;
    envelope["id"] = event.id;
    envelope["rpc_method"] = event.method;
    envelope["timestamp"] = event.timestamp_ns;

    // Non-throwing parse; discarded on malformed input
    auto result = nlohmann::json::parse(event.payload, nullptr, false);
    if (result.is_discarded()) {
        envelope["result"] = event.payload;
    } else {
        envelope["result"] = std::move(result);
    }
    return envelope.dump();
}

} // namespace RpcExtractor
