#pragma once
#include <rpcextractor/core/events/event.hpp>
#include <atomic>
#include <string>

namespace RpcExtractor {

class EventFactory {
public:
    // Stamps a process-unique id and the current wall-clock time
    static Event createEvent(std::string method, std::string payload);

    /**
     * @brief Serialize into the JSON envelope published on the bus
     *
     * {"id": <n>, "rpc_method": "<method>", "timestamp": <unix ns>, "result": <payload>}
     * A payload that is not valid JSON is embedded as a JSON string.
     */
    static std::string toEnvelope(const Event& event);

private:
    static std::atomic<uint64_t> global_event_id;
};

} // namespace RpcExtractor
