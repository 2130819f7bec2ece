#pragma once
#include <optional>
#include <string>

namespace RpcExtractor {

/**
 * @brief Why a message did not reach the bus
 */
struct PublishError {
    std::string subject;
    std::string message;
};

/**
 * @class BusClient
 * @brief Message-bus connection shared by all method tasks
 *
 * publish() must be safe for concurrent use. Delivery is at-most-once: an
 * empty optional means the message was handed to the broker connection.
 */
class BusClient {
public:
    virtual ~BusClient() = default;
    virtual std::optional<PublishError> publish(const std::string& subject,
                                                const std::string& payload) = 0;
};

} // namespace RpcExtractor
