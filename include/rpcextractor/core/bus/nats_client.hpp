#pragma once
#include <rpcextractor/core/bus/bus_client.hpp>
#include <rpcextractor/core/utils/net.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace RpcExtractor {

/**
 * @brief The NATS server could not be reached or rejected the connection
 */
class BusConnectError : public std::runtime_error {
public:
    explicit BusConnectError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @class NatsClient
 * @brief Publish-only client for the NATS text protocol
 *
 * Handshake: INFO <- server, CONNECT + PING -> server, PONG <- server.
 * A reader thread answers server PINGs and logs -ERR lines. publish() may be
 * called from any thread. No reconnection: once the socket breaks every
 * publish() fails until the process restarts.
 */
class NatsClient : public BusClient {
public:
    struct Options {
        Endpoint address{"127.0.0.1", 4222};
        std::string username;
        std::string password;
        std::string name = "rpc-extractor";
        std::chrono::milliseconds connect_timeout{5000};
    };

    explicit NatsClient(Options options);
    ~NatsClient() noexcept override;

    NatsClient(const NatsClient&) = delete;
    NatsClient& operator=(const NatsClient&) = delete;

    // Throws BusConnectError on connection failure or server rejection
    void connect();
    void close();

    bool isConnected() const { return connected_.load(std::memory_order_acquire); }

    std::optional<PublishError> publish(const std::string& subject,
                                        const std::string& payload) override;

    // Subjects are non-empty tokens without whitespace
    static bool isValidSubject(const std::string& subject);

    uint64_t maxPayload() const { return max_payload_; }

private:
    enum class ReadStatus { LINE, TIMEOUT, CLOSED };

    ReadStatus readLine(std::string& line);
    void handshake();
    std::string buildConnect() const;
    void readLoop();
    bool sendRaw(const std::string& data);

    Options options_;
    int fd_{-1};                 // reassigned only under write_mtx_
    uint64_t max_payload_{1024 * 1024};

    std::string readBuffer_;     // touched by handshake, then only by reader thread
    std::mutex write_mtx_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> running_{false};
    std::thread reader_;
};

} // namespace RpcExtractor
