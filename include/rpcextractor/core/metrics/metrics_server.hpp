#pragma once
#include <rpcextractor/core/metrics/registry.hpp>
#include <rpcextractor/core/utils/net.hpp>

#include <atomic>
#include <string>
#include <thread>

namespace RpcExtractor {

/**
 * @class MetricsServer
 * @brief Serves MetricRegistry::render() over HTTP/1.1 on "/" and "/metrics"
 *
 * One accept thread; each request is answered inline and the connection
 * closed. start() throws std::runtime_error if the address cannot be bound.
 */
class MetricsServer {
public:
    MetricsServer(const MetricRegistry& registry, Endpoint address);
    ~MetricsServer() noexcept;

    MetricsServer(const MetricsServer&) = delete;
    MetricsServer& operator=(const MetricsServer&) = delete;

    void start();
    void stop();

    // Bound port (differs from the configured one when binding port 0)
    uint16_t port() const { return boundPort_; }
    bool isRunning() const { return isRunning_.load(std::memory_order_acquire); }

private:
    void acceptConnections(int listenFd);
    void handleClient(int clientFd);
    std::string buildResponse(const std::string& requestLine) const;

    const MetricRegistry& registry_;
    Endpoint address_;
    int server_fd_{-1};
    uint16_t boundPort_{0};
    std::atomic<bool> isRunning_{false};
    std::thread acceptThread_;

    std::atomic<uint64_t> totalRequests_{0};
};

} // namespace RpcExtractor
