#pragma once

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace RpcExtractor {

/**
 * @brief A "host:port" pair as written in the configuration file
 */
struct Endpoint {
    std::string host;
    uint16_t port = 0;

    std::string toString() const { return host + ":" + std::to_string(port); }
};

namespace Net {

/**
 * @brief Parse "host:port"; returns nullopt on a missing host, missing port
 * or a port outside 1..65535
 */
std::optional<Endpoint> parseEndpoint(const std::string& text);

/**
 * @brief Open a blocking TCP connection, bounded by @p timeout
 * @return connected fd, or -1 with errno set
 */
int connectTcp(const Endpoint& endpoint, std::chrono::milliseconds timeout);

/**
 * @brief Bind + listen on endpoint (port 0 picks an ephemeral port)
 * @return listening fd, or -1 with errno set
 */
int listenTcp(const Endpoint& endpoint, int backlog = SOMAXCONN);

// Port the socket is bound to (useful after binding port 0)
uint16_t localPort(int fd);

// Write the whole buffer; false on any send failure
bool sendAll(int fd, const char* data, size_t len);
inline bool sendAll(int fd, const std::string& data) {
    return sendAll(fd, data.data(), data.size());
}

void setRecvTimeout(int fd, std::chrono::milliseconds timeout);

void closeSocket(int fd);

} // namespace Net
} // namespace RpcExtractor
