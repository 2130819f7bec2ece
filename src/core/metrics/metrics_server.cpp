#include <rpcextractor/core/metrics/metrics_server.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>

namespace RpcExtractor {

namespace {
constexpr size_t kMaxRequestHeader = 8192;
constexpr auto kClientReadTimeout = std::chrono::milliseconds(2000);
constexpr auto kAcceptErrorBackoff = std::chrono::milliseconds(100);
}

MetricsServer::MetricsServer(const MetricRegistry& registry, Endpoint address)
    : registry_(registry), address_(std::move(address)) {}

MetricsServer::~MetricsServer() noexcept {
    stop();
}

void MetricsServer::start() {
    if (isRunning_.load(std::memory_order_acquire)) return;

    server_fd_ = Net::listenTcp(address_);
    if (server_fd_ < 0) {
        throw std::runtime_error(fmt::format("Failed to bind metrics server on {}: {}",
                                             address_.toString(), std::strerror(errno)));
    }
    boundPort_ = Net::localPort(server_fd_);

    isRunning_.store(true, std::memory_order_release);
    acceptThread_ = std::thread(&MetricsServer::acceptConnections, this, server_fd_);
    spdlog::info("[MetricsServer] Serving metrics on {}:{}", address_.host, boundPort_);
}

void MetricsServer::stop() {
    bool wasRunning = isRunning_.exchange(false, std::memory_order_acq_rel);

    // Close server socket to unblock accept()
    if (server_fd_ != -1) {
        Net::closeSocket(server_fd_);
        server_fd_ = -1;
    }
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    if (wasRunning) {
        spdlog::info("[MetricsServer] Stopped. Total requests: {}", totalRequests_.load());
    }
}

void MetricsServer::acceptConnections(int listenFd) {
    while (isRunning_.load(std::memory_order_acquire)) {
        sockaddr_in clientAddr{};
        socklen_t clientLen = sizeof(clientAddr);
        int clientFd = accept(listenFd, reinterpret_cast<sockaddr*>(&clientAddr), &clientLen);

        if (clientFd < 0) {
            int err = errno;
            if (isRunning_.load(std::memory_order_acquire) && err != EINTR) {
                spdlog::error("[MetricsServer] Failed to accept connection: {}", std::strerror(err));
                // Listening socket is gone or broken
                if (err == EBADF || err == EINVAL) break;
                // Out of descriptors or similar: the pending connection stays queued
                std::this_thread::sleep_for(kAcceptErrorBackoff);
            }
            continue;
        }

        handleClient(clientFd);
        Net::closeSocket(clientFd);
    }
}

void MetricsServer::handleClient(int clientFd) {
    Net::setRecvTimeout(clientFd, kClientReadTimeout);

    std::string request;
    char temp[1024];
    while (request.find("\r\n\r\n") == std::string::npos && request.size() < kMaxRequestHeader) {
        ssize_t n = recv(clientFd, temp, sizeof(temp), 0);
        if (n <= 0) break;
        request.append(temp, static_cast<size_t>(n));
    }

    auto eol = request.find("\r\n");
    if (eol == std::string::npos) {
        spdlog::debug("[MetricsServer] Dropping incomplete request");
        return;
    }

    totalRequests_.fetch_add(1, std::memory_order_relaxed);
    std::string response = buildResponse(request.substr(0, eol));
    if (!Net::sendAll(clientFd, response)) {
        spdlog::debug("[MetricsServer] Client went away before response was sent");
    }
}

std::string MetricsServer::buildResponse(const std::string& requestLine) const {
    // "<METHOD> <PATH> HTTP/1.x"
    auto firstSpace = requestLine.find(' ');
    auto secondSpace = requestLine.find(' ', firstSpace == std::string::npos ? 0 : firstSpace + 1);
    std::string method = requestLine.substr(0, firstSpace);
    std::string path = (firstSpace == std::string::npos)
        ? std::string()
        : requestLine.substr(firstSpace + 1, secondSpace - firstSpace - 1);

    auto reply = [](const char* status, const char* contentType, const std::string& body) {
        return fmt::format("HTTP/1.1 {}\r\nContent-Type: {}\r\nContent-Length: {}\r\n"
                           "Connection: close\r\n\r\n{}",
                           status, contentType, body.size(), body);
    };

    if (method != "GET") {
        return reply("405 Method Not Allowed", "text/plain", "method not allowed\n");
    }
    if (path != "/" && path != "/metrics") {
        return reply("404 Not Found", "text/plain", "not found\n");
    }
    return reply("200 OK", "text/plain; version=0.0.4", registry_.render());
}

} // namespace RpcExtractor
