#pragma once
// ============================================================================
// LOOPBACK FAKE TCP PEER
// ============================================================================
// Accepts exactly one connection on 127.0.0.1:<ephemeral port> and runs a
// scripted conversation on it in a background thread.
// ============================================================================

#include <rpcextractor/core/utils/net.hpp>

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>

namespace RpcExtractor {
namespace Testing {

class FakeTcpServer {
public:
    using Script = std::function<void(int fd)>;

    explicit FakeTcpServer(Script script) {
        listen_fd_ = Net::listenTcp(Endpoint{"127.0.0.1", 0}, 4);
        if (listen_fd_ < 0) {
            throw std::runtime_error("FakeTcpServer: cannot listen on loopback");
        }
        port_ = Net::localPort(listen_fd_);

        int listenFd = listen_fd_;
        thread_ = std::thread([listenFd, script]() {
            int fd = ::accept(listenFd, nullptr, nullptr);
            if (fd < 0) return;
            Net::setRecvTimeout(fd, std::chrono::milliseconds(3000));
            script(fd);
            Net::closeSocket(fd);
        });
    }

    ~FakeTcpServer() { join(); }

    FakeTcpServer(const FakeTcpServer&) = delete;
    FakeTcpServer& operator=(const FakeTcpServer&) = delete;

    // Waits for the script to finish; unblocks accept() if nobody connected
    void join() {
        if (listen_fd_ >= 0) {
            ::shutdown(listen_fd_, SHUT_RDWR);
        }
        if (thread_.joinable()) {
            thread_.join();
        }
        if (listen_fd_ >= 0) {
            ::close(listen_fd_);
            listen_fd_ = -1;
        }
    }

    uint16_t port() const { return port_; }
    Endpoint endpoint() const { return Endpoint{"127.0.0.1", port_}; }

private:
    int listen_fd_{-1};
    uint16_t port_{0};
    std::thread thread_;
};

// One CRLF-terminated line without the CRLF; empty on EOF or timeout
inline std::string readLine(int fd, std::string& buffer) {
    while (true) {
        auto eol = buffer.find("\r\n");
        if (eol != std::string::npos) {
            std::string line = buffer.substr(0, eol);
            buffer.erase(0, eol + 2);
            return line;
        }
        char temp[1024];
        ssize_t n = ::recv(fd, temp, sizeof(temp), 0);
        if (n <= 0) return "";
        buffer.append(temp, static_cast<size_t>(n));
    }
}

// Exactly n bytes (fewer on EOF or timeout)
inline std::string readExact(int fd, std::string& buffer, size_t n) {
    while (buffer.size() < n) {
        char temp[1024];
        ssize_t got = ::recv(fd, temp, sizeof(temp), 0);
        if (got <= 0) break;
        buffer.append(temp, static_cast<size_t>(got));
    }
    std::string out = buffer.substr(0, n);
    buffer.erase(0, out.size());
    return out;
}

// Everything up to and including the blank line ending an HTTP header block
inline std::string readHttpHeaders(int fd, std::string& buffer) {
    while (buffer.find("\r\n\r\n") == std::string::npos) {
        char temp[1024];
        ssize_t n = ::recv(fd, temp, sizeof(temp), 0);
        if (n <= 0) return "";
        buffer.append(temp, static_cast<size_t>(n));
    }
    auto end = buffer.find("\r\n\r\n") + 4;
    std::string headers = buffer.substr(0, end);
    buffer.erase(0, end);
    return headers;
}

} // namespace Testing
} // namespace RpcExtractor
