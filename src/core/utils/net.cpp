#include <rpcextractor/core/utils/net.hpp>

#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <cstdlib>

namespace RpcExtractor {
namespace Net {

std::optional<Endpoint> parseEndpoint(const std::string& text) {
    auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
        return std::nullopt;
    }

    std::string portText = text.substr(colon + 1);
    for (char c : portText) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    if (portText.size() > 5) return std::nullopt;

    unsigned long port = std::strtoul(portText.c_str(), nullptr, 10);
    if (port == 0 || port > 65535) return std::nullopt;

    Endpoint ep;
    ep.host = text.substr(0, colon);
    ep.port = static_cast<uint16_t>(port);
    return ep;
}

int connectTcp(const Endpoint& endpoint, std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    std::string port = std::to_string(endpoint.port);
    if (getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &result) != 0 || !result) {
        errno = EHOSTUNREACH;
        return -1;
    }

    int fd = -1;
    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;

        // Non-blocking connect so the attempt is bounded by timeout
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        int rc = connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc < 0 && errno == EINPROGRESS) {
            pollfd pfd{fd, POLLOUT, 0};
            rc = poll(&pfd, 1, static_cast<int>(timeout.count()));
            if (rc == 0) {
                errno = ETIMEDOUT;
                rc = -1;
            } else if (rc > 0) {
                int soError = 0;
                socklen_t len = sizeof(soError);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len);
                if (soError != 0) {
                    errno = soError;
                    rc = -1;
                } else {
                    rc = 0;
                }
            }
        }

        if (rc == 0) {
            fcntl(fd, F_SETFL, flags);
            break;
        }

        int savedErrno = errno;
        close(fd);
        errno = savedErrno;
        fd = -1;
    }

    freeaddrinfo(result);
    return fd;
}

int listenTcp(const Endpoint& endpoint, int backlog) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;

    // Enable SO_REUSEADDR to avoid "address already in use" errors
    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(endpoint.port);
    if (endpoint.host.empty() || endpoint.host == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (endpoint.host == "localhost") {
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    } else if (inet_pton(AF_INET, endpoint.host.c_str(), &addr.sin_addr) != 1) {
        close(fd);
        errno = EADDRNOTAVAIL;
        return -1;
    }

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        listen(fd, backlog) < 0) {
        int savedErrno = errno;
        close(fd);
        errno = savedErrno;
        return -1;
    }
    return fd;
}

uint16_t localPort(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

bool sendAll(int fd, const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

void setRecvTimeout(int fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<long>(timeout.count() / 1000);
    tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

void closeSocket(int fd) {
    if (fd == -1) return;
    shutdown(fd, SHUT_RDWR);
    close(fd);
}

} // namespace Net
} // namespace RpcExtractor
