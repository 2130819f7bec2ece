#include <rpcextractor/core/bus/nats_client.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <cerrno>
#include <cstring>

namespace RpcExtractor {

namespace {
constexpr auto kReaderPollInterval = std::chrono::milliseconds(500);
constexpr size_t kMaxControlLine = 64 * 1024;
}

NatsClient::NatsClient(Options options) : options_(std::move(options)) {}

NatsClient::~NatsClient() noexcept {
    close();
}

void NatsClient::connect() {
    if (connected_.load(std::memory_order_acquire)) return;

    if (options_.username.empty()) {
        spdlog::debug("[NatsClient] Connecting to NATS-server at {} without authentication",
                      options_.address.toString());
    } else {
        spdlog::info("[NatsClient] Connecting to NATS-server {} with user={} and password=***",
                     options_.address.toString(), options_.username);
    }

    int fd = Net::connectTcp(options_.address, options_.connect_timeout);
    if (fd < 0) {
        throw BusConnectError(fmt::format("Cannot connect to NATS server {}: {}",
                                          options_.address.toString(), std::strerror(errno)));
    }
    {
        std::lock_guard<std::mutex> lock(write_mtx_);
        fd_ = fd;
    }

    try {
        handshake();
    } catch (const BusConnectError&) {
        std::lock_guard<std::mutex> lock(write_mtx_);
        Net::closeSocket(fd_);
        fd_ = -1;
        throw;
    }

    Net::setRecvTimeout(fd_, kReaderPollInterval);
    connected_.store(true, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    reader_ = std::thread(&NatsClient::readLoop, this);
    spdlog::info("[NatsClient] Connected to {} (max_payload={})",
                 options_.address.toString(), max_payload_);
}

void NatsClient::handshake() {
    Net::setRecvTimeout(fd_, options_.connect_timeout);

    std::string line;
    if (readLine(line) != ReadStatus::LINE || line.compare(0, 5, "INFO ") != 0) {
        throw BusConnectError("NATS server did not send INFO");
    }

    auto info = nlohmann::json::parse(line.substr(5), nullptr, false);
    if (!info.is_discarded() && info.is_object()) {
        auto mp = info.find("max_payload");
        if (mp != info.end() && mp->is_number_unsigned()) {
            max_payload_ = mp->get<uint64_t>();
        }
    }

    if (!sendRaw(buildConnect() + "PING\r\n")) {
        throw BusConnectError(fmt::format("Failed to send CONNECT: {}", std::strerror(errno)));
    }

    while (true) {
        auto status = readLine(line);
        if (status == ReadStatus::TIMEOUT) {
            throw BusConnectError("Timed out waiting for NATS handshake");
        }
        if (status == ReadStatus::CLOSED) {
            throw BusConnectError("NATS server closed the connection during handshake");
        }
        if (line == "PONG") {
            return;
        }
        if (line.compare(0, 4, "-ERR") == 0) {
            throw BusConnectError("NATS server rejected connection: " + line);
        }
        if (line == "PING" && !sendRaw("PONG\r\n")) {
            throw BusConnectError(fmt::format("Failed to answer PING: {}", std::strerror(errno)));
        }
        // +OK and INFO updates are ignored
    }
}

std::string NatsClient::buildConnect() const {
    nlohmann::json connect;
    connect["verbose"] = false;
    connect["pedantic"] = false;
    connect["tls_required"] = false;
    connect["name"] = options_.name;
    connect["lang"] = "cpp";
    connect["version"] = "1.0.0";
    connect["protocol"] = 1;
    if (!options_.username.empty()) {
        connect["user"] = options_.username;
        connect["pass"] = options_.password;
    }
    return "CONNECT " + connect.dump() + "\r\n";
}

NatsClient::ReadStatus NatsClient::readLine(std::string& line) {
    while (true) {
        auto eol = readBuffer_.find("\r\n");
        if (eol != std::string::npos) {
            line = readBuffer_.substr(0, eol);
            readBuffer_.erase(0, eol + 2);
            return ReadStatus::LINE;
        }
        if (readBuffer_.size() > kMaxControlLine) {
            spdlog::warn("[NatsClient] Oversized control line from server, discarding");
            readBuffer_.clear();
        }

        char temp[4096];
        ssize_t n = recv(fd_, temp, sizeof(temp), 0);
        if (n > 0) {
            readBuffer_.append(temp, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return ReadStatus::TIMEOUT;
        }
        return ReadStatus::CLOSED;
    }
}

void NatsClient::readLoop() {
    std::string line;
    while (running_.load(std::memory_order_acquire)) {
        auto status = readLine(line);
        if (status == ReadStatus::TIMEOUT) continue;
        if (status == ReadStatus::CLOSED) {
            if (running_.load(std::memory_order_acquire)) {
                spdlog::warn("[NatsClient] Connection to {} closed by server",
                             options_.address.toString());
            }
            break;
        }

        if (line == "PING") {
            if (!sendRaw("PONG\r\n")) {
                spdlog::warn("[NatsClient] Failed to answer PING: {}", std::strerror(errno));
            }
        } else if (line.compare(0, 4, "-ERR") == 0) {
            spdlog::error("[NatsClient] Server error: {}", line);
        }
    }
    connected_.store(false, std::memory_order_release);
}

bool NatsClient::sendRaw(const std::string& data) {
    std::lock_guard<std::mutex> lock(write_mtx_);
    if (fd_ == -1) {
        errno = ENOTCONN;
        return false;
    }
    return Net::sendAll(fd_, data);
}

bool NatsClient::isValidSubject(const std::string& subject) {
    if (subject.empty()) return false;
    for (char c : subject) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') return false;
    }
    return subject.front() != '.' && subject.back() != '.';
}

std::optional<PublishError> NatsClient::publish(const std::string& subject,
                                                const std::string& payload) {
    if (!isValidSubject(subject)) {
        return PublishError{subject, "invalid subject"};
    }
    if (!connected_.load(std::memory_order_acquire)) {
        return PublishError{subject, "not connected to NATS server"};
    }
    if (payload.size() > max_payload_) {
        return PublishError{subject, fmt::format("payload of {} bytes exceeds server max_payload {}",
                                                 payload.size(), max_payload_)};
    }

    std::string frame;
    frame.reserve(subject.size() + payload.size() + 32);
    frame += fmt::format("PUB {} {}\r\n", subject, payload.size());
    frame += payload;
    frame += "\r\n";

    if (!sendRaw(frame)) {
        int err = errno;
        connected_.store(false, std::memory_order_release);
        return PublishError{subject, fmt::format("send failed: {}", std::strerror(err))};
    }
    return std::nullopt;
}

void NatsClient::close() {
    running_.store(false, std::memory_order_release);
    connected_.store(false, std::memory_order_release);

    // Wake the reader and any publisher blocked in send() before the fd is
    // released; taking write_mtx_ here could wait behind a stalled send()
    if (fd_ != -1) {
        ::shutdown(fd_, SHUT_RDWR);
    }
    if (reader_.joinable()) {
        reader_.join();
    }

    // Publishers past the connected_ check serialize on write_mtx_ and see fd_ == -1
    bool released = false;
    {
        std::lock_guard<std::mutex> lock(write_mtx_);
        if (fd_ != -1) {
            ::close(fd_);
            fd_ = -1;
            released = true;
        }
    }
    if (released) {
        spdlog::info("[NatsClient] Disconnected from {}", options_.address.toString());
    }
}

} // namespace RpcExtractor
