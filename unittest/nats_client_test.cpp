// ============================================================================
// NATS CLIENT UNIT TESTS
// ============================================================================
// Protocol handshake and PUB framing against a scripted loopback server
// ============================================================================

#include <gtest/gtest.h>
#include <rpcextractor/core/bus/nats_client.hpp>
#include <nlohmann/json.hpp>
#include "support/fake_tcp_server.hpp"

#include <atomic>
#include <csignal>
#include <pthread.h>
#include <thread>
#include <vector>

using namespace RpcExtractor;
using namespace RpcExtractor::Testing;
using namespace std::chrono_literals;

namespace {

const std::string kInfo =
    "INFO {\"server_id\":\"FAKE\",\"version\":\"2.10.0\",\"max_payload\":1048576}\r\n";

NatsClient::Options optionsFor(const Endpoint& endpoint) {
    NatsClient::Options options;
    options.address = endpoint;
    options.connect_timeout = 2000ms;
    return options;
}

// Server side of a successful handshake; returns the CONNECT line
std::string acceptHandshake(int fd, std::string& buffer, const std::string& info = kInfo) {
    Net::sendAll(fd, info);
    std::string connect = readLine(fd, buffer);
    std::string ping = readLine(fd, buffer);
    if (ping == "PING") {
        Net::sendAll(fd, "PONG\r\n");
    }
    return connect;
}

void ignoreSignal(int) {}

} // namespace

TEST(NatsClient, HandshakeAndPublishFrame) {
    std::string connectLine;
    std::string pubLine;
    std::string payload;

    FakeTcpServer server([&](int fd) {
        std::string buffer;
        connectLine = acceptHandshake(fd, buffer);
        pubLine = readLine(fd, buffer);
        payload = readExact(fd, buffer, 16);
        readLine(fd, buffer);  // trailing CRLF
    });

    NatsClient client(optionsFor(server.endpoint()));
    ASSERT_NO_THROW(client.connect());
    EXPECT_TRUE(client.isConnected());
    EXPECT_EQ(client.maxPayload(), 1048576u);

    auto err = client.publish("getpeerinfo", R"({"result":[1,2]})");
    EXPECT_FALSE(err.has_value());

    server.join();
    client.close();

    ASSERT_EQ(connectLine.rfind("CONNECT ", 0), 0u);
    auto connect = nlohmann::json::parse(connectLine.substr(8));
    EXPECT_EQ(connect["verbose"], false);
    EXPECT_EQ(connect["name"], "rpc-extractor");
    EXPECT_FALSE(connect.contains("user"));
    EXPECT_FALSE(connect.contains("pass"));

    EXPECT_EQ(pubLine, "PUB getpeerinfo 16");
    EXPECT_EQ(payload, R"({"result":[1,2]})");
}

TEST(NatsClient, SendsCredentialsWhenConfigured) {
    std::string connectLine;
    FakeTcpServer server([&](int fd) {
        std::string buffer;
        connectLine = acceptHandshake(fd, buffer);
    });

    auto options = optionsFor(server.endpoint());
    options.username = "extractor";
    options.password = "hunter2";
    NatsClient client(options);
    ASSERT_NO_THROW(client.connect());

    server.join();
    client.close();

    auto connect = nlohmann::json::parse(connectLine.substr(8));
    EXPECT_EQ(connect["user"], "extractor");
    EXPECT_EQ(connect["pass"], "hunter2");
}

TEST(NatsClient, AuthorizationViolationFailsConnect) {
    FakeTcpServer server([](int fd) {
        std::string buffer;
        Net::sendAll(fd, kInfo);
        readLine(fd, buffer);  // CONNECT
        readLine(fd, buffer);  // PING
        Net::sendAll(fd, "-ERR 'Authorization Violation'\r\n");
    });

    NatsClient client(optionsFor(server.endpoint()));
    EXPECT_THROW(client.connect(), BusConnectError);
    EXPECT_FALSE(client.isConnected());
}

TEST(NatsClient, MissingInfoFailsConnect) {
    FakeTcpServer server([](int) {
        // Close straight away
    });

    NatsClient client(optionsFor(server.endpoint()));
    EXPECT_THROW(client.connect(), BusConnectError);
}

TEST(NatsClient, UnreachableServerFailsConnect) {
    int fd = Net::listenTcp(Endpoint{"127.0.0.1", 0});
    ASSERT_GE(fd, 0);
    uint16_t port = Net::localPort(fd);
    Net::closeSocket(fd);

    NatsClient client(optionsFor(Endpoint{"127.0.0.1", port}));
    EXPECT_THROW(client.connect(), BusConnectError);
}

TEST(NatsClient, AnswersServerPing) {
    std::atomic<bool> gotPong{false};

    FakeTcpServer server([&](int fd) {
        std::string buffer;
        acceptHandshake(fd, buffer);
        Net::sendAll(fd, "PING\r\n");
        gotPong.store(readLine(fd, buffer) == "PONG");
    });

    NatsClient client(optionsFor(server.endpoint()));
    ASSERT_NO_THROW(client.connect());

    server.join();
    client.close();
    EXPECT_TRUE(gotPong.load());
}

TEST(NatsClient, PayloadAboveServerLimitIsRejected) {
    FakeTcpServer server([](int fd) {
        std::string buffer;
        acceptHandshake(fd, buffer, "INFO {\"max_payload\":8}\r\n");
        // Keep the connection open until the client goes away
        readLine(fd, buffer);
    });

    NatsClient client(optionsFor(server.endpoint()));
    ASSERT_NO_THROW(client.connect());
    EXPECT_EQ(client.maxPayload(), 8u);

    auto err = client.publish("uptime", "0123456789abcdef");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->subject, "uptime");

    client.close();
    server.join();
}

TEST(NatsClient, PublishWithoutConnectionFails) {
    NatsClient client(NatsClient::Options{});

    auto err = client.publish("uptime", "1");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->message, "not connected to NATS server");
}

TEST(NatsClient, SubjectValidation) {
    EXPECT_TRUE(NatsClient::isValidSubject("getpeerinfo"));
    EXPECT_TRUE(NatsClient::isValidSubject("node.getpeerinfo"));
    EXPECT_FALSE(NatsClient::isValidSubject(""));
    EXPECT_FALSE(NatsClient::isValidSubject("has space"));
    EXPECT_FALSE(NatsClient::isValidSubject("crlf\r\n"));
    EXPECT_FALSE(NatsClient::isValidSubject(".leading"));

    NatsClient client(NatsClient::Options{});
    auto err = client.publish("bad subject", "1");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->message, "invalid subject");
}

TEST(NatsClient, CloseWhilePublishingIsSafe) {
    FakeTcpServer server([](int fd) {
        std::string buffer;
        acceptHandshake(fd, buffer);
        // Consume frames until the client shuts the socket
        while (!readLine(fd, buffer).empty()) {
        }
    });

    NatsClient client(optionsFor(server.endpoint()));
    ASSERT_NO_THROW(client.connect());

    std::atomic<bool> publishing{true};
    std::atomic<size_t> failures{0};
    std::vector<std::thread> publishers;
    for (int i = 0; i < 4; ++i) {
        publishers.emplace_back([&]() {
            while (publishing.load()) {
                if (client.publish("uptime", R"({"result":1})")) {
                    failures.fetch_add(1);
                }
            }
        });
    }

    std::this_thread::sleep_for(20ms);
    client.close();
    std::this_thread::sleep_for(5ms);
    publishing.store(false);
    for (auto& t : publishers) {
        t.join();
    }
    server.join();

    EXPECT_FALSE(client.isConnected());
    EXPECT_GT(failures.load(), 0u);

    auto err = client.publish("uptime", "1");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->message, "not connected to NATS server");
}

TEST(NatsClient, SignalDuringHandshakeDoesNotFailConnect) {
    struct sigaction action{};
    action.sa_handler = ignoreSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;  // no SA_RESTART: recv() returns EINTR
    struct sigaction previous{};
    ASSERT_EQ(sigaction(SIGUSR1, &action, &previous), 0);

    std::atomic<bool> pingSeen{false};
    FakeTcpServer server([&](int fd) {
        std::string buffer;
        Net::sendAll(fd, kInfo);
        readLine(fd, buffer);  // CONNECT
        readLine(fd, buffer);  // PING
        pingSeen.store(true);
        std::this_thread::sleep_for(300ms);
        Net::sendAll(fd, "PONG\r\n");
        readLine(fd, buffer);  // until the client goes away
    });

    NatsClient client(optionsFor(server.endpoint()));
    std::atomic<bool> connected{false};
    std::thread connector([&]() {
        try {
            client.connect();
            connected.store(true);
        } catch (const BusConnectError& e) {
            ADD_FAILURE() << "connect failed: " << e.what();
        }
    });

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!pingSeen.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    // The connector is now parked in recv() waiting for PONG
    for (int i = 0; i < 3; ++i) {
        std::this_thread::sleep_for(50ms);
        pthread_kill(connector.native_handle(), SIGUSR1);
    }
    connector.join();
    sigaction(SIGUSR1, &previous, nullptr);

    EXPECT_TRUE(connected.load());
    client.close();
    server.join();
}
