// ============================================================================
// CURL RPC CLIENT UNIT TESTS
// ============================================================================
// Response decoding plus real HTTP round trips against a loopback fake node
// ============================================================================

#include <gtest/gtest.h>
#include <rpcextractor/core/rpc/curl_rpc_client.hpp>
#include <nlohmann/json.hpp>
#include "support/fake_tcp_server.hpp"

#include <cstdlib>
#include <thread>

using namespace RpcExtractor;
using namespace RpcExtractor::Testing;
using namespace std::chrono_literals;

namespace {

size_t contentLength(const std::string& headers) {
    const std::string key = "Content-Length: ";
    auto pos = headers.find(key);
    if (pos == std::string::npos) return 0;
    return static_cast<size_t>(std::strtoul(headers.c_str() + pos + key.size(), nullptr, 10));
}

std::string httpResponse(const char* status, const std::string& body) {
    return std::string("HTTP/1.1 ") + status + "\r\n"
         + "Content-Type: application/json\r\n"
         + "Content-Length: " + std::to_string(body.size()) + "\r\n"
         + "Connection: close\r\n\r\n" + body;
}

CurlRpcClient::Options optionsFor(const Endpoint& endpoint,
                                  std::chrono::milliseconds timeout = 2000ms) {
    CurlRpcClient::Options options;
    options.endpoint = endpoint;
    options.user = "alice";
    options.password = "secret";
    options.timeout = timeout;
    return options;
}

} // namespace

// ============================================================================
// RESPONSE DECODING TESTS
// ============================================================================

TEST(CurlRpcClientDecode, ReturnsSerializedResult) {
    std::string result = CurlRpcClient::decodeResponse(
        200, R"({"result":{"blocks":840000,"chain":"main"},"error":null,"id":"rpc-extractor"})");

    auto parsed = nlohmann::json::parse(result);
    EXPECT_EQ(parsed["blocks"], 840000);
    EXPECT_EQ(parsed["chain"], "main");
}

TEST(CurlRpcClientDecode, ScalarResultIsKept) {
    EXPECT_EQ(CurlRpcClient::decodeResponse(200, R"({"result":3600,"error":null,"id":1})"), "3600");
}

TEST(CurlRpcClientDecode, UnauthorizedIsAuthError) {
    EXPECT_THROW(CurlRpcClient::decodeResponse(401, ""), AuthError);
    EXPECT_THROW(CurlRpcClient::decodeResponse(403, "Forbidden"), AuthError);
}

TEST(CurlRpcClientDecode, MalformedBodyIsDecodeError) {
    EXPECT_THROW(CurlRpcClient::decodeResponse(200, "not json"), DecodeError);
    EXPECT_THROW(CurlRpcClient::decodeResponse(200, "[1,2,3]"), DecodeError);
    EXPECT_THROW(CurlRpcClient::decodeResponse(200, R"({"error":null,"id":1})"), DecodeError);
}

TEST(CurlRpcClientDecode, RpcErrorMemberIsDecodeError) {
    // bitcoind answers unknown methods with HTTP 404 and an error object
    try {
        CurlRpcClient::decodeResponse(
            404, R"({"result":null,"error":{"code":-32601,"message":"Method not found"},"id":1})");
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.kind(), RpcFailureKind::DECODE);
        EXPECT_NE(std::string(e.what()).find("Method not found"), std::string::npos);
    }
}

TEST(CurlRpcClientDecode, ServerErrorWithoutErrorMemberIsDecodeError) {
    EXPECT_THROW(CurlRpcClient::decodeResponse(500, R"({"result":1})"), DecodeError);
}

// ============================================================================
// TRANSPORT TESTS
// ============================================================================

TEST(CurlRpcClient, BuildsUrlFromEndpoint) {
    CurlRpcClient client(optionsFor(Endpoint{"127.0.0.1", 8332}));
    EXPECT_EQ(client.url(), "http://127.0.0.1:8332/");
}

TEST(CurlRpcClient, PostsJsonRpcRequestWithBasicAuth) {
    std::string seenHeaders;
    std::string seenBody;

    FakeTcpServer node([&](int fd) {
        std::string buffer;
        seenHeaders = readHttpHeaders(fd, buffer);
        seenBody = readExact(fd, buffer, contentLength(seenHeaders));
        Net::sendAll(fd, httpResponse("200 OK", R"({"result":{"uptime":42},"error":null,"id":"rpc-extractor"})"));
    });

    CurlRpcClient client(optionsFor(node.endpoint()));
    std::string result = client.call("getmemoryinfo");
    node.join();

    EXPECT_EQ(nlohmann::json::parse(result)["uptime"], 42);

    EXPECT_EQ(seenHeaders.rfind("POST / HTTP/1.1\r\n", 0), 0u);
    // base64("alice:secret")
    EXPECT_NE(seenHeaders.find("Authorization: Basic YWxpY2U6c2VjcmV0"), std::string::npos);
    EXPECT_NE(seenHeaders.find("Content-Type: application/json"), std::string::npos);

    auto request = nlohmann::json::parse(seenBody);
    EXPECT_EQ(request["jsonrpc"], "1.0");
    EXPECT_EQ(request["id"], "rpc-extractor");
    EXPECT_EQ(request["method"], "getmemoryinfo");
    EXPECT_TRUE(request["params"].is_array());
    EXPECT_TRUE(request["params"].empty());
}

TEST(CurlRpcClient, RejectedCredentialsAreAuthError) {
    FakeTcpServer node([](int fd) {
        std::string buffer;
        std::string headers = readHttpHeaders(fd, buffer);
        readExact(fd, buffer, contentLength(headers));
        Net::sendAll(fd, "HTTP/1.1 401 Unauthorized\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
    });

    CurlRpcClient client(optionsFor(node.endpoint()));
    EXPECT_THROW(client.call("uptime"), AuthError);
}

TEST(CurlRpcClient, SlowNodeIsTimeoutError) {
    FakeTcpServer node([](int fd) {
        std::string buffer;
        readHttpHeaders(fd, buffer);
        std::this_thread::sleep_for(800ms);
    });

    CurlRpcClient client(optionsFor(node.endpoint(), 200ms));
    EXPECT_THROW(client.call("getpeerinfo"), TimeoutError);
}

TEST(CurlRpcClient, ClosedPortIsNetworkError) {
    // Grab an ephemeral port, then release it so nothing listens there
    int fd = Net::listenTcp(Endpoint{"127.0.0.1", 0});
    ASSERT_GE(fd, 0);
    uint16_t port = Net::localPort(fd);
    Net::closeSocket(fd);

    CurlRpcClient client(optionsFor(Endpoint{"127.0.0.1", port}));
    try {
        client.call("uptime");
        FAIL() << "expected NetworkError";
    } catch (const RpcError& e) {
        EXPECT_EQ(e.kind(), RpcFailureKind::NETWORK);
    }
}
