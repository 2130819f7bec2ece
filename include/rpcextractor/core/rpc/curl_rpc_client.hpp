#pragma once

#include <rpcextractor/core/rpc/rpc_client.hpp>
#include <rpcextractor/core/utils/net.hpp>
#include <curl/curl.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace RpcExtractor {

/**
 * @class CurlRpcClient
 * @brief JSON-RPC 1.0 over HTTP (libcurl) with basic authentication
 *
 * Keeps one easy handle per method so each method reuses its own
 * keep-alive connection. A handle is only touched by the (single) in-flight
 * call of its method.
 */
class CurlRpcClient : public RpcClient {
public:
    struct Options {
        Endpoint endpoint;
        std::string user;
        std::string password;
        std::chrono::milliseconds timeout{5000};
    };

    explicit CurlRpcClient(Options options);
    ~CurlRpcClient() override;

    CurlRpcClient(const CurlRpcClient&) = delete;
    CurlRpcClient& operator=(const CurlRpcClient&) = delete;

    std::string call(const std::string& method) override;

    const std::string& url() const { return url_; }

    // Raw response body -> serialized `result`; throws AuthError/DecodeError
    static std::string decodeResponse(long httpStatus, const std::string& body);

private:
    struct EasyHandleDeleter {
        void operator()(CURL* h) const { curl_easy_cleanup(h); }
    };
    using EasyHandle = std::unique_ptr<CURL, EasyHandleDeleter>;

    CURL* handleFor(const std::string& method);
    std::string buildRequest(const std::string& method);

    Options options_;
    std::string url_;

    std::mutex handles_mtx_;
    std::unordered_map<std::string, EasyHandle> handles_;
};

} // namespace RpcExtractor
