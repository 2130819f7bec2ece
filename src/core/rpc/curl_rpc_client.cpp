#include <rpcextractor/core/rpc/curl_rpc_client.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace RpcExtractor {

using json = nlohmann::json;

namespace {

std::once_flag g_curl_init;

size_t writeCallback(char* contents, size_t size, size_t nmemb, void* userp) {
    auto* out = static_cast<std::string*>(userp);
    out->append(contents, size * nmemb);
    return size * nmemb;
}

struct HeaderListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

CurlRpcClient::CurlRpcClient(Options options)
    : options_(std::move(options)),
      url_(fmt::format("http://{}/", options_.endpoint.toString())) {
    std::call_once(g_curl_init, []() {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
        }
    });
    spdlog::info("[RpcClient] Using RPC endpoint {} (timeout {} ms)", url_, options_.timeout.count());
}

CurlRpcClient::~CurlRpcClient() = default;

CURL* CurlRpcClient::handleFor(const std::string& method) {
    std::lock_guard<std::mutex> lock(handles_mtx_);
    auto it = handles_.find(method);
    if (it != handles_.end()) {
        return it->second.get();
    }

    EasyHandle handle(curl_easy_init());
    if (!handle) {
        throw NetworkError("curl_easy_init failed");
    }
    CURL* h = handle.get();
    curl_easy_setopt(h, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(h, CURLOPT_USERNAME, options_.user.c_str());
    curl_easy_setopt(h, CURLOPT_PASSWORD, options_.password.c_str());
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout.count()));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.timeout.count()));
    // Required for timeouts in multi-threaded programs
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeCallback);

    handles_.emplace(method, std::move(handle));
    return h;
}

std::string CurlRpcClient::buildRequest(const std::string& method) {
    json payload;
    payload["jsonrpc"] = "1.0";
    payload["id"] = "rpc-extractor";
    payload["method"] = method;
    payload["params"] = json::array();
    return payload.dump();
}

std::string CurlRpcClient::call(const std::string& method) {
    CURL* h = handleFor(method);

    const std::string body = buildRequest(method);
    std::string response;
    char errbuf[CURL_ERROR_SIZE] = {0};

    std::unique_ptr<curl_slist, HeaderListDeleter> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"));

    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(h, CURLOPT_COPYPOSTFIELDS, body.c_str());
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);

    CURLcode res = curl_easy_perform(h);

    // Handle outlives the locals it points at; detach them
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, nullptr);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, nullptr);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, nullptr);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw TimeoutError(fmt::format("{} timed out after {} ms", method, options_.timeout.count()));
    }
    if (res != CURLE_OK) {
        throw NetworkError(fmt::format("{} failed: {} ({})", method, curl_easy_strerror(res),
                                       errbuf[0] ? errbuf : "no details"));
    }

    long httpStatus = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &httpStatus);
    return decodeResponse(httpStatus, response);
}

std::string CurlRpcClient::decodeResponse(long httpStatus, const std::string& body) {
    if (httpStatus == 401 || httpStatus == 403) {
        throw AuthError(fmt::format("RPC credentials rejected (HTTP {})", httpStatus));
    }

    json doc;
    try {
        doc = json::parse(body);
    } catch (const json::parse_error& e) {
        throw DecodeError(fmt::format("Invalid JSON in response (HTTP {}): {}", httpStatus, e.what()));
    }

    if (!doc.is_object()) {
        throw DecodeError(fmt::format("Response is not a JSON object (HTTP {})", httpStatus));
    }

    auto err = doc.find("error");
    if (err != doc.end() && !err->is_null()) {
        std::string message = err->dump();
        long code = 0;
        if (err->is_object()) {
            auto m = err->find("message");
            if (m != err->end() && m->is_string()) message = m->get<std::string>();
            auto c = err->find("code");
            if (c != err->end() && c->is_number_integer()) code = c->get<long>();
        }
        throw DecodeError(fmt::format("RPC error {}: {}", code, message));
    }

    auto result = doc.find("result");
    if (result == doc.end()) {
        throw DecodeError(fmt::format("Response has no result member (HTTP {})", httpStatus));
    }
    if (httpStatus != 200) {
        throw DecodeError(fmt::format("Unexpected HTTP status {}", httpStatus));
    }
    return result->dump();
}

} // namespace RpcExtractor
