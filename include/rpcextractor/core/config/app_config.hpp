#pragma once

#include <rpcextractor/core/utils/net.hpp>
#include <chrono>
#include <string>
#include <unordered_set>

namespace RpcExtractor {
namespace AppConfig {

struct RpcConfig {
    Endpoint endpoint;
    std::string cookie_file;
    // Resolved credentials (from user/password or the cookie file)
    std::string user;
    std::string password;
    std::chrono::milliseconds timeout{5000};
};

struct NatsConfig {
    Endpoint address{"127.0.0.1", 4222};
    std::string username;
    // Resolved password (inline or read from password_file)
    std::string password;
    std::string password_file;
};

struct MetricsConfig {
    Endpoint address{"127.0.0.1", 8282};
};

struct AppConfiguration {
    std::string app_name = "rpc-extractor";
    std::string log_level = "info";
    std::chrono::seconds query_interval{10};

    RpcConfig rpc;
    NatsConfig nats;
    MetricsConfig metrics;

    // Names of RPC methods switched off with methods.disable_<name>
    std::unordered_set<std::string> disabled_methods;
};

} // namespace AppConfig
} // namespace RpcExtractor
