#include <rpcextractor/core/config/loader.hpp>
#include <rpcextractor/core/methods/method_catalog.hpp>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <array>
#include <fstream>
#include <sstream>

namespace RpcExtractor {

namespace {

constexpr std::string_view DISABLE_PREFIX = "disable_";

constexpr std::array<std::string_view, 7> LOG_LEVELS = {
    "trace", "debug", "info", "warn", "error", "critical", "off"
};

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

// Read an optional scalar; a present value of the wrong type is an error
template <typename T>
T readOr(const YAML::Node& parent, const char* section, const char* key, const T& fallback) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) return fallback;
    if (!node.IsScalar()) {
        throw ConfigError(std::string("Field '") + section + key + "' must be a scalar");
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        throw ConfigError(std::string("Field '") + section + key + "' has an invalid type");
    }
}

template <typename T>
T readRequired(const YAML::Node& parent, const char* section, const char* key) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        throw ConfigError(std::string("Missing required field '") + section + key + "'");
    }
    return readOr<T>(parent, section, key, T{});
}

Endpoint parseEndpointField(const std::string& value, const char* field) {
    auto ep = Net::parseEndpoint(value);
    if (!ep) {
        throw ConfigError(std::string("Field '") + field + "' must be <host>:<port>, got '" + value + "'");
    }
    return *ep;
}

YAML::Node sectionOf(const YAML::Node& root, const char* name, bool required) {
    YAML::Node node = root[name];
    if (!node || node.IsNull()) {
        if (required) {
            throw ConfigError(std::string("Missing required section '") + name + "'");
        }
        return YAML::Node(YAML::NodeType::Map);
    }
    if (!node.IsMap()) {
        throw ConfigError(std::string("Section '") + name + "' must be a mapping");
    }
    return node;
}

} // namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    std::ifstream in(filepath);
    if (!in.is_open()) {
        throw ConfigError("Cannot open config file: " + filepath);
    }

    YAML::Node root;
    try {
        root = YAML::Load(in);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Malformed YAML in " + filepath + ": " + e.what());
    }

    auto config = parse(root);
    spdlog::info("[ConfigLoader] Loaded {}", filepath);
    return config;
}

AppConfig::AppConfiguration ConfigLoader::loadFromString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Malformed YAML: ") + e.what());
    }
    return parse(root);
}

AppConfig::AppConfiguration ConfigLoader::parse(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw ConfigError("Configuration root must be a mapping");
    }

    AppConfig::AppConfiguration config;
    config.app_name = readOr<std::string>(root, "", "app_name", config.app_name);

    config.log_level = readOr<std::string>(root, "", "log_level", config.log_level);
    bool knownLevel = false;
    for (auto level : LOG_LEVELS) {
        if (config.log_level == level) knownLevel = true;
    }
    if (!knownLevel) {
        throw ConfigError("Field 'log_level' has unknown value '" + config.log_level + "'");
    }

    long interval = readOr<long>(root, "", "query_interval_seconds",
                                 static_cast<long>(config.query_interval.count()));
    if (interval <= 0) {
        throw ConfigError("Field 'query_interval_seconds' must be greater than 0");
    }
    config.query_interval = std::chrono::seconds(interval);

    // --- rpc ---------------------------------------------------------------
    const YAML::Node rpc = sectionOf(root, "rpc", true);
    config.rpc.endpoint = parseEndpointField(
        readRequired<std::string>(rpc, "rpc.", "host"), "rpc.host");

    long timeoutMs = readOr<long>(rpc, "rpc.", "timeout_ms",
                                  static_cast<long>(config.rpc.timeout.count()));
    if (timeoutMs <= 0) {
        throw ConfigError("Field 'rpc.timeout_ms' must be greater than 0");
    }
    config.rpc.timeout = std::chrono::milliseconds(timeoutMs);

    config.rpc.user = readOr<std::string>(rpc, "rpc.", "user", "");
    config.rpc.password = readOr<std::string>(rpc, "rpc.", "password", "");
    config.rpc.cookie_file = readOr<std::string>(rpc, "rpc.", "cookie_file", "");

    if (!config.rpc.user.empty()) {
        if (!config.rpc.cookie_file.empty()) {
            spdlog::warn("[ConfigLoader] Both rpc.user and rpc.cookie_file set, using rpc.user");
        }
    } else if (!config.rpc.cookie_file.empty()) {
        auto [user, password] = readCookieFile(config.rpc.cookie_file);
        config.rpc.user = std::move(user);
        config.rpc.password = std::move(password);
    } else {
        throw ConfigError("No RPC credentials: set rpc.cookie_file or rpc.user/rpc.password");
    }

    // --- nats --------------------------------------------------------------
    const YAML::Node nats = sectionOf(root, "nats", false);
    std::string natsAddress = readOr<std::string>(nats, "nats.", "address",
                                                  config.nats.address.toString());
    config.nats.address = parseEndpointField(natsAddress, "nats.address");
    config.nats.username = readOr<std::string>(nats, "nats.", "username", "");
    config.nats.password = readOr<std::string>(nats, "nats.", "password", "");
    config.nats.password_file = readOr<std::string>(nats, "nats.", "password_file", "");

    if (!config.nats.username.empty()) {
        if (!config.nats.password.empty()) {
            spdlog::debug("[ConfigLoader] Using supplied NATS user={} and password=***",
                          config.nats.username);
        } else if (!config.nats.password_file.empty()) {
            config.nats.password = readPasswordFile(config.nats.password_file);
            spdlog::info("[ConfigLoader] Using supplied NATS user={} with password from file {}",
                         config.nats.username, config.nats.password_file);
        } else {
            spdlog::warn("[ConfigLoader] No NATS password supplied for connection to {} with user={}",
                         config.nats.address.toString(), config.nats.username);
        }
    }

    // --- metrics -----------------------------------------------------------
    const YAML::Node metrics = sectionOf(root, "metrics", false);
    std::string metricsAddress = readOr<std::string>(metrics, "metrics.", "address",
                                                     config.metrics.address.toString());
    config.metrics.address = parseEndpointField(metricsAddress, "metrics.address");

    // --- methods -----------------------------------------------------------
    const YAML::Node methods = sectionOf(root, "methods", false);
    for (const auto& item : methods) {
        std::string key = item.first.as<std::string>();
        if (key.compare(0, DISABLE_PREFIX.size(), DISABLE_PREFIX) != 0) {
            throw ConfigError("Unknown field 'methods." + key + "'");
        }
        std::string method = key.substr(DISABLE_PREFIX.size());
        if (!MethodCatalog::isSupported(method)) {
            throw ConfigError("Unknown RPC method in 'methods." + key + "'");
        }
        if (readOr<bool>(methods, "methods.", key.c_str(), false)) {
            config.disabled_methods.insert(method);
        }
    }

    return config;
}

std::pair<std::string, std::string> ConfigLoader::readCookieFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("Cannot read RPC cookie file: " + path);
    }
    std::string line;
    std::getline(in, line);
    line = trim(line);

    auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
        throw ConfigError("RPC cookie file " + path + " is not in <user>:<password> format");
    }
    return {line.substr(0, colon), line.substr(colon + 1)};
}

std::string ConfigLoader::readPasswordFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("Cannot read password file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return trim(buffer.str());
}

} // namespace RpcExtractor
