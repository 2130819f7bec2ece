#pragma once
#include <rpcextractor/core/config/app_config.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace YAML { class Node; }

namespace RpcExtractor {

/**
 * @brief Invalid or unreadable configuration; fatal at startup
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

class ConfigLoader {
public:
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
    static AppConfig::AppConfiguration loadFromString(const std::string& yaml);

    // "<user>:<password>" as written by bitcoind into its .cookie file
    static std::pair<std::string, std::string> readCookieFile(const std::string& path);

    // Whole file content, surrounding whitespace trimmed
    static std::string readPasswordFile(const std::string& path);

private:
    static AppConfig::AppConfiguration parse(const YAML::Node& root);
};

} // namespace RpcExtractor
