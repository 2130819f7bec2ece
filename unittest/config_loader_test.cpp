// ============================================================================
// CONFIG LOADER UNIT TESTS
// ============================================================================
// Tests for YAML configuration loading and validation
// ============================================================================

#include <gtest/gtest.h>
#include <rpcextractor/core/config/loader.hpp>
#include <rpcextractor/core/config/app_config.hpp>

using namespace RpcExtractor;

// ============================================================================
// SUCCESSFUL LOADING TESTS
// ============================================================================

TEST(ConfigLoader, ShippedConfigurationNeedsNodeCookie) {
    // The shipped file points at a cookie that does not exist on a build host
    EXPECT_THROW(ConfigLoader::loadConfig("config/config.yaml"), ConfigError);
}

TEST(ConfigLoader, LoadValidConfiguration) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("unittest/fixtures/valid.yaml");

    EXPECT_EQ(config.app_name, "rpc-extractor-test");
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.query_interval, std::chrono::seconds(3));

    // RPC: credentials come from the cookie file
    EXPECT_EQ(config.rpc.endpoint.host, "127.0.0.1");
    EXPECT_EQ(config.rpc.endpoint.port, 18443);
    EXPECT_EQ(config.rpc.user, "__cookie__");
    EXPECT_EQ(config.rpc.password, "0f3a9c2b7e");
    EXPECT_EQ(config.rpc.timeout, std::chrono::milliseconds(1500));

    // NATS: password read from file and trimmed
    EXPECT_EQ(config.nats.address.host, "10.0.0.5");
    EXPECT_EQ(config.nats.address.port, 4223);
    EXPECT_EQ(config.nats.username, "extractor");
    EXPECT_EQ(config.nats.password, "hunter2");

    EXPECT_EQ(config.metrics.address.toString(), "0.0.0.0:9100");

    EXPECT_EQ(config.disabled_methods.size(), 2u);
    EXPECT_EQ(config.disabled_methods.count("getpeerinfo"), 1u);
    EXPECT_EQ(config.disabled_methods.count("getblockchaininfo"), 1u);
    EXPECT_EQ(config.disabled_methods.count("uptime"), 0u);
}

TEST(ConfigLoader, DefaultsApplyForOptionalSections) {
    auto config = ConfigLoader::loadFromString(
        "rpc:\n"
        "  host: node.local:8332\n"
        "  user: alice\n"
        "  password: secret\n");

    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.query_interval, std::chrono::seconds(10));
    EXPECT_EQ(config.rpc.timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(config.rpc.user, "alice");
    EXPECT_EQ(config.rpc.password, "secret");
    EXPECT_EQ(config.nats.address.toString(), "127.0.0.1:4222");
    EXPECT_TRUE(config.nats.username.empty());
    EXPECT_EQ(config.metrics.address.toString(), "127.0.0.1:8282");
    EXPECT_TRUE(config.disabled_methods.empty());
}

TEST(ConfigLoader, ExplicitUserWinsOverCookieFile) {
    auto config = ConfigLoader::loadFromString(
        "rpc:\n"
        "  host: 127.0.0.1:8332\n"
        "  user: alice\n"
        "  password: secret\n"
        "  cookie_file: unittest/fixtures/rpc.cookie\n");

    EXPECT_EQ(config.rpc.user, "alice");
    EXPECT_EQ(config.rpc.password, "secret");
}

TEST(ConfigLoader, NatsUserWithoutPasswordIsAccepted) {
    auto config = ConfigLoader::loadFromString(
        "rpc:\n"
        "  host: 127.0.0.1:8332\n"
        "  user: alice\n"
        "  password: secret\n"
        "nats:\n"
        "  username: extractor\n");

    EXPECT_EQ(config.nats.username, "extractor");
    EXPECT_TRUE(config.nats.password.empty());
}

TEST(ConfigLoader, DisableSwitchSetToFalseKeepsMethod) {
    auto config = ConfigLoader::loadFromString(
        "rpc:\n"
        "  host: 127.0.0.1:8332\n"
        "  user: alice\n"
        "  password: secret\n"
        "methods:\n"
        "  disable_uptime: false\n"
        "  disable_getnettotals: true\n");

    EXPECT_EQ(config.disabled_methods.count("uptime"), 0u);
    EXPECT_EQ(config.disabled_methods.count("getnettotals"), 1u);
}

TEST(ConfigLoader, ReadCookieFileSplitsOnFirstColon) {
    auto [user, password] = ConfigLoader::readCookieFile("unittest/fixtures/rpc.cookie");
    EXPECT_EQ(user, "__cookie__");
    EXPECT_EQ(password, "0f3a9c2b7e");
}

// ============================================================================
// ERROR HANDLING TESTS
// ============================================================================

TEST(ConfigLoader, ThrowsOnFileNotFound) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("config/non_existent.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnMissingRequiredField) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/missing_field.yaml"),
        ConfigError
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldType) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_type.yaml"),
        ConfigError
    );
}

TEST(ConfigLoader, ThrowsOnZeroInterval) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_value.yaml"),
        ConfigError
    );
}

TEST(ConfigLoader, ThrowsOnMalformedEndpoint) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/bad_endpoint.yaml"),
        ConfigError
    );
}

TEST(ConfigLoader, ThrowsWithoutRpcCredentials) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/no_credentials.yaml"),
        ConfigError
    );
}

TEST(ConfigLoader, ThrowsOnUnreadableCookieFile) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/missing_cookie.yaml"),
        ConfigError
    );
}

TEST(ConfigLoader, ThrowsOnMalformedCookieFile) {
    EXPECT_THROW(ConfigLoader::readCookieFile("unittest/fixtures/malformed.cookie"), ConfigError);
}

TEST(ConfigLoader, ThrowsOnUnknownMethodSwitch) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/unknown_method.yaml"),
        ConfigError
    );
}

TEST(ConfigLoader, ThrowsOnUnknownLogLevel) {
    EXPECT_THROW(
        ConfigLoader::loadFromString(
            "log_level: verbose\n"
            "rpc:\n"
            "  host: 127.0.0.1:8332\n"
            "  user: alice\n"
            "  password: secret\n"),
        ConfigError
    );
}

TEST(ConfigLoader, ThrowsOnZeroTimeout) {
    EXPECT_THROW(
        ConfigLoader::loadFromString(
            "rpc:\n"
            "  host: 127.0.0.1:8332\n"
            "  user: alice\n"
            "  password: secret\n"
            "  timeout_ms: 0\n"),
        ConfigError
    );
}

TEST(ConfigLoader, ThrowsOnNonMappingRoot) {
    EXPECT_THROW(ConfigLoader::loadFromString("- just\n- a list\n"), ConfigError);
}
