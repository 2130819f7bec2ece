#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>

#include <rpcextractor/core/config/loader.hpp>
#include <rpcextractor/core/bus/nats_client.hpp>
#include <rpcextractor/core/events/publisher.hpp>
#include <rpcextractor/core/methods/method_catalog.hpp>
#include <rpcextractor/core/metrics/metrics_server.hpp>
#include <rpcextractor/core/metrics/recorder.hpp>
#include <rpcextractor/core/metrics/registry.hpp>
#include <rpcextractor/core/rpc/curl_rpc_client.hpp>
#include <rpcextractor/core/rpc/fetcher.hpp>
#include <rpcextractor/core/scheduler/scheduler.hpp>
#include <rpcextractor/core/scheduler/shutdown_signal.hpp>

using namespace RpcExtractor;

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};
static std::atomic<int> g_signal{0};

static void signalHandler(int signum) {
    g_signal.store(signum, std::memory_order_relaxed);
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("rpc-extractor v1.0.0 starting...");
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    return ConfigLoader::loadConfig(configPath);
}

static void applyLogLevel(const std::string& level) {
    spdlog::set_level(spdlog::level::from_str(level));
    spdlog::info("Log level set to {}", level);
}

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Components {
    // Order matters for destruction: dependents are declared after their dependencies
    std::unique_ptr<MetricRegistry> registry;
    std::unique_ptr<MetricsRecorder> recorder;
    std::unique_ptr<MetricsServer> metricsServer;

    std::unique_ptr<NatsClient> nats;
    std::unique_ptr<Publisher> publisher;

    std::unique_ptr<CurlRpcClient> rpcClient;
    std::unique_ptr<Fetcher> fetcher;

    std::unique_ptr<MethodCatalog> catalog;
    std::unique_ptr<Scheduler> scheduler;
};

static Components initializeComponents(const AppConfig::AppConfiguration& config,
                                       ShutdownSignal& shutdown) {
    Components c;

    // Metrics
    c.registry = std::make_unique<MetricRegistry>(std::string(MetricNames::NAMESPACE));
    c.recorder = std::make_unique<MetricsRecorder>(*c.registry);
    c.metricsServer = std::make_unique<MetricsServer>(*c.registry, config.metrics.address);

    // Message bus
    NatsClient::Options natsOptions;
    natsOptions.address = config.nats.address;
    natsOptions.username = config.nats.username;
    natsOptions.password = config.nats.password;
    c.nats = std::make_unique<NatsClient>(natsOptions);
    c.publisher = std::make_unique<Publisher>(*c.nats);

    // Node RPC
    CurlRpcClient::Options rpcOptions;
    rpcOptions.endpoint = config.rpc.endpoint;
    rpcOptions.user = config.rpc.user;
    rpcOptions.password = config.rpc.password;
    rpcOptions.timeout = config.rpc.timeout;
    c.rpcClient = std::make_unique<CurlRpcClient>(rpcOptions);
    c.fetcher = std::make_unique<Fetcher>(*c.rpcClient);

    // Scheduling
    c.catalog = std::make_unique<MethodCatalog>(config.disabled_methods);
    for (const auto& spec : c.catalog->specs()) {
        if (!spec.enabled) {
            spdlog::info("Method {} disabled by configuration", spec.name);
        }
    }
    c.scheduler = std::make_unique<Scheduler>(
        *c.catalog, *c.fetcher, *c.publisher, *c.recorder, shutdown,
        std::chrono::duration_cast<std::chrono::milliseconds>(config.query_interval));

    return c;
}

static void startComponents(Components& c, const AppConfig::AppConfiguration& config) {
    spdlog::info("Starting components...");

    // Both are fatal on failure
    c.metricsServer->start();
    spdlog::info("Metrics served on {}", config.metrics.address.toString());

    c.nats->connect();

    spdlog::info("Querying {} every {}s", config.rpc.endpoint.toString(),
                 config.query_interval.count());
    c.scheduler->start();

    spdlog::info("All components started successfully");
}

static void stopComponents(Components& c) {
    spdlog::info("=== SHUTDOWN SEQUENCE ===");

    // Stop in reverse order of start
    if (c.scheduler) c.scheduler->stop();
    if (c.nats) c.nats->close();
    if (c.metricsServer) c.metricsServer->stop();

    spdlog::info("=== SHUTDOWN COMPLETE ===");
}

int main(int argc, char* argv[]) {
    setupLogging();
    setupSignalHandlers();

    ShutdownSignal shutdown;

    try {
        auto config = loadConfiguration(argc, argv);
        applyLogLevel(config.log_level);
        spdlog::info("Configuration loaded successfully");

        auto components = initializeComponents(config, shutdown);

        try {
            startComponents(components, config);
        } catch (const std::exception&) {
            stopComponents(components);
            throw;
        }

        spdlog::info("rpc-extractor running. Press Ctrl+C to shutdown.");

        while (g_running.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
        spdlog::info("Signal {} received, initiating shutdown...",
                     g_signal.load(std::memory_order_relaxed));

        shutdown.trigger();
        stopComponents(components);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("rpc-extractor terminated gracefully");
    return EXIT_SUCCESS;
}
