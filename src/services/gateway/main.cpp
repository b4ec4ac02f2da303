/// @file main.cpp
/// @brief Provider gateway entry point.
///
/// Builds the resilience and routing components over an in-memory shared
/// store, probes provider health on a fixed interval, and serves status
/// and metrics until SIGINT/SIGTERM.

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#include "pgw/foundation/clock.hpp"
#include "pgw/foundation/config_manager.hpp"
#include "pgw/foundation/gateway_logger.hpp"
#include "pgw/foundation/gateway_metrics.hpp"
#include "pgw/foundation/job_scheduler.hpp"
#include "pgw/service/circuit_breaker_registry.hpp"
#include "pgw/service/execution_mode.hpp"
#include "pgw/service/gateway_config.hpp"
#include "pgw/service/health_checker.hpp"
#include "pgw/service/liveness_probe.hpp"
#include "pgw/service/model_catalog.hpp"
#include "pgw/service/model_registry.hpp"
#include "pgw/service/model_router.hpp"
#include "pgw/service/rate_limiter.hpp"
#include "pgw/service/service_runner.hpp"
#include "pgw/service/shared_store.hpp"
#include "pgw/service/status_server.hpp"
#include "pgw/version.hpp"

namespace {

using pgw::foundation::LogCategory;

pgw::foundation::GatewayResult<pgw::service::ModelRegistry> loadRegistry(
    const pgw::foundation::ConfigManager& config) {
    auto path = pgw::service::modelCatalogPath(config);
    if (!path) {
        return pgw::foundation::GatewayResult<pgw::service::ModelRegistry>::ok(
            pgw::service::ModelRegistry::builtin());
    }
    PGW_LOG_INFO(LogCategory::Config, "loading model catalog from " + path->string());
    return pgw::service::loadModelCatalog(*path);
}

double breakerGauge(pgw::service::CircuitState state) {
    switch (state) {
        case pgw::service::CircuitState::Closed:
            return 0.0;
        case pgw::service::CircuitState::HalfOpen:
            return 1.0;
        case pgw::service::CircuitState::Open:
            return 2.0;
    }
    return 0.0;
}

void publishBreakerGauges(pgw::service::CircuitBreakerRegistry& breakers,
                          pgw::foundation::GatewayMetrics& metrics) {
    for (const auto& [provider, stats] : breakers.allStats()) {
        metrics.setGauge(pgw::foundation::series("pgw_breaker_state", "provider", provider),
                         breakerGauge(stats.state));
        metrics.setGauge(
            pgw::foundation::series("pgw_breaker_timeout_seconds", "provider", provider),
            static_cast<double>(stats.currentTimeout.count()));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    pgw::service::SignalHandler signals;
    std::signal(SIGPIPE, SIG_IGN);

    auto configPath = pgw::service::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "/etc/pgw/gateway.yaml";
    }

    pgw::foundation::ConfigManager config;
    auto loadResult = pgw::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto registry = loadRegistry(config);
    if (!registry) {
        std::cerr << "Failed to load model catalog: " << registry.error().message() << "\n";
        return EXIT_FAILURE;
    }

    pgw::service::ExecutionModePolicy policy;
    auto validated = policy.validate(registry.value());
    if (!validated) {
        std::cerr << "Invalid execution mode presets: " << validated.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto& metrics = pgw::foundation::GatewayMetrics::instance();
    auto clock = pgw::foundation::SystemClock::shared();
    auto store = std::make_shared<pgw::service::InMemorySharedStore>(clock);

    pgw::service::CircuitBreakerRegistry breakers(
        pgw::service::buildCircuitBreakerConfig(config), clock);

    pgw::service::RateLimiter limiter(pgw::service::buildRateLimitConfig(config), store, clock,
                                      &metrics);

    pgw::service::ModelRouter router(registry.value(), policy, breakers,
                                     pgw::service::buildDeploymentMode(config));

    auto endpoints = pgw::service::buildProbeEndpoints(config);
    auto healthConfig = pgw::service::buildHealthCheckConfig(config, endpoints);
    auto interval = pgw::service::healthCheckInterval(config);

    pgw::foundation::GatewayJobScheduler scheduler(
        std::max<std::size_t>(healthConfig.providers.size(), 1));
    pgw::service::ProviderHealthChecker checker(
        healthConfig, store, std::make_shared<pgw::service::HttpLivenessProbe>(endpoints),
        breakers, scheduler, metrics, clock);

    std::mutex latestMutex;
    pgw::service::HealthSnapshot latest;

    pgw::service::StatusServer status(pgw::service::buildStatusServerConfig(config), metrics,
                                      [&latestMutex, &latest] {
                                          std::lock_guard lock(latestMutex);
                                          return latest;
                                      });
    auto startResult = status.start();
    if (!startResult) {
        std::cerr << "Failed to start status server: " << startResult.error().message()
                  << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "Provider gateway " << pgw::Version::string << " started (status:"
              << status.port() << " deployment:"
              << pgw::service::toString(router.deploymentMode())
              << " quota:" << limiter.config().authenticatedLimit << "/"
              << limiter.config().window.count() << "s)\n";

    pgw::service::GracefulShutdown shutdown;
    shutdown.addHook("ready", [&status]() { status.setReady(false); });
    shutdown.addHook("status", [&status]() { status.stop(); });
    shutdown.addHook("logger", []() {
        auto flushed = pgw::foundation::GatewayLogger::instance().flush();
        if (!flushed) {
            std::cerr << "Logger flush failed: " << flushed.error().message() << "\n";
        }
    });

    bool ready = false;
    do {
        auto snapshot = checker.checkAllProviders();
        router.applyHealth(snapshot);
        publishBreakerGauges(breakers, metrics);
        {
            std::lock_guard lock(latestMutex);
            latest = std::move(snapshot);
        }
        if (!ready) {
            status.setReady(true);
            ready = true;
        }
    } while (!signals.waitFor(interval));

    std::cout << "Shutting down provider gateway...\n";
    shutdown.execute();
    std::cout << "Provider gateway stopped\n";
    return EXIT_SUCCESS;
}
