/// @file gateway_config.cpp
/// @brief Config builders for the gateway components.

#include "pgw/service/gateway_config.hpp"

#include <string>

#include "pgw/foundation/gateway_logger.hpp"

namespace pgw::service {

CircuitBreakerConfig buildCircuitBreakerConfig(const foundation::ConfigManager& config) {
    CircuitBreakerConfig cfg;

    auto failures = config.get<unsigned int>("circuit_breaker.failure_threshold");
    if (failures) {
        cfg.failureThreshold = failures.value();
    }

    auto recovery = config.get<int>("circuit_breaker.recovery_timeout_seconds");
    if (recovery) {
        cfg.recoveryTimeout = std::chrono::seconds(recovery.value());
    }

    auto maxRecovery = config.get<int>("circuit_breaker.max_recovery_timeout_seconds");
    if (maxRecovery) {
        cfg.maxRecoveryTimeout = std::chrono::seconds(maxRecovery.value());
    }

    auto successes = config.get<unsigned int>("circuit_breaker.success_threshold");
    if (successes) {
        cfg.successThreshold = successes.value();
    }

    // The doubling cap never undercuts the base timeout.
    if (cfg.maxRecoveryTimeout < cfg.recoveryTimeout) {
        PGW_LOG_WARN(foundation::LogCategory::Config,
                     "max_recovery_timeout_seconds below recovery_timeout_seconds; using " +
                         std::to_string(cfg.recoveryTimeout.count()) + "s");
        cfg.maxRecoveryTimeout = cfg.recoveryTimeout;
    }

    return cfg;
}

RateLimitConfig buildRateLimitConfig(const foundation::ConfigManager& config) {
    RateLimitConfig cfg;

    auto authenticated = config.get<int64_t>("rate_limit.authenticated");
    if (authenticated) {
        cfg.authenticatedLimit = authenticated.value();
    }

    auto demo = config.get<int64_t>("rate_limit.demo");
    if (demo) {
        cfg.demoLimit = demo.value();
    }

    auto admin = config.get<int64_t>("rate_limit.admin");
    if (admin) {
        cfg.adminLimit = admin.value();
    }

    auto window = config.get<int>("rate_limit.window_seconds");
    if (window && window.value() > 0) {
        cfg.window = std::chrono::seconds(window.value());
    }

    return cfg;
}

std::map<std::string, std::string> buildProbeEndpoints(const foundation::ConfigManager& config) {
    auto providers = config.childKeys("health.endpoints");
    if (providers.empty()) {
        return defaultProbeEndpoints();
    }

    std::map<std::string, std::string> endpoints;
    for (const auto& provider : providers) {
        auto url = config.get<std::string>("health.endpoints." + provider);
        if (url) {
            endpoints.emplace(provider, std::move(url).value());
        }
    }
    return endpoints;
}

HealthCheckConfig buildHealthCheckConfig(const foundation::ConfigManager& config,
                                         const std::map<std::string, std::string>& endpoints) {
    HealthCheckConfig cfg;

    auto ttl = config.get<int>("health.cache_ttl_seconds");
    if (ttl) {
        cfg.cacheTtl = std::chrono::seconds(ttl.value());
    }

    auto timeout = config.get<int>("health.probe_timeout_ms");
    if (timeout) {
        cfg.probeTimeout = std::chrono::milliseconds(timeout.value());
    }

    for (const auto& [provider, url] : endpoints) {
        cfg.providers.push_back(provider);
    }
    return cfg;
}

std::chrono::seconds healthCheckInterval(const foundation::ConfigManager& config) {
    auto interval = config.get<int>("health.check_interval_seconds");
    if (interval && interval.value() > 0) {
        return std::chrono::seconds(interval.value());
    }
    return std::chrono::seconds(30);
}

StatusServerConfig buildStatusServerConfig(const foundation::ConfigManager& config) {
    StatusServerConfig cfg;

    auto port = config.get<int>("status.port");
    if (port) {
        cfg.port = static_cast<uint16_t>(port.value());
    }

    auto name = config.get<std::string>("status.service_name");
    if (name) {
        cfg.serviceName = std::move(name).value();
    }

    return cfg;
}

DeploymentMode buildDeploymentMode(const foundation::ConfigManager& config) {
    auto mode = config.get<std::string>("deployment.mode");
    return mode ? parseDeploymentMode(mode.value()) : DeploymentMode::Cloud;
}

std::optional<std::filesystem::path> modelCatalogPath(const foundation::ConfigManager& config) {
    auto path = config.get<std::string>("models.catalog_path");
    if (!path || path.value().empty()) {
        return std::nullopt;
    }
    return std::filesystem::path(path.value());
}

} // namespace pgw::service
