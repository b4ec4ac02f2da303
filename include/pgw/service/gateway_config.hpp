#pragma once

/// @file gateway_config.hpp
/// @brief Mapping from configuration keys onto component configs.
///
/// Every builder starts from the component defaults and overrides only the
/// keys present in the ConfigManager.

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "pgw/foundation/config_manager.hpp"
#include "pgw/service/circuit_breaker.hpp"
#include "pgw/service/deployment_mode.hpp"
#include "pgw/service/health_checker.hpp"
#include "pgw/service/rate_limiter.hpp"
#include "pgw/service/status_server.hpp"

namespace pgw::service {

/// circuit_breaker.{failure_threshold, recovery_timeout_seconds,
/// max_recovery_timeout_seconds, success_threshold}
[[nodiscard]] CircuitBreakerConfig buildCircuitBreakerConfig(
    const foundation::ConfigManager& config);

/// rate_limit.{authenticated, demo, admin, window_seconds}
[[nodiscard]] RateLimitConfig buildRateLimitConfig(const foundation::ConfigManager& config);

/// health.endpoints.<provider>; the defaults when the map is absent.
[[nodiscard]] std::map<std::string, std::string> buildProbeEndpoints(
    const foundation::ConfigManager& config);

/// health.{cache_ttl_seconds, probe_timeout_ms}; providers are the keys of
/// @p endpoints.
[[nodiscard]] HealthCheckConfig buildHealthCheckConfig(
    const foundation::ConfigManager& config,
    const std::map<std::string, std::string>& endpoints);

/// health.check_interval_seconds (default 30).
[[nodiscard]] std::chrono::seconds healthCheckInterval(const foundation::ConfigManager& config);

/// status.{port, service_name}
[[nodiscard]] StatusServerConfig buildStatusServerConfig(const foundation::ConfigManager& config);

/// deployment.mode (default cloud).
[[nodiscard]] DeploymentMode buildDeploymentMode(const foundation::ConfigManager& config);

/// models.catalog_path, if set.
[[nodiscard]] std::optional<std::filesystem::path> modelCatalogPath(
    const foundation::ConfigManager& config);

}  // namespace pgw::service
