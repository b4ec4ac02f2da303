#pragma once

/// @file health_checker.hpp
/// @brief Cached, breaker-aware provider health checks.

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "pgw/foundation/clock.hpp"
#include "pgw/foundation/gateway_metrics.hpp"
#include "pgw/foundation/job_scheduler.hpp"
#include "pgw/service/circuit_breaker_registry.hpp"
#include "pgw/service/liveness_probe.hpp"
#include "pgw/service/provider_health.hpp"
#include "pgw/service/shared_store.hpp"

namespace pgw::service {

struct HealthCheckConfig {
    /// Lifetime of a cached verdict in the shared store.
    std::chrono::seconds cacheTtl{60};

    /// Deadline for one liveness probe.
    std::chrono::milliseconds probeTimeout{5000};

    /// Providers covered by checkAllProviders().
    std::vector<std::string> providers;
};

/// Produces per-provider health verdicts.
///
/// A check reads the cache first; on a miss it probes the provider,
/// classifies the status, folds in the circuit phase (Open forces down,
/// HalfOpen turns healthy into degraded) and writes the verdict back with
/// the cache TTL. Cache failures are logged and never fail a check.
///
/// The store, probe, breakers, scheduler and metrics must outlive the
/// checker.
class ProviderHealthChecker {
public:
    ProviderHealthChecker(HealthCheckConfig config, std::shared_ptr<ISharedStore> store,
                          std::shared_ptr<IProviderProbe> probe, CircuitBreakerRegistry& breakers,
                          foundation::GatewayJobScheduler& scheduler,
                          foundation::GatewayMetrics& metrics,
                          std::shared_ptr<foundation::IClock> clock =
                              foundation::SystemClock::shared());

    /// Health of one provider. Unknown providers are reported down without
    /// a probe. Exceptions thrown by the probe propagate.
    [[nodiscard]] ProviderHealth checkProviderHealth(std::string_view provider);

    /// Check every configured provider concurrently on the scheduler.
    ///
    /// Always returns one entry per configured provider; a check that
    /// throws or cannot be scheduled yields a down entry carrying the
    /// error message.
    [[nodiscard]] HealthSnapshot checkAllProviders();

    /// Drop the cached verdict so the next check probes again.
    void invalidate(std::string_view provider);

    [[nodiscard]] const HealthCheckConfig& config() const noexcept { return config_; }

    /// Shared-store key of a provider's cached verdict.
    [[nodiscard]] static std::string cacheKey(std::string_view provider);

private:
    [[nodiscard]] ProviderHealth probeProvider(std::string_view provider);
    void foldCircuitState(std::string_view provider, ProviderHealth& health);
    [[nodiscard]] ProviderHealth downEntry(std::string message) const;

    HealthCheckConfig config_;
    std::shared_ptr<ISharedStore> store_;
    std::shared_ptr<IProviderProbe> probe_;
    CircuitBreakerRegistry& breakers_;
    foundation::GatewayJobScheduler& scheduler_;
    foundation::GatewayMetrics& metrics_;
    std::shared_ptr<foundation::IClock> clock_;
};

}  // namespace pgw::service
