/// @file health_checker.cpp
/// @brief ProviderHealthChecker implementation.

#include "pgw/service/health_checker.hpp"

#include <mutex>
#include <utility>

#include "pgw/foundation/gateway_logger.hpp"

namespace pgw::service {

using foundation::GatewayLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

constexpr std::string_view kCachePrefix = "provider:health:";
constexpr std::string_view kProbeLatency = "pgw_probe_latency_ms";
constexpr std::string_view kProviderUp = "pgw_provider_up";

void warn(std::string_view provider, std::string_view msg, std::string_view detail) {
    LogContext ctx;
    ctx.provider = std::string(provider);
    ctx.extra["error"] = std::string(detail);
    GatewayLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Health, msg, ctx);
}

}  // anonymous namespace

ProviderHealthChecker::ProviderHealthChecker(HealthCheckConfig config,
                                             std::shared_ptr<ISharedStore> store,
                                             std::shared_ptr<IProviderProbe> probe,
                                             CircuitBreakerRegistry& breakers,
                                             foundation::GatewayJobScheduler& scheduler,
                                             foundation::GatewayMetrics& metrics,
                                             std::shared_ptr<foundation::IClock> clock)
    : config_(std::move(config)),
      store_(std::move(store)),
      probe_(std::move(probe)),
      breakers_(breakers),
      scheduler_(scheduler),
      metrics_(metrics),
      clock_(std::move(clock)) {
    metrics_.registerHistogram(kProbeLatency, foundation::HistogramBuckets::probeLatency());
}

std::string ProviderHealthChecker::cacheKey(std::string_view provider) {
    return std::string(kCachePrefix) + std::string(provider);
}

ProviderHealth ProviderHealthChecker::checkProviderHealth(std::string_view provider) {
    auto key = cacheKey(provider);

    auto cached = store_->get(key);
    if (!cached) {
        warn(provider, "health cache read failed", cached.error().message());
    } else if (cached.value()) {
        auto decoded = decodeHealth(*cached.value());
        if (decoded) {
            return std::move(decoded).value();
        }
        warn(provider, "discarding malformed health cache entry", decoded.error().message());
    }

    if (!probe_->knows(provider)) {
        return downEntry("Unknown provider: " + std::string(provider));
    }

    auto health = probeProvider(provider);
    foldCircuitState(provider, health);

    metrics_.setGauge(foundation::series(kProviderUp, "provider", provider),
                      health.status == HealthState::Down ? 0.0 : 1.0);

    auto stored = store_->setWithTtl(key, encodeHealth(health), config_.cacheTtl);
    if (!stored) {
        warn(provider, "health cache write failed", stored.error().message());
    }
    return health;
}

HealthSnapshot ProviderHealthChecker::checkAllProviders() {
    HealthSnapshot results;
    std::mutex resultsMutex;

    std::vector<std::pair<std::string, foundation::GatewayJobScheduler::JobId>> jobs;
    jobs.reserve(config_.providers.size());

    for (const auto& provider : config_.providers) {
        auto id = scheduler_.schedule([this, provider, &results, &resultsMutex] {
            auto health = checkProviderHealth(provider);
            std::lock_guard lock(resultsMutex);
            results[provider] = std::move(health);
        });
        if (!id) {
            warn(provider, "could not schedule health check", id.error().message());
            std::lock_guard lock(resultsMutex);
            results[provider] = downEntry(std::string(id.error().message()));
            continue;
        }
        jobs.emplace_back(provider, id.value());
    }

    for (const auto& [provider, id] : jobs) {
        auto done = scheduler_.wait(id);
        if (!done) {
            LogContext ctx;
            ctx.provider = provider;
            ctx.extra["error"] = std::string(done.error().message());
            GatewayLogger::instance().logWithContext(LogLevel::Error, LogCategory::Health,
                                                     "health check failed", ctx);
            std::lock_guard lock(resultsMutex);
            results[provider] = downEntry(std::string(done.error().message()));
            metrics_.setGauge(foundation::series(kProviderUp, "provider", provider), 0.0);
        }
    }
    return results;
}

void ProviderHealthChecker::invalidate(std::string_view provider) {
    auto removed = store_->remove(cacheKey(provider));
    if (!removed) {
        warn(provider, "health cache invalidation failed", removed.error().message());
    }
}

ProviderHealth ProviderHealthChecker::probeProvider(std::string_view provider) {
    auto started = clock_->monotonicNow();
    auto outcome = probe_->probe(provider, config_.probeTimeout);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        clock_->monotonicNow() - started);

    metrics_.recordHistogram(kProbeLatency, static_cast<double>(elapsed.count()));

    ProviderHealth health;
    health.lastCheck = clock_->wallNow();
    health.responseTime = elapsed;

    if (!outcome) {
        health.status = HealthState::Down;
        health.errorMessage = std::string(outcome.error().message());
        warn(provider, "liveness probe failed", outcome.error().message());
        return health;
    }

    auto code = outcome.value().statusCode;
    health.status = classifyStatus(code);
    if (health.status != HealthState::Healthy) {
        health.errorMessage = "HTTP " + std::to_string(code);
    }
    return health;
}

void ProviderHealthChecker::foldCircuitState(std::string_view provider, ProviderHealth& health) {
    switch (breakers_.state(provider)) {
        case CircuitState::Open:
            health.status = HealthState::Down;
            if (!health.errorMessage) {
                health.errorMessage = "Circuit breaker open";
            }
            break;
        case CircuitState::HalfOpen:
            if (health.status == HealthState::Healthy) {
                health.status = HealthState::Degraded;
            }
            break;
        case CircuitState::Closed:
            break;
    }
}

ProviderHealth ProviderHealthChecker::downEntry(std::string message) const {
    ProviderHealth health;
    health.status = HealthState::Down;
    health.lastCheck = clock_->wallNow();
    health.errorMessage = std::move(message);
    return health;
}

} // namespace pgw::service
