#pragma once

/// @file circuit_breaker_registry.hpp
/// @brief Provider-keyed circuit breakers with fallback selection.

#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "pgw/foundation/clock.hpp"
#include "pgw/foundation/gateway_result.hpp"
#include "pgw/service/circuit_breaker.hpp"

namespace pgw::service {

/// One CircuitBreaker per provider, created lazily on first reference and
/// kept for the registry's lifetime. Failures on one provider never affect
/// another provider's phase or timeout.
///
/// Lookups take a shared lock on the map; creation upgrades to an
/// exclusive lock. Per-provider state is guarded by that breaker's own
/// mutex.
///
/// Usage:
/// @code
///   CircuitBreakerRegistry breakers;
///   auto reply = breakers.call("groq", [&] { return groq.generate(prompt); });
///   if (!reply && reply.error().code() == ErrorCode::BreakerOpen) {
///       auto alt = breakers.fallbackProvider("groq", {"together", "openrouter"});
///   }
/// @endcode
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(
        CircuitBreakerConfig config = {},
        std::shared_ptr<foundation::IClock> clock = foundation::SystemClock::shared());

    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    void recordSuccess(std::string_view provider);
    void recordFailure(std::string_view provider);

    /// False only while the provider's circuit is Open.
    [[nodiscard]] bool isAvailable(std::string_view provider);

    /// Current phase; evaluates the lazy Open -> HalfOpen transition.
    [[nodiscard]] CircuitState state(std::string_view provider);

    /// Run @p operation under breaker protection.
    ///
    /// @p operation must return a GatewayResult. When the circuit is Open
    /// the operation is not invoked and a BreakerOpen error is returned;
    /// that rejection is not recorded as a failure. An error result is
    /// recorded as a failure and returned; an exception is recorded as a
    /// failure and rethrown.
    template <typename Fn>
    auto call(std::string_view provider, Fn&& operation) -> std::invoke_result_t<Fn&>;

    /// First candidate, in the given order, that is not @p failed and whose
    /// circuit is not Open.
    [[nodiscard]] std::optional<std::string> fallbackProvider(
        std::string_view failed, const std::vector<std::string>& candidates);

    /// Force the provider's circuit Closed with zeroed counters. Never fails.
    void reset(std::string_view provider);

    /// Stats for one provider; unknown providers report default Closed stats
    /// without creating state.
    [[nodiscard]] CircuitStats stats(std::string_view provider);

    /// Stats for every provider referenced so far, ordered by name.
    [[nodiscard]] std::map<std::string, CircuitStats> allStats();

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

private:
    std::shared_ptr<CircuitBreaker> breaker(std::string_view provider);
    std::shared_ptr<CircuitBreaker> find(std::string_view provider) const;

    CircuitBreakerConfig config_;
    std::shared_ptr<foundation::IClock> clock_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

// --- Template implementations ---

template <typename Fn>
auto CircuitBreakerRegistry::call(std::string_view provider, Fn&& operation)
    -> std::invoke_result_t<Fn&> {
    using ResultType = std::invoke_result_t<Fn&>;

    auto cb = breaker(provider);
    if (!cb->allowRequest()) {
        return ResultType::err(foundation::GatewayError(
            foundation::ErrorCode::BreakerOpen,
            "circuit breaker is open for provider: " + std::string(provider)));
    }

    try {
        auto result = operation();
        if (result.hasValue()) {
            cb->recordSuccess();
        } else {
            cb->recordFailure();
        }
        return result;
    } catch (...) {
        cb->recordFailure();
        throw;
    }
}

}  // namespace pgw::service
