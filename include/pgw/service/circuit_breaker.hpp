#pragma once

/// @file circuit_breaker.hpp
/// @brief Per-provider circuit breaker with exponential-backoff recovery.
///
/// Implements Closed -> Open -> HalfOpen with a recovery timeout that
/// doubles on every failed recovery trial, capped at a maximum.

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "pgw/foundation/clock.hpp"

namespace pgw::service {

/// Configuration shared by every provider breaker.
struct CircuitBreakerConfig {
    /// Consecutive failures (while Closed) before the circuit opens.
    uint32_t failureThreshold = 5;

    /// Base time the circuit stays open before a recovery trial.
    std::chrono::seconds recoveryTimeout{60};

    /// Upper bound for the doubled recovery timeout.
    std::chrono::seconds maxRecoveryTimeout{300};

    /// Consecutive HalfOpen successes required to close the circuit.
    uint32_t successThreshold = 2;
};

/// Circuit breaker phases.
enum class CircuitState : uint8_t {
    Closed,   ///< Normal operation; calls pass through.
    Open,     ///< Calls are rejected without reaching the provider.
    HalfOpen  ///< Recovery trial; calls pass and are counted.
};

[[nodiscard]] constexpr std::string_view toString(CircuitState s) {
    switch (s) {
        case CircuitState::Closed:
            return "closed";
        case CircuitState::Open:
            return "open";
        case CircuitState::HalfOpen:
            return "half_open";
    }
    return "unknown";
}

/// Point-in-time view of one provider's breaker.
struct CircuitStats {
    CircuitState state{CircuitState::Closed};
    uint32_t consecutiveFailures{0};
    uint32_t halfOpenSuccesses{0};
    std::chrono::seconds currentTimeout{0};
    uint64_t rejectedCount{0};
    std::optional<std::chrono::system_clock::time_point> lastFailureTime;
    std::optional<std::chrono::system_clock::time_point> openedAt;
};

/// State machine for a single provider.
///
/// The Open -> HalfOpen transition is lazy: it is evaluated under the
/// breaker's mutex by state(), allowRequest() and stats() once the
/// current timeout has elapsed, so overlapping readers observe exactly
/// one transition.
///
/// Thread-safe: every read-modify-write holds the mutex.
class CircuitBreaker {
public:
    CircuitBreaker(std::string provider, CircuitBreakerConfig config,
                   std::shared_ptr<foundation::IClock> clock);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /// Whether a call may proceed. Counts a rejection when Open.
    [[nodiscard]] bool allowRequest();

    void recordSuccess();
    void recordFailure();

    /// Force Closed with zeroed counters and the base timeout.
    void reset();

    /// Current phase (may transition Open -> HalfOpen).
    [[nodiscard]] CircuitState state();

    /// Snapshot of counters and timing (may transition Open -> HalfOpen).
    [[nodiscard]] CircuitStats stats();

    [[nodiscard]] std::string_view provider() const noexcept { return provider_; }

private:
    void refreshLocked();
    void transitionTo(CircuitState newState);

    std::string provider_;
    CircuitBreakerConfig config_;
    std::shared_ptr<foundation::IClock> clock_;

    std::mutex mutex_;
    CircuitState state_{CircuitState::Closed};
    uint32_t consecutiveFailures_{0};
    uint32_t halfOpenSuccesses_{0};
    uint64_t totalRejected_{0};
    std::chrono::seconds currentTimeout_;
    std::optional<std::chrono::steady_clock::time_point> openedAt_;
    std::optional<std::chrono::system_clock::time_point> openedAtWall_;
    std::optional<std::chrono::system_clock::time_point> lastFailureTime_;
};

}  // namespace pgw::service
