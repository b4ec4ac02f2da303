/// @file circuit_breaker.cpp
/// @brief CircuitBreaker state machine implementation.

#include "pgw/service/circuit_breaker.hpp"

#include <algorithm>

#include "pgw/foundation/gateway_logger.hpp"

namespace pgw::service {

using pgw::foundation::GatewayLogger;
using pgw::foundation::LogCategory;
using pgw::foundation::LogContext;
using pgw::foundation::LogLevel;

CircuitBreaker::CircuitBreaker(std::string provider, CircuitBreakerConfig config,
                               std::shared_ptr<foundation::IClock> clock)
    : provider_(std::move(provider)),
      config_(config),
      clock_(std::move(clock)),
      currentTimeout_(config.recoveryTimeout) {}

bool CircuitBreaker::allowRequest() {
    std::lock_guard lock(mutex_);
    refreshLocked();
    if (state_ == CircuitState::Open) {
        ++totalRejected_;
        return false;
    }
    return true;
}

void CircuitBreaker::recordSuccess() {
    std::lock_guard lock(mutex_);
    refreshLocked();

    switch (state_) {
        case CircuitState::Closed:
            consecutiveFailures_ = 0;
            break;

        case CircuitState::HalfOpen:
            ++halfOpenSuccesses_;
            if (halfOpenSuccesses_ >= config_.successThreshold) {
                transitionTo(CircuitState::Closed);
            }
            break;

        case CircuitState::Open:
            // A call admitted before the circuit opened finished late.
            break;
    }
}

void CircuitBreaker::recordFailure() {
    std::lock_guard lock(mutex_);
    refreshLocked();

    ++consecutiveFailures_;
    lastFailureTime_ = clock_->wallNow();

    switch (state_) {
        case CircuitState::Closed:
            if (consecutiveFailures_ >= config_.failureThreshold) {
                currentTimeout_ = config_.recoveryTimeout;
                transitionTo(CircuitState::Open);
            }
            break;

        case CircuitState::HalfOpen:
            currentTimeout_ = std::min(currentTimeout_ * 2, config_.maxRecoveryTimeout);
            transitionTo(CircuitState::Open);
            break;

        case CircuitState::Open:
            break;
    }
}

void CircuitBreaker::reset() {
    std::lock_guard lock(mutex_);
    state_ = CircuitState::Closed;
    consecutiveFailures_ = 0;
    halfOpenSuccesses_ = 0;
    totalRejected_ = 0;
    currentTimeout_ = config_.recoveryTimeout;
    openedAt_.reset();
    openedAtWall_.reset();
    lastFailureTime_.reset();
}

CircuitState CircuitBreaker::state() {
    std::lock_guard lock(mutex_);
    refreshLocked();
    return state_;
}

CircuitStats CircuitBreaker::stats() {
    std::lock_guard lock(mutex_);
    refreshLocked();
    return CircuitStats{
        .state = state_,
        .consecutiveFailures = consecutiveFailures_,
        .halfOpenSuccesses = halfOpenSuccesses_,
        .currentTimeout = currentTimeout_,
        .rejectedCount = totalRejected_,
        .lastFailureTime = lastFailureTime_,
        .openedAt = openedAtWall_,
    };
}

void CircuitBreaker::refreshLocked() {
    if (state_ != CircuitState::Open || !openedAt_) {
        return;
    }
    if (clock_->monotonicNow() - *openedAt_ >= currentTimeout_) {
        transitionTo(CircuitState::HalfOpen);
    }
}

void CircuitBreaker::transitionTo(CircuitState newState) {
    state_ = newState;

    LogContext ctx;
    ctx.provider = provider_;
    ctx.extra["timeout_s"] = std::to_string(currentTimeout_.count());

    switch (newState) {
        case CircuitState::Closed:
            consecutiveFailures_ = 0;
            halfOpenSuccesses_ = 0;
            currentTimeout_ = config_.recoveryTimeout;
            GatewayLogger::instance().logWithContext(
                LogLevel::Info, LogCategory::Breaker, "circuit closed", ctx);
            break;

        case CircuitState::Open:
            openedAt_ = clock_->monotonicNow();
            openedAtWall_ = clock_->wallNow();
            halfOpenSuccesses_ = 0;
            ctx.extra["failures"] = std::to_string(consecutiveFailures_);
            GatewayLogger::instance().logWithContext(
                LogLevel::Warning, LogCategory::Breaker, "circuit opened", ctx);
            break;

        case CircuitState::HalfOpen:
            halfOpenSuccesses_ = 0;
            GatewayLogger::instance().logWithContext(
                LogLevel::Info, LogCategory::Breaker, "circuit half-open", ctx);
            break;
    }
}

} // namespace pgw::service
