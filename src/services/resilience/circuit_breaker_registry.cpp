/// @file circuit_breaker_registry.cpp
/// @brief CircuitBreakerRegistry implementation.

#include "pgw/service/circuit_breaker_registry.hpp"

#include <mutex>

namespace pgw::service {

CircuitBreakerRegistry::CircuitBreakerRegistry(CircuitBreakerConfig config,
                                               std::shared_ptr<foundation::IClock> clock)
    : config_(config), clock_(std::move(clock)) {}

void CircuitBreakerRegistry::recordSuccess(std::string_view provider) {
    breaker(provider)->recordSuccess();
}

void CircuitBreakerRegistry::recordFailure(std::string_view provider) {
    breaker(provider)->recordFailure();
}

bool CircuitBreakerRegistry::isAvailable(std::string_view provider) {
    return state(provider) != CircuitState::Open;
}

CircuitState CircuitBreakerRegistry::state(std::string_view provider) {
    return breaker(provider)->state();
}

std::optional<std::string> CircuitBreakerRegistry::fallbackProvider(
    std::string_view failed, const std::vector<std::string>& candidates) {
    for (const auto& candidate : candidates) {
        if (candidate != failed && isAvailable(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

void CircuitBreakerRegistry::reset(std::string_view provider) {
    if (auto cb = find(provider)) {
        cb->reset();
    }
}

CircuitStats CircuitBreakerRegistry::stats(std::string_view provider) {
    if (auto cb = find(provider)) {
        return cb->stats();
    }
    CircuitStats fresh;
    fresh.currentTimeout = config_.recoveryTimeout;
    return fresh;
}

std::map<std::string, CircuitStats> CircuitBreakerRegistry::allStats() {
    std::vector<std::shared_ptr<CircuitBreaker>> snapshot;
    {
        std::shared_lock lock(mutex_);
        snapshot.reserve(breakers_.size());
        for (const auto& [name, cb] : breakers_) {
            snapshot.push_back(cb);
        }
    }

    std::map<std::string, CircuitStats> out;
    for (const auto& cb : snapshot) {
        out.emplace(std::string(cb->provider()), cb->stats());
    }
    return out;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::breaker(std::string_view provider) {
    if (auto existing = find(provider)) {
        return existing;
    }

    std::unique_lock lock(mutex_);
    auto key = std::string(provider);
    auto [it, inserted] = breakers_.try_emplace(key, nullptr);
    if (inserted) {
        it->second = std::make_shared<CircuitBreaker>(key, config_, clock_);
    }
    return it->second;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::find(std::string_view provider) const {
    std::shared_lock lock(mutex_);
    auto it = breakers_.find(std::string(provider));
    return it == breakers_.end() ? nullptr : it->second;
}

} // namespace pgw::service
