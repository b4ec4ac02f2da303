#pragma once

/// @file provider_health.hpp
/// @brief Provider health verdicts and their cache encoding.

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "pgw/foundation/gateway_result.hpp"

namespace pgw::service {

/// Health verdict, ordered from best to worst.
enum class HealthState : uint8_t { Healthy, Degraded, Down };

[[nodiscard]] constexpr std::string_view toString(HealthState s) {
    switch (s) {
        case HealthState::Healthy:
            return "healthy";
        case HealthState::Degraded:
            return "degraded";
        case HealthState::Down:
            return "down";
    }
    return "unknown";
}

[[nodiscard]] foundation::GatewayResult<HealthState> parseHealthState(std::string_view name);

/// Classify a probe's HTTP status: 2xx healthy, 3xx-4xx degraded, else down.
[[nodiscard]] constexpr HealthState classifyStatus(int statusCode) noexcept {
    if (statusCode >= 200 && statusCode < 300) {
        return HealthState::Healthy;
    }
    if (statusCode >= 300 && statusCode < 500) {
        return HealthState::Degraded;
    }
    return HealthState::Down;
}

/// Derived health of one provider; recomputable from a probe plus the
/// provider's circuit phase.
struct ProviderHealth {
    HealthState status{HealthState::Down};
    std::chrono::system_clock::time_point lastCheck;
    std::optional<std::chrono::milliseconds> responseTime;
    std::optional<std::string> errorMessage;
};

/// Latest verdict per provider.
using HealthSnapshot = std::map<std::string, ProviderHealth>;

/// Worst status across @p snapshot; Healthy when empty.
[[nodiscard]] HealthState aggregateStatus(const HealthSnapshot& snapshot) noexcept;

/// Encode for the shared-store cache as a YAML flow map:
/// {status: healthy, last_check_ms: 1767225600000, response_time_ms: 120}
[[nodiscard]] std::string encodeHealth(const ProviderHealth& health);

/// Decode a cache entry; StoreValueMalformed on any parse failure.
[[nodiscard]] foundation::GatewayResult<ProviderHealth> decodeHealth(std::string_view encoded);

}  // namespace pgw::service
