/// @file provider_health.cpp
/// @brief Health state helpers and yaml-cpp cache encoding.

#include "pgw/service/provider_health.hpp"

#include <algorithm>

#include <yaml-cpp/yaml.h>

#include "pgw/foundation/clock.hpp"

namespace pgw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;

GatewayResult<HealthState> parseHealthState(std::string_view name) {
    for (auto state : {HealthState::Healthy, HealthState::Degraded, HealthState::Down}) {
        if (toString(state) == name) {
            return GatewayResult<HealthState>::ok(state);
        }
    }
    return GatewayResult<HealthState>::err(GatewayError(
        ErrorCode::StoreValueMalformed, "unknown health status: " + std::string(name)));
}

HealthState aggregateStatus(const HealthSnapshot& snapshot) noexcept {
    auto worst = HealthState::Healthy;
    for (const auto& [provider, health] : snapshot) {
        worst = std::max(worst, health.status);
    }
    return worst;
}

std::string encodeHealth(const ProviderHealth& health) {
    YAML::Emitter out;
    out << YAML::Flow << YAML::BeginMap;
    out << YAML::Key << "status" << YAML::Value << std::string(toString(health.status));
    out << YAML::Key << "last_check_ms" << YAML::Value
        << foundation::toUnixMillis(health.lastCheck);
    if (health.responseTime) {
        out << YAML::Key << "response_time_ms" << YAML::Value << health.responseTime->count();
    }
    if (health.errorMessage) {
        out << YAML::Key << "error_message" << YAML::Value << YAML::DoubleQuoted
            << *health.errorMessage;
    }
    out << YAML::EndMap;
    return out.c_str();
}

GatewayResult<ProviderHealth> decodeHealth(std::string_view encoded) {
    auto malformed = [](const std::string& reason) {
        return GatewayResult<ProviderHealth>::err(
            GatewayError(ErrorCode::StoreValueMalformed, "bad health cache entry: " + reason));
    };

    try {
        auto node = YAML::Load(std::string(encoded));
        if (!node.IsMap() || !node["status"] || !node["last_check_ms"]) {
            return malformed("missing status or last_check_ms");
        }

        auto status = parseHealthState(node["status"].as<std::string>());
        if (!status) {
            return malformed(std::string(status.error().message()));
        }

        ProviderHealth health;
        health.status = status.value();
        health.lastCheck = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(node["last_check_ms"].as<int64_t>()));
        if (node["response_time_ms"]) {
            health.responseTime =
                std::chrono::milliseconds(node["response_time_ms"].as<int64_t>());
        }
        if (node["error_message"]) {
            health.errorMessage = node["error_message"].as<std::string>();
        }
        return GatewayResult<ProviderHealth>::ok(std::move(health));
    } catch (const YAML::Exception& e) {
        return malformed(e.what());
    }
}

} // namespace pgw::service
