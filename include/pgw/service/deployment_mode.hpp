#pragma once

/// @file deployment_mode.hpp
/// @brief Cloud / local / hybrid provider selection.

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pgw::service {

enum class DeploymentMode : uint8_t { Cloud, Local, Hybrid };

[[nodiscard]] constexpr std::string_view toString(DeploymentMode m) {
    switch (m) {
        case DeploymentMode::Cloud:
            return "cloud";
        case DeploymentMode::Local:
            return "local";
        case DeploymentMode::Hybrid:
            return "hybrid";
    }
    return "unknown";
}

/// Case-insensitive. Unrecognized names fall back to Cloud with a warning.
[[nodiscard]] DeploymentMode parseDeploymentMode(std::string_view name);

/// Providers in priority order for @p mode.
[[nodiscard]] std::vector<std::string> providerPriority(DeploymentMode mode);

/// Whether models that are not local-only may be routed in @p mode.
[[nodiscard]] constexpr bool usesCloud(DeploymentMode mode) noexcept {
    return mode != DeploymentMode::Local;
}

/// Whether local-only models may be routed in @p mode.
[[nodiscard]] constexpr bool usesLocal(DeploymentMode mode) noexcept {
    return mode != DeploymentMode::Cloud;
}

}  // namespace pgw::service
