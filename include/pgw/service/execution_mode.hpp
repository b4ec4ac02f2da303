#pragma once

/// @file execution_mode.hpp
/// @brief Named cost/quality presets consumed by orchestration and routing.

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pgw/foundation/gateway_result.hpp"
#include "pgw/service/model_registry.hpp"

namespace pgw::service {

enum class ExecutionMode : uint8_t { Fast, Balanced, BestQuality };

[[nodiscard]] constexpr std::string_view toString(ExecutionMode m) {
    switch (m) {
        case ExecutionMode::Fast:
            return "fast";
        case ExecutionMode::Balanced:
            return "balanced";
        case ExecutionMode::BestQuality:
            return "best_quality";
    }
    return "unknown";
}

/// Case-insensitive; UnknownExecutionMode for anything but the three names.
[[nodiscard]] foundation::GatewayResult<ExecutionMode> parseExecutionMode(std::string_view name);

/// How candidates beyond the preferred list are ordered.
enum class FallbackStrategy : uint8_t {
    Cheapest,       ///< Ascending combined cost.
    Automatic,      ///< Ascending average latency.
    HighestQuality  ///< Descending reliability.
};

[[nodiscard]] constexpr std::string_view toString(FallbackStrategy s) {
    switch (s) {
        case FallbackStrategy::Cheapest:
            return "cheapest";
        case FallbackStrategy::Automatic:
            return "automatic";
        case FallbackStrategy::HighestQuality:
            return "highest_quality";
    }
    return "unknown";
}

/// Ranking used by the router for a fallback strategy.
[[nodiscard]] ModelRanking rankingFor(FallbackStrategy strategy) noexcept;

/// Immutable preset for one execution mode.
struct ExecutionModeConfig {
    ExecutionMode mode{ExecutionMode::Balanced};
    uint32_t maxParallelExecutions{0};
    std::chrono::seconds timeout{0};
    uint32_t maxRetries{0};
    bool enableArbitration{false};
    bool enableSynthesis{false};
    double accuracyRequirement{0.0};
    /// nullopt means no cost ceiling.
    std::optional<double> costLimit;
    std::vector<std::string> preferredModels;
    FallbackStrategy fallbackStrategy{FallbackStrategy::Automatic};
};

/// Lookup from mode to its preset. Pure data, no I/O.
///
/// The presets are validated on construction: parallelism and accuracy
/// must not decrease from fast to balanced to best_quality, and fast's
/// cost limit must be strictly the smallest set limit.
class ExecutionModePolicy {
public:
    /// Policy over the shipped presets.
    ExecutionModePolicy();

    /// Policy over custom presets, indexed by ExecutionMode.
    /// @return InvalidPreset when an entry's mode does not match its slot
    ///         or the ordering constraints do not hold.
    [[nodiscard]] static foundation::GatewayResult<ExecutionModePolicy> create(
        std::array<ExecutionModeConfig, 3> presets);

    /// The presets shipped with the gateway.
    [[nodiscard]] static std::array<ExecutionModeConfig, 3> defaultPresets();

    [[nodiscard]] const ExecutionModeConfig& config(ExecutionMode mode) const;

    /// Config by name; UnknownExecutionMode for unrecognized names.
    [[nodiscard]] foundation::GatewayResult<ExecutionModeConfig> config(
        std::string_view name) const;

    [[nodiscard]] const std::vector<std::string>& preferredModels(ExecutionMode mode) const;
    [[nodiscard]] std::optional<double> costLimit(ExecutionMode mode) const;
    [[nodiscard]] bool arbitrationEnabled(ExecutionMode mode) const;
    [[nodiscard]] uint32_t maxParallelExecutions(ExecutionMode mode) const;
    [[nodiscard]] double accuracyRequirement(ExecutionMode mode) const;

    /// UnknownModel when a preset prefers a model absent from @p registry.
    [[nodiscard]] foundation::GatewayResult<void> validate(const ModelRegistry& registry) const;

private:
    explicit ExecutionModePolicy(std::array<ExecutionModeConfig, 3> presets);

    static foundation::GatewayResult<void> checkOrdering(
        const std::array<ExecutionModeConfig, 3>& presets);

    std::array<ExecutionModeConfig, 3> presets_;
};

}  // namespace pgw::service
