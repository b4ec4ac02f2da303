/// @file execution_mode.cpp
/// @brief ExecutionModePolicy presets and validation.

#include "pgw/service/execution_mode.hpp"

#include <algorithm>
#include <cctype>

namespace pgw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;

namespace {

std::size_t slot(ExecutionMode mode) {
    return static_cast<std::size_t>(mode);
}

}  // anonymous namespace

GatewayResult<ExecutionMode> parseExecutionMode(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (auto mode : {ExecutionMode::Fast, ExecutionMode::Balanced, ExecutionMode::BestQuality}) {
        if (toString(mode) == lowered) {
            return GatewayResult<ExecutionMode>::ok(mode);
        }
    }
    return GatewayResult<ExecutionMode>::err(GatewayError(
        ErrorCode::UnknownExecutionMode, "unknown execution mode: " + std::string(name)));
}

ModelRanking rankingFor(FallbackStrategy strategy) noexcept {
    switch (strategy) {
        case FallbackStrategy::Cheapest:
            return ModelRanking::Cost;
        case FallbackStrategy::Automatic:
            return ModelRanking::Latency;
        case FallbackStrategy::HighestQuality:
            return ModelRanking::Quality;
    }
    return ModelRanking::CatalogOrder;
}

std::array<ExecutionModeConfig, 3> ExecutionModePolicy::defaultPresets() {
    return {
        ExecutionModeConfig{
            .mode = ExecutionMode::Fast,
            .maxParallelExecutions = 3,
            .timeout = std::chrono::seconds(30),
            .maxRetries = 1,
            .enableArbitration = false,
            .enableSynthesis = true,
            .accuracyRequirement = 0.7,
            .costLimit = 1.0,
            .preferredModels = {"groq-mixtral-8x7b", "huggingface-mistral-7b",
                                "together-mixtral-8x7b"},
            .fallbackStrategy = FallbackStrategy::Cheapest,
        },
        ExecutionModeConfig{
            .mode = ExecutionMode::Balanced,
            .maxParallelExecutions = 5,
            .timeout = std::chrono::seconds(60),
            .maxRetries = 3,
            .enableArbitration = true,
            .enableSynthesis = true,
            .accuracyRequirement = 0.8,
            .costLimit = 5.0,
            .preferredModels = {"groq-llama3-70b", "together-mixtral-8x7b", "groq-mixtral-8x7b",
                                "together-llama2-70b"},
            .fallbackStrategy = FallbackStrategy::Automatic,
        },
        ExecutionModeConfig{
            .mode = ExecutionMode::BestQuality,
            .maxParallelExecutions = 8,
            .timeout = std::chrono::seconds(120),
            .maxRetries = 5,
            .enableArbitration = true,
            .enableSynthesis = true,
            .accuracyRequirement = 0.95,
            .costLimit = std::nullopt,
            .preferredModels = {"openrouter-claude-3-sonnet", "openrouter-gpt4-turbo",
                                "groq-llama3-70b", "together-llama2-70b"},
            .fallbackStrategy = FallbackStrategy::HighestQuality,
        },
    };
}

ExecutionModePolicy::ExecutionModePolicy() : presets_(defaultPresets()) {}

ExecutionModePolicy::ExecutionModePolicy(std::array<ExecutionModeConfig, 3> presets)
    : presets_(std::move(presets)) {}

GatewayResult<ExecutionModePolicy> ExecutionModePolicy::create(
    std::array<ExecutionModeConfig, 3> presets) {
    auto checked = checkOrdering(presets);
    if (!checked) {
        return GatewayResult<ExecutionModePolicy>::err(checked.error());
    }
    return GatewayResult<ExecutionModePolicy>::ok(ExecutionModePolicy(std::move(presets)));
}

GatewayResult<void> ExecutionModePolicy::checkOrdering(
    const std::array<ExecutionModeConfig, 3>& presets) {
    auto invalid = [](std::string reason) {
        return GatewayResult<void>::err(GatewayError(ErrorCode::InvalidPreset, std::move(reason)));
    };

    for (auto mode : {ExecutionMode::Fast, ExecutionMode::Balanced, ExecutionMode::BestQuality}) {
        if (presets[slot(mode)].mode != mode) {
            return invalid("preset slot for " + std::string(toString(mode)) +
                           " holds another mode");
        }
    }

    const auto& fast = presets[slot(ExecutionMode::Fast)];
    const auto& balanced = presets[slot(ExecutionMode::Balanced)];
    const auto& best = presets[slot(ExecutionMode::BestQuality)];

    if (fast.maxParallelExecutions > balanced.maxParallelExecutions ||
        balanced.maxParallelExecutions > best.maxParallelExecutions) {
        return invalid("max_parallel_executions must not decrease fast -> best_quality");
    }
    if (fast.accuracyRequirement > balanced.accuracyRequirement ||
        balanced.accuracyRequirement > best.accuracyRequirement) {
        return invalid("accuracy_requirement must not decrease fast -> best_quality");
    }
    if (fast.costLimit) {
        for (const auto* other : {&balanced, &best}) {
            if (other->costLimit && *fast.costLimit >= *other->costLimit) {
                return invalid("fast cost_limit must be strictly the smallest");
            }
        }
    }
    if (balanced.costLimit && best.costLimit && *balanced.costLimit > *best.costLimit) {
        return invalid("cost_limit must not decrease balanced -> best_quality");
    }
    return GatewayResult<void>::ok();
}

const ExecutionModeConfig& ExecutionModePolicy::config(ExecutionMode mode) const {
    return presets_[slot(mode)];
}

GatewayResult<ExecutionModeConfig> ExecutionModePolicy::config(std::string_view name) const {
    auto mode = parseExecutionMode(name);
    if (!mode) {
        return GatewayResult<ExecutionModeConfig>::err(mode.error());
    }
    return GatewayResult<ExecutionModeConfig>::ok(config(mode.value()));
}

const std::vector<std::string>& ExecutionModePolicy::preferredModels(ExecutionMode mode) const {
    return config(mode).preferredModels;
}

std::optional<double> ExecutionModePolicy::costLimit(ExecutionMode mode) const {
    return config(mode).costLimit;
}

bool ExecutionModePolicy::arbitrationEnabled(ExecutionMode mode) const {
    return config(mode).enableArbitration;
}

uint32_t ExecutionModePolicy::maxParallelExecutions(ExecutionMode mode) const {
    return config(mode).maxParallelExecutions;
}

double ExecutionModePolicy::accuracyRequirement(ExecutionMode mode) const {
    return config(mode).accuracyRequirement;
}

GatewayResult<void> ExecutionModePolicy::validate(const ModelRegistry& registry) const {
    for (const auto& preset : presets_) {
        for (const auto& id : preset.preferredModels) {
            if (!registry.model(id)) {
                return GatewayResult<void>::err(GatewayError(
                    ErrorCode::UnknownModel, "execution mode " +
                                                 std::string(toString(preset.mode)) +
                                                 " prefers unknown model: " + id));
            }
        }
    }
    return GatewayResult<void>::ok();
}

} // namespace pgw::service
