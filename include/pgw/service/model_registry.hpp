#pragma once

/// @file model_registry.hpp
/// @brief Read-only model catalog with capability, cost, latency and
///        quality queries.

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "pgw/foundation/gateway_result.hpp"

namespace pgw::service {

/// Kind of task a model can serve.
enum class TaskCapability : uint8_t {
    Reasoning,
    Research,
    CodeGeneration,
    Debugging,
    CreativeOutput,
    FactChecking
};

[[nodiscard]] constexpr std::string_view toString(TaskCapability c) {
    switch (c) {
        case TaskCapability::Reasoning:
            return "reasoning";
        case TaskCapability::Research:
            return "research";
        case TaskCapability::CodeGeneration:
            return "code_generation";
        case TaskCapability::Debugging:
            return "debugging";
        case TaskCapability::CreativeOutput:
            return "creative_output";
        case TaskCapability::FactChecking:
            return "fact_checking";
    }
    return "unknown";
}

/// Parse a snake_case capability name ("code_generation").
[[nodiscard]] foundation::GatewayResult<TaskCapability> parseTaskCapability(
    std::string_view name);

/// Static description of one callable model.
struct ModelRecord {
    std::string id;
    std::string provider;
    std::string remoteModelName;
    std::vector<TaskCapability> capabilities;
    double costPerInputToken{0.0};
    double costPerOutputToken{0.0};
    std::chrono::milliseconds averageLatency{0};
    uint32_t maxContextTokens{0};
    double reliabilityScore{0.0};
    bool localOnly{false};

    [[nodiscard]] bool supports(TaskCapability capability) const;

    /// Input plus output cost per token, the cost used for ranking.
    [[nodiscard]] double combinedCost() const noexcept {
        return costPerInputToken + costPerOutputToken;
    }
};

/// Ordering applied by rankedForCapability().
enum class ModelRanking : uint8_t {
    CatalogOrder,
    Cost,     ///< Ascending combined cost.
    Latency,  ///< Ascending average latency.
    Quality   ///< Descending reliability score.
};

/// Immutable catalog keyed by model id.
///
/// Every capability query returns only models whose capability set
/// contains the queried capability. Rankings are stable, so ties keep
/// catalog order.
class ModelRegistry {
public:
    /// Validate and build a registry.
    /// @return CatalogInvalid when an id repeats, a provider is empty, a
    ///         cost is negative, a reliability lies outside [0, 1] or a
    ///         model declares no capabilities.
    [[nodiscard]] static foundation::GatewayResult<ModelRegistry> create(
        std::vector<ModelRecord> models);

    /// The ten-model catalog shipped with the gateway.
    [[nodiscard]] static ModelRegistry builtin();

    /// Built-in records, in catalog order.
    [[nodiscard]] static std::vector<ModelRecord> builtinModels();

    [[nodiscard]] foundation::GatewayResult<ModelRecord> model(std::string_view id) const;

    [[nodiscard]] const std::vector<ModelRecord>& models() const noexcept { return models_; }

    /// Ids of every model supporting @p capability, in catalog order.
    [[nodiscard]] std::vector<std::string> modelsForCapability(TaskCapability capability) const;

    /// Models supporting @p capability, ordered by @p ranking.
    [[nodiscard]] std::vector<ModelRecord> rankedForCapability(TaskCapability capability,
                                                               ModelRanking ranking) const;

    /// Minimum combined cost; NoCandidates when nothing supports @p capability.
    [[nodiscard]] foundation::GatewayResult<std::string> cheapestForCapability(
        TaskCapability capability) const;

    /// Minimum average latency.
    [[nodiscard]] foundation::GatewayResult<std::string> fastestForCapability(
        TaskCapability capability) const;

    /// Maximum reliability score.
    [[nodiscard]] foundation::GatewayResult<std::string> bestQualityForCapability(
        TaskCapability capability) const;

    [[nodiscard]] std::vector<std::string> cloudModels() const;
    [[nodiscard]] std::vector<std::string> localModels() const;

    /// False for unknown ids.
    [[nodiscard]] bool isLocalModel(std::string_view id) const;

    /// Distinct providers in order of first appearance.
    [[nodiscard]] std::vector<std::string> providers() const;

private:
    explicit ModelRegistry(std::vector<ModelRecord> models);

    foundation::GatewayResult<std::string> firstRanked(TaskCapability capability,
                                                       ModelRanking ranking) const;

    std::vector<ModelRecord> models_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace pgw::service
