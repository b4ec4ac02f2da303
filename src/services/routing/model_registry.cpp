/// @file model_registry.cpp
/// @brief ModelRegistry implementation and built-in catalog.

#include "pgw/service/model_registry.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iterator>
#include <unordered_set>
#include <utility>

namespace pgw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;

namespace {

constexpr std::array<TaskCapability, 6> kAllCapabilities = {
    TaskCapability::Reasoning,      TaskCapability::Research,
    TaskCapability::CodeGeneration, TaskCapability::Debugging,
    TaskCapability::CreativeOutput, TaskCapability::FactChecking,
};

ModelRecord makeModel(std::string id, std::string provider, std::string remote,
                      std::vector<TaskCapability> caps, double inputCost, double outputCost,
                      int latencyMs, uint32_t context, double reliability,
                      bool localOnly = false) {
    return ModelRecord{
        .id = std::move(id),
        .provider = std::move(provider),
        .remoteModelName = std::move(remote),
        .capabilities = std::move(caps),
        .costPerInputToken = inputCost,
        .costPerOutputToken = outputCost,
        .averageLatency = std::chrono::milliseconds(latencyMs),
        .maxContextTokens = context,
        .reliabilityScore = reliability,
        .localOnly = localOnly,
    };
}

}  // anonymous namespace

GatewayResult<TaskCapability> parseTaskCapability(std::string_view name) {
    for (auto capability : kAllCapabilities) {
        if (toString(capability) == name) {
            return GatewayResult<TaskCapability>::ok(capability);
        }
    }
    return GatewayResult<TaskCapability>::err(GatewayError(
        ErrorCode::InvalidArgument, "unknown task capability: " + std::string(name)));
}

bool ModelRecord::supports(TaskCapability capability) const {
    return std::find(capabilities.begin(), capabilities.end(), capability) !=
           capabilities.end();
}

ModelRegistry::ModelRegistry(std::vector<ModelRecord> models) : models_(std::move(models)) {
    for (std::size_t i = 0; i < models_.size(); ++i) {
        index_.emplace(models_[i].id, i);
    }
}

GatewayResult<ModelRegistry> ModelRegistry::create(std::vector<ModelRecord> models) {
    std::unordered_set<std::string> seen;
    for (const auto& m : models) {
        auto invalid = [&m](std::string reason) {
            return GatewayResult<ModelRegistry>::err(GatewayError(
                ErrorCode::CatalogInvalid, "model '" + m.id + "': " + std::move(reason)));
        };

        if (m.id.empty()) {
            return invalid("empty model id");
        }
        if (!seen.insert(m.id).second) {
            return invalid("duplicate model id");
        }
        if (m.provider.empty()) {
            return invalid("empty provider");
        }
        if (!std::isfinite(m.costPerInputToken) || !std::isfinite(m.costPerOutputToken)) {
            return invalid("non-finite cost");
        }
        if (m.costPerInputToken < 0.0 || m.costPerOutputToken < 0.0) {
            return invalid("negative cost");
        }
        // NaN fails every comparison, so the range test alone would accept it.
        if (!std::isfinite(m.reliabilityScore) || m.reliabilityScore < 0.0 ||
            m.reliabilityScore > 1.0) {
            return invalid("reliability score outside [0, 1]");
        }
        if (m.averageLatency.count() < 0) {
            return invalid("negative average latency");
        }
        if (m.capabilities.empty()) {
            return invalid("no capabilities");
        }
    }
    return GatewayResult<ModelRegistry>::ok(ModelRegistry(std::move(models)));
}

std::vector<ModelRecord> ModelRegistry::builtinModels() {
    using C = TaskCapability;
    return {
        makeModel("groq-llama3-70b", "groq", "llama3-70b-8192",
                  {C::Reasoning, C::Research, C::CodeGeneration}, 0.00000059, 0.00000079, 500,
                  8192, 0.95),
        makeModel("groq-mixtral-8x7b", "groq", "mixtral-8x7b-32768",
                  {C::Reasoning, C::CreativeOutput}, 0.00000027, 0.00000027, 400, 32768, 0.93),
        makeModel("together-mixtral-8x7b", "together", "mistralai/Mixtral-8x7B-Instruct-v0.1",
                  {C::Reasoning, C::CodeGeneration}, 0.0000006, 0.0000006, 1200, 32768, 0.92),
        makeModel("together-llama2-70b", "together", "meta-llama/Llama-2-70b-chat-hf",
                  {C::Research, C::CreativeOutput}, 0.0000009, 0.0000009, 1500, 4096, 0.90),
        makeModel("openrouter-claude-3-sonnet", "openrouter", "anthropic/claude-3-sonnet",
                  {C::Reasoning, C::Research, C::CodeGeneration, C::FactChecking}, 0.000003,
                  0.000015, 2000, 200000, 0.98),
        makeModel("openrouter-gpt4-turbo", "openrouter", "openai/gpt-4-turbo",
                  {C::Reasoning, C::CodeGeneration, C::Debugging}, 0.00001, 0.00003, 3000,
                  128000, 0.97),
        makeModel("huggingface-mistral-7b", "huggingface", "mistralai/Mistral-7B-Instruct-v0.2",
                  {C::Reasoning, C::CreativeOutput}, 0.0000002, 0.0000002, 2500, 32768, 0.85),
        makeModel("ollama-llama2", "ollama", "llama2",
                  {C::Reasoning, C::Research, C::CreativeOutput}, 0.0, 0.0, 3000, 4096, 0.85,
                  true),
        makeModel("ollama-mistral", "ollama", "mistral",
                  {C::Reasoning, C::CodeGeneration, C::CreativeOutput}, 0.0, 0.0, 2500, 8192,
                  0.87, true),
        makeModel("ollama-codellama", "ollama", "codellama", {C::CodeGeneration, C::Debugging},
                  0.0, 0.0, 3500, 4096, 0.83, true),
    };
}

ModelRegistry ModelRegistry::builtin() {
    return ModelRegistry(builtinModels());
}

GatewayResult<ModelRecord> ModelRegistry::model(std::string_view id) const {
    auto it = index_.find(std::string(id));
    if (it == index_.end()) {
        return GatewayResult<ModelRecord>::err(
            GatewayError(ErrorCode::UnknownModel, "unknown model: " + std::string(id)));
    }
    return GatewayResult<ModelRecord>::ok(models_[it->second]);
}

std::vector<std::string> ModelRegistry::modelsForCapability(TaskCapability capability) const {
    std::vector<std::string> ids;
    for (const auto& m : models_) {
        if (m.supports(capability)) {
            ids.push_back(m.id);
        }
    }
    return ids;
}

std::vector<ModelRecord> ModelRegistry::rankedForCapability(TaskCapability capability,
                                                            ModelRanking ranking) const {
    std::vector<ModelRecord> out;
    std::copy_if(models_.begin(), models_.end(), std::back_inserter(out),
                 [capability](const ModelRecord& m) { return m.supports(capability); });

    switch (ranking) {
        case ModelRanking::CatalogOrder:
            break;
        case ModelRanking::Cost:
            std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
                return a.combinedCost() < b.combinedCost();
            });
            break;
        case ModelRanking::Latency:
            std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
                return a.averageLatency < b.averageLatency;
            });
            break;
        case ModelRanking::Quality:
            std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
                return a.reliabilityScore > b.reliabilityScore;
            });
            break;
    }
    return out;
}

GatewayResult<std::string> ModelRegistry::cheapestForCapability(TaskCapability capability) const {
    return firstRanked(capability, ModelRanking::Cost);
}

GatewayResult<std::string> ModelRegistry::fastestForCapability(TaskCapability capability) const {
    return firstRanked(capability, ModelRanking::Latency);
}

GatewayResult<std::string> ModelRegistry::bestQualityForCapability(
    TaskCapability capability) const {
    return firstRanked(capability, ModelRanking::Quality);
}

std::vector<std::string> ModelRegistry::cloudModels() const {
    std::vector<std::string> ids;
    for (const auto& m : models_) {
        if (!m.localOnly) {
            ids.push_back(m.id);
        }
    }
    return ids;
}

std::vector<std::string> ModelRegistry::localModels() const {
    std::vector<std::string> ids;
    for (const auto& m : models_) {
        if (m.localOnly) {
            ids.push_back(m.id);
        }
    }
    return ids;
}

bool ModelRegistry::isLocalModel(std::string_view id) const {
    auto it = index_.find(std::string(id));
    return it != index_.end() && models_[it->second].localOnly;
}

std::vector<std::string> ModelRegistry::providers() const {
    std::vector<std::string> out;
    for (const auto& m : models_) {
        if (std::find(out.begin(), out.end(), m.provider) == out.end()) {
            out.push_back(m.provider);
        }
    }
    return out;
}

GatewayResult<std::string> ModelRegistry::firstRanked(TaskCapability capability,
                                                      ModelRanking ranking) const {
    auto ranked = rankedForCapability(capability, ranking);
    if (ranked.empty()) {
        return GatewayResult<std::string>::err(
            GatewayError(ErrorCode::NoCandidates, "no models registered for capability: " +
                                                      std::string(toString(capability))));
    }
    return GatewayResult<std::string>::ok(ranked.front().id);
}

} // namespace pgw::service
