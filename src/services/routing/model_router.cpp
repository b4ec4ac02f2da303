/// @file model_router.cpp
/// @brief ModelRouter implementation.

#include "pgw/service/model_router.hpp"

#include <unordered_set>

#include "pgw/foundation/gateway_logger.hpp"

namespace pgw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayLogger;
using foundation::GatewayResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

ModelRouter::ModelRouter(const ModelRegistry& registry, const ExecutionModePolicy& policy,
                         CircuitBreakerRegistry& breakers, DeploymentMode deployment)
    : registry_(registry), policy_(policy), breakers_(breakers), deployment_(deployment) {}

GatewayResult<std::vector<std::string>> ModelRouter::rankCandidates(
    ExecutionMode mode, TaskCapability capability) const {
    const auto& preset = policy_.config(mode);

    std::vector<std::string> ranked;
    std::unordered_set<std::string> taken;

    for (const auto& id : preset.preferredModels) {
        auto model = registry_.model(id);
        if (!model) {
            continue;
        }
        const auto& record = model.value();
        if (record.supports(capability) && routable(record) && taken.insert(id).second) {
            ranked.push_back(id);
        }
    }

    for (const auto& record :
         registry_.rankedForCapability(capability, rankingFor(preset.fallbackStrategy))) {
        if (routable(record) && taken.insert(record.id).second) {
            ranked.push_back(record.id);
        }
    }

    if (ranked.empty()) {
        return GatewayResult<std::vector<std::string>>::err(GatewayError(
            ErrorCode::NoCandidates,
            "no " + std::string(toString(deployment_)) + " models registered for capability: " +
                std::string(toString(capability))));
    }
    return GatewayResult<std::vector<std::string>>::ok(std::move(ranked));
}

GatewayResult<RoutingPlan> ModelRouter::plan(ExecutionMode mode, TaskCapability capability) {
    auto ranked = rankCandidates(mode, capability);
    if (!ranked) {
        return GatewayResult<RoutingPlan>::err(ranked.error());
    }

    HealthSnapshot health;
    {
        std::lock_guard lock(healthMutex_);
        health = health_;
    }

    RoutingPlan result;
    std::vector<std::string> degraded;
    for (const auto& id : ranked.value()) {
        auto model = registry_.model(id);
        if (!model) {
            continue;
        }
        const auto& provider = model.value().provider;

        auto it = health.find(provider);
        auto status = it == health.end() ? HealthState::Healthy : it->second.status;

        if (!breakers_.isAvailable(provider) || status == HealthState::Down) {
            result.skipped.push_back(id);
        } else if (status == HealthState::Degraded) {
            degraded.push_back(id);
        } else {
            result.candidates.push_back(id);
        }
    }
    result.candidates.insert(result.candidates.end(), degraded.begin(), degraded.end());

    if (!result.skipped.empty()) {
        LogContext ctx;
        ctx.extra["mode"] = std::string(toString(mode));
        ctx.extra["capability"] = std::string(toString(capability));
        ctx.extra["skipped"] = std::to_string(result.skipped.size());
        GatewayLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Routing,
                                                 "routing around unavailable providers", ctx);
    }
    return GatewayResult<RoutingPlan>::ok(std::move(result));
}

GatewayResult<std::string> ModelRouter::select(ExecutionMode mode, TaskCapability capability) {
    auto planned = plan(mode, capability);
    if (!planned) {
        return GatewayResult<std::string>::err(planned.error());
    }
    const auto& candidates = planned.value().candidates;
    if (candidates.empty()) {
        return GatewayResult<std::string>::err(GatewayError(
            ErrorCode::NoAvailableProvider,
            "every candidate for " + std::string(toString(capability)) + " is unavailable"));
    }
    return GatewayResult<std::string>::ok(candidates.front());
}

void ModelRouter::applyHealth(HealthSnapshot snapshot) {
    std::lock_guard lock(healthMutex_);
    health_ = std::move(snapshot);
}

bool ModelRouter::routable(const ModelRecord& model) const noexcept {
    return model.localOnly ? usesLocal(deployment_) : usesCloud(deployment_);
}

} // namespace pgw::service
