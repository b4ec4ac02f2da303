#pragma once

/// @file model_router.hpp
/// @brief Candidate ranking and breaker/health-aware model selection.

#include <mutex>
#include <string>
#include <vector>

#include "pgw/foundation/gateway_result.hpp"
#include "pgw/service/circuit_breaker_registry.hpp"
#include "pgw/service/deployment_mode.hpp"
#include "pgw/service/execution_mode.hpp"
#include "pgw/service/model_registry.hpp"
#include "pgw/service/provider_health.hpp"

namespace pgw::service {

/// Dispatch order for one request.
struct RoutingPlan {
    /// Eligible model ids, best first.
    std::vector<std::string> candidates;
    /// Ranked ids dropped because their provider's breaker is open or
    /// its health is down.
    std::vector<std::string> skipped;
};

/// Composes the execution mode policy, model registry, circuit breakers
/// and the latest health snapshot into a dispatch order.
///
/// The registry, policy and breakers must outlive the router.
///
/// Example:
/// @code
///   ModelRouter router(registry, policy, breakers, DeploymentMode::Cloud);
///   auto model = router.select(ExecutionMode::Fast, TaskCapability::Reasoning);
///   if (!model) {
///       // NoCandidates or NoAvailableProvider
///   }
/// @endcode
class ModelRouter {
public:
    ModelRouter(const ModelRegistry& registry, const ExecutionModePolicy& policy,
                CircuitBreakerRegistry& breakers,
                DeploymentMode deployment = DeploymentMode::Cloud);

    /// Preferred models that support @p capability in preference order,
    /// then the remaining capable models ordered by the mode's fallback
    /// strategy, restricted to the deployment mode.
    /// @return NoCandidates when no routable model supports @p capability.
    [[nodiscard]] foundation::GatewayResult<std::vector<std::string>> rankCandidates(
        ExecutionMode mode, TaskCapability capability) const;

    /// rankCandidates() minus providers whose breaker is open or whose
    /// health is down; degraded providers move after the others.
    [[nodiscard]] foundation::GatewayResult<RoutingPlan> plan(ExecutionMode mode,
                                                              TaskCapability capability);

    /// First planned candidate.
    /// @return NoCandidates, or NoAvailableProvider when every candidate
    ///         was skipped.
    [[nodiscard]] foundation::GatewayResult<std::string> select(ExecutionMode mode,
                                                                TaskCapability capability);

    /// Replace the health view used by plan().
    void applyHealth(HealthSnapshot snapshot);

    [[nodiscard]] DeploymentMode deploymentMode() const noexcept { return deployment_; }

private:
    [[nodiscard]] bool routable(const ModelRecord& model) const noexcept;

    const ModelRegistry& registry_;
    const ExecutionModePolicy& policy_;
    CircuitBreakerRegistry& breakers_;
    DeploymentMode deployment_;

    mutable std::mutex healthMutex_;
    HealthSnapshot health_;
};

}  // namespace pgw::service
