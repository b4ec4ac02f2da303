/// @file model_router_test.cpp
/// @brief Unit tests for ModelRouter candidate ranking and selection.

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "pgw/foundation/clock.hpp"
#include "pgw/service/circuit_breaker_registry.hpp"
#include "pgw/service/execution_mode.hpp"
#include "pgw/service/model_registry.hpp"
#include "pgw/service/model_router.hpp"
#include "pgw/service/provider_health.hpp"

using namespace pgw::service;
using namespace pgw::foundation;

using Ids = std::vector<std::string>;

class ModelRouterTest : public ::testing::Test {
protected:
    void openBreaker(std::string_view provider) {
        for (uint32_t i = 0; i < breakers_.config().failureThreshold; ++i) {
            breakers_.recordFailure(provider);
        }
    }

    static ProviderHealth health(HealthState state) {
        ProviderHealth h;
        h.status = state;
        h.lastCheck = std::chrono::system_clock::time_point(std::chrono::seconds(1767225600));
        return h;
    }

    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    ModelRegistry registry_ = ModelRegistry::builtin();
    ExecutionModePolicy policy_;
    CircuitBreakerRegistry breakers_{CircuitBreakerConfig{}, clock_};
    ModelRouter router_{registry_, policy_, breakers_, DeploymentMode::Cloud};
};

// ===========================================================================
// Ranking
// ===========================================================================

TEST_F(ModelRouterTest, PreferredFirstThenCheapestForFast) {
    auto ranked = router_.rankCandidates(ExecutionMode::Fast, TaskCapability::Reasoning);
    ASSERT_TRUE(ranked.hasValue());
    EXPECT_EQ(ranked.value(),
              (Ids{"groq-mixtral-8x7b", "huggingface-mistral-7b", "together-mixtral-8x7b",
                   "groq-llama3-70b", "openrouter-claude-3-sonnet", "openrouter-gpt4-turbo"}));
}

TEST_F(ModelRouterTest, PreferredSkipsModelsLackingCapability) {
    auto ranked = router_.rankCandidates(ExecutionMode::Balanced, TaskCapability::CodeGeneration);
    ASSERT_TRUE(ranked.hasValue());
    EXPECT_EQ(ranked.value(), (Ids{"groq-llama3-70b", "together-mixtral-8x7b",
                                   "openrouter-claude-3-sonnet", "openrouter-gpt4-turbo"}));
}

TEST_F(ModelRouterTest, BestQualityDebuggingInCloud) {
    auto ranked = router_.rankCandidates(ExecutionMode::BestQuality, TaskCapability::Debugging);
    ASSERT_TRUE(ranked.hasValue());
    EXPECT_EQ(ranked.value(), (Ids{"openrouter-gpt4-turbo"}));
}

TEST_F(ModelRouterTest, LocalDeploymentOnlyRoutesLocalModels) {
    ModelRouter local(registry_, policy_, breakers_, DeploymentMode::Local);
    auto ranked = local.rankCandidates(ExecutionMode::Fast, TaskCapability::Reasoning);
    ASSERT_TRUE(ranked.hasValue());
    EXPECT_EQ(ranked.value(), (Ids{"ollama-llama2", "ollama-mistral"}));
    EXPECT_EQ(local.deploymentMode(), DeploymentMode::Local);
}

TEST_F(ModelRouterTest, HybridAppendsLocalModels) {
    ModelRouter hybrid(registry_, policy_, breakers_, DeploymentMode::Hybrid);
    auto ranked = hybrid.rankCandidates(ExecutionMode::Fast, TaskCapability::Reasoning);
    ASSERT_TRUE(ranked.hasValue());
    EXPECT_EQ(ranked.value(),
              (Ids{"groq-mixtral-8x7b", "huggingface-mistral-7b", "together-mixtral-8x7b",
                   "ollama-llama2", "ollama-mistral", "groq-llama3-70b",
                   "openrouter-claude-3-sonnet", "openrouter-gpt4-turbo"}));
}

TEST_F(ModelRouterTest, NoCandidatesWhenDeploymentExcludesAll) {
    ModelRouter local(registry_, policy_, breakers_, DeploymentMode::Local);
    auto ranked = local.rankCandidates(ExecutionMode::Balanced, TaskCapability::FactChecking);
    ASSERT_TRUE(ranked.hasError());
    EXPECT_EQ(ranked.error().code(), ErrorCode::NoCandidates);

    auto selected = local.select(ExecutionMode::Balanced, TaskCapability::FactChecking);
    ASSERT_TRUE(selected.hasError());
    EXPECT_EQ(selected.error().code(), ErrorCode::NoCandidates);
}

// ===========================================================================
// Planning around breakers and health
// ===========================================================================

TEST_F(ModelRouterTest, SelectReturnsFirstCandidate) {
    auto selected = router_.select(ExecutionMode::Fast, TaskCapability::Reasoning);
    ASSERT_TRUE(selected.hasValue());
    EXPECT_EQ(selected.value(), "groq-mixtral-8x7b");
}

TEST_F(ModelRouterTest, OpenBreakerSkipsProvider) {
    openBreaker("groq");

    auto planned = router_.plan(ExecutionMode::Fast, TaskCapability::Reasoning);
    ASSERT_TRUE(planned.hasValue());
    EXPECT_EQ(planned.value().candidates,
              (Ids{"huggingface-mistral-7b", "together-mixtral-8x7b",
                   "openrouter-claude-3-sonnet", "openrouter-gpt4-turbo"}));
    EXPECT_EQ(planned.value().skipped, (Ids{"groq-mixtral-8x7b", "groq-llama3-70b"}));

    EXPECT_EQ(router_.select(ExecutionMode::Fast, TaskCapability::Reasoning).value(),
              "huggingface-mistral-7b");
}

TEST_F(ModelRouterTest, HalfOpenProviderIsRoutable) {
    openBreaker("groq");
    clock_->advance(std::chrono::seconds(60));
    EXPECT_EQ(router_.select(ExecutionMode::Fast, TaskCapability::Reasoning).value(),
              "groq-mixtral-8x7b");
}

TEST_F(ModelRouterTest, DownProviderSkippedAndDegradedDemoted) {
    router_.applyHealth({
        {"groq", health(HealthState::Down)},
        {"huggingface", health(HealthState::Degraded)},
        {"together", health(HealthState::Healthy)},
    });

    auto planned = router_.plan(ExecutionMode::Fast, TaskCapability::Reasoning);
    ASSERT_TRUE(planned.hasValue());
    EXPECT_EQ(planned.value().candidates,
              (Ids{"together-mixtral-8x7b", "openrouter-claude-3-sonnet",
                   "openrouter-gpt4-turbo", "huggingface-mistral-7b"}));
    EXPECT_EQ(planned.value().skipped, (Ids{"groq-mixtral-8x7b", "groq-llama3-70b"}));
}

TEST_F(ModelRouterTest, ProvidersMissingFromSnapshotCountAsHealthy) {
    router_.applyHealth({{"openrouter", health(HealthState::Down)}});
    auto planned = router_.plan(ExecutionMode::Fast, TaskCapability::Reasoning);
    ASSERT_TRUE(planned.hasValue());
    EXPECT_EQ(planned.value().candidates.front(), "groq-mixtral-8x7b");
    EXPECT_EQ(planned.value().skipped,
              (Ids{"openrouter-claude-3-sonnet", "openrouter-gpt4-turbo"}));
}

TEST_F(ModelRouterTest, NoAvailableProviderWhenEverythingSkipped) {
    openBreaker("openrouter");
    auto selected = router_.select(ExecutionMode::BestQuality, TaskCapability::Debugging);
    ASSERT_TRUE(selected.hasError());
    EXPECT_EQ(selected.error().code(), ErrorCode::NoAvailableProvider);
}

TEST_F(ModelRouterTest, ApplyHealthReplacesPreviousSnapshot) {
    router_.applyHealth({{"groq", health(HealthState::Down)}});
    router_.applyHealth({});
    EXPECT_EQ(router_.select(ExecutionMode::Fast, TaskCapability::Reasoning).value(),
              "groq-mixtral-8x7b");
}
