/// @file execution_mode_test.cpp
/// @brief Unit tests for ExecutionModePolicy and deployment modes.

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "pgw/service/deployment_mode.hpp"
#include "pgw/service/execution_mode.hpp"
#include "pgw/service/model_registry.hpp"

using namespace pgw::service;
using namespace pgw::foundation;
using namespace std::chrono_literals;

// ===========================================================================
// Mode names
// ===========================================================================

TEST(ExecutionModeParseTest, CaseInsensitive) {
    EXPECT_EQ(parseExecutionMode("fast").value(), ExecutionMode::Fast);
    EXPECT_EQ(parseExecutionMode("Balanced").value(), ExecutionMode::Balanced);
    EXPECT_EQ(parseExecutionMode("BEST_QUALITY").value(), ExecutionMode::BestQuality);
}

TEST(ExecutionModeParseTest, UnknownName) {
    auto r = parseExecutionMode("turbo");
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::UnknownExecutionMode);
    EXPECT_EQ(r.error().message(), "unknown execution mode: turbo");

    EXPECT_TRUE(parseExecutionMode("").hasError());
    EXPECT_TRUE(parseExecutionMode("best quality").hasError());
}

TEST(ExecutionModeParseTest, ToString) {
    EXPECT_EQ(toString(ExecutionMode::BestQuality), "best_quality");
    EXPECT_EQ(toString(FallbackStrategy::HighestQuality), "highest_quality");
}

TEST(FallbackStrategyTest, RankingMapping) {
    EXPECT_EQ(rankingFor(FallbackStrategy::Cheapest), ModelRanking::Cost);
    EXPECT_EQ(rankingFor(FallbackStrategy::Automatic), ModelRanking::Latency);
    EXPECT_EQ(rankingFor(FallbackStrategy::HighestQuality), ModelRanking::Quality);
}

// ===========================================================================
// Shipped presets
// ===========================================================================

class ExecutionModePolicyTest : public ::testing::Test {
protected:
    ExecutionModePolicy policy_;
};

TEST_F(ExecutionModePolicyTest, FastPreset) {
    const auto& fast = policy_.config(ExecutionMode::Fast);
    EXPECT_EQ(fast.mode, ExecutionMode::Fast);
    EXPECT_EQ(fast.maxParallelExecutions, 3u);
    EXPECT_EQ(fast.timeout, 30s);
    EXPECT_EQ(fast.maxRetries, 1u);
    EXPECT_FALSE(fast.enableArbitration);
    EXPECT_TRUE(fast.enableSynthesis);
    EXPECT_DOUBLE_EQ(fast.accuracyRequirement, 0.7);
    ASSERT_TRUE(fast.costLimit.has_value());
    EXPECT_DOUBLE_EQ(*fast.costLimit, 1.0);
    EXPECT_EQ(fast.fallbackStrategy, FallbackStrategy::Cheapest);
    EXPECT_EQ(fast.preferredModels.front(), "groq-mixtral-8x7b");
}

TEST_F(ExecutionModePolicyTest, BalancedPreset) {
    EXPECT_EQ(policy_.maxParallelExecutions(ExecutionMode::Balanced), 5u);
    EXPECT_TRUE(policy_.arbitrationEnabled(ExecutionMode::Balanced));
    EXPECT_DOUBLE_EQ(policy_.accuracyRequirement(ExecutionMode::Balanced), 0.8);
    EXPECT_DOUBLE_EQ(policy_.costLimit(ExecutionMode::Balanced).value(), 5.0);
    EXPECT_EQ(policy_.preferredModels(ExecutionMode::Balanced).size(), 4u);
    EXPECT_EQ(policy_.config(ExecutionMode::Balanced).fallbackStrategy,
              FallbackStrategy::Automatic);
}

TEST_F(ExecutionModePolicyTest, BestQualityHasNoCostLimit) {
    EXPECT_FALSE(policy_.costLimit(ExecutionMode::BestQuality).has_value());
    EXPECT_EQ(policy_.maxParallelExecutions(ExecutionMode::BestQuality), 8u);
    EXPECT_EQ(policy_.config(ExecutionMode::BestQuality).timeout, 120s);
    EXPECT_EQ(policy_.config(ExecutionMode::BestQuality).maxRetries, 5u);
    EXPECT_EQ(policy_.preferredModels(ExecutionMode::BestQuality).front(),
              "openrouter-claude-3-sonnet");
}

TEST_F(ExecutionModePolicyTest, MonotonicAcrossModes) {
    auto fast = ExecutionMode::Fast;
    auto balanced = ExecutionMode::Balanced;
    auto best = ExecutionMode::BestQuality;

    EXPECT_LE(policy_.maxParallelExecutions(fast), policy_.maxParallelExecutions(balanced));
    EXPECT_LE(policy_.maxParallelExecutions(balanced), policy_.maxParallelExecutions(best));
    EXPECT_LE(policy_.accuracyRequirement(fast), policy_.accuracyRequirement(balanced));
    EXPECT_LE(policy_.accuracyRequirement(balanced), policy_.accuracyRequirement(best));
    EXPECT_LT(*policy_.costLimit(fast), *policy_.costLimit(balanced));
}

TEST_F(ExecutionModePolicyTest, ConfigByName) {
    auto r = policy_.config("FAST");
    ASSERT_TRUE(r.hasValue());
    EXPECT_EQ(r.value().mode, ExecutionMode::Fast);

    auto bad = policy_.config("slow");
    ASSERT_TRUE(bad.hasError());
    EXPECT_EQ(bad.error().code(), ErrorCode::UnknownExecutionMode);
}

TEST_F(ExecutionModePolicyTest, PreferredModelsExistInBuiltinCatalog) {
    EXPECT_TRUE(policy_.validate(ModelRegistry::builtin()).hasValue());
}

TEST_F(ExecutionModePolicyTest, ValidateReportsUnknownPreferredModel) {
    ModelRecord only;
    only.id = "groq-mixtral-8x7b";
    only.provider = "groq";
    only.capabilities = {TaskCapability::Reasoning};
    only.reliabilityScore = 0.9;
    auto registry = ModelRegistry::create({only});
    ASSERT_TRUE(registry.hasValue());

    auto r = policy_.validate(registry.value());
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::UnknownModel);
    EXPECT_NE(r.error().message().find("huggingface-mistral-7b"), std::string_view::npos);
}

// ===========================================================================
// Custom presets
// ===========================================================================

TEST(ExecutionModePolicyCreateTest, AcceptsShippedPresets) {
    EXPECT_TRUE(ExecutionModePolicy::create(ExecutionModePolicy::defaultPresets()).hasValue());
}

TEST(ExecutionModePolicyCreateTest, AcceptsCustomPreferredModels) {
    auto presets = ExecutionModePolicy::defaultPresets();
    presets[0].preferredModels = {"ollama-mistral"};
    auto policy = ExecutionModePolicy::create(presets);
    ASSERT_TRUE(policy.hasValue());
    EXPECT_EQ(policy.value().preferredModels(ExecutionMode::Fast),
              (std::vector<std::string>{"ollama-mistral"}));
}

TEST(ExecutionModePolicyCreateTest, RejectsDecreasingParallelism) {
    auto presets = ExecutionModePolicy::defaultPresets();
    presets[1].maxParallelExecutions = 2;
    auto r = ExecutionModePolicy::create(presets);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::InvalidPreset);
}

TEST(ExecutionModePolicyCreateTest, RejectsDecreasingAccuracy) {
    auto presets = ExecutionModePolicy::defaultPresets();
    presets[2].accuracyRequirement = 0.5;
    EXPECT_EQ(ExecutionModePolicy::create(presets).error().code(), ErrorCode::InvalidPreset);
}

TEST(ExecutionModePolicyCreateTest, RejectsFastCostNotSmallest) {
    auto presets = ExecutionModePolicy::defaultPresets();
    presets[0].costLimit = 5.0;
    EXPECT_EQ(ExecutionModePolicy::create(presets).error().code(), ErrorCode::InvalidPreset);
}

TEST(ExecutionModePolicyCreateTest, RejectsMisplacedMode) {
    auto presets = ExecutionModePolicy::defaultPresets();
    std::swap(presets[0], presets[1]);
    EXPECT_EQ(ExecutionModePolicy::create(presets).error().code(), ErrorCode::InvalidPreset);
}

// ===========================================================================
// Deployment modes
// ===========================================================================

TEST(DeploymentModeTest, Parse) {
    EXPECT_EQ(parseDeploymentMode("cloud"), DeploymentMode::Cloud);
    EXPECT_EQ(parseDeploymentMode("LOCAL"), DeploymentMode::Local);
    EXPECT_EQ(parseDeploymentMode("Hybrid"), DeploymentMode::Hybrid);
}

TEST(DeploymentModeTest, UnknownFallsBackToCloud) {
    EXPECT_EQ(parseDeploymentMode("edge"), DeploymentMode::Cloud);
    EXPECT_EQ(parseDeploymentMode(""), DeploymentMode::Cloud);
}

TEST(DeploymentModeTest, ProviderPriority) {
    EXPECT_EQ(providerPriority(DeploymentMode::Cloud),
              (std::vector<std::string>{"groq", "together", "openrouter", "huggingface"}));
    EXPECT_EQ(providerPriority(DeploymentMode::Local), (std::vector<std::string>{"ollama"}));
    EXPECT_EQ(providerPriority(DeploymentMode::Hybrid),
              (std::vector<std::string>{"groq", "together", "openrouter", "huggingface",
                                        "ollama"}));
}

TEST(DeploymentModeTest, CloudLocalFlags) {
    static_assert(usesCloud(DeploymentMode::Cloud) && !usesLocal(DeploymentMode::Cloud));
    static_assert(!usesCloud(DeploymentMode::Local) && usesLocal(DeploymentMode::Local));
    static_assert(usesCloud(DeploymentMode::Hybrid) && usesLocal(DeploymentMode::Hybrid));
    EXPECT_EQ(toString(DeploymentMode::Hybrid), "hybrid");
}
