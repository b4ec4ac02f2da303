/// @file service_runner_test.cpp
/// @brief Unit tests for shutdown hooks, CLI/config loading and the
///        gateway config builders.

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "pgw/foundation/clock.hpp"
#include "pgw/foundation/config_manager.hpp"
#include "pgw/service/circuit_breaker.hpp"
#include "pgw/service/gateway_config.hpp"
#include "pgw/service/service_runner.hpp"

using namespace pgw::service;
using namespace pgw::foundation;
using namespace std::chrono_literals;

namespace {

class TempConfigFile {
public:
    TempConfigFile(const std::string& name, const std::string& content)
        : path_(std::filesystem::temp_directory_path() / ("pgw_runner_" + name + ".yaml")) {
        std::ofstream out(path_);
        out << content;
    }
    ~TempConfigFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempConfigFile(const TempConfigFile&) = delete;
    TempConfigFile& operator=(const TempConfigFile&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

void loadYaml(ConfigManager& config, const std::string& yaml) {
    auto loaded = config.loadFromString(yaml);
    ASSERT_TRUE(loaded.hasValue()) << loaded.error().message();
}

}  // namespace

// ===========================================================================
// GracefulShutdown
// ===========================================================================

TEST(GracefulShutdownTest, HooksRunInRegistrationOrder) {
    GracefulShutdown shutdown;
    std::vector<std::string> order;
    shutdown.addHook("status", [&] { order.push_back("status"); });
    shutdown.addHook("scheduler", [&] { order.push_back("scheduler"); });
    shutdown.addHook("logger", [&] { order.push_back("logger"); });

    EXPECT_EQ(shutdown.hookCount(), 3u);
    shutdown.execute();
    EXPECT_EQ(order, (std::vector<std::string>{"status", "scheduler", "logger"}));
}

TEST(GracefulShutdownTest, ThrowingHookDoesNotStopOthers) {
    GracefulShutdown shutdown;
    int ran = 0;
    shutdown.addHook("first", [&] { ++ran; });
    shutdown.addHook("broken", [] { throw std::runtime_error("flush failed"); });
    shutdown.addHook("last", [&] { ++ran; });

    EXPECT_NO_THROW(shutdown.execute());
    EXPECT_EQ(ran, 2);
}

TEST(GracefulShutdownTest, EmptyAndZeroDrainTimeout) {
    GracefulShutdown shutdown;
    EXPECT_EQ(shutdown.hookCount(), 0u);
    EXPECT_NO_THROW(shutdown.execute());

    bool ran = false;
    shutdown.setDrainTimeout(0s);
    shutdown.addHook("late", [&] { ran = true; });
    shutdown.execute();
    EXPECT_TRUE(ran);
}

TEST(SignalHandlerTest, NoShutdownBeforeSignal) {
    SignalHandler signals;
    EXPECT_FALSE(signals.shutdownRequested());
    EXPECT_FALSE(signals.waitFor(10ms));
}

// ===========================================================================
// CLI and file loading
// ===========================================================================

TEST(ParseConfigArgTest, FindsConfigFlag) {
    std::string prog = "pgw_gateway";
    std::string flag = "--config";
    std::string path = "/etc/pgw/gateway.yaml";
    std::vector<char*> argv{prog.data(), flag.data(), path.data()};

    EXPECT_EQ(parseConfigArg(static_cast<int>(argv.size()), argv.data()),
              std::filesystem::path("/etc/pgw/gateway.yaml"));
}

TEST(ParseConfigArgTest, MissingOrDanglingFlag) {
    std::string prog = "pgw_gateway";
    std::string flag = "--config";
    std::vector<char*> bare{prog.data()};
    std::vector<char*> dangling{prog.data(), flag.data()};

    EXPECT_TRUE(parseConfigArg(static_cast<int>(bare.size()), bare.data()).empty());
    EXPECT_TRUE(parseConfigArg(static_cast<int>(dangling.size()), dangling.data()).empty());
}

TEST(LoadConfigTest, LoadsDefaultPath) {
    TempConfigFile file("load", "status:\n  port: 9200\n");
    unsetenv("PGW_CONFIG_PATH");

    ConfigManager config;
    auto r = loadConfig(config, file.path());
    ASSERT_TRUE(r.hasValue()) << r.error().message();
    EXPECT_EQ(config.get<int>("status.port").value(), 9200);
}

TEST(LoadConfigTest, EnvironmentOverridesDefaultPath) {
    TempConfigFile file("env", "deployment:\n  mode: hybrid\n");
    setenv("PGW_CONFIG_PATH", file.path().c_str(), 1);

    ConfigManager config;
    auto r = loadConfig(config, "/nonexistent/gateway.yaml");
    unsetenv("PGW_CONFIG_PATH");

    ASSERT_TRUE(r.hasValue()) << r.error().message();
    EXPECT_EQ(buildDeploymentMode(config), DeploymentMode::Hybrid);
}

TEST(LoadConfigTest, MissingFileFails) {
    unsetenv("PGW_CONFIG_PATH");
    ConfigManager config;
    auto r = loadConfig(config, "/nonexistent/gateway.yaml");
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::ConfigLoadFailed);
}

// ===========================================================================
// Config builders
// ===========================================================================

TEST(GatewayConfigTest, DefaultsWhenKeysAbsent) {
    ConfigManager config;

    auto breaker = buildCircuitBreakerConfig(config);
    EXPECT_EQ(breaker.failureThreshold, 5u);
    EXPECT_EQ(breaker.recoveryTimeout, 60s);
    EXPECT_EQ(breaker.maxRecoveryTimeout, 300s);
    EXPECT_EQ(breaker.successThreshold, 2u);

    auto quota = buildRateLimitConfig(config);
    EXPECT_EQ(quota.authenticatedLimit, 100);
    EXPECT_EQ(quota.demoLimit, 3);
    EXPECT_EQ(quota.adminLimit, 1000);
    EXPECT_EQ(quota.window, 3600s);

    auto endpoints = buildProbeEndpoints(config);
    EXPECT_EQ(endpoints, defaultProbeEndpoints());

    auto health = buildHealthCheckConfig(config, endpoints);
    EXPECT_EQ(health.cacheTtl, 60s);
    EXPECT_EQ(health.probeTimeout, 5000ms);
    EXPECT_EQ(health.providers,
              (std::vector<std::string>{"groq", "huggingface", "openrouter", "together"}));

    EXPECT_EQ(healthCheckInterval(config), 30s);

    auto status = buildStatusServerConfig(config);
    EXPECT_EQ(status.port, 9100);
    EXPECT_EQ(status.serviceName, "pgw");

    EXPECT_EQ(buildDeploymentMode(config), DeploymentMode::Cloud);
    EXPECT_FALSE(modelCatalogPath(config).has_value());
}

TEST(GatewayConfigTest, OverridesFromYaml) {
    ConfigManager config;
    loadYaml(config, R"(
circuit_breaker:
  failure_threshold: 3
  recovery_timeout_seconds: 10
  max_recovery_timeout_seconds: 40
  success_threshold: 1
rate_limit:
  authenticated: 50
  demo: 1
  admin: 500
  window_seconds: 60
health:
  cache_ttl_seconds: 15
  probe_timeout_ms: 250
  check_interval_seconds: 5
  endpoints:
    ollama: http://localhost:11434/api/tags
    groq: https://api.groq.com/openai/v1/models
status:
  port: 9300
  service_name: pgw-edge
deployment:
  mode: local
models:
  catalog_path: /etc/pgw/models.yaml
)");

    auto breaker = buildCircuitBreakerConfig(config);
    EXPECT_EQ(breaker.failureThreshold, 3u);
    EXPECT_EQ(breaker.recoveryTimeout, 10s);
    EXPECT_EQ(breaker.maxRecoveryTimeout, 40s);
    EXPECT_EQ(breaker.successThreshold, 1u);

    auto quota = buildRateLimitConfig(config);
    EXPECT_EQ(quota.authenticatedLimit, 50);
    EXPECT_EQ(quota.demoLimit, 1);
    EXPECT_EQ(quota.adminLimit, 500);
    EXPECT_EQ(quota.window, 60s);

    auto endpoints = buildProbeEndpoints(config);
    ASSERT_EQ(endpoints.size(), 2u);
    EXPECT_EQ(endpoints.at("ollama"), "http://localhost:11434/api/tags");

    auto health = buildHealthCheckConfig(config, endpoints);
    EXPECT_EQ(health.cacheTtl, 15s);
    EXPECT_EQ(health.probeTimeout, 250ms);
    EXPECT_EQ(health.providers, (std::vector<std::string>{"groq", "ollama"}));
    EXPECT_EQ(healthCheckInterval(config), 5s);

    auto status = buildStatusServerConfig(config);
    EXPECT_EQ(status.port, 9300);
    EXPECT_EQ(status.serviceName, "pgw-edge");

    EXPECT_EQ(buildDeploymentMode(config), DeploymentMode::Local);
    EXPECT_EQ(modelCatalogPath(config), std::filesystem::path("/etc/pgw/models.yaml"));
}

TEST(GatewayConfigTest, InvalidValuesKeepDefaults) {
    ConfigManager config;
    loadYaml(config, R"(
rate_limit:
  window_seconds: 0
  demo: lots
health:
  check_interval_seconds: -1
deployment:
  mode: edge
models:
  catalog_path: ""
)");

    auto quota = buildRateLimitConfig(config);
    EXPECT_EQ(quota.window, 3600s);
    EXPECT_EQ(quota.demoLimit, 3);
    EXPECT_EQ(healthCheckInterval(config), 30s);
    EXPECT_EQ(buildDeploymentMode(config), DeploymentMode::Cloud);
    EXPECT_FALSE(modelCatalogPath(config).has_value());
}

TEST(GatewayConfigTest, MaxRecoveryTimeoutClampedToBase) {
    ConfigManager config;
    loadYaml(config, R"(
circuit_breaker:
  recovery_timeout_seconds: 60
  max_recovery_timeout_seconds: 30
)");

    auto breaker = buildCircuitBreakerConfig(config);
    EXPECT_EQ(breaker.recoveryTimeout, 60s);
    EXPECT_EQ(breaker.maxRecoveryTimeout, 60s);

    ConfigManager raisedBase;
    loadYaml(raisedBase, R"(
circuit_breaker:
  recovery_timeout_seconds: 600
)");
    auto raised = buildCircuitBreakerConfig(raisedBase);
    EXPECT_EQ(raised.maxRecoveryTimeout, 600s);
}

TEST(GatewayConfigTest, ClampedCapKeepsOpenTimeoutAtBase) {
    ConfigManager config;
    loadYaml(config, R"(
circuit_breaker:
  failure_threshold: 1
  recovery_timeout_seconds: 60
  max_recovery_timeout_seconds: 30
)");

    auto clock = std::make_shared<ManualClock>();
    CircuitBreaker breaker("p", buildCircuitBreakerConfig(config), clock);
    breaker.recordFailure();
    clock->advance(60s);
    ASSERT_EQ(breaker.state(), CircuitState::HalfOpen);

    breaker.recordFailure();
    EXPECT_EQ(breaker.stats().currentTimeout, 60s);
    clock->advance(59s);
    EXPECT_EQ(breaker.state(), CircuitState::Open);
    clock->advance(1s);
    EXPECT_EQ(breaker.state(), CircuitState::HalfOpen);
}

TEST(GatewayConfigTest, ShippedConfigParses) {
    ConfigManager config;
    auto r = config.load(std::filesystem::path(PGW_SOURCE_DIR) / "config" / "gateway.yaml");
    ASSERT_TRUE(r.hasValue()) << r.error().message();

    EXPECT_EQ(buildStatusServerConfig(config).port, 9100);
    EXPECT_EQ(buildProbeEndpoints(config).size(), 4u);
    EXPECT_FALSE(modelCatalogPath(config).has_value());
}
