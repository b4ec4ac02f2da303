/// @file status_server_test.cpp
/// @brief Unit tests for StatusServer endpoints over a real loopback socket.

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "pgw/foundation/gateway_metrics.hpp"
#include "pgw/service/liveness_probe.hpp"
#include "pgw/service/provider_health.hpp"
#include "pgw/service/status_server.hpp"

using namespace pgw::service;
using namespace pgw::foundation;
using namespace std::chrono_literals;

namespace {

struct HttpReply {
    int status{0};
    std::string body;
};

/// Send "GET <path>" to 127.0.0.1:<port> and read until the server closes.
HttpReply httpGet(uint16_t port, const std::string& path) {
    HttpReply reply;
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return reply;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {  // NOLINT
        close(fd);
        return reply;
    }

    std::string request = "GET " + path + " HTTP/1.1\r\nHost: localhost\r\n\r\n";
    if (write(fd, request.data(), request.size()) != static_cast<ssize_t>(request.size())) {
        close(fd);
        return reply;
    }

    std::string raw;
    std::array<char, 4096> buf{};
    for (;;) {
        auto n = read(fd, buf.data(), buf.size());
        if (n <= 0) {
            break;
        }
        raw.append(buf.data(), static_cast<std::size_t>(n));
    }
    close(fd);

    if (raw.size() >= 12 && raw.compare(0, 5, "HTTP/") == 0) {
        reply.status = std::stoi(raw.substr(9, 3));
    }
    auto headerEnd = raw.find("\r\n\r\n");
    if (headerEnd != std::string::npos) {
        reply.body = raw.substr(headerEnd + 4);
    }
    return reply;
}

/// Loopback listener on ::1 that answers one request with 204.
class Ipv6OneShotServer {
public:
    Ipv6OneShotServer() {
        fd_ = socket(AF_INET6, SOCK_STREAM, 0);
        if (fd_ < 0) {
            return;
        }
        struct sockaddr_in6 addr{};
        addr.sin6_family = AF_INET6;
        addr.sin6_addr = in6addr_loopback;
        addr.sin6_port = 0;
        socklen_t len = sizeof(addr);
        if (bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0 ||  // NOLINT
            listen(fd_, 1) != 0 ||
            getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {  // NOLINT
            close(fd_);
            fd_ = -1;
            return;
        }
        port_ = ntohs(addr.sin6_port);
        worker_ = std::thread([this] { serveOne(); });
    }

    ~Ipv6OneShotServer() {
        if (worker_.joinable()) {
            shutdown(fd_, SHUT_RDWR);
            worker_.join();
        }
        if (fd_ >= 0) {
            close(fd_);
        }
    }

    Ipv6OneShotServer(const Ipv6OneShotServer&) = delete;
    Ipv6OneShotServer& operator=(const Ipv6OneShotServer&) = delete;

    [[nodiscard]] bool listening() const { return fd_ >= 0; }
    [[nodiscard]] uint16_t port() const { return port_; }

private:
    void serveOne() {
        int client = accept(fd_, nullptr, nullptr);
        if (client < 0) {
            return;
        }
        std::string request;
        std::array<char, 1024> buf{};
        while (request.find("\r\n\r\n") == std::string::npos) {
            auto n = read(client, buf.data(), buf.size());
            if (n <= 0) {
                break;
            }
            request.append(buf.data(), static_cast<std::size_t>(n));
        }
        const std::string reply =
            "HTTP/1.1 204 No Content\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
        (void)write(client, reply.data(), reply.size());
        close(client);
    }

    int fd_{-1};
    uint16_t port_{0};
    std::thread worker_;
};

/// Loopback listener that completes handshakes in the backlog but never answers.
class SilentListener {
public:
    SilentListener() {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) {
            return;
        }
        struct sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        socklen_t len = sizeof(addr);
        if (bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0 ||  // NOLINT
            listen(fd_, 4) != 0 ||
            getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {  // NOLINT
            close(fd_);
            fd_ = -1;
            return;
        }
        port_ = ntohs(addr.sin_port);
    }

    ~SilentListener() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }

    SilentListener(const SilentListener&) = delete;
    SilentListener& operator=(const SilentListener&) = delete;

    [[nodiscard]] int fd() const { return fd_; }
    [[nodiscard]] uint16_t port() const { return port_; }

private:
    int fd_{-1};
    uint16_t port_{0};
};

/// Open a connection to 127.0.0.1:<port> and return the fd without sending anything.
int connectIdle(uint16_t port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {  // NOLINT
        close(fd);
        return -1;
    }
    return fd;
}

ProviderHealth entry(HealthState state, std::optional<std::string> message = std::nullopt) {
    ProviderHealth h;
    h.status = state;
    h.lastCheck = std::chrono::system_clock::time_point(1767225600000ms);
    h.responseTime = 42ms;
    h.errorMessage = std::move(message);
    return h;
}

}  // namespace

class StatusServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto started = server_.start();
        ASSERT_TRUE(started.hasValue()) << started.error().message();
        ASSERT_NE(server_.port(), 0);
    }

    void TearDown() override { server_.stop(); }

    void setSnapshot(HealthSnapshot snapshot) {
        std::lock_guard lock(mutex_);
        snapshot_ = std::move(snapshot);
    }

    std::mutex mutex_;
    HealthSnapshot snapshot_;
    GatewayMetrics metrics_;
    StatusServer server_{StatusServerConfig{0, "pgw-test"}, metrics_, [this] {
                             std::lock_guard lock(mutex_);
                             return snapshot_;
                         }};
};

// ===========================================================================
// Lifecycle
// ===========================================================================

TEST(StatusServerLifecycleTest, NotRunningBeforeStart) {
    GatewayMetrics metrics;
    StatusServer server(StatusServerConfig{0, "idle"}, metrics, [] { return HealthSnapshot{}; });
    EXPECT_FALSE(server.isRunning());
    server.stop();
    EXPECT_FALSE(server.isRunning());
}

TEST_F(StatusServerTest, StartStopIsIdempotent) {
    EXPECT_TRUE(server_.isRunning());
    EXPECT_TRUE(server_.start().hasValue());

    server_.stop();
    EXPECT_FALSE(server_.isRunning());
    server_.stop();
    EXPECT_FALSE(server_.isRunning());
}

TEST_F(StatusServerTest, BindConflictReportsListenFailed) {
    StatusServer second(StatusServerConfig{server_.port(), "dup"}, metrics_,
                        [] { return HealthSnapshot{}; });
    auto r = second.start();
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::ListenFailed);
    EXPECT_FALSE(second.isRunning());
}

// ===========================================================================
// Endpoints
// ===========================================================================

TEST_F(StatusServerTest, HealthzReportsProviders) {
    setSnapshot({
        {"groq", entry(HealthState::Healthy)},
        {"together", entry(HealthState::Degraded, "HTTP 429")},
    });

    auto reply = httpGet(server_.port(), "/healthz");
    EXPECT_EQ(reply.status, 200);
    EXPECT_NE(reply.body.find(R"("status":"degraded")"), std::string::npos);
    EXPECT_NE(reply.body.find(R"("service":"pgw-test")"), std::string::npos);
    EXPECT_NE(reply.body.find(R"("groq":{"status":"healthy")"), std::string::npos);
    EXPECT_NE(reply.body.find(R"("last_check_ms":1767225600000)"), std::string::npos);
    EXPECT_NE(reply.body.find(R"("response_time_ms":42)"), std::string::npos);
    EXPECT_NE(reply.body.find(R"("error_message":"HTTP 429")"), std::string::npos);
}

TEST_F(StatusServerTest, HealthzEscapesMessages) {
    setSnapshot({{"groq", entry(HealthState::Down, "bad \"quote\"")}});
    auto reply = httpGet(server_.port(), "/healthz");
    EXPECT_NE(reply.body.find(R"(bad \"quote\")"), std::string::npos);
}

TEST_F(StatusServerTest, HealthzWithNoProviders) {
    auto reply = httpGet(server_.port(), "/healthz");
    EXPECT_EQ(reply.status, 200);
    EXPECT_NE(reply.body.find(R"("status":"healthy")"), std::string::npos);
    EXPECT_NE(reply.body.find(R"("providers":{})"), std::string::npos);
}

TEST_F(StatusServerTest, ReadyzFollowsReadyFlag) {
    EXPECT_EQ(httpGet(server_.port(), "/readyz").status, 503);

    server_.setReady(true);
    auto reply = httpGet(server_.port(), "/readyz");
    EXPECT_EQ(reply.status, 200);
    EXPECT_NE(reply.body.find(R"("status":"ready")"), std::string::npos);
    EXPECT_DOUBLE_EQ(metrics_.gaugeValue("pgw_status_ready"), 1.0);

    server_.setReady(false);
    EXPECT_EQ(httpGet(server_.port(), "/readyz").status, 503);
}

TEST_F(StatusServerTest, ReadyzRequiresOneProviderUp) {
    server_.setReady(true);
    setSnapshot({
        {"groq", entry(HealthState::Down)},
        {"together", entry(HealthState::Down)},
    });
    EXPECT_EQ(httpGet(server_.port(), "/readyz").status, 503);

    setSnapshot({
        {"groq", entry(HealthState::Down)},
        {"together", entry(HealthState::Degraded)},
    });
    EXPECT_EQ(httpGet(server_.port(), "/readyz").status, 200);
}

TEST_F(StatusServerTest, MetricsEndpointServesScrape) {
    metrics_.incrementCounter("pgw_requests_total", 7);
    auto reply = httpGet(server_.port(), "/metrics");
    EXPECT_EQ(reply.status, 200);
    EXPECT_NE(reply.body.find("pgw_requests_total 7"), std::string::npos);
}

TEST_F(StatusServerTest, UnknownPathIs404) {
    EXPECT_EQ(httpGet(server_.port(), "/admin").status, 404);
}

// ===========================================================================
// HttpLivenessProbe against a local endpoint
// ===========================================================================

TEST_F(StatusServerTest, LivenessProbeReadsStatusCode) {
    auto base = "http://127.0.0.1:" + std::to_string(server_.port());
    HttpLivenessProbe probe({{"local", base + "/healthz"}, {"missing", base + "/nowhere"}});

    auto ok = probe.probe("local", 2000ms);
    ASSERT_TRUE(ok.hasValue()) << ok.error().message();
    EXPECT_EQ(ok.value().statusCode, 200);

    auto notFound = probe.probe("missing", 2000ms);
    ASSERT_TRUE(notFound.hasValue()) << notFound.error().message();
    EXPECT_EQ(notFound.value().statusCode, 404);
    EXPECT_EQ(classifyStatus(notFound.value().statusCode), HealthState::Degraded);
}

TEST_F(StatusServerTest, LivenessProbeConnectFailure) {
    auto port = server_.port();
    server_.stop();

    HttpLivenessProbe probe({{"gone", "http://127.0.0.1:" + std::to_string(port) + "/healthz"}});
    auto r = probe.probe("gone", 1000ms);
    ASSERT_TRUE(r.hasError());
    EXPECT_TRUE(r.error().code() == ErrorCode::ProbeFailed ||
                r.error().code() == ErrorCode::ProbeTimeout);
}

TEST(HttpLivenessCheckTest, ReachesBracketedIpv6Literal) {
    Ipv6OneShotServer server;
    if (!server.listening()) {
        GTEST_SKIP() << "IPv6 loopback unavailable";
    }

    HttpLivenessProbe liveness(
        {{"v6", "http://[::1]:" + std::to_string(server.port()) + "/v1/models"}});
    auto r = liveness.probe("v6", 2000ms);
    ASSERT_TRUE(r.hasValue()) << r.error().message();
    EXPECT_EQ(r.value().statusCode, 204);
    EXPECT_EQ(classifyStatus(r.value().statusCode), HealthState::Healthy);
}

TEST(HttpLivenessCheckTest, TimeoutBoundsSilentEndpoint) {
    SilentListener listener;
    ASSERT_GE(listener.fd(), 0);

    HttpLivenessProbe liveness(
        {{"silent", "http://127.0.0.1:" + std::to_string(listener.port()) + "/v1/models"}});
    auto started = std::chrono::steady_clock::now();
    auto r = liveness.probe("silent", 300ms);
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::ProbeTimeout);
    EXPECT_LT(elapsed, 2s);
}

// ===========================================================================
// Slow clients
// ===========================================================================

TEST_F(StatusServerTest, IdleClientDoesNotBlockOthers) {
    int idle = connectIdle(server_.port());
    ASSERT_GE(idle, 0);

    auto reply = httpGet(server_.port(), "/healthz");
    EXPECT_EQ(reply.status, 200);

    close(idle);
}

TEST_F(StatusServerTest, StopReturnsWithIdleClientConnected) {
    int idle = connectIdle(server_.port());
    ASSERT_GE(idle, 0);

    auto started = std::chrono::steady_clock::now();
    server_.stop();
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(server_.isRunning());
    EXPECT_LT(elapsed, 5s);
    close(idle);
}
