/// @file status_server.cpp
/// @brief Minimal HTTP status/metrics server implementation.
///
/// Single-threaded, poll-based responder over POSIX sockets with graceful
/// shutdown.

#include "pgw/service/status_server.hpp"

#include "pgw/foundation/clock.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>

// POSIX socket headers
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "pgw/foundation/gateway_logger.hpp"
#include "pgw/foundation/gateway_metrics.hpp"

namespace pgw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;

namespace {

constexpr int kClientReadTimeoutMs = 1000;

std::string jsonEscape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::array<char, 8> buf{};
                    std::snprintf(buf.data(), buf.size(), "\\u%04x", c);
                    out += buf.data();
                } else {
                    out += c;
                }
        }
    }
    return out;
}

/// Format a health snapshot as JSON.
std::string snapshotToJson(const HealthSnapshot& snapshot, std::string_view service,
                           std::chrono::seconds uptime) {
    std::ostringstream out;
    out << R"({"status":")" << toString(aggregateStatus(snapshot))
        << R"(","service":")" << jsonEscape(service)
        << R"(","uptime_seconds":)" << uptime.count()
        << R"(,"providers":{)";

    bool first = true;
    for (const auto& [provider, health] : snapshot) {
        if (!first) { out << ","; }
        first = false;
        out << R"(")" << jsonEscape(provider) << R"(":{"status":")"
            << toString(health.status) << R"(","last_check_ms":)"
            << foundation::toUnixMillis(health.lastCheck);
        if (health.responseTime) {
            out << R"(,"response_time_ms":)" << health.responseTime->count();
        }
        if (health.errorMessage) {
            out << R"(,"error_message":")" << jsonEscape(*health.errorMessage) << R"(")";
        }
        out << "}";
    }

    out << "}}";
    return out.str();
}

/// Build a minimal HTTP response.
std::string httpResponse(int statusCode, std::string_view contentType,
                         std::string_view body) {
    std::ostringstream out;
    out << "HTTP/1.1 " << statusCode;
    switch (statusCode) {
        case 200: out << " OK"; break;
        case 404: out << " Not Found"; break;
        case 503: out << " Service Unavailable"; break;
        default:  out << " Error"; break;
    }
    out << "\r\nContent-Type: " << contentType
        << "\r\nContent-Length: " << body.size()
        << "\r\nConnection: close"
        << "\r\n\r\n"
        << body;
    return out.str();
}

/// "GET /healthz HTTP/1.1\r\n..." -> "/healthz"
std::string_view extractPath(std::string_view request) {
    auto methodEnd = request.find(' ');
    if (methodEnd == std::string_view::npos) { return "/"; }
    auto pathStart = methodEnd + 1;
    auto pathEnd = request.find(' ', pathStart);
    if (pathEnd == std::string_view::npos) { return "/"; }
    return request.substr(pathStart, pathEnd - pathStart);
}

bool anyProviderUp(const HealthSnapshot& snapshot) {
    if (snapshot.empty()) {
        return true;
    }
    for (const auto& [provider, health] : snapshot) {
        if (health.status != HealthState::Down) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct StatusServer::Impl {
    StatusServerConfig config;
    foundation::GatewayMetrics& metrics;
    HealthSnapshotSource snapshot;
    std::atomic<bool> running{false};
    std::atomic<bool> ready{false};
    std::atomic<uint16_t> boundPort{0};
    std::thread serverThread;
    int listenFd{-1};
    std::chrono::steady_clock::time_point startTime{};

    Impl(StatusServerConfig cfg, foundation::GatewayMetrics& m, HealthSnapshotSource s)
        : config(std::move(cfg)), metrics(m), snapshot(std::move(s)) {}

    void run() {
        while (running.load(std::memory_order_relaxed)) {
            struct pollfd pfd{};
            pfd.fd = listenFd;
            pfd.events = POLLIN;

            // 500ms keeps shutdown responsive.
            int ret = poll(&pfd, 1, 500);
            if (ret <= 0) { continue; }

            if ((pfd.revents & POLLIN) == 0) { continue; }

            int clientFd = accept(listenFd, nullptr, nullptr);
            if (clientFd < 0) { continue; }

            handleClient(clientFd);
            close(clientFd);
        }
    }

    void handleClient(int clientFd) {
        // A silent client would otherwise stall the accept loop and stop().
        struct pollfd pfd{};
        pfd.fd = clientFd;
        pfd.events = POLLIN;
        if (poll(&pfd, 1, kClientReadTimeoutMs) <= 0 || (pfd.revents & POLLIN) == 0) {
            PGW_LOG_DEBUG(foundation::LogCategory::Network, "status server dropped idle client");
            return;
        }

        // Only the request line matters.
        std::array<char, 1024> buf{};
        auto bytesRead = read(clientFd, buf.data(), buf.size() - 1);
        if (bytesRead <= 0) { return; }

        std::string_view request(buf.data(), static_cast<std::size_t>(bytesRead));
        auto path = extractPath(request);

        std::string response;

        if (path == "/healthz") {
            auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::steady_clock::now() - startTime);
            response = httpResponse(200, "application/json",
                                    snapshotToJson(snapshot(), config.serviceName, uptime));
        } else if (path == "/readyz") {
            auto current = snapshot();
            if (ready.load(std::memory_order_relaxed) && anyProviderUp(current)) {
                response = httpResponse(
                    200, "application/json",
                    R"({"status":"ready","service":")" + jsonEscape(config.serviceName) +
                        R"("})");
            } else {
                response = httpResponse(
                    503, "application/json",
                    R"({"status":"not_ready","service":")" + jsonEscape(config.serviceName) +
                        R"("})");
            }
        } else if (path == "/metrics") {
            response = httpResponse(200, "text/plain; version=0.0.4; charset=utf-8",
                                    metrics.scrape());
        } else {
            response = httpResponse(404, "text/plain", "Not Found");
        }

        std::size_t sent = 0;
        while (sent < response.size()) {
            auto n = write(clientFd, response.data() + sent, response.size() - sent);
            if (n < 0 && errno == EINTR) { continue; }
            if (n <= 0) {
                PGW_LOG_DEBUG(foundation::LogCategory::Network,
                              std::string("status response write failed: ") +
                                  std::strerror(errno));
                return;
            }
            sent += static_cast<std::size_t>(n);
        }
    }
};

// ── Public API ──────────────────────────────────────────────────────────────

StatusServer::StatusServer(StatusServerConfig config, foundation::GatewayMetrics& metrics,
                           HealthSnapshotSource snapshot)
    : impl_(std::make_unique<Impl>(std::move(config), metrics, std::move(snapshot))) {}

StatusServer::~StatusServer() {
    stop();
}

GatewayResult<void> StatusServer::start() {
    if (impl_->running.load()) {
        return GatewayResult<void>::ok();
    }

    impl_->listenFd = socket(AF_INET, SOCK_STREAM, 0);
    if (impl_->listenFd < 0) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::NetworkError, "failed to create status server socket"));
    }

    int optval = 1;
    if (setsockopt(impl_->listenFd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) < 0) {
        PGW_LOG_WARN(foundation::LogCategory::Network,
                     std::string("SO_REUSEADDR failed: ") + std::strerror(errno));
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(impl_->config.port);

    if (bind(impl_->listenFd,
             reinterpret_cast<struct sockaddr*>(&addr),  // NOLINT
             sizeof(addr)) < 0) {
        close(impl_->listenFd);
        impl_->listenFd = -1;
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ListenFailed, "failed to bind status server on port " +
                                                      std::to_string(impl_->config.port)));
    }

    if (listen(impl_->listenFd, 8) < 0) {
        close(impl_->listenFd);
        impl_->listenFd = -1;
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ListenFailed, "failed to listen on status server socket"));
    }

    struct sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(impl_->listenFd, reinterpret_cast<struct sockaddr*>(&bound),  // NOLINT
                    &len) == 0) {
        impl_->boundPort.store(ntohs(bound.sin_port));
    } else {
        impl_->boundPort.store(impl_->config.port);
    }

    impl_->startTime = std::chrono::steady_clock::now();
    impl_->running.store(true, std::memory_order_relaxed);
    impl_->serverThread = std::thread([this]() { impl_->run(); });

    PGW_LOG_INFO(foundation::LogCategory::Network,
                 "status server listening on port " + std::to_string(impl_->boundPort.load()));
    return GatewayResult<void>::ok();
}

void StatusServer::stop() {
    if (!impl_->running.load(std::memory_order_relaxed)) {
        return;
    }

    impl_->running.store(false, std::memory_order_relaxed);

    // Join before closing so poll() never sees a recycled descriptor.
    if (impl_->serverThread.joinable()) {
        impl_->serverThread.join();
    }
    if (impl_->listenFd >= 0) {
        close(impl_->listenFd);
        impl_->listenFd = -1;
    }
}

void StatusServer::setReady(bool ready) {
    impl_->ready.store(ready, std::memory_order_relaxed);
    impl_->metrics.setGauge("pgw_status_ready", ready ? 1.0 : 0.0);
}

bool StatusServer::isRunning() const {
    return impl_->running.load(std::memory_order_relaxed);
}

uint16_t StatusServer::port() const {
    auto bound = impl_->boundPort.load();
    return bound != 0 ? bound : impl_->config.port;
}

} // namespace pgw::service
