#pragma once

/// @file status_server.hpp
/// @brief Lightweight HTTP status/metrics server for probes and scraping.
///
/// Provides /healthz (aggregate provider health), /readyz (readiness) and
/// /metrics (Prometheus text format) over a minimal HTTP responder.

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "pgw/foundation/gateway_result.hpp"
#include "pgw/service/provider_health.hpp"

namespace pgw::foundation {
class GatewayMetrics;
}

namespace pgw::service {

/// Configuration for the StatusServer.
struct StatusServerConfig {
    /// TCP port to listen on; 0 picks an ephemeral port.
    uint16_t port = 9100;

    /// Service name reported in JSON responses.
    std::string serviceName = "pgw";
};

/// Supplies the latest provider health verdicts.
using HealthSnapshotSource = std::function<HealthSnapshot()>;

/// Minimal HTTP server exposing gateway status.
///
/// Endpoints:
///   - GET /healthz -> 200 with per-provider health; overall status is the
///     worst provider status
///   - GET /readyz  -> 200 when ready and at least one provider is not
///     down (or none are known yet), 503 otherwise
///   - GET /metrics -> Prometheus text exposition format
///
/// Example:
/// @code
///   StatusServer status({.port = 9100}, metrics, [&] { return latest.get(); });
///   status.start();
///   status.setReady(true);
///   // ... gateway runs ...
///   status.stop();
/// @endcode
///
/// Thread-safe: runs an internal background thread for accepting connections.
class StatusServer {
public:
    StatusServer(StatusServerConfig config, foundation::GatewayMetrics& metrics,
                 HealthSnapshotSource snapshot);
    ~StatusServer();

    StatusServer(const StatusServer&) = delete;
    StatusServer& operator=(const StatusServer&) = delete;

    /// Start listening on the configured port.
    [[nodiscard]] foundation::GatewayResult<void> start();

    /// Stop the server and close the listening socket.
    void stop();

    /// Set the readiness state. When false, /readyz returns 503.
    void setReady(bool ready);

    [[nodiscard]] bool isRunning() const;

    /// Bound port; the assigned one once started with port 0.
    [[nodiscard]] uint16_t port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace pgw::service
