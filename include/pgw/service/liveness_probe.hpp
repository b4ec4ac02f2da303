#pragma once

/// @file liveness_probe.hpp
/// @brief Provider liveness probes (HTTP/HTTPS GET with a single deadline).

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "pgw/foundation/gateway_result.hpp"

namespace pgw::service {

/// Raw probe outcome before classification.
struct ProbeOutcome {
    int statusCode{0};
};

/// Transport used by the health checker to reach a provider.
///
/// Implementations must be thread-safe: one probe per provider runs
/// concurrently.
class IProviderProbe {
public:
    virtual ~IProviderProbe() = default;

    /// Whether a liveness endpoint is configured for @p provider.
    [[nodiscard]] virtual bool knows(std::string_view provider) const = 0;

    /// Issue one liveness request bounded by @p timeout.
    /// @return The response status, or ProbeTimeout / ProbeFailed /
    ///         UnknownProvider.
    [[nodiscard]] virtual foundation::GatewayResult<ProbeOutcome> probe(
        std::string_view provider, std::chrono::milliseconds timeout) = 0;
};

/// Public model-listing URLs of the cloud providers.
[[nodiscard]] std::map<std::string, std::string> defaultProbeEndpoints();

/// GET-based liveness check over libcurl; https endpoints verify the peer
/// and host name.
///
/// The timeout covers the whole transfer, name resolution included.
class HttpLivenessProbe : public IProviderProbe {
public:
    explicit HttpLivenessProbe(
        std::map<std::string, std::string> endpoints = defaultProbeEndpoints());
    ~HttpLivenessProbe() override;

    HttpLivenessProbe(const HttpLivenessProbe&) = delete;
    HttpLivenessProbe& operator=(const HttpLivenessProbe&) = delete;

    [[nodiscard]] bool knows(std::string_view provider) const override;

    [[nodiscard]] foundation::GatewayResult<ProbeOutcome> probe(
        std::string_view provider, std::chrono::milliseconds timeout) override;

    [[nodiscard]] const std::map<std::string, std::string>& endpoints() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace pgw::service
