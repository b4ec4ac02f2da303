#pragma once

/// @file gateway_metrics.hpp
/// @brief In-memory counters, gauges and histograms with Prometheus export.

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pgw::foundation {

/// Upper bounds ("le") of histogram buckets.
struct HistogramBuckets {
    /// Probe latency buckets in milliseconds.
    static HistogramBuckets probeLatency();

    std::vector<double> boundaries;
};

/// Build a series name with one label: series("pgw_provider_up", "provider", "groq")
/// -> pgw_provider_up{provider="groq"}
[[nodiscard]] std::string series(std::string_view name, std::string_view label,
                                 std::string_view value);

/// Thread-safe metrics facade.
///
/// Series names may carry a Prometheus label set; TYPE lines are emitted
/// once per base name.
///
/// Example:
/// @code
///   auto& metrics = GatewayMetrics::instance();
///   metrics.incrementCounter("pgw_quota_rejected_total");
///   metrics.setGauge(series("pgw_provider_up", "provider", "groq"), 1.0);
///   std::string prom = metrics.scrape();
/// @endcode
class GatewayMetrics {
public:
    GatewayMetrics();
    ~GatewayMetrics();

    GatewayMetrics(const GatewayMetrics&) = delete;
    GatewayMetrics& operator=(const GatewayMetrics&) = delete;
    GatewayMetrics(GatewayMetrics&&) noexcept;
    GatewayMetrics& operator=(GatewayMetrics&&) noexcept;

    void incrementCounter(std::string_view name, uint64_t value = 1);
    [[nodiscard]] uint64_t counterValue(std::string_view name) const;

    void setGauge(std::string_view name, double value);
    [[nodiscard]] double gaugeValue(std::string_view name) const;

    /// Register a histogram; must precede recordHistogram() for the name.
    void registerHistogram(std::string_view name, HistogramBuckets buckets);

    /// Record an observation. No-op for unregistered histograms.
    void recordHistogram(std::string_view name, double value);

    /// Total observations recorded in a histogram (0 if unregistered).
    [[nodiscard]] uint64_t histogramCount(std::string_view name) const;

    /// Prometheus text exposition format.
    [[nodiscard]] std::string scrape() const;

    /// Drop every series. Intended for tests.
    void reset();

    static GatewayMetrics& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pgw::foundation
