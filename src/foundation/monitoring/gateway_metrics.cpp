/// @file gateway_metrics.cpp
/// @brief In-memory GatewayMetrics implementation.

#include "pgw/foundation/gateway_metrics.hpp"

#include <cmath>
#include <map>
#include <mutex>
#include <set>
#include <sstream>

namespace pgw::foundation {

HistogramBuckets HistogramBuckets::probeLatency() {
    return HistogramBuckets{{25, 50, 100, 250, 500, 1000, 2500, 5000}};
}

std::string series(std::string_view name, std::string_view label, std::string_view value) {
    std::string out(name);
    out += '{';
    out += label;
    out += "=\"";
    out += value;
    out += "\"}";
    return out;
}

namespace {

struct HistogramData {
    std::vector<double> boundaries;
    std::vector<uint64_t> bucketCounts;  // one per boundary + 1 for +Inf
    uint64_t totalCount{0};
    double totalSum{0.0};

    explicit HistogramData(std::vector<double> bounds)
        : boundaries(std::move(bounds)), bucketCounts(boundaries.size() + 1, 0) {}

    void record(double value) {
        for (std::size_t i = 0; i < boundaries.size(); ++i) {
            if (value <= boundaries[i]) {
                ++bucketCounts[i];
            }
        }
        ++bucketCounts.back();
        ++totalCount;
        totalSum += value;
    }
};

std::string formatDouble(double value) {
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    if (std::isnan(value)) {
        return "NaN";
    }
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::string_view baseName(std::string_view name) {
    return name.substr(0, name.find('{'));
}

/// Insert extra labels into a possibly-labelled series name.
std::string withLabel(std::string_view name, std::string_view suffix,
                      std::string_view extraLabel) {
    auto brace = name.find('{');
    std::string out(name.substr(0, brace));
    out += suffix;
    if (brace == std::string_view::npos) {
        if (!extraLabel.empty()) {
            out += '{';
            out += extraLabel;
            out += '}';
        }
        return out;
    }
    auto labels = name.substr(brace + 1, name.size() - brace - 2);
    out += '{';
    out += labels;
    if (!extraLabel.empty()) {
        out += ',';
        out += extraLabel;
    }
    out += '}';
    return out;
}

}  // anonymous namespace

struct GatewayMetrics::Impl {
    // Ordered maps keep scrape output stable.
    mutable std::mutex mutex;
    std::map<std::string, uint64_t, std::less<>> counters;
    std::map<std::string, double, std::less<>> gauges;
    std::map<std::string, HistogramData, std::less<>> histograms;
};

GatewayMetrics::GatewayMetrics() : impl_(std::make_unique<Impl>()) {}

GatewayMetrics::~GatewayMetrics() = default;

GatewayMetrics::GatewayMetrics(GatewayMetrics&&) noexcept = default;

GatewayMetrics& GatewayMetrics::operator=(GatewayMetrics&&) noexcept = default;

void GatewayMetrics::incrementCounter(std::string_view name, uint64_t value) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->counters.find(name);
    if (it == impl_->counters.end()) {
        impl_->counters.emplace(std::string(name), value);
    } else {
        it->second += value;
    }
}

uint64_t GatewayMetrics::counterValue(std::string_view name) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->counters.find(name);
    return it == impl_->counters.end() ? 0 : it->second;
}

void GatewayMetrics::setGauge(std::string_view name, double value) {
    std::lock_guard lock(impl_->mutex);
    impl_->gauges.insert_or_assign(std::string(name), value);
}

double GatewayMetrics::gaugeValue(std::string_view name) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->gauges.find(name);
    return it == impl_->gauges.end() ? 0.0 : it->second;
}

void GatewayMetrics::registerHistogram(std::string_view name, HistogramBuckets buckets) {
    std::lock_guard lock(impl_->mutex);
    if (impl_->histograms.find(name) == impl_->histograms.end()) {
        impl_->histograms.emplace(std::string(name),
                                  HistogramData(std::move(buckets.boundaries)));
    }
}

void GatewayMetrics::recordHistogram(std::string_view name, double value) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->histograms.find(name);
    if (it != impl_->histograms.end()) {
        it->second.record(value);
    }
}

uint64_t GatewayMetrics::histogramCount(std::string_view name) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->histograms.find(name);
    return it == impl_->histograms.end() ? 0 : it->second.totalCount;
}

std::string GatewayMetrics::scrape() const {
    std::lock_guard lock(impl_->mutex);
    std::ostringstream out;
    std::set<std::string, std::less<>> typed;

    auto typeLine = [&](std::string_view name, std::string_view type) {
        auto base = baseName(name);
        if (typed.insert(std::string(base)).second) {
            out << "# TYPE " << base << ' ' << type << '\n';
        }
    };

    for (const auto& [name, value] : impl_->counters) {
        typeLine(name, "counter");
        out << name << ' ' << value << '\n';
    }

    for (const auto& [name, value] : impl_->gauges) {
        typeLine(name, "gauge");
        out << name << ' ' << formatDouble(value) << '\n';
    }

    for (const auto& [name, data] : impl_->histograms) {
        typeLine(name, "histogram");
        for (std::size_t i = 0; i < data.boundaries.size(); ++i) {
            out << withLabel(name, "_bucket", "le=\"" + formatDouble(data.boundaries[i]) + "\"")
                << ' ' << data.bucketCounts[i] << '\n';
        }
        out << withLabel(name, "_bucket", "le=\"+Inf\"") << ' '
            << data.bucketCounts.back() << '\n';
        out << withLabel(name, "_sum", {}) << ' ' << formatDouble(data.totalSum) << '\n';
        out << withLabel(name, "_count", {}) << ' ' << data.totalCount << '\n';
    }

    return out.str();
}

void GatewayMetrics::reset() {
    std::lock_guard lock(impl_->mutex);
    impl_->counters.clear();
    impl_->gauges.clear();
    impl_->histograms.clear();
}

GatewayMetrics& GatewayMetrics::instance() {
    static GatewayMetrics inst;
    return inst;
}

} // namespace pgw::foundation
