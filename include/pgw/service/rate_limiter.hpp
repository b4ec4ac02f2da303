#pragma once

/// @file rate_limiter.hpp
/// @brief Fixed-window per-caller quota enforcement with tiered limits.
///
/// Counts requests per (identifier, window_start) in the shared store.
/// Windows are aligned to multiples of the window length in Unix time, so
/// up to twice the limit can pass across one window boundary.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "pgw/foundation/clock.hpp"
#include "pgw/foundation/gateway_metrics.hpp"
#include "pgw/foundation/gateway_result.hpp"
#include "pgw/service/shared_store.hpp"

namespace pgw::service {

/// Per-tier limits for one window.
struct RateLimitConfig {
    int64_t authenticatedLimit = 100;
    int64_t demoLimit = 3;
    int64_t adminLimit = 1000;
    std::chrono::seconds window{3600};
};

/// Outcome of one quota check.
struct QuotaDecision {
    bool allowed{false};
    int64_t remaining{0};
    std::chrono::system_clock::time_point resetAt;
    /// Zero when allowed.
    std::chrono::seconds retryAfter{0};
    int64_t limit{0};
};

/// Quota gate for callers, independent of provider selection.
///
/// Example:
/// @code
///   RateLimiter limiter({}, std::make_shared<InMemorySharedStore>());
///   auto admitted = limiter.admit("user-42", false, false);
///   if (!admitted) {
///       auto* decision = admitted.error().context<QuotaDecision>();
///       respond429(decision->retryAfter);
///   }
/// @endcode
class RateLimiter {
public:
    RateLimiter(RateLimitConfig config, std::shared_ptr<ISharedStore> store,
                std::shared_ptr<foundation::IClock> clock = foundation::SystemClock::shared(),
                foundation::GatewayMetrics* metrics = nullptr);

    /// Check and, when allowed, consume one request of quota.
    ///
    /// Admin callers get the admin limit; otherwise demo callers get the
    /// demo limit and everyone else the authenticated limit. A rejection
    /// is a successful result with allowed == false and remaining == 0;
    /// errors are reserved for store failures.
    [[nodiscard]] foundation::GatewayResult<QuotaDecision> checkLimit(std::string_view identifier,
                                                                      bool isDemo, bool isAdmin);

    /// Like checkLimit(), but a rejection becomes a QuotaExceeded error
    /// whose context is the QuotaDecision.
    [[nodiscard]] foundation::GatewayResult<QuotaDecision> admit(std::string_view identifier,
                                                                 bool isDemo, bool isAdmin);

    /// Requests counted for @p identifier in the current window.
    [[nodiscard]] foundation::GatewayResult<int64_t> currentUsage(std::string_view identifier,
                                                                  bool isDemo);

    /// Clear the current window's counter for @p identifier. Never fails;
    /// store errors are logged.
    void resetLimit(std::string_view identifier, bool isDemo);

    [[nodiscard]] const RateLimitConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] int64_t windowStart(std::chrono::system_clock::time_point now) const;
    [[nodiscard]] std::string counterKey(std::string_view identifier, bool isDemo,
                                         int64_t windowStart) const;
    [[nodiscard]] int64_t limitFor(bool isDemo, bool isAdmin) const noexcept;

    RateLimitConfig config_;
    std::shared_ptr<ISharedStore> store_;
    std::shared_ptr<foundation::IClock> clock_;
    foundation::GatewayMetrics* metrics_;
};

}  // namespace pgw::service
