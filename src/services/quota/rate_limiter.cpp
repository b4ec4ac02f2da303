/// @file rate_limiter.cpp
/// @brief Fixed-window RateLimiter implementation.

#include "pgw/service/rate_limiter.hpp"

#include <charconv>
#include <chrono>

#include "pgw/foundation/gateway_logger.hpp"

namespace pgw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayLogger;
using foundation::GatewayResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

constexpr std::string_view kKeyPrefix = "rate_limit:";
constexpr std::string_view kDemoKeyPrefix = "rate_limit:demo:";
constexpr std::string_view kRejectedCounter = "pgw_quota_rejected_total";

}  // anonymous namespace

RateLimiter::RateLimiter(RateLimitConfig config, std::shared_ptr<ISharedStore> store,
                         std::shared_ptr<foundation::IClock> clock,
                         foundation::GatewayMetrics* metrics)
    : config_(config), store_(std::move(store)), clock_(std::move(clock)), metrics_(metrics) {}

GatewayResult<QuotaDecision> RateLimiter::checkLimit(std::string_view identifier, bool isDemo,
                                                     bool isAdmin) {
    auto now = clock_->wallNow();
    auto start = windowStart(now);
    auto limit = limitFor(isDemo, isAdmin);

    QuotaDecision decision;
    decision.limit = limit;
    decision.resetAt = std::chrono::system_clock::time_point(std::chrono::seconds(start)) +
                       config_.window;

    auto counted = store_->incrementIfBelow(counterKey(identifier, isDemo, start), limit,
                                            config_.window);
    if (!counted) {
        return GatewayResult<QuotaDecision>::err(counted.error());
    }

    const auto& count = counted.value();
    if (!count) {
        decision.allowed = false;
        decision.remaining = 0;
        // Round up so a client that waits retryAfter lands in the next window.
        decision.retryAfter = std::chrono::ceil<std::chrono::seconds>(decision.resetAt - now);

        if (metrics_ != nullptr) {
            metrics_->incrementCounter(kRejectedCounter);
        }
        LogContext ctx;
        ctx.identifier = std::string(identifier);
        ctx.extra["limit"] = std::to_string(limit);
        ctx.extra["retry_after_s"] = std::to_string(decision.retryAfter.count());
        GatewayLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Quota,
                                                 "quota exceeded", ctx);
        return GatewayResult<QuotaDecision>::ok(decision);
    }

    decision.allowed = true;
    decision.remaining = limit - *count;
    return GatewayResult<QuotaDecision>::ok(decision);
}

GatewayResult<QuotaDecision> RateLimiter::admit(std::string_view identifier, bool isDemo,
                                                bool isAdmin) {
    auto decision = checkLimit(identifier, isDemo, isAdmin);
    if (!decision || decision.value().allowed) {
        return decision;
    }
    auto retry = decision.value().retryAfter.count();
    return GatewayResult<QuotaDecision>::err(
        GatewayError(ErrorCode::QuotaExceeded,
                     "rate limit exceeded, retry after " + std::to_string(retry) + "s",
                     decision.value()));
}

GatewayResult<int64_t> RateLimiter::currentUsage(std::string_view identifier, bool isDemo) {
    auto key = counterKey(identifier, isDemo, windowStart(clock_->wallNow()));
    auto stored = store_->get(key);
    if (!stored) {
        return GatewayResult<int64_t>::err(stored.error());
    }
    if (!stored.value()) {
        return GatewayResult<int64_t>::ok(0);
    }

    const auto& text = *stored.value();
    int64_t count = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), count);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return GatewayResult<int64_t>::err(
            GatewayError(ErrorCode::StoreValueMalformed, "malformed counter under " + key));
    }
    return GatewayResult<int64_t>::ok(count);
}

void RateLimiter::resetLimit(std::string_view identifier, bool isDemo) {
    auto key = counterKey(identifier, isDemo, windowStart(clock_->wallNow()));
    auto removed = store_->remove(key);
    if (!removed) {
        LogContext ctx;
        ctx.identifier = std::string(identifier);
        ctx.extra["error"] = std::string(removed.error().message());
        GatewayLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Quota,
                                                 "failed to reset rate limit", ctx);
    }
}

int64_t RateLimiter::windowStart(std::chrono::system_clock::time_point now) const {
    auto seconds = foundation::toUnixSeconds(now);
    auto window = static_cast<int64_t>(config_.window.count());
    return seconds - (seconds % window);
}

std::string RateLimiter::counterKey(std::string_view identifier, bool isDemo,
                                    int64_t start) const {
    std::string key(isDemo ? kDemoKeyPrefix : kKeyPrefix);
    key += identifier;
    key += ':';
    key += std::to_string(start);
    return key;
}

int64_t RateLimiter::limitFor(bool isDemo, bool isAdmin) const noexcept {
    if (isAdmin) {
        return config_.adminLimit;
    }
    return isDemo ? config_.demoLimit : config_.authenticatedLimit;
}

} // namespace pgw::service
