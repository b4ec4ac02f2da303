#pragma once

/// @file clock.hpp
/// @brief Injectable time source for window bucketing and timeout checks.

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

namespace pgw::foundation {

/// Time source consumed by the breaker, rate limiter, store and health checker.
///
/// monotonicNow() drives elapsed-time comparisons (breaker recovery, TTL
/// expiry); wallNow() drives fixed-window bucketing and reported timestamps.
class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual std::chrono::steady_clock::time_point monotonicNow() const = 0;
    [[nodiscard]] virtual std::chrono::system_clock::time_point wallNow() const = 0;
};

/// Production clock backed by std::chrono.
class SystemClock final : public IClock {
public:
    [[nodiscard]] std::chrono::steady_clock::time_point monotonicNow() const override;
    [[nodiscard]] std::chrono::system_clock::time_point wallNow() const override;

    /// Shared process-wide instance, used as the default for every component.
    static std::shared_ptr<SystemClock> shared();
};

/// Settable clock; both time lines move together on advance().
///
/// Thread-safe, so concurrent tests may read it while one thread advances.
///
/// Example:
/// @code
///   auto clock = std::make_shared<ManualClock>();
///   CircuitBreakerRegistry breakers({}, clock);
///   ...
///   clock->advance(std::chrono::seconds(60));
/// @endcode
class ManualClock final : public IClock {
public:
    /// Starts at wall time 2026-01-01T00:00:00Z.
    ManualClock();

    [[nodiscard]] std::chrono::steady_clock::time_point monotonicNow() const override;
    [[nodiscard]] std::chrono::system_clock::time_point wallNow() const override;

    void advance(std::chrono::milliseconds delta);

    /// Jump the wall clock to the given Unix second; monotonic time moves
    /// forward by the same amount, or not at all when jumping backwards.
    void setWallSeconds(int64_t unixSeconds);

private:
    mutable std::mutex mutex_;
    std::chrono::steady_clock::time_point monotonic_;
    std::chrono::system_clock::time_point wall_;
};

/// Unix seconds of a wall-clock time point.
[[nodiscard]] inline int64_t toUnixSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

/// Unix milliseconds of a wall-clock time point.
[[nodiscard]] inline int64_t toUnixMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace pgw::foundation
