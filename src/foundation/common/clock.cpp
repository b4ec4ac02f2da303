/// @file clock.cpp
/// @brief SystemClock and ManualClock implementations.

#include "pgw/foundation/clock.hpp"

namespace pgw::foundation {

namespace {

// 2026-01-01T00:00:00Z
constexpr int64_t kManualClockEpoch = 1767225600;

} // anonymous namespace

std::chrono::steady_clock::time_point SystemClock::monotonicNow() const {
    return std::chrono::steady_clock::now();
}

std::chrono::system_clock::time_point SystemClock::wallNow() const {
    return std::chrono::system_clock::now();
}

std::shared_ptr<SystemClock> SystemClock::shared() {
    static auto inst = std::make_shared<SystemClock>();
    return inst;
}

ManualClock::ManualClock()
    : monotonic_(std::chrono::steady_clock::time_point{} + std::chrono::hours(1)),
      wall_(std::chrono::system_clock::time_point{} +
            std::chrono::seconds(kManualClockEpoch)) {}

std::chrono::steady_clock::time_point ManualClock::monotonicNow() const {
    std::lock_guard lock(mutex_);
    return monotonic_;
}

std::chrono::system_clock::time_point ManualClock::wallNow() const {
    std::lock_guard lock(mutex_);
    return wall_;
}

void ManualClock::advance(std::chrono::milliseconds delta) {
    std::lock_guard lock(mutex_);
    monotonic_ += delta;
    wall_ += delta;
}

void ManualClock::setWallSeconds(int64_t unixSeconds) {
    std::lock_guard lock(mutex_);
    auto target = std::chrono::system_clock::time_point{} + std::chrono::seconds(unixSeconds);
    if (target > wall_) {
        monotonic_ += std::chrono::duration_cast<std::chrono::steady_clock::duration>(target - wall_);
    }
    wall_ = target;
}

} // namespace pgw::foundation
