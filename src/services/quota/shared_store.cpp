/// @file shared_store.cpp
/// @brief InMemorySharedStore implementation.

#include "pgw/service/shared_store.hpp"

#include <charconv>

#include "pgw/foundation/gateway_logger.hpp"

namespace pgw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;

InMemorySharedStore::InMemorySharedStore(std::shared_ptr<foundation::IClock> clock)
    : clock_(std::move(clock)) {}

GatewayResult<std::optional<std::string>> InMemorySharedStore::get(std::string_view key) {
    std::lock_guard lock(mutex_);
    auto* entry = findLive(std::string(key));
    if (entry == nullptr) {
        return GatewayResult<std::optional<std::string>>::ok(std::nullopt);
    }
    return GatewayResult<std::optional<std::string>>::ok(entry->value);
}

GatewayResult<std::optional<int64_t>> InMemorySharedStore::incrementIfBelow(
    std::string_view key, int64_t ceiling, std::chrono::seconds ttl) {
    std::lock_guard lock(mutex_);
    auto name = std::string(key);

    int64_t count = 0;
    if (auto* entry = findLive(name)) {
        const auto* first = entry->value.data();
        const auto* last = first + entry->value.size();
        auto [ptr, ec] = std::from_chars(first, last, count);
        if (ec != std::errc{} || ptr != last) {
            PGW_LOG_WARN(foundation::LogCategory::Store,
                         "refusing to increment non-integer value under " + name);
            return GatewayResult<std::optional<int64_t>>::err(
                GatewayError(ErrorCode::StoreValueMalformed,
                             "value under '" + name + "' is not an integer counter"));
        }
    }

    if (count >= ceiling) {
        return GatewayResult<std::optional<int64_t>>::ok(std::nullopt);
    }

    ++count;
    entries_.insert_or_assign(std::move(name),
                              Entry{std::to_string(count), clock_->monotonicNow() + ttl});
    return GatewayResult<std::optional<int64_t>>::ok(count);
}

GatewayResult<void> InMemorySharedStore::setWithTtl(std::string_view key, std::string value,
                                                    std::chrono::seconds ttl) {
    std::lock_guard lock(mutex_);
    entries_.insert_or_assign(std::string(key),
                              Entry{std::move(value), clock_->monotonicNow() + ttl});
    return GatewayResult<void>::ok();
}

GatewayResult<void> InMemorySharedStore::remove(std::string_view key) {
    std::lock_guard lock(mutex_);
    entries_.erase(std::string(key));
    return GatewayResult<void>::ok();
}

std::size_t InMemorySharedStore::size() {
    std::lock_guard lock(mutex_);
    auto now = clock_->monotonicNow();
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expiresAt <= now) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    return entries_.size();
}

InMemorySharedStore::Entry* InMemorySharedStore::findLive(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    if (it->second.expiresAt <= clock_->monotonicNow()) {
        entries_.erase(it);
        return nullptr;
    }
    return &it->second;
}

} // namespace pgw::service
