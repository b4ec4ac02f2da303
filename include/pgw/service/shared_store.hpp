#pragma once

/// @file shared_store.hpp
/// @brief Shared counting/caching store interface and in-memory implementation.
///
/// Abstracts the key-value store behind rate counters and the health cache
/// so the components can run against any backend (in-memory, Redis, ...).

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "pgw/foundation/clock.hpp"
#include "pgw/foundation/gateway_result.hpp"

namespace pgw::service {

/// Abstract interface for the shared store.
///
/// Implementations must be thread-safe when shared across threads.
class ISharedStore {
public:
    virtual ~ISharedStore() = default;

    /// Value stored under @p key, or nullopt when absent or expired.
    [[nodiscard]] virtual foundation::GatewayResult<std::optional<std::string>> get(
        std::string_view key) = 0;

    /// Atomically increment the integer counter under @p key unless it has
    /// already reached @p ceiling, and (re)arm its expiry to @p ttl.
    ///
    /// @return The new count, or nullopt when the count was already at or
    ///         above the ceiling (nothing is written in that case).
    [[nodiscard]] virtual foundation::GatewayResult<std::optional<int64_t>> incrementIfBelow(
        std::string_view key, int64_t ceiling, std::chrono::seconds ttl) = 0;

    /// Store @p value under @p key, expiring after @p ttl.
    virtual foundation::GatewayResult<void> setWithTtl(std::string_view key, std::string value,
                                                       std::chrono::seconds ttl) = 0;

    /// Delete @p key. Removing an absent key succeeds.
    virtual foundation::GatewayResult<void> remove(std::string_view key) = 0;
};

/// Thread-safe process-local store with lazy TTL expiry.
///
/// Entries expire against the injected clock's monotonic time and are
/// dropped on the next access that observes them expired.
class InMemorySharedStore : public ISharedStore {
public:
    explicit InMemorySharedStore(
        std::shared_ptr<foundation::IClock> clock = foundation::SystemClock::shared());

    [[nodiscard]] foundation::GatewayResult<std::optional<std::string>> get(
        std::string_view key) override;

    [[nodiscard]] foundation::GatewayResult<std::optional<int64_t>> incrementIfBelow(
        std::string_view key, int64_t ceiling, std::chrono::seconds ttl) override;

    foundation::GatewayResult<void> setWithTtl(std::string_view key, std::string value,
                                               std::chrono::seconds ttl) override;

    foundation::GatewayResult<void> remove(std::string_view key) override;

    /// Number of live (unexpired) entries.
    [[nodiscard]] std::size_t size();

private:
    struct Entry {
        std::string value;
        std::chrono::steady_clock::time_point expiresAt;
    };

    /// Live entry for @p key, erasing it when expired. Caller holds mutex_.
    Entry* findLive(const std::string& key);

    std::shared_ptr<foundation::IClock> clock_;
    std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace pgw::service
