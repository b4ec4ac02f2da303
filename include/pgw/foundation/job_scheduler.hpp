#pragma once

/// @file job_scheduler.hpp
/// @brief GatewayJobScheduler wrapping kcenon thread_system for fan-out work.

#include "pgw/foundation/gateway_result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

namespace pgw::foundation {

/// Thread-pool backed scheduler used to run independent jobs concurrently
/// (one liveness probe per provider). PIMPL keeps thread_system headers
/// out of the public API.
///
/// Example:
/// @code
///   GatewayJobScheduler scheduler(4);
///   auto id = scheduler.schedule([] { probeProvider("groq"); });
///   scheduler.wait(id.value());
/// @endcode
class GatewayJobScheduler {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;

    /// Construct a scheduler backed by @p numThreads workers.
    explicit GatewayJobScheduler(std::size_t numThreads = std::thread::hardware_concurrency());

    ~GatewayJobScheduler();

    GatewayJobScheduler(const GatewayJobScheduler&) = delete;
    GatewayJobScheduler& operator=(const GatewayJobScheduler&) = delete;
    GatewayJobScheduler(GatewayJobScheduler&&) noexcept;
    GatewayJobScheduler& operator=(GatewayJobScheduler&&) noexcept;

    /// Enqueue a job.
    /// @return The assigned JobId, or JobScheduleFailed.
    GatewayResult<JobId> schedule(JobFunc job);

    /// Block until the job completes and forget it.
    /// @return Success, JobNotFound, or ThreadError if the job threw.
    GatewayResult<void> wait(JobId id);

    /// Number of worker threads.
    [[nodiscard]] std::size_t workerCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace pgw::foundation
