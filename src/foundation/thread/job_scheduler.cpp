/// @file job_scheduler.cpp
/// @brief GatewayJobScheduler implementation wrapping kcenon thread_system.

#include "pgw/foundation/job_scheduler.hpp"

#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pgw::foundation {

struct GatewayJobScheduler::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::size_t workers{0};
    std::atomic<uint64_t> nextJobId{1};

    std::unordered_map<JobId, std::shared_future<void>> futures;
    std::mutex mutex;
};

GatewayJobScheduler::GatewayJobScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    impl_->workers = std::max<std::size_t>(numThreads, 1);
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("GatewayJobScheduler");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(impl_->workers);
    for (std::size_t i = 0; i < impl_->workers; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

GatewayJobScheduler::~GatewayJobScheduler() {
    if (impl_ && impl_->pool) {
        impl_->pool->stop(false); // graceful: wait for running jobs
    }
}

GatewayJobScheduler::GatewayJobScheduler(GatewayJobScheduler&&) noexcept = default;
GatewayJobScheduler& GatewayJobScheduler::operator=(GatewayJobScheduler&&) noexcept = default;

GatewayResult<GatewayJobScheduler::JobId> GatewayJobScheduler::schedule(JobFunc job) {
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    auto threadJob = kcenon::thread::job_builder()
        .name("pgw_job_" + std::to_string(id))
        .work([fn = std::move(job), promise]() -> kcenon::common::VoidResult {
            // The exception travels to wait() through the promise.
            try {
                fn();
                promise->set_value();
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    {
        std::lock_guard lock(impl_->mutex);
        impl_->futures[id] = future;
    }

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        std::lock_guard lock(impl_->mutex);
        impl_->futures.erase(id);
        return GatewayResult<JobId>::err(
            GatewayError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }

    return GatewayResult<JobId>::ok(id);
}

GatewayResult<void> GatewayJobScheduler::wait(JobId id) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->futures.find(id);
        if (it == impl_->futures.end()) {
            return GatewayResult<void>::err(
                GatewayError(ErrorCode::JobNotFound, "job not found"));
        }
        future = it->second;
    }

    GatewayResult<void> outcome = GatewayResult<void>::ok();
    try {
        future.get();
    } catch (const std::exception& e) {
        outcome = GatewayResult<void>::err(
            GatewayError(ErrorCode::ThreadError, std::string("job execution failed: ") + e.what()));
    } catch (...) {
        outcome = GatewayResult<void>::err(
            GatewayError(ErrorCode::ThreadError, "job execution failed: non-standard exception"));
    }

    std::lock_guard lock(impl_->mutex);
    impl_->futures.erase(id);
    return outcome;
}

std::size_t GatewayJobScheduler::workerCount() const noexcept {
    return impl_ ? impl_->workers : 0;
}

} // namespace pgw::foundation
