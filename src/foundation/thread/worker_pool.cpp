/// @file worker_pool.cpp
/// @brief WorkerPool implementation over kcenon thread_system.

#include "cbs/foundation/worker_pool.hpp"

#include <kcenon/thread/core/job_builder.h>
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cbs::foundation {

struct WorkerPool::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::size_t workers = 0;
    std::atomic<uint64_t> nextJobId{1};

    std::unordered_map<JobId, std::shared_future<void>> futures;
    std::mutex mutex;
};

WorkerPool::WorkerPool(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    impl_->workers = std::max<std::size_t>(numThreads, 1);
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("cbs.WorkerPool");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(impl_->workers);
    for (std::size_t i = 0; i < impl_->workers; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

WorkerPool::~WorkerPool() {
    if (impl_ && impl_->pool) {
        impl_->pool->stop(false);
    }
}

WorkerPool::WorkerPool(WorkerPool&&) noexcept = default;
WorkerPool& WorkerPool::operator=(WorkerPool&&) noexcept = default;

ApiResult<WorkerPool::JobId> WorkerPool::schedule(JobFunc job) {
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    auto threadJob = kcenon::thread::job_builder()
        .name("cbs_job_" + std::to_string(id))
        .work([fn = std::move(job), promise]() -> kcenon::common::VoidResult {
            try {
                fn();
                promise->set_value();
            } catch (...) {
                // Delivered to the waiter through the future.
                promise->set_exception(std::current_exception());
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        return ApiResult<JobId>::err(
            ApiError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }

    {
        std::lock_guard lock(impl_->mutex);
        impl_->futures.emplace(id, std::move(future));
    }
    return ApiResult<JobId>::ok(id);
}

ApiResult<void> WorkerPool::wait(JobId id) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->futures.find(id);
        if (it == impl_->futures.end()) {
            return ApiResult<void>::err(ApiError(ErrorCode::JobNotFound, "job not found"));
        }
        future = it->second;
        impl_->futures.erase(it);
    }

    try {
        future.get();
    } catch (const std::exception& e) {
        return ApiResult<void>::err(
            ApiError(ErrorCode::ThreadError, std::string("job execution failed: ") + e.what()));
    } catch (...) {
        return ApiResult<void>::err(ApiError(ErrorCode::ThreadError, "job execution failed"));
    }
    return ApiResult<void>::ok();
}

ApiResult<void> WorkerPool::run(JobFunc job) {
    auto id = schedule(std::move(job));
    if (id.hasError()) {
        return ApiResult<void>::err(id.error());
    }
    return wait(id.value());
}

std::size_t WorkerPool::workerCount() const noexcept {
    return impl_ ? impl_->workers : 0;
}

} // namespace cbs::foundation
