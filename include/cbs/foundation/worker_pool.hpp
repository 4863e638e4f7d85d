#pragma once

/// @file worker_pool.hpp
/// @brief Bounded worker pool wrapping kcenon thread_system.
///
/// Password hashing is the only intentionally expensive step in the
/// identity core. Running it on a fixed number of workers caps the CPU it
/// can take from request intake under a burst of logins.

#include "cbs/foundation/api_result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

namespace cbs::foundation {

/// Fixed-size pool of worker threads.
///
/// Example:
/// @code
///   WorkerPool pool(4);
///   std::string digest;
///   auto done = pool.run([&] { digest = expensiveHash(); });
/// @endcode
class WorkerPool {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;

    /// Start @p numThreads workers (at least one).
    explicit WorkerPool(std::size_t numThreads = std::thread::hardware_concurrency());

    /// Stops the pool after running jobs finish.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) noexcept;
    WorkerPool& operator=(WorkerPool&&) noexcept;

    /// Queue a job.
    /// @return Its JobId, or JobScheduleFailed if the pool rejected it.
    ApiResult<JobId> schedule(JobFunc job);

    /// Block until job @p id has run, then forget it.
    /// @return Success, JobNotFound, or ThreadError if the job threw.
    ApiResult<void> wait(JobId id);

    /// schedule() followed by wait().
    ApiResult<void> run(JobFunc job);

    [[nodiscard]] std::size_t workerCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace cbs::foundation
