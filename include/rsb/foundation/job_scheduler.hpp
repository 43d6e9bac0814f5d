#pragma once

/// @file job_scheduler.hpp
/// @brief JobScheduler wrapping kcenon thread_system for backend work.

#include "rsb/foundation/service_result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

namespace rsb::foundation {

/// Priority levels for scheduled jobs.
///
/// Maps to kcenon::thread::job_priority internally:
///   Critical -> highest, High -> high, Normal -> normal, Low -> low
enum class JobPriority { Critical, High, Normal, Low };

/// Job scheduler wrapping kcenon's thread_system.
///
/// Backend handlers run their pipelines here so that the bridge only ever
/// waits on a future. Uses PIMPL to keep thread_system headers out of the
/// public API.
///
/// Example:
/// @code
///   JobScheduler scheduler(4);
///   auto id = scheduler.schedule([] { runStage(); }, JobPriority::High);
///   scheduler.wait(id.value());
/// @endcode
class JobScheduler {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;

    /// Construct a scheduler backed by a thread pool with @p numThreads workers.
    explicit JobScheduler(std::size_t numThreads = std::thread::hardware_concurrency());

    ~JobScheduler();

    // Non-copyable, movable.
    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;
    JobScheduler(JobScheduler&&) noexcept;
    JobScheduler& operator=(JobScheduler&&) noexcept;

    /// Schedule a tracked job with the given priority.
    /// @return The assigned JobId, to be passed to wait() or cancel().
    ServiceResult<JobId> schedule(JobFunc job, JobPriority priority = JobPriority::Normal);

    /// Schedule an untracked job. The job is responsible for reporting its
    /// own completion (typically through a promise).
    ServiceResult<void> post(JobFunc job, JobPriority priority = JobPriority::Normal);

    /// Block until the job identified by @p id completes and forget it.
    /// @return Success, JobNotFound, JobCancelled, or ThreadError if the
    ///         job threw.
    ServiceResult<void> wait(JobId id);

    /// Request cancellation of a pending job. A job that already started
    /// runs to completion.
    ServiceResult<void> cancel(JobId id);

    /// Number of tracked jobs not yet waited on.
    [[nodiscard]] std::size_t trackedCount() const;

    /// Number of worker threads.
    [[nodiscard]] std::size_t workerCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace rsb::foundation
