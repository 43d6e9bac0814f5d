/// @file job_scheduler.cpp
/// @brief JobScheduler implementation wrapping kcenon thread_system.

#include "rsb/foundation/job_scheduler.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rsb::foundation {

// ---------------------------------------------------------------------------
// Priority mapping: rsb -> kcenon
// ---------------------------------------------------------------------------
static kcenon::thread::job_priority mapPriority(JobPriority p) {
    switch (p) {
        case JobPriority::Critical: return kcenon::thread::job_priority::highest;
        case JobPriority::High:     return kcenon::thread::job_priority::high;
        case JobPriority::Normal:   return kcenon::thread::job_priority::normal;
        case JobPriority::Low:      return kcenon::thread::job_priority::low;
    }
    return kcenon::thread::job_priority::normal;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct JobScheduler::Impl {
    struct Tracked {
        std::shared_future<void> future;
        std::shared_ptr<std::atomic<bool>> cancelled;
    };

    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::size_t workers{0};
    std::atomic<uint64_t> nextJobId{1};

    std::unordered_map<JobId, Tracked> tracked;
    mutable std::mutex mutex;

    bool enqueue(std::string name, JobPriority priority, JobFunc fn) {
        auto threadJob = kcenon::thread::job_builder()
            .name(std::move(name))
            .priority(mapPriority(priority))
            .work([fn = std::move(fn)]() -> kcenon::common::VoidResult {
                fn();
                return kcenon::common::VoidResult::ok(std::monostate{});
            })
            .build();
        return !pool->enqueue(std::move(threadJob)).is_err();
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
JobScheduler::JobScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    if (numThreads == 0) {
        numThreads = 1;
    }
    impl_->workers = numThreads;
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("rsb_job_scheduler");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(numThreads);
    for (std::size_t i = 0; i < numThreads; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

JobScheduler::~JobScheduler() {
    if (impl_ && impl_->pool) {
        impl_->pool->stop(false); // graceful: wait for running jobs
    }
}

JobScheduler::JobScheduler(JobScheduler&&) noexcept = default;
JobScheduler& JobScheduler::operator=(JobScheduler&&) noexcept = default;

// ---------------------------------------------------------------------------
// schedule()
// ---------------------------------------------------------------------------
ServiceResult<JobScheduler::JobId> JobScheduler::schedule(JobFunc job, JobPriority priority) {
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    auto work = [fn = std::move(job), cancelled, promise]() {
        std::exception_ptr failure;
        if (!cancelled->load(std::memory_order_acquire)) {
            try {
                fn();
            } catch (...) {
                failure = std::current_exception();
            }
        }
        if (failure) {
            promise->set_exception(failure);
        } else {
            promise->set_value();
        }
    };

    // Register before enqueueing so a fast worker cannot outrun wait().
    {
        std::lock_guard lock(impl_->mutex);
        impl_->tracked[id] = Impl::Tracked{future, cancelled};
    }

    if (!impl_->enqueue("rsb_job_" + std::to_string(id), priority, std::move(work))) {
        std::lock_guard lock(impl_->mutex);
        impl_->tracked.erase(id);
        return ServiceResult<JobId>::err(
            ServiceError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }

    return ServiceResult<JobId>::ok(id);
}

// ---------------------------------------------------------------------------
// post()
// ---------------------------------------------------------------------------
ServiceResult<void> JobScheduler::post(JobFunc job, JobPriority priority) {
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    if (!impl_->enqueue("rsb_post_" + std::to_string(id), priority, std::move(job))) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }
    return ServiceResult<void>::ok();
}

// ---------------------------------------------------------------------------
// wait()
// ---------------------------------------------------------------------------
ServiceResult<void> JobScheduler::wait(JobId id) {
    Impl::Tracked entry;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->tracked.find(id);
        if (it == impl_->tracked.end()) {
            return ServiceResult<void>::err(
                ServiceError(ErrorCode::JobNotFound, "job not found"));
        }
        entry = it->second;
    }

    entry.future.wait();
    {
        std::lock_guard lock(impl_->mutex);
        impl_->tracked.erase(id);
    }

    if (entry.cancelled->load(std::memory_order_acquire)) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::JobCancelled, "job was cancelled"));
    }

    try {
        entry.future.get();
    } catch (const std::exception& e) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ThreadError, std::string("job execution failed: ") + e.what()));
    } catch (...) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ThreadError, "job execution failed"));
    }

    return ServiceResult<void>::ok();
}

// ---------------------------------------------------------------------------
// cancel()
// ---------------------------------------------------------------------------
ServiceResult<void> JobScheduler::cancel(JobId id) {
    std::lock_guard lock(impl_->mutex);

    auto it = impl_->tracked.find(id);
    if (it == impl_->tracked.end()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::JobNotFound, "job not found"));
    }

    auto status = it->second.future.wait_for(std::chrono::seconds(0));
    if (status == std::future_status::ready) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::JobCancelled, "job already completed"));
    }

    it->second.cancelled->store(true, std::memory_order_release);
    return ServiceResult<void>::ok();
}

std::size_t JobScheduler::trackedCount() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->tracked.size();
}

std::size_t JobScheduler::workerCount() const noexcept {
    return impl_->workers;
}

} // namespace rsb::foundation
