/// @file staged_backend.cpp
/// @brief StagedBackend implementation on top of JobScheduler.

#include "rsb/service/staged_backend.hpp"

#include "rsb/foundation/service_logger.hpp"

#include <exception>
#include <mutex>
#include <thread>
#include <utility>

namespace rsb::service {

using namespace rsb::foundation;

// ── Impl ────────────────────────────────────────────────────────────────────

// Shared with in-flight jobs so a request may finish after the backend
// object itself is gone.
struct StagedBackend::Impl {
    StagedBackendConfig config;

    mutable std::mutex mutex;
    std::vector<Stage> stages;
    BackendStatus lastStatus{BackendStatus::Initializing};
    uint32_t inFlight{0};
    uint64_t processed{0};
    double avgResponseTime{0.0};
    double successRate{1.0};
    std::map<std::string, uint64_t> stageUsage;

    std::vector<Stage> snapshotStages() {
        std::lock_guard lock(mutex);
        ++inFlight;
        return stages;
    }

    void finish(double elapsed, bool success, const std::vector<std::string>& ran) {
        std::lock_guard lock(mutex);
        --inFlight;
        ++processed;
        auto n = static_cast<double>(processed);
        avgResponseTime = (avgResponseTime * (n - 1.0) + elapsed) / n;
        successRate = (successRate * (n - 1.0) + (success ? 1.0 : 0.0)) / n;
        for (const auto& id : ran) {
            ++stageUsage[id];
        }
        lastStatus = success ? BackendStatus::Ready : BackendStatus::Error;
    }

    BackendResult run(const std::string& content) {
        auto start = std::chrono::steady_clock::now();
        auto pipeline = snapshotStages();

        std::vector<std::string> ran;
        ran.reserve(pipeline.size());

        auto elapsed = [&start] {
            return std::chrono::duration<double>(std::chrono::steady_clock::now() - start)
                .count();
        };

        auto fail = [&](std::string message) {
            finish(elapsed(), false, ran);
            RSB_LOG_WARN(LogCategory::Backend, message);
            return BackendResult::err(ServiceError(ErrorCode::StageFailed, std::move(message)));
        };

        if (pipeline.empty()) {
            return fail("backend '" + config.name + "' has no stages");
        }

        std::string current = content;
        for (const auto& stage : pipeline) {
            if (config.stageDelay.count() > 0) {
                std::this_thread::sleep_for(config.stageDelay);
            }

            ServiceResult<std::string> out = ServiceResult<std::string>::err(
                ServiceError(ErrorCode::StageFailed, "stage did not run"));
            try {
                out = stage.func(current);
            } catch (const std::exception& e) {
                ran.push_back(stage.id);
                return fail("stage '" + stage.id + "' threw: " + e.what());
            } catch (...) {
                ran.push_back(stage.id);
                return fail("stage '" + stage.id + "' threw a non-standard exception");
            }

            ran.push_back(stage.id);
            if (out.hasError()) {
                return fail("stage '" + stage.id + "' failed: " +
                            std::string(out.error().message()));
            }
            current = std::move(out).value();
        }

        auto seconds = elapsed();
        finish(seconds, true, ran);

        LogContext ctx;
        ctx.extra["backend"] = config.name;
        ctx.extra["stages"] = std::to_string(ran.size());
        ServiceLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Backend,
                                                 "pipeline completed", ctx);

        return BackendResult::ok(
            Response::succeeded(std::move(current), config.confidence, seconds, std::move(ran)));
    }
};

// ── StagedBackend ───────────────────────────────────────────────────────────

StagedBackend::StagedBackend(StagedBackendConfig config,
                             std::shared_ptr<JobScheduler> scheduler)
    : impl_(std::make_shared<Impl>()), scheduler_(std::move(scheduler)) {
    impl_->config = std::move(config);
}

StagedBackend::~StagedBackend() = default;

void StagedBackend::addStage(std::string id, StageFunc func) {
    std::lock_guard lock(impl_->mutex);
    impl_->stages.push_back(Stage{std::move(id), std::move(func)});
    if (impl_->lastStatus == BackendStatus::Initializing) {
        impl_->lastStatus = BackendStatus::Ready;
    }
}

std::future<BackendResult> StagedBackend::handle(const Request& request) {
    auto promise = std::make_shared<std::promise<BackendResult>>();
    auto future = promise->get_future();

    if (!scheduler_) {
        promise->set_value(BackendResult::err(
            ServiceError(ErrorCode::BackendFailure, "backend has no scheduler")));
        return future;
    }

    auto posted = scheduler_->post(
        [impl = impl_, promise, content = request.content()] {
            promise->set_value(impl->run(content));
        },
        JobPriority::Normal);

    if (posted.hasError()) {
        promise->set_value(BackendResult::err(posted.error()));
    }
    return future;
}

std::string_view StagedBackend::name() const {
    return impl_->config.name;
}

BackendMetrics StagedBackend::metrics() const {
    std::lock_guard lock(impl_->mutex);
    BackendMetrics m;
    m.name = impl_->config.name;
    m.status = impl_->inFlight > 0 ? BackendStatus::Processing : impl_->lastStatus;
    m.messagesProcessed = impl_->processed;
    m.avgResponseTime = impl_->avgResponseTime;
    m.successRate = impl_->successRate;
    m.stageUsage = impl_->stageUsage;
    return m;
}

std::size_t StagedBackend::stageCount() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->stages.size();
}

}  // namespace rsb::service
