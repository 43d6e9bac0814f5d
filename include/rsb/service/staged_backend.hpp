#pragma once

/// @file staged_backend.hpp
/// @brief Backend handler running a fixed pipeline of named stages.
///
/// Each request runs the stages in order on the job scheduler; the output
/// of one stage is the input of the next and the final output becomes the
/// response content.

#include "rsb/foundation/job_scheduler.hpp"
#include "rsb/foundation/service_result.hpp"
#include "rsb/service/ibackend_handler.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rsb::service {

/// One pipeline step: transforms its input or fails.
using StageFunc = std::function<foundation::ServiceResult<std::string>(std::string_view)>;

/// A named pipeline step.
struct Stage {
    std::string id;
    StageFunc func;
};

/// Configuration for a StagedBackend.
struct StagedBackendConfig {
    std::string name = "staged";

    /// Confidence reported on successful responses.
    double confidence = 0.95;

    /// Simulated work per stage. Sleeps on a scheduler worker, never on
    /// the caller's thread.
    std::chrono::milliseconds stageDelay{0};
};

/// Staged pipeline backend.
///
/// Usage:
/// @code
///   auto scheduler = std::make_shared<JobScheduler>(2);
///   auto backend = std::make_shared<StagedBackend>(
///       StagedBackendConfig{.name = "echo"}, scheduler);
///   backend->addStage("upper", [](std::string_view in) {
///       return ServiceResult<std::string>::ok(toUpper(in));
///   });
///   auto response = backend->handle(Request("hello")).get();
/// @endcode
///
/// Stages must be added before the first request is handled.
class StagedBackend : public IBackendHandler {
public:
    StagedBackend(StagedBackendConfig config,
                  std::shared_ptr<foundation::JobScheduler> scheduler);
    ~StagedBackend() override;

    StagedBackend(const StagedBackend&) = delete;
    StagedBackend& operator=(const StagedBackend&) = delete;

    /// Append a stage to the pipeline. Marks the backend ready.
    void addStage(std::string id, StageFunc func);

    [[nodiscard]] std::future<BackendResult> handle(const Request& request) override;

    [[nodiscard]] std::string_view name() const override;

    [[nodiscard]] BackendMetrics metrics() const override;

    /// Number of configured stages.
    [[nodiscard]] std::size_t stageCount() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
    std::shared_ptr<foundation::JobScheduler> scheduler_;
};

}  // namespace rsb::service
