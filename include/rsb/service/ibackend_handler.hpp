#pragma once

/// @file ibackend_handler.hpp
/// @brief Interface for the request-processing backend behind the bridge.

#include "rsb/service/bridge_types.hpp"

#include <cstdint>
#include <future>
#include <map>
#include <string>
#include <string_view>

namespace rsb::service {

/// Lifecycle status reported by a backend.
enum class BackendStatus : uint8_t {
    Initializing,
    Ready,
    Processing,
    Error
};

[[nodiscard]] constexpr std::string_view toString(BackendStatus status) {
    switch (status) {
        case BackendStatus::Initializing:
            return "initializing";
        case BackendStatus::Ready:
            return "ready";
        case BackendStatus::Processing:
            return "processing";
        case BackendStatus::Error:
            return "error";
    }
    return "unknown";
}

/// Backend-reported statistics, surfaced through the health reporter.
struct BackendMetrics {
    std::string name;
    BackendStatus status = BackendStatus::Initializing;
    uint64_t messagesProcessed = 0;
    double avgResponseTime = 0.0;                 ///< Seconds.
    double successRate = 1.0;                     ///< 0.0 - 1.0.
    std::map<std::string, uint64_t> stageUsage;   ///< Stage id -> invocations.
};

/// A request-processing backend.
///
/// handle() starts work and returns immediately. Implementations complete
/// the future through a std::promise; a promise destroyed without a value
/// is reported to the bridge as a cancelled call.
class IBackendHandler {
public:
    virtual ~IBackendHandler() = default;

    /// Begin processing @p request.
    [[nodiscard]] virtual std::future<BackendResult> handle(const Request& request) = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;

    [[nodiscard]] virtual BackendMetrics metrics() const = 0;
};

}  // namespace rsb::service
