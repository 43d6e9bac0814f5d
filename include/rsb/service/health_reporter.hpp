#pragma once

/// @file health_reporter.hpp
/// @brief Read-only health and metrics views over a ResilientBridge.

#include "rsb/foundation/types.hpp"
#include "rsb/service/circuit_breaker.hpp"
#include "rsb/service/ibackend_handler.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace rsb::service {

class ResilientBridge;

/// Overall health of the bridge.
enum class HealthStatus : uint8_t {
    Healthy,
    Degraded
};

[[nodiscard]] constexpr std::string_view toString(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy:
            return "healthy";
        case HealthStatus::Degraded:
            return "degraded";
    }
    return "unknown";
}

/// Point-in-time metrics of a bridge and its backend.
struct BridgeMetricsReport {
    uint64_t requestsTotal = 0;
    uint64_t errorsTotal = 0;
    uint64_t cacheHits = 0;
    double errorRate = 0.0;          ///< errors / max(requests, 1).
    double avgLatencySeconds = 0.0;
    std::size_t cacheSize = 0;
    ServiceCircuitBreaker::State breakerState = ServiceCircuitBreaker::State::Closed;
    uint32_t breakerFailures = 0;
    uint64_t breakerRejected = 0;
    double admissionTokens = 0.0;
    BackendMetrics backend;
};

/// Health summary of a bridge.
struct HealthReport {
    HealthStatus status = HealthStatus::Healthy;
    std::map<std::string, std::string> components;
    foundation::TimePoint timestamp{};
    BridgeMetricsReport metrics;
};

/// Builds metrics and health reports from a bridge's components.
///
/// Holds a const reference only: reporting never mutates the bridge and
/// is safe to call concurrently with ResilientBridge::execute().
///
/// Usage:
/// @code
///   HealthReporter reporter(*bridge);
///   auto health = reporter.health();
///   std::cout << HealthReporter::toJson(health) << '\n';
/// @endcode
class HealthReporter {
public:
    explicit HealthReporter(const ResilientBridge& bridge,
                            foundation::TimeSource clock = foundation::wallClock());

    [[nodiscard]] BridgeMetricsReport metrics() const;

    /// Degraded iff the circuit breaker is Open.
    [[nodiscard]] HealthReport health() const;

    [[nodiscard]] static std::string toJson(const BridgeMetricsReport& report);
    [[nodiscard]] static std::string toJson(const HealthReport& report);

private:
    const ResilientBridge& bridge_;
    foundation::TimeSource clock_;
};

/// Seconds since the Unix epoch, as reported in JSON timestamps.
[[nodiscard]] double epochSeconds(foundation::TimePoint tp);

/// Append @p metrics as a JSON object to @p out.
void appendBackendJson(std::string& out, const BackendMetrics& metrics);

}  // namespace rsb::service
