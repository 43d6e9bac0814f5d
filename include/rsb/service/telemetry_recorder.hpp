#pragma once

/// @file telemetry_recorder.hpp
/// @brief Buffered telemetry samples and request aggregates.
///
/// The recorder appends named samples to an in-memory buffer and hands
/// the buffer to a sink once it reaches the flush threshold. It also
/// owns the bridge's aggregate request statistics.

#include "rsb/foundation/service_metrics.hpp"
#include "rsb/foundation/service_result.hpp"
#include "rsb/foundation/types.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace rsb::service {

/// One buffered measurement.
struct TelemetrySample {
    std::string name;
    double value = 0.0;
    foundation::TimePoint timestamp{};
    foundation::MetricLabels labels;
};

/// Aggregate request statistics.
struct TelemetrySnapshot {
    uint64_t requestCount = 0;
    uint64_t errorCount = 0;
    uint64_t successCount = 0;
    uint64_t cacheHits = 0;
    double latencySum = 0.0;   ///< Seconds.
    double avgLatency = 0.0;   ///< Seconds, maintained incrementally.

    /// errors / max(requests, 1).
    [[nodiscard]] double errorRate() const noexcept {
        return static_cast<double>(errorCount) /
               static_cast<double>(requestCount > 0 ? requestCount : 1);
    }
};

/// Receives a batch of samples on flush.
using TelemetrySink = std::function<void(const std::vector<TelemetrySample>&)>;

/// Configuration for the telemetry recorder.
struct TelemetryConfig {
    /// Buffer size that triggers flushIfDue(). Must be >= 1.
    std::size_t flushThreshold = 10;

    /// Prefix applied to metric names by the default sink.
    std::string metricPrefix = "rsb_";

    [[nodiscard]] foundation::ServiceResult<void> validate() const;
};

/// Build the default sink: counters for request_success, request_error and
/// cache_hit, a histogram for response_time, gauges for every other name.
[[nodiscard]] TelemetrySink metricsSink(foundation::ServiceMetrics& metrics,
                                        std::string prefix = "rsb_");

/// Thread-safe telemetry buffer plus aggregate statistics.
///
/// record() never fails and only holds the recorder lock long enough to
/// append. The sink runs outside the lock; a sink that throws loses its
/// batch, which is logged.
class TelemetryRecorder {
public:
    explicit TelemetryRecorder(TelemetryConfig config = {},
                               TelemetrySink sink = {},
                               foundation::TimeSource clock = foundation::wallClock());

    /// Append a sample.
    void record(std::string_view name, double value, foundation::MetricLabels labels = {});

    /// Flush if the buffer holds at least flushThreshold samples.
    /// @return Number of samples handed to the sink.
    std::size_t flushIfDue();

    /// Flush unconditionally.
    /// @return Number of samples handed to the sink.
    std::size_t flush();

    /// Update the aggregates for one finished request.
    ///
    /// @param latency  Request latency in seconds.
    /// @param success  Whether the request succeeded.
    /// @param cacheHit Whether it was served from cache.
    /// @return The aggregates after the update.
    TelemetrySnapshot recordRequest(double latency, bool success, bool cacheHit);

    [[nodiscard]] TelemetrySnapshot snapshot() const;

    /// Samples currently buffered.
    [[nodiscard]] std::size_t pending() const;

    /// Total number of samples handed to the sink.
    [[nodiscard]] uint64_t flushedCount() const;

    /// Total number of samples lost to sink failures.
    [[nodiscard]] uint64_t droppedCount() const;

    [[nodiscard]] const TelemetryConfig& config() const noexcept { return config_; }

private:
    std::size_t deliver(std::vector<TelemetrySample> batch);

    TelemetryConfig config_;
    TelemetrySink sink_;
    foundation::TimeSource clock_;

    mutable std::mutex mutex_;
    std::vector<TelemetrySample> buffer_;
    TelemetrySnapshot stats_;
    uint64_t flushed_{0};
    uint64_t dropped_{0};
};

} // namespace rsb::service
