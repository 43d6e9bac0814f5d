/// @file telemetry_recorder.cpp
/// @brief TelemetryRecorder implementation and the metrics sink.

#include "rsb/service/telemetry_recorder.hpp"

#include "rsb/foundation/service_logger.hpp"

#include <exception>
#include <utility>

namespace rsb::service {

using namespace rsb::foundation;

ServiceResult<void> TelemetryConfig::validate() const {
    if (flushThreshold == 0) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::InvalidArgument, "telemetry flush threshold must be >= 1"));
    }
    return ServiceResult<void>::ok();
}

// ── Default sink ────────────────────────────────────────────────────────────

TelemetrySink metricsSink(ServiceMetrics& metrics, std::string prefix) {
    metrics.registerHistogram(prefix + "response_time_ms", HistogramBuckets::defaultLatency());

    return [&metrics, prefix = std::move(prefix)](const std::vector<TelemetrySample>& batch) {
        for (const auto& sample : batch) {
            if (sample.name == "request_success" || sample.name == "request_error" ||
                sample.name == "cache_hit") {
                auto count = sample.value > 0.0 ? static_cast<uint64_t>(sample.value) : 0;
                metrics.incrementCounter(prefix + sample.name + "_total", count, sample.labels);
            } else if (sample.name == "response_time") {
                metrics.recordHistogram(prefix + "response_time_ms", sample.value, sample.labels);
            } else {
                metrics.setGauge(prefix + sample.name, sample.value, sample.labels);
            }
        }
        RSB_LOG_DEBUG(LogCategory::Telemetry,
                      "flushed " + std::to_string(batch.size()) + " samples");
    };
}

// ── TelemetryRecorder ───────────────────────────────────────────────────────

TelemetryRecorder::TelemetryRecorder(TelemetryConfig config, TelemetrySink sink,
                                     TimeSource clock)
    : config_(std::move(config)), sink_(std::move(sink)), clock_(std::move(clock)) {
    buffer_.reserve(config_.flushThreshold);
}

void TelemetryRecorder::record(std::string_view name, double value, MetricLabels labels) {
    TelemetrySample sample{std::string(name), value, clock_(), std::move(labels)};
    std::lock_guard lock(mutex_);
    buffer_.push_back(std::move(sample));
}

std::size_t TelemetryRecorder::flushIfDue() {
    std::vector<TelemetrySample> batch;
    {
        std::lock_guard lock(mutex_);
        if (buffer_.size() < config_.flushThreshold) {
            return 0;
        }
        batch.swap(buffer_);
        buffer_.reserve(config_.flushThreshold);
    }
    return deliver(std::move(batch));
}

std::size_t TelemetryRecorder::flush() {
    std::vector<TelemetrySample> batch;
    {
        std::lock_guard lock(mutex_);
        batch.swap(buffer_);
        buffer_.reserve(config_.flushThreshold);
    }
    return deliver(std::move(batch));
}

std::size_t TelemetryRecorder::deliver(std::vector<TelemetrySample> batch) {
    if (batch.empty()) {
        return 0;
    }
    auto size = batch.size();
    if (!sink_) {
        std::lock_guard lock(mutex_);
        flushed_ += size;
        return size;
    }

    try {
        sink_(batch);
    } catch (const std::exception& e) {
        {
            std::lock_guard lock(mutex_);
            dropped_ += size;
        }
        RSB_LOG_WARN(LogCategory::Telemetry,
                     "telemetry sink failed, dropped " + std::to_string(size) +
                         " samples: " + e.what());
        return 0;
    }

    std::lock_guard lock(mutex_);
    flushed_ += size;
    return size;
}

TelemetrySnapshot TelemetryRecorder::recordRequest(double latency, bool success, bool cacheHit) {
    if (latency < 0.0) {
        latency = 0.0;
    }

    std::lock_guard lock(mutex_);
    auto& s = stats_;
    ++s.requestCount;
    if (success) {
        ++s.successCount;
    } else {
        ++s.errorCount;
    }
    if (cacheHit) {
        ++s.cacheHits;
    }
    s.latencySum += latency;

    auto n = static_cast<double>(s.requestCount);
    s.avgLatency = (s.avgLatency * (n - 1.0) + latency) / n;
    return s;
}

TelemetrySnapshot TelemetryRecorder::snapshot() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

std::size_t TelemetryRecorder::pending() const {
    std::lock_guard lock(mutex_);
    return buffer_.size();
}

uint64_t TelemetryRecorder::flushedCount() const {
    std::lock_guard lock(mutex_);
    return flushed_;
}

uint64_t TelemetryRecorder::droppedCount() const {
    std::lock_guard lock(mutex_);
    return dropped_;
}

} // namespace rsb::service
