#pragma once

/// @file service_metrics.hpp
/// @brief ServiceMetrics for labelled metric collection and Prometheus-style export.
///
/// Provides counters, gauges and histograms with thread-safe in-memory
/// storage behind PIMPL. The telemetry recorder flushes its buffered
/// samples here.

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rsb::foundation {

/// Label set attached to a metric series. Ordered so that series keys and
/// exported text are deterministic.
using MetricLabels = std::map<std::string, std::string>;

/// Classification of a metric for the TYPE annotation.
enum class MetricType : uint8_t {
    Counter,
    Gauge,
    Histogram
};

/// Bucket boundaries for histogram metrics.
///
/// Each boundary defines the upper bound of a bucket (le = "less than or equal").
struct HistogramBuckets {
    /// Default latency buckets in milliseconds: {1,5,10,25,50,100,250,500,1000,5000}.
    static HistogramBuckets defaultLatency();

    std::vector<double> boundaries;
};

/// Central metrics facade providing counters, gauges, histograms and
/// text-format export.
///
/// Every operation takes an optional label set; a (name, labels) pair
/// identifies one series. Histograms are registered per name and every
/// label combination of that name shares the buckets.
///
/// Example:
/// @code
///   auto& metrics = ServiceMetrics::instance();
///   metrics.incrementCounter("rsb_request_success");
///   metrics.setGauge("rsb_confidence", 0.95, {{"preview", "hello"}});
///   metrics.registerHistogram("rsb_response_time_ms", HistogramBuckets::defaultLatency());
///   metrics.recordHistogram("rsb_response_time_ms", 12.5);
///   std::string text = metrics.scrape();
/// @endcode
class ServiceMetrics {
public:
    ServiceMetrics();
    ~ServiceMetrics();

    ServiceMetrics(const ServiceMetrics&) = delete;
    ServiceMetrics& operator=(const ServiceMetrics&) = delete;
    ServiceMetrics(ServiceMetrics&&) noexcept;
    ServiceMetrics& operator=(ServiceMetrics&&) noexcept;

    // ── Counters ────────────────────────────────────────────────────────

    /// Increment a counter by the given value (default 1).
    /// Creates the series on first use.
    void incrementCounter(std::string_view name, uint64_t value = 1,
                          const MetricLabels& labels = {});

    /// Read the current counter value. Returns 0 if the series does not exist.
    [[nodiscard]] uint64_t counterValue(std::string_view name,
                                        const MetricLabels& labels = {}) const;

    // ── Gauges ──────────────────────────────────────────────────────────

    /// Set a gauge to an absolute value. Creates the series on first use.
    void setGauge(std::string_view name, double value, const MetricLabels& labels = {});

    /// Read the current gauge value. Returns 0.0 if the series does not exist.
    [[nodiscard]] double gaugeValue(std::string_view name,
                                    const MetricLabels& labels = {}) const;

    // ── Histograms ──────────────────────────────────────────────────────

    /// Register a histogram with the given bucket boundaries.
    /// Re-registering an existing name keeps the original buckets.
    void registerHistogram(std::string_view name, HistogramBuckets buckets);

    /// Record an observation. Unregistered names are registered with
    /// HistogramBuckets::defaultLatency().
    void recordHistogram(std::string_view name, double value,
                         const MetricLabels& labels = {});

    /// Number of observations recorded for a series.
    [[nodiscard]] uint64_t histogramCount(std::string_view name,
                                          const MetricLabels& labels = {}) const;

    /// Sum of observations recorded for a series.
    [[nodiscard]] double histogramSum(std::string_view name,
                                      const MetricLabels& labels = {}) const;

    // ── Export ───────────────────────────────────────────────────────────

    /// Serialize all series in Prometheus text exposition format.
    [[nodiscard]] std::string scrape() const;

    /// Clear all series and histogram registrations. Intended for tests.
    void reset();

    /// Access the global ServiceMetrics instance.
    static ServiceMetrics& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rsb::foundation
