/// @file service_metrics.cpp
/// @brief In-memory implementation of ServiceMetrics.
///
/// Series are kept in ordered maps keyed by (name, labels) under one mutex
/// per metric kind.

#include "rsb/foundation/service_metrics.hpp"

#include <cmath>
#include <mutex>
#include <sstream>
#include <utility>

namespace rsb::foundation {

// ── HistogramBuckets factory ────────────────────────────────────────────────

HistogramBuckets HistogramBuckets::defaultLatency() {
    return HistogramBuckets{{1, 5, 10, 25, 50, 100, 250, 500, 1000, 5000}};
}

namespace {

using SeriesKey = std::pair<std::string, MetricLabels>;

struct HistogramData {
    std::vector<double> boundaries;
    std::vector<uint64_t> bucketCounts;  // one per boundary + 1 for +Inf
    uint64_t totalCount{0};
    double totalSum{0.0};

    explicit HistogramData(std::vector<double> bounds)
        : boundaries(std::move(bounds)), bucketCounts(boundaries.size() + 1, 0) {}

    void record(double value) {
        for (std::size_t i = 0; i < boundaries.size(); ++i) {
            if (value <= boundaries[i]) {
                ++bucketCounts[i];
            }
        }
        ++bucketCounts.back();
        ++totalCount;
        totalSum += value;
    }
};

std::string formatDouble(double value) {
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    if (std::isnan(value)) {
        return "NaN";
    }
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

// Render {k="v",...}; `extra` is appended last (used for the le label).
std::string formatLabels(const MetricLabels& labels, std::string_view extra = {}) {
    if (labels.empty() && extra.empty()) {
        return {};
    }
    std::string out = "{";
    bool first = true;
    for (const auto& [key, val] : labels) {
        if (!first) {
            out += ',';
        }
        out += key;
        out += "=\"";
        for (char c : val) {
            if (c == '"' || c == '\\') {
                out += '\\';
                out += c;
            } else if (c == '\n') {
                out += "\\n";
            } else {
                out += c;
            }
        }
        out += '"';
        first = false;
    }
    if (!extra.empty()) {
        if (!first) {
            out += ',';
        }
        out += extra;
    }
    out += '}';
    return out;
}

SeriesKey makeKey(std::string_view name, const MetricLabels& labels) {
    return {std::string(name), labels};
}

}  // anonymous namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct ServiceMetrics::Impl {
    mutable std::mutex counterMutex;
    std::map<SeriesKey, uint64_t> counters;

    mutable std::mutex gaugeMutex;
    std::map<SeriesKey, double> gauges;

    mutable std::mutex histogramMutex;
    std::map<std::string, std::vector<double>, std::less<>> histogramBuckets;
    std::map<SeriesKey, HistogramData> histograms;
};

// ── Construction / destruction / move ───────────────────────────────────────

ServiceMetrics::ServiceMetrics() : impl_(std::make_unique<Impl>()) {}

ServiceMetrics::~ServiceMetrics() = default;

ServiceMetrics::ServiceMetrics(ServiceMetrics&&) noexcept = default;

ServiceMetrics& ServiceMetrics::operator=(ServiceMetrics&&) noexcept = default;

// ── Counters ────────────────────────────────────────────────────────────────

void ServiceMetrics::incrementCounter(std::string_view name, uint64_t value,
                                      const MetricLabels& labels) {
    std::lock_guard lock(impl_->counterMutex);
    impl_->counters[makeKey(name, labels)] += value;
}

uint64_t ServiceMetrics::counterValue(std::string_view name,
                                      const MetricLabels& labels) const {
    std::lock_guard lock(impl_->counterMutex);
    auto it = impl_->counters.find(makeKey(name, labels));
    return it == impl_->counters.end() ? 0 : it->second;
}

// ── Gauges ──────────────────────────────────────────────────────────────────

void ServiceMetrics::setGauge(std::string_view name, double value,
                              const MetricLabels& labels) {
    std::lock_guard lock(impl_->gaugeMutex);
    impl_->gauges[makeKey(name, labels)] = value;
}

double ServiceMetrics::gaugeValue(std::string_view name, const MetricLabels& labels) const {
    std::lock_guard lock(impl_->gaugeMutex);
    auto it = impl_->gauges.find(makeKey(name, labels));
    return it == impl_->gauges.end() ? 0.0 : it->second;
}

// ── Histograms ──────────────────────────────────────────────────────────────

void ServiceMetrics::registerHistogram(std::string_view name, HistogramBuckets buckets) {
    std::lock_guard lock(impl_->histogramMutex);
    if (impl_->histogramBuckets.find(name) == impl_->histogramBuckets.end()) {
        impl_->histogramBuckets.emplace(std::string(name), std::move(buckets.boundaries));
    }
}

void ServiceMetrics::recordHistogram(std::string_view name, double value,
                                     const MetricLabels& labels) {
    std::lock_guard lock(impl_->histogramMutex);
    auto bucketIt = impl_->histogramBuckets.find(name);
    if (bucketIt == impl_->histogramBuckets.end()) {
        bucketIt = impl_->histogramBuckets
                       .emplace(std::string(name), HistogramBuckets::defaultLatency().boundaries)
                       .first;
    }
    auto key = makeKey(name, labels);
    auto it = impl_->histograms.find(key);
    if (it == impl_->histograms.end()) {
        it = impl_->histograms.emplace(std::move(key), HistogramData(bucketIt->second)).first;
    }
    it->second.record(value);
}

uint64_t ServiceMetrics::histogramCount(std::string_view name,
                                        const MetricLabels& labels) const {
    std::lock_guard lock(impl_->histogramMutex);
    auto it = impl_->histograms.find(makeKey(name, labels));
    return it == impl_->histograms.end() ? 0 : it->second.totalCount;
}

double ServiceMetrics::histogramSum(std::string_view name, const MetricLabels& labels) const {
    std::lock_guard lock(impl_->histogramMutex);
    auto it = impl_->histograms.find(makeKey(name, labels));
    return it == impl_->histograms.end() ? 0.0 : it->second.totalSum;
}

// ── Scrape ──────────────────────────────────────────────────────────────────

std::string ServiceMetrics::scrape() const {
    std::ostringstream out;

    // Series are sorted by name, so a TYPE line is emitted once per name.
    {
        std::lock_guard lock(impl_->counterMutex);
        std::string lastName;
        for (const auto& [key, value] : impl_->counters) {
            if (key.first != lastName) {
                out << "# TYPE " << key.first << " counter\n";
                lastName = key.first;
            }
            out << key.first << formatLabels(key.second) << " " << value << "\n";
        }
    }

    {
        std::lock_guard lock(impl_->gaugeMutex);
        std::string lastName;
        for (const auto& [key, value] : impl_->gauges) {
            if (key.first != lastName) {
                out << "# TYPE " << key.first << " gauge\n";
                lastName = key.first;
            }
            out << key.first << formatLabels(key.second) << " " << formatDouble(value) << "\n";
        }
    }

    {
        std::lock_guard lock(impl_->histogramMutex);
        std::string lastName;
        for (const auto& [key, data] : impl_->histograms) {
            const auto& name = key.first;
            if (name != lastName) {
                out << "# TYPE " << name << " histogram\n";
                lastName = name;
            }
            for (std::size_t i = 0; i < data.boundaries.size(); ++i) {
                auto le = "le=\"" + formatDouble(data.boundaries[i]) + "\"";
                out << name << "_bucket" << formatLabels(key.second, le) << " "
                    << data.bucketCounts[i] << "\n";
            }
            out << name << "_bucket" << formatLabels(key.second, "le=\"+Inf\"") << " "
                << data.bucketCounts.back() << "\n";
            out << name << "_sum" << formatLabels(key.second) << " "
                << formatDouble(data.totalSum) << "\n";
            out << name << "_count" << formatLabels(key.second) << " " << data.totalCount
                << "\n";
        }
    }

    return out.str();
}

// ── Reset ───────────────────────────────────────────────────────────────────

void ServiceMetrics::reset() {
    {
        std::lock_guard lock(impl_->counterMutex);
        impl_->counters.clear();
    }
    {
        std::lock_guard lock(impl_->gaugeMutex);
        impl_->gauges.clear();
    }
    {
        std::lock_guard lock(impl_->histogramMutex);
        impl_->histograms.clear();
        impl_->histogramBuckets.clear();
    }
}

// ── Singleton ───────────────────────────────────────────────────────────────

ServiceMetrics& ServiceMetrics::instance() {
    static ServiceMetrics inst;
    return inst;
}

}  // namespace rsb::foundation
