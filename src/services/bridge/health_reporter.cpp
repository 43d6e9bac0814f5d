/// @file health_reporter.cpp
/// @brief HealthReporter implementation and JSON rendering.

#include "rsb/service/health_reporter.hpp"

#include "rsb/foundation/json_log_formatter.hpp"
#include "rsb/service/resilient_bridge.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace rsb::service {

using namespace rsb::foundation;

namespace {

std::string number(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

}  // anonymous namespace

double epochSeconds(TimePoint tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

void appendBackendJson(std::string& out, const BackendMetrics& metrics) {
    out += "{\"name\":";
    appendJsonString(out, metrics.name);
    out += ",\"status\":";
    appendJsonString(out, toString(metrics.status));
    out += ",\"messages_processed\":" + std::to_string(metrics.messagesProcessed);
    out += ",\"avg_response_time\":" + number(metrics.avgResponseTime);
    out += ",\"success_rate\":" + number(metrics.successRate);
    out += ",\"stage_usage\":{";
    bool first = true;
    for (const auto& [stage, count] : metrics.stageUsage) {
        if (!first) {
            out += ',';
        }
        first = false;
        appendJsonString(out, stage);
        out += ':' + std::to_string(count);
    }
    out += "}}";
}

HealthReporter::HealthReporter(const ResilientBridge& bridge, TimeSource clock)
    : bridge_(bridge), clock_(std::move(clock)) {}

BridgeMetricsReport HealthReporter::metrics() const {
    auto stats = bridge_.telemetry().snapshot();

    BridgeMetricsReport report;
    report.requestsTotal = stats.requestCount;
    report.errorsTotal = stats.errorCount;
    report.cacheHits = stats.cacheHits;
    report.errorRate = stats.errorRate();
    report.avgLatencySeconds = stats.avgLatency;
    report.cacheSize = bridge_.cache().size();
    report.breakerState = bridge_.breaker().state();
    report.breakerFailures = bridge_.breaker().failureCount();
    report.breakerRejected = bridge_.breaker().rejectedCount();
    report.admissionTokens = bridge_.admission().available();
    report.backend = bridge_.backend().metrics();
    return report;
}

HealthReport HealthReporter::health() const {
    HealthReport report;
    report.metrics = metrics();
    report.timestamp = clock_();

    auto breakerState = report.metrics.breakerState;
    report.status = breakerState == ServiceCircuitBreaker::State::Open ? HealthStatus::Degraded
                                                                       : HealthStatus::Healthy;

    report.components["backend"] = std::string(toString(report.metrics.backend.status));
    report.components["circuit_breaker"] = std::string(toString(breakerState));
    report.components["cache"] = bridge_.config().cache.enabled ? "healthy" : "disabled";
    report.components["rate_limiter"] = "healthy";
    report.components["telemetry"] = "healthy";
    return report;
}

// ── JSON ────────────────────────────────────────────────────────────────────

std::string HealthReporter::toJson(const BridgeMetricsReport& report) {
    std::string out = "{";
    out += "\"requests_total\":" + std::to_string(report.requestsTotal);
    out += ",\"errors_total\":" + std::to_string(report.errorsTotal);
    out += ",\"cache_hits\":" + std::to_string(report.cacheHits);
    out += ",\"error_rate\":" + number(report.errorRate);
    out += ",\"avg_latency_seconds\":" + number(report.avgLatencySeconds);
    out += ",\"cache_size\":" + std::to_string(report.cacheSize);
    out += ",\"rate_limiter_tokens\":" + number(report.admissionTokens);
    out += ",\"circuit_breaker_state\":";
    appendJsonString(out, toString(report.breakerState));
    out += ",\"circuit_breaker_failures\":" + std::to_string(report.breakerFailures);
    out += ",\"circuit_breaker_rejected\":" + std::to_string(report.breakerRejected);
    out += ",\"backend_metrics\":";
    appendBackendJson(out, report.backend);
    out += '}';
    return out;
}

std::string HealthReporter::toJson(const HealthReport& report) {
    std::ostringstream ts;
    ts << std::fixed << std::setprecision(3) << epochSeconds(report.timestamp);

    std::string out = "{\"status\":";
    appendJsonString(out, toString(report.status));
    out += ",\"components\":{";
    bool first = true;
    for (const auto& [name, status] : report.components) {
        if (!first) {
            out += ',';
        }
        first = false;
        appendJsonString(out, name);
        out += ':';
        appendJsonString(out, status);
    }
    out += "},\"timestamp\":" + ts.str();
    out += ",\"metrics\":" + toJson(report.metrics);
    out += '}';
    return out;
}

}  // namespace rsb::service
