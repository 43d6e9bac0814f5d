/// @file message_service.cpp
/// @brief MessageService implementation.

#include "rsb/service/message_service.hpp"

#include "rsb/foundation/json_log_formatter.hpp"
#include "rsb/foundation/service_error.hpp"
#include "rsb/service/resilient_bridge.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace rsb::service {

using namespace rsb::foundation;

MessageService::MessageService(ResilientBridge& bridge, TimeSource clock)
    : bridge_(bridge),
      reporter_(bridge, clock),
      clock_(std::move(clock)),
      startedAt_(clock_()) {}

MessageReply MessageService::handleMessage(const MessageRequest& request) {
    Request bridged(request.content, request.userId, request.metadata, clock_());
    auto response = bridge_.execute(bridged);

    MessageReply reply;
    reply.response = response.content();
    reply.confidence = response.confidence();
    reply.processingTime = response.processingTime();
    reply.success = response.success();
    reply.errorCode = response.errorCode();
    reply.retryable = !reply.success && ServiceError(reply.errorCode).isTransient();
    reply.timestamp = clock_();
    return reply;
}

ServiceHealth MessageService::health() const {
    ServiceHealth h;
    h.report = reporter_.health();
    h.uptimeSeconds = uptimeSeconds();
    return h;
}

BridgeMetricsReport MessageService::metrics() const {
    return reporter_.metrics();
}

double MessageService::uptimeSeconds() const {
    return elapsedSeconds(startedAt_, clock_());
}

std::string MessageService::toJson(const MessageReply& reply) {
    std::ostringstream nums;
    nums << ",\"confidence\":" << reply.confidence
         << ",\"processing_time\":" << reply.processingTime;

    std::ostringstream ts;
    ts << std::fixed << std::setprecision(3) << epochSeconds(reply.timestamp);

    std::string out = "{\"response\":";
    appendJsonString(out, reply.response);
    out += nums.str();
    out += ",\"success\":";
    out += reply.success ? "true" : "false";
    if (!reply.success) {
        out += ",\"error\":";
        appendJsonString(out, errorCodeName(reply.errorCode));
        out += ",\"retryable\":";
        out += reply.retryable ? "true" : "false";
    }
    out += ",\"timestamp\":" + ts.str();
    out += '}';
    return out;
}

std::string MessageService::toJson(const ServiceHealth& health) {
    auto body = HealthReporter::toJson(health.report);
    std::ostringstream uptime;
    uptime << std::fixed << std::setprecision(3) << health.uptimeSeconds;
    // Insert uptime before the closing brace of the health object.
    body.insert(body.size() - 1, ",\"uptime_seconds\":" + uptime.str());
    return body;
}

}  // namespace rsb::service
