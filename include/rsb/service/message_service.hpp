#pragma once

/// @file message_service.hpp
/// @brief Operational wrapper exposing message handling, health and metrics.
///
/// The in-process counterpart of a message / health / metrics endpoint
/// set. Replies carry plain values and render to JSON for the CLI.

#include "rsb/foundation/error_code.hpp"
#include "rsb/foundation/types.hpp"
#include "rsb/service/bridge_types.hpp"
#include "rsb/service/health_reporter.hpp"

#include <memory>
#include <string>

namespace rsb::service {

class ResilientBridge;

/// Inbound message.
struct MessageRequest {
    std::string content;
    std::string userId{kAnonymousUser};
    Metadata metadata;
};

/// Reply to a message.
struct MessageReply {
    std::string response;
    double confidence = 0.0;
    double processingTime = 0.0;  ///< Seconds.
    bool success = false;
    foundation::ErrorCode errorCode = foundation::ErrorCode::Success;
    bool retryable = false;       ///< Failed for a transient reason; resubmit later.
    foundation::TimePoint timestamp{};
};

/// Health report plus process uptime.
struct ServiceHealth {
    HealthReport report;
    double uptimeSeconds = 0.0;
};

/// Message service in front of a ResilientBridge.
///
/// Usage:
/// @code
///   MessageService service(*bridge);
///   auto reply = service.handleMessage({.content = "hello", .userId = "alice"});
///   std::cout << MessageService::toJson(reply) << '\n';
/// @endcode
class MessageService {
public:
    explicit MessageService(ResilientBridge& bridge,
                            foundation::TimeSource clock = foundation::wallClock());

    /// Run @p request through the bridge. Never throws.
    [[nodiscard]] MessageReply handleMessage(const MessageRequest& request);

    [[nodiscard]] ServiceHealth health() const;

    [[nodiscard]] BridgeMetricsReport metrics() const;

    /// Seconds since construction.
    [[nodiscard]] double uptimeSeconds() const;

    [[nodiscard]] static std::string toJson(const MessageReply& reply);
    [[nodiscard]] static std::string toJson(const ServiceHealth& health);

private:
    ResilientBridge& bridge_;
    HealthReporter reporter_;
    foundation::TimeSource clock_;
    foundation::TimePoint startedAt_;
};

}  // namespace rsb::service
