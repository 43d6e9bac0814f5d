#pragma once

/// @file json_log_formatter.hpp
/// @brief Structured JSON log formatter with correlation ID support.
///
/// Produces one JSON object per log line. Each bridge request opens a
/// CorrelationScope so every line it emits carries the same id.

#include "rsb/foundation/service_logger.hpp"

#include <string>
#include <string_view>

namespace rsb::foundation {

/// Append @p value to @p out as a quoted, escaped JSON string.
void appendJsonString(std::string& out, std::string_view value);

/// Generate a UUID v4 string (e.g., "550e8400-e29b-41d4-a716-446655440000").
///
/// Uses a thread-local PRNG seeded from std::random_device.
[[nodiscard]] std::string generateCorrelationId();

/// RAII scope guard that sets the current thread's correlation ID on
/// construction and restores the previous value on destruction.
///
/// Usage:
/// @code
///   {
///       CorrelationScope scope(generateCorrelationId());
///       // All log calls on this thread will include the correlation ID
///   }
///   // Previous correlation ID (or empty) is restored
/// @endcode
class CorrelationScope {
public:
    explicit CorrelationScope(std::string correlationId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope&) = delete;
    CorrelationScope& operator=(const CorrelationScope&) = delete;

    /// Get the current thread's correlation ID (empty if none set).
    [[nodiscard]] static const std::string& current();

private:
    std::string previous_;
};

/// Stateless JSON log formatter.
///
/// Output format:
/// @code
///   {"timestamp":"2026-02-14T12:00:00.000Z","level":"INFO",
///    "category":"Bridge","correlation_id":"uuid","message":"...",
///    "request_id":7,"user_id":"alice","extra":{"stage":"parser"}}
/// @endcode
class JsonLogFormatter {
public:
    /// Format a log entry as a single-line JSON object.
    ///
    /// The correlation id comes from LogContext::traceId when set,
    /// otherwise from the calling thread's CorrelationScope.
    [[nodiscard]] static std::string format(LogLevel level,
                                            LogCategory category,
                                            std::string_view message,
                                            const LogContext& ctx = {});
};

}  // namespace rsb::foundation
