#pragma once

/// @file service_logger.hpp
/// @brief ServiceLogger wrapping kcenon logger interfaces for structured bridge logging.
///
/// Provides category-based filtering, structured logging with context,
/// per-category runtime log level control, and an optional JSON line format.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "rsb/foundation/service_result.hpp"
#include "rsb/foundation/types.hpp"

namespace rsb::foundation {

/// Log severity levels for the bridge.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Bridge log categories for structured filtering.
///
/// Each category can have its own minimum log level, enabling
/// fine-grained control over logging verbosity per component.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Process lifecycle, runner
    Admission = 1, ///< Token bucket admission control
    Breaker   = 2, ///< Circuit breaker transitions
    Cache     = 3, ///< Result cache
    Telemetry = 4, ///< Telemetry buffering and flushes
    Bridge    = 5, ///< Request orchestration
    Backend   = 6, ///< Backend handler and stages
    Config    = 7  ///< Configuration loading
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 8;

/// Output format of formatted log lines.
enum class LogFormat : uint8_t {
    Text, ///< "[Category] message {k=v, ...}"
    Json  ///< One JSON object per line (see JsonLogFormatter)
};

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Admission", "Breaker", "Cache", "Telemetry", "Bridge", "Backend", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name ("debug", "INFO", ...). Returns nullopt if unknown.
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.requestId = RequestId(42);
///   ctx.userId = "user-001";
///   ctx.extra["stage"] = "parser";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Backend,
///                         "Stage completed", ctx);
/// @endcode
struct LogContext {
    std::optional<RequestId> requestId;
    std::optional<std::string> userId;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Bridge logger wrapping kcenon's logging interfaces.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
/// Messages are forwarded to the logger registered in kcenon's
/// GlobalLoggerRegistry under "rsb.<Category>", falling back to the
/// registry's default logger.
///
/// Default log levels per category:
/// | Category  | Default Level |
/// |-----------|---------------|
/// | Core      | Info          |
/// | Admission | Info          |
/// | Breaker   | Info          |
/// | Cache     | Info          |
/// | Telemetry | Info          |
/// | Bridge    | Info          |
/// | Backend   | Info          |
/// | Config    | Info          |
class ServiceLogger {
public:
    ServiceLogger();
    ~ServiceLogger();

    // Non-copyable, movable.
    ServiceLogger(const ServiceLogger&) = delete;
    ServiceLogger& operator=(const ServiceLogger&) = delete;
    ServiceLogger(ServiceLogger&&) noexcept;
    ServiceLogger& operator=(ServiceLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    /// When the context carries no trace id, the calling thread's
    /// CorrelationScope id is attached.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Set the minimum log level for every category.
    void setAllLevels(LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Select text or JSON line output.
    void setFormat(LogFormat format);

    [[nodiscard]] LogFormat format() const;

    /// Flush all buffered log messages.
    ServiceResult<void> flush();

    /// Get the global ServiceLogger singleton instance.
    static ServiceLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rsb::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace; macros are global)
// ---------------------------------------------------------------------------

/// @name RSB_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// RSB_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef RSB_MIN_LOG_LEVEL
    #define RSB_MIN_LOG_LEVEL 0
#endif

#define RSB_LOG(level, cat, msg)                                                     \
    do {                                                                             \
        _Pragma("GCC diagnostic push")                                               \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                          \
        if (static_cast<int>(level) >= RSB_MIN_LOG_LEVEL &&                          \
            ::rsb::foundation::ServiceLogger::instance().isEnabled((level), (cat)))  \
        {                                                                            \
            ::rsb::foundation::ServiceLogger::instance().log((level), (cat), (msg)); \
        }                                                                            \
        _Pragma("GCC diagnostic pop")                                                \
    } while (0)

#define RSB_LOG_DEBUG(cat, msg) \
    RSB_LOG(::rsb::foundation::LogLevel::Debug, (cat), (msg))

#define RSB_LOG_INFO(cat, msg) \
    RSB_LOG(::rsb::foundation::LogLevel::Info, (cat), (msg))

#define RSB_LOG_WARN(cat, msg) \
    RSB_LOG(::rsb::foundation::LogLevel::Warning, (cat), (msg))

#define RSB_LOG_ERROR(cat, msg) \
    RSB_LOG(::rsb::foundation::LogLevel::Error, (cat), (msg))

/// @}
