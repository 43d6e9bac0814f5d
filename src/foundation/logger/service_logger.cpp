/// @file service_logger.cpp
/// @brief ServiceLogger implementation wrapping kcenon logger interfaces.

#include "rsb/foundation/service_logger.hpp"
#include "rsb/foundation/json_log_formatter.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <sstream>
#include <string>

namespace rsb::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: rsb -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Context serialization for the text format
// ---------------------------------------------------------------------------
static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.requestId && ctx.requestId->isValid()) {
        append("request_id", std::to_string(ctx.requestId->value()));
    }
    if (ctx.userId && !ctx.userId->empty()) {
        append("user_id", *ctx.userId);
    }
    if (ctx.traceId && !ctx.traceId->empty()) {
        append("trace_id", *ctx.traceId);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct ServiceLogger::Impl {
    // Per-category log levels (atomic for lock-free reads on the hot path)
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Named loggers registered in GlobalLoggerRegistry, one per category
    std::array<std::string, kLogCategoryCount> loggerNames;

    std::atomic<LogFormat> format{LogFormat::Text};

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(LogLevel::Info, std::memory_order_relaxed);
            loggerNames[i] = std::string("rsb.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        // Named logger first; a NullLogger falls through to the default
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        if (!logger->is_enabled(kci::log_level::off)) {
            auto defaultLogger = registry.get_default_logger();
            if (defaultLogger != kci::GlobalLoggerRegistry::null_logger()) {
                return defaultLogger;
            }
        }
        return logger;
    }

    void emit(LogLevel level, LogCategory cat, std::string_view msg,
              const LogContext& ctx) const {
        auto logger = getLogger(cat);

        if (format.load(std::memory_order_acquire) == LogFormat::Json) {
            logger->log(mapLevel(level), JsonLogFormatter::format(level, cat, msg, ctx));
            return;
        }

        std::string ctxStr = formatContext(ctx);

        // Format: [Category] message {key=val, ...}
        std::string formatted;
        formatted.reserve(msg.size() + ctxStr.size() + 20);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!ctxStr.empty()) {
            formatted += " {";
            formatted += ctxStr;
            formatted += '}';
        }

        logger->log(mapLevel(level), formatted);
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
ServiceLogger::ServiceLogger() : impl_(std::make_unique<Impl>()) {}

ServiceLogger::~ServiceLogger() = default;

ServiceLogger::ServiceLogger(ServiceLogger&&) noexcept = default;
ServiceLogger& ServiceLogger::operator=(ServiceLogger&&) noexcept = default;

// ---------------------------------------------------------------------------
// log() / logWithContext()
// ---------------------------------------------------------------------------
void ServiceLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    LogContext ctx;
    const auto& corrId = CorrelationScope::current();
    if (!corrId.empty()) {
        ctx.traceId = corrId;
    }
    impl_->emit(level, cat, msg, ctx);
}

void ServiceLogger::logWithContext(LogLevel level, LogCategory cat,
                                   std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    if (!ctx.traceId && !CorrelationScope::current().empty()) {
        LogContext withTrace = ctx;
        withTrace.traceId = CorrelationScope::current();
        impl_->emit(level, cat, msg, withTrace);
        return;
    }
    impl_->emit(level, cat, msg, ctx);
}

// ---------------------------------------------------------------------------
// Category level control
// ---------------------------------------------------------------------------
void ServiceLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

void ServiceLogger::setAllLevels(LogLevel minLevel) {
    for (auto& level : impl_->categoryLevels) {
        level.store(minLevel, std::memory_order_release);
    }
}

LogLevel ServiceLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool ServiceLogger::isEnabled(LogLevel level, LogCategory cat) const {
    if (level == LogLevel::Off) {
        return false;
    }
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

void ServiceLogger::setFormat(LogFormat format) {
    impl_->format.store(format, std::memory_order_release);
}

LogFormat ServiceLogger::format() const {
    return impl_->format.load(std::memory_order_acquire);
}

// ---------------------------------------------------------------------------
// flush()
// ---------------------------------------------------------------------------
ServiceResult<void> ServiceLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return ServiceResult<void>::ok();
}

// ---------------------------------------------------------------------------
// instance()
// ---------------------------------------------------------------------------
ServiceLogger& ServiceLogger::instance() {
    static ServiceLogger inst;
    return inst;
}

} // namespace rsb::foundation
