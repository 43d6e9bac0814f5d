/// @file resilient_bridge.cpp
/// @brief ResilientBridge implementation.

#include "rsb/service/resilient_bridge.hpp"

#include "rsb/foundation/json_log_formatter.hpp"
#include "rsb/foundation/service_logger.hpp"
#include "rsb/foundation/service_metrics.hpp"

#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace rsb::service {

using namespace rsb::foundation;

// ── Helpers ─────────────────────────────────────────────────────────────────

namespace {

constexpr std::size_t kPreviewLength = 20;

/// First kPreviewLength bytes of @p content, cut back to a UTF-8 boundary.
std::string preview(const std::string& content) {
    if (content.size() <= kPreviewLength) {
        return content;
    }
    auto len = kPreviewLength;
    while (len > 0 && (static_cast<unsigned char>(content[len]) & 0xC0) == 0x80) {
        --len;
    }
    return content.substr(0, len);
}

double secondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

/// Human-readable prefix naming the failure class.
std::string failureClass(ErrorCode code) {
    switch (code) {
        case ErrorCode::AdmissionRejected:
            return "rate limited";
        case ErrorCode::BreakerOpen:
            return "circuit open";
        case ErrorCode::BackendTimeout:
            return "backend timed out";
        case ErrorCode::BackendCancelled:
            return "backend cancelled";
        default:
            return "backend failure";
    }
}

bool isBackendCode(ErrorCode code) {
    return code == ErrorCode::BackendFailure || code == ErrorCode::BackendTimeout ||
           code == ErrorCode::BackendCancelled;
}

}  // anonymous namespace

// ── BridgeConfig ────────────────────────────────────────────────────────────

ServiceResult<void> BridgeConfig::validate() const {
    if (auto r = admission.validate(); r.hasError()) {
        return r;
    }
    if (auto r = breaker.validate(); r.hasError()) {
        return r;
    }
    if (auto r = cache.validate(); r.hasError()) {
        return r;
    }
    if (auto r = telemetry.validate(); r.hasError()) {
        return r;
    }
    if (backendTimeout.count() < 0) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::InvalidArgument, "backend timeout must not be negative"));
    }
    return ServiceResult<void>::ok();
}

// ── Construction ────────────────────────────────────────────────────────────

ServiceResult<std::unique_ptr<ResilientBridge>> ResilientBridge::create(
    BridgeConfig config,
    std::shared_ptr<IBackendHandler> backend,
    TelemetrySink sink,
    TimeSource clock) {
    using ResultT = ServiceResult<std::unique_ptr<ResilientBridge>>;

    if (!backend) {
        return ResultT::err(ServiceError(ErrorCode::InvalidArgument, "backend handler is null"));
    }
    if (!clock) {
        return ResultT::err(ServiceError(ErrorCode::InvalidArgument, "time source is empty"));
    }
    if (auto valid = config.validate(); valid.hasError()) {
        RSB_LOG_ERROR(LogCategory::Bridge,
                      "invalid bridge configuration: " + valid.error().describe());
        return ResultT::err(valid.error());
    }

    if (!sink) {
        sink = metricsSink(ServiceMetrics::instance(), config.telemetry.metricPrefix);
    }

    return ResultT::ok(std::make_unique<ResilientBridge>(ConstructionKey{}, std::move(config),
                                                         std::move(backend), std::move(sink),
                                                         std::move(clock)));
}

ResilientBridge::ResilientBridge(ConstructionKey,
                                 BridgeConfig config,
                                 std::shared_ptr<IBackendHandler> backend,
                                 TelemetrySink sink,
                                 TimeSource clock)
    : config_(std::move(config)),
      backend_(std::move(backend)),
      admission_(config_.admission, clock),
      breaker_(config_.breaker, clock),
      cache_(config_.cache, clock),
      telemetry_(config_.telemetry, std::move(sink), clock) {
    RSB_LOG_INFO(LogCategory::Bridge,
                 "bridge ready: backend=" + std::string(backend_->name()) +
                     " cache=" + std::string(toString(config_.cache.scope)));
}

ResilientBridge::~ResilientBridge() {
    telemetry_.flush();
}

// ── execute() ───────────────────────────────────────────────────────────────

Response ResilientBridge::execute(const Request& request) {
    auto start = std::chrono::steady_clock::now();
    CorrelationScope trace(generateCorrelationId());

    LogContext ctx;
    ctx.requestId = RequestId(nextRequestId_.fetch_add(1, std::memory_order_relaxed));
    ctx.userId = request.userId();

    auto& logger = ServiceLogger::instance();

    auto fail = [&](ErrorCode code, std::string_view detail) {
        auto elapsed = secondsSince(start);
        auto stats = telemetry_.recordRequest(elapsed, false, false);
        telemetry_.record("request_error", 1.0, {{"reason", std::string(errorCodeName(code))}});
        telemetry_.record("error_rate", stats.errorRate());
        telemetry_.flushIfDue();

        auto message = failureClass(code);
        if (!detail.empty()) {
            message += ": ";
            message += detail;
        }
        logger.logWithContext(LogLevel::Warning, LogCategory::Bridge, message, ctx);
        return Response::failed(code, std::move(message), elapsed);
    };

    // 1. Admission. Rejections never reach the breaker.
    if (!admission_.tryAcquire()) {
        return fail(ErrorCode::AdmissionRejected, {});
    }

    // 2. Cache lookup.
    std::string key;
    if (config_.cache.enabled) {
        key = cacheKey(request, config_.cache.scope);
        if (key.empty()) {
            logger.logWithContext(LogLevel::Debug, LogCategory::Cache,
                                  "no fingerprint, bypassing cache", ctx);
        }
    }
    if (!key.empty()) {
        if (auto cached = cache_.get(key)) {
            telemetry_.recordRequest(secondsSince(start), cached->success(), true);
            telemetry_.record("cache_hit", 1.0);
            telemetry_.flushIfDue();
            logger.logWithContext(LogLevel::Debug, LogCategory::Cache, "cache hit", ctx);
            return *cached;
        }
    }

    // 3. Breaker-guarded backend call.
    auto outcome = breaker_.call([&] { return invokeBackend(request); });
    if (outcome.hasError()) {
        auto code = outcome.error().code();
        return fail(code, code == ErrorCode::BreakerOpen ? std::string_view{}
                                                         : outcome.error().message());
    }

    // 4. Success.
    Response response = std::move(outcome).value();
    if (!key.empty()) {
        cache_.put(key, response);
    }

    auto elapsed = secondsSince(start);
    telemetry_.recordRequest(elapsed, true, false);
    telemetry_.record("request_success", 1.0);
    telemetry_.record("response_time", elapsed * 1000.0);
    telemetry_.record("confidence", response.confidence(), {{"preview", preview(request.content())}});
    telemetry_.flushIfDue();

    logger.logWithContext(LogLevel::Debug, LogCategory::Bridge, "request completed", ctx);
    return response;
}

std::future<Response> ResilientBridge::executeAsync(Request request) {
    return std::async(std::launch::async,
                      [this, request = std::move(request)]() { return execute(request); });
}

std::size_t ResilientBridge::flushTelemetry() {
    return telemetry_.flush();
}

// ── invokeBackend() ─────────────────────────────────────────────────────────

BackendResult ResilientBridge::invokeBackend(const Request& request) {
    auto failure = [](ErrorCode code, std::string message) {
        return BackendResult::err(ServiceError(code, std::move(message)));
    };

    try {
        auto future = backend_->handle(request);
        if (!future.valid()) {
            return failure(ErrorCode::BackendFailure, "backend returned no result");
        }

        if (config_.backendTimeout.count() > 0 &&
            future.wait_for(config_.backendTimeout) != std::future_status::ready) {
            // The abandoned promise-backed future does not block on destruction.
            return failure(ErrorCode::BackendTimeout,
                           "no result within " + std::to_string(config_.backendTimeout.count()) +
                               " ms");
        }

        auto result = future.get();
        if (result.hasError()) {
            auto code = result.error().code();
            return failure(isBackendCode(code) ? code : ErrorCode::BackendFailure,
                           std::string(result.error().message()));
        }
        if (!result.value().success()) {
            return failure(ErrorCode::BackendFailure, result.value().content());
        }
        return result;
    } catch (const std::future_error& e) {
        if (e.code() == std::future_errc::broken_promise) {
            return failure(ErrorCode::BackendCancelled, "result abandoned by backend");
        }
        return failure(ErrorCode::BackendFailure, e.what());
    } catch (const std::exception& e) {
        return failure(ErrorCode::BackendFailure, e.what());
    } catch (...) {
        return failure(ErrorCode::BackendFailure, "unknown exception from backend");
    }
}

}  // namespace rsb::service
