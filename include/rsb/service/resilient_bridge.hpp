#pragma once

/// @file resilient_bridge.hpp
/// @brief Orchestrator wrapping a backend with admission control, a circuit
///        breaker, a result cache and telemetry.
///
/// Every request passes, in order: token-bucket admission, cache lookup,
/// breaker-guarded backend call, cache store, telemetry. Failures at any
/// step come back as a failed Response; execute() never throws.

#include "rsb/foundation/service_result.hpp"
#include "rsb/foundation/types.hpp"
#include "rsb/service/bridge_types.hpp"
#include "rsb/service/circuit_breaker.hpp"
#include "rsb/service/ibackend_handler.hpp"
#include "rsb/service/result_cache.hpp"
#include "rsb/service/telemetry_recorder.hpp"
#include "rsb/service/token_bucket.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>

namespace rsb::service {

/// Configuration for a ResilientBridge.
struct BridgeConfig {
    TokenBucketConfig admission;
    CircuitBreakerConfig breaker;
    ResultCacheConfig cache;
    TelemetryConfig telemetry;

    /// Longest wait for a backend result. 0 = unbounded.
    std::chrono::milliseconds backendTimeout{30000};

    /// Validate every section.
    [[nodiscard]] foundation::ServiceResult<void> validate() const;
};

/// Resilience bridge in front of an IBackendHandler.
///
/// Usage:
/// @code
///   auto bridge = ResilientBridge::create(config, backend);
///   if (bridge.hasError()) { /* invalid configuration */ }
///   Response r = bridge.value()->execute(Request("hello", "alice"));
/// @endcode
///
/// Thread-safe: each component guards its own state; no step holds more
/// than one component lock, and no lock is held while awaiting the backend.
class ResilientBridge {
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    /// Validate @p config and build a bridge around @p backend.
    ///
    /// @param sink  Telemetry sink; empty selects the ServiceMetrics sink.
    /// @param clock Time source for admission, breaker and cache.
    /// @return InvalidArgument on an invalid configuration or null backend.
    [[nodiscard]] static foundation::ServiceResult<std::unique_ptr<ResilientBridge>> create(
        BridgeConfig config,
        std::shared_ptr<IBackendHandler> backend,
        TelemetrySink sink = {},
        foundation::TimeSource clock = foundation::wallClock());

    /// Reachable only through create(), which validates first.
    ResilientBridge(ConstructionKey,
                    BridgeConfig config,
                    std::shared_ptr<IBackendHandler> backend,
                    TelemetrySink sink,
                    foundation::TimeSource clock);

    ~ResilientBridge();

    ResilientBridge(const ResilientBridge&) = delete;
    ResilientBridge& operator=(const ResilientBridge&) = delete;

    /// Process one request. Never throws.
    [[nodiscard]] Response execute(const Request& request);

    /// Process one request on a separate thread.
    ///
    /// The task refers to this bridge, so the bridge must outlive the
    /// returned future. Wait on or destroy every pending future before
    /// destroying the bridge; destroying the future blocks until the task
    /// has finished.
    [[nodiscard]] std::future<Response> executeAsync(Request request);

    // ── Read-only component access ──────────────────────────────────────

    [[nodiscard]] const TokenBucket& admission() const noexcept { return admission_; }
    [[nodiscard]] const ServiceCircuitBreaker& breaker() const noexcept { return breaker_; }
    [[nodiscard]] const ResultCache& cache() const noexcept { return cache_; }
    [[nodiscard]] const TelemetryRecorder& telemetry() const noexcept { return telemetry_; }
    [[nodiscard]] const IBackendHandler& backend() const noexcept { return *backend_; }
    [[nodiscard]] const BridgeConfig& config() const noexcept { return config_; }

    /// Flush buffered telemetry regardless of the threshold.
    std::size_t flushTelemetry();

private:
    [[nodiscard]] BackendResult invokeBackend(const Request& request);

    BridgeConfig config_;
    std::shared_ptr<IBackendHandler> backend_;
    TokenBucket admission_;
    ServiceCircuitBreaker breaker_;
    ResultCache cache_;
    TelemetryRecorder telemetry_;
    std::atomic<uint64_t> nextRequestId_{1};
};

}  // namespace rsb::service
