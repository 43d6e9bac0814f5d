#pragma once

/// @file circuit_breaker.hpp
/// @brief Circuit breaker guarding calls into the backend.
///
/// Implements the circuit breaker pattern (Closed -> Open -> HalfOpen)
/// so that a failing backend is not hammered while it recovers. In
/// HalfOpen exactly one trial call is in flight; its outcome decides
/// whether the circuit closes or re-opens.

#include "rsb/foundation/service_result.hpp"
#include "rsb/foundation/types.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace rsb::service {

/// Configuration for a ServiceCircuitBreaker instance.
struct CircuitBreakerConfig {
    /// Number of consecutive failures before the circuit opens. Must be >= 1.
    uint32_t failureThreshold = 5;

    /// Duration the circuit stays open before a trial call is admitted.
    std::chrono::milliseconds recoveryTimeout{60000};

    /// Human-readable name for logging and metrics.
    std::string name = "backend";

    /// Reject a zero threshold or a negative recovery timeout.
    [[nodiscard]] foundation::ServiceResult<void> validate() const;
};

/// Circuit breaker state machine for protecting backend calls.
///
/// Usage:
/// @code
///   ServiceCircuitBreaker cb(CircuitBreakerConfig{.name = "backend"});
///   auto result = cb.call([&] { return invokeBackend(); });
///   if (result.hasError() &&
///       result.error().code() == ErrorCode::BreakerOpen) {
///       // Circuit is open, failed fast without calling the backend
///   }
/// @endcode
///
/// The lower-level admit() / recordSuccess() / recordFailure() API is
/// available for callers that cannot wrap the work in a callable; the
/// Permit returned by admit() must be passed back on completion.
///
/// Thread-safe: all state transitions use a mutex.
class ServiceCircuitBreaker {
public:
    /// Circuit breaker states.
    enum class State : uint8_t {
        Closed,   ///< Normal operation; calls pass through.
        Open,     ///< Failure threshold reached; calls are rejected.
        HalfOpen  ///< Recovering; one trial call allowed.
    };

    /// Outcome of an admission check.
    enum class Permit : uint8_t {
        Rejected, ///< Do not invoke the operation.
        Normal,   ///< Admitted while Closed.
        Trial     ///< The single HalfOpen trial call.
    };

    explicit ServiceCircuitBreaker(CircuitBreakerConfig config = {},
                                   foundation::TimeSource clock = foundation::wallClock());

    /// Run @p op under breaker protection.
    ///
    /// @p op must return a ServiceResult; an error result counts as a
    /// failure. When the circuit rejects the call, @p op is not invoked
    /// and ErrorCode::BreakerOpen is returned.
    template <typename Op>
    auto call(Op&& op) -> std::invoke_result_t<Op&&> {
        using ResultT = std::invoke_result_t<Op&&>;

        auto permit = admit();
        if (permit == Permit::Rejected) {
            return ResultT::err(foundation::ServiceError(
                foundation::ErrorCode::BreakerOpen,
                "circuit breaker '" + config_.name + "' is open"));
        }

        try {
            auto result = std::forward<Op>(op)();
            if (result.hasValue()) {
                recordSuccess(permit);
            } else {
                recordFailure(permit);
            }
            return result;
        } catch (...) {
            recordFailure(permit);
            throw;
        }
    }

    /// Check whether a call may proceed.
    ///
    /// If the circuit is Open and the recovery timeout has elapsed, the
    /// circuit moves to HalfOpen and the caller receives the Trial permit.
    [[nodiscard]] Permit admit();

    /// Convenience form of admit() for callers that only need a yes/no.
    /// A Trial granted here must be completed with recordSuccess(Permit::Trial)
    /// or recordFailure(Permit::Trial).
    [[nodiscard]] bool allowRequest() { return admit() != Permit::Rejected; }

    /// Record a successful call admitted with @p permit.
    ///
    /// A trial success closes the circuit. A Normal success resets the
    /// consecutive failure counter while Closed and is ignored otherwise.
    void recordSuccess(Permit permit = Permit::Normal);

    /// Record a failed call admitted with @p permit.
    ///
    /// Increments the consecutive failure counter and refreshes the
    /// last-failure time. Reaching the threshold while Closed, or failing
    /// the trial, opens the circuit.
    void recordFailure(Permit permit = Permit::Normal);

    /// Force the circuit into a specific state (for testing or manual override).
    void forceState(State newState);

    /// Reset all counters and return to Closed state.
    void reset();

    // ── Queries ──────────────────────────────────────────────────────────

    [[nodiscard]] State state() const;

    /// Number of consecutive failures.
    [[nodiscard]] uint32_t failureCount() const;

    /// Total number of calls rejected without invoking the operation.
    [[nodiscard]] uint64_t rejectedCount() const;

    /// Time of the most recent failure, if any.
    [[nodiscard]] std::optional<foundation::TimePoint> lastFailureTime() const;

    /// Whether a HalfOpen trial call is currently outstanding.
    [[nodiscard]] bool trialInFlight() const;

    [[nodiscard]] std::string_view name() const;

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

private:
    void transitionTo(State newState, foundation::TimePoint now);
    void logTransition(State from, State to) const;

    CircuitBreakerConfig config_;
    foundation::TimeSource clock_;
    mutable std::mutex mutex_;
    State state_{State::Closed};
    uint32_t consecutiveFailures_{0};
    uint64_t totalRejected_{0};
    bool trialInFlight_{false};
    std::optional<foundation::TimePoint> lastFailureTime_;
};

/// Convert circuit breaker state to string.
[[nodiscard]] constexpr std::string_view toString(ServiceCircuitBreaker::State s) {
    switch (s) {
        case ServiceCircuitBreaker::State::Closed:
            return "closed";
        case ServiceCircuitBreaker::State::Open:
            return "open";
        case ServiceCircuitBreaker::State::HalfOpen:
            return "half_open";
    }
    return "unknown";
}

}  // namespace rsb::service
