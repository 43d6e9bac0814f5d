/// @file circuit_breaker.cpp
/// @brief ServiceCircuitBreaker state machine implementation.

#include "rsb/service/circuit_breaker.hpp"

#include "rsb/foundation/service_logger.hpp"

#include <string>

namespace rsb::service {

using namespace rsb::foundation;

ServiceResult<void> CircuitBreakerConfig::validate() const {
    if (failureThreshold == 0) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::InvalidArgument, "breaker failure threshold must be >= 1"));
    }
    if (recoveryTimeout.count() < 0) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::InvalidArgument, "breaker recovery timeout must not be negative"));
    }
    return ServiceResult<void>::ok();
}

ServiceCircuitBreaker::ServiceCircuitBreaker(CircuitBreakerConfig config, TimeSource clock)
    : config_(std::move(config)), clock_(std::move(clock)) {}

ServiceCircuitBreaker::Permit ServiceCircuitBreaker::admit() {
    auto now = clock_();
    auto before = State::Closed;
    auto permit = Permit::Rejected;
    {
        std::lock_guard lock(mutex_);
        before = state_;

        switch (state_) {
            case State::Closed:
                return Permit::Normal;

            case State::Open: {
                // A failure time ahead of now means the clock stepped back and
                // the cool-down can no longer be measured. Allow the trial; a
                // failed trial re-opens with a failure time on the new timeline.
                bool clockSteppedBack = lastFailureTime_ && now < *lastFailureTime_;
                auto elapsed = lastFailureTime_ ? now - *lastFailureTime_
                                                : WallClock::duration::max();
                if (clockSteppedBack || elapsed >= config_.recoveryTimeout) {
                    transitionTo(State::HalfOpen, now);
                    trialInFlight_ = true;
                    permit = Permit::Trial;
                } else {
                    ++totalRejected_;
                }
                break;
            }

            case State::HalfOpen:
                if (trialInFlight_) {
                    ++totalRejected_;
                } else {
                    trialInFlight_ = true;
                    permit = Permit::Trial;
                }
                break;
        }
    }

    if (before == State::Open && permit == Permit::Trial) {
        logTransition(State::Open, State::HalfOpen);
    }
    return permit;
}

void ServiceCircuitBreaker::recordSuccess(Permit permit) {
    auto now = clock_();
    auto before = State::Closed;
    auto after = State::Closed;
    {
        std::lock_guard lock(mutex_);
        before = state_;

        if (permit == Permit::Trial) {
            trialInFlight_ = false;
            if (state_ == State::HalfOpen) {
                transitionTo(State::Closed, now);
            }
        } else if (state_ == State::Closed) {
            consecutiveFailures_ = 0;
        }
        // A Normal success arriving after the circuit left Closed is stale
        // and must not close it.
        after = state_;
    }

    if (before != after) {
        logTransition(before, after);
    }
}

void ServiceCircuitBreaker::recordFailure(Permit permit) {
    auto now = clock_();
    auto before = State::Closed;
    auto after = State::Closed;
    uint32_t failures = 0;
    {
        std::lock_guard lock(mutex_);
        before = state_;

        ++consecutiveFailures_;
        lastFailureTime_ = now;

        if (permit == Permit::Trial) {
            trialInFlight_ = false;
            if (state_ == State::HalfOpen) {
                transitionTo(State::Open, now);
            }
        } else if (state_ == State::Closed &&
                   consecutiveFailures_ >= config_.failureThreshold) {
            transitionTo(State::Open, now);
        }
        after = state_;
        failures = consecutiveFailures_;
    }

    if (before != after) {
        logTransition(before, after);
        if (after == State::Open) {
            RSB_LOG_ERROR(LogCategory::Breaker,
                          "circuit '" + config_.name + "' opened after " +
                              std::to_string(failures) + " failures");
        }
    }
}

void ServiceCircuitBreaker::forceState(State newState) {
    auto now = clock_();
    std::lock_guard lock(mutex_);
    transitionTo(newState, now);
    trialInFlight_ = false;
}

void ServiceCircuitBreaker::reset() {
    std::lock_guard lock(mutex_);
    state_ = State::Closed;
    consecutiveFailures_ = 0;
    totalRejected_ = 0;
    trialInFlight_ = false;
    lastFailureTime_.reset();
}

ServiceCircuitBreaker::State ServiceCircuitBreaker::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

uint32_t ServiceCircuitBreaker::failureCount() const {
    std::lock_guard lock(mutex_);
    return consecutiveFailures_;
}

uint64_t ServiceCircuitBreaker::rejectedCount() const {
    std::lock_guard lock(mutex_);
    return totalRejected_;
}

std::optional<TimePoint> ServiceCircuitBreaker::lastFailureTime() const {
    std::lock_guard lock(mutex_);
    return lastFailureTime_;
}

bool ServiceCircuitBreaker::trialInFlight() const {
    std::lock_guard lock(mutex_);
    return trialInFlight_;
}

std::string_view ServiceCircuitBreaker::name() const {
    return config_.name;
}

void ServiceCircuitBreaker::transitionTo(State newState, TimePoint now) {
    state_ = newState;
    if (newState == State::Closed) {
        consecutiveFailures_ = 0;
    } else if (newState == State::Open) {
        // Recovery timeout starts from now when entering Open state.
        lastFailureTime_ = now;
    }
}

void ServiceCircuitBreaker::logTransition(State from, State to) const {
    RSB_LOG_INFO(LogCategory::Breaker,
                 "circuit '" + config_.name + "' " + std::string(toString(from)) +
                     " -> " + std::string(toString(to)));
}

} // namespace rsb::service
