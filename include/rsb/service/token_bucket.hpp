#pragma once

/// @file token_bucket.hpp
/// @brief Token bucket admission controller for the bridge.
///
/// Tokens accumulate at a constant rate up to a burst capacity; each
/// admitted request spends tokens. Refill is computed lazily on access
/// from the elapsed wall-clock time.

#include "rsb/foundation/service_result.hpp"
#include "rsb/foundation/types.hpp"

#include <cstdint>
#include <mutex>

namespace rsb::service {

/// Configuration for a TokenBucket.
struct TokenBucketConfig {
    /// Maximum number of tokens (burst size). Must be positive.
    double capacity = 1000.0;

    /// Tokens added per second. Zero disables refill.
    double refillRate = 100.0;

    /// Reject non-positive capacity or negative refill rate.
    [[nodiscard]] foundation::ServiceResult<void> validate() const;
};

/// Token bucket admission controller.
///
/// Example:
/// @code
///   TokenBucket bucket(TokenBucketConfig{.capacity = 10, .refillRate = 5});
///   if (bucket.tryAcquire()) {
///       // Request admitted
///   }
/// @endcode
///
/// Thread-safe: every operation runs under the bucket's mutex.
class TokenBucket {
public:
    /// The bucket starts full.
    explicit TokenBucket(TokenBucketConfig config = {},
                         foundation::TimeSource clock = foundation::wallClock());

    /// Refill from elapsed time, then spend @p cost tokens if available.
    /// A cost of 0 is treated as 1.
    /// @return true if admitted; false leaves the token count unchanged.
    [[nodiscard]] bool tryAcquire(uint32_t cost = 1);

    /// Tokens that would be available now, without mutating the bucket.
    [[nodiscard]] double available() const;

    /// Refill the bucket to capacity.
    void reset();

    [[nodiscard]] double capacity() const noexcept { return config_.capacity; }
    [[nodiscard]] double refillRate() const noexcept { return config_.refillRate; }

private:
    [[nodiscard]] double projected(foundation::TimePoint now) const;

    TokenBucketConfig config_;
    foundation::TimeSource clock_;
    mutable std::mutex mutex_;
    double tokens_;
    foundation::TimePoint lastRefill_;
};

} // namespace rsb::service
