/// @file token_bucket.cpp
/// @brief TokenBucket implementation.

#include "rsb/service/token_bucket.hpp"

#include "rsb/foundation/service_logger.hpp"

#include <algorithm>
#include <utility>

namespace rsb::service {

using namespace rsb::foundation;

ServiceResult<void> TokenBucketConfig::validate() const {
    if (!(capacity > 0.0)) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::InvalidArgument, "admission capacity must be positive"));
    }
    if (!(refillRate >= 0.0)) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::InvalidArgument, "admission refill rate must not be negative"));
    }
    return ServiceResult<void>::ok();
}

TokenBucket::TokenBucket(TokenBucketConfig config, TimeSource clock)
    : config_(config),
      clock_(std::move(clock)),
      tokens_(config.capacity),
      lastRefill_(clock_()) {}

bool TokenBucket::tryAcquire(uint32_t cost) {
    auto required = static_cast<double>(std::max<uint32_t>(cost, 1));
    auto now = clock_();

    std::lock_guard lock(mutex_);

    // A backwards clock step adds nothing (projected clamps) and rebases the
    // refill mark so refill resumes from the new timeline.
    tokens_ = projected(now);
    lastRefill_ = now;

    if (tokens_ - required < 0.0) {
        return false;
    }
    tokens_ -= required;
    return true;
}

double TokenBucket::available() const {
    auto now = clock_();
    std::lock_guard lock(mutex_);
    return projected(now);
}

void TokenBucket::reset() {
    auto now = clock_();
    {
        std::lock_guard lock(mutex_);
        tokens_ = config_.capacity;
        lastRefill_ = now;
    }
    RSB_LOG_DEBUG(LogCategory::Admission, "token bucket reset to capacity");
}

double TokenBucket::projected(TimePoint now) const {
    auto added = elapsedSeconds(lastRefill_, now) * config_.refillRate;
    return std::min(tokens_ + added, config_.capacity);
}

} // namespace rsb::service
