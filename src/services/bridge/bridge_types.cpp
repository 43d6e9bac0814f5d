/// @file bridge_types.cpp
/// @brief Request fingerprinting and Response construction.

#include "rsb/service/bridge_types.hpp"

#include "fingerprint_utils.hpp"

#include <algorithm>
#include <utility>

namespace rsb::service {

using namespace rsb::foundation;

ServiceResult<std::string> computeFingerprint(std::string_view content) {
    auto digest = detail::sha256Hex(content);
    if (digest.empty()) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::FingerprintFailed, "SHA-256 digest failed"));
    }
    return ServiceResult<std::string>::ok(std::move(digest));
}

// ── Request ─────────────────────────────────────────────────────────────────

Request::Request(std::string content,
                 std::string userId,
                 Metadata metadata,
                 TimePoint createdAt)
    : content_(std::move(content)),
      userId_(userId.empty() ? std::string(kAnonymousUser) : std::move(userId)),
      metadata_(std::move(metadata)),
      createdAt_(createdAt) {
    auto fp = computeFingerprint(content_);
    if (fp.hasValue()) {
        fingerprint_ = std::move(fp).value();
    }
}

// ── Response ────────────────────────────────────────────────────────────────

Response Response::succeeded(std::string content,
                             double confidence,
                             double processingTime,
                             std::vector<std::string> stagesUsed) {
    Response r;
    r.content_ = std::move(content);
    r.confidence_ = std::clamp(confidence, 0.0, 1.0);
    r.processingTime_ = std::max(processingTime, 0.0);
    r.stagesUsed_ = std::move(stagesUsed);
    r.success_ = true;
    r.errorCode_ = ErrorCode::Success;
    return r;
}

Response Response::failed(ErrorCode code, std::string message, double processingTime) {
    Response r;
    r.content_ = std::move(message);
    r.processingTime_ = std::max(processingTime, 0.0);
    r.success_ = false;
    r.errorCode_ = code == ErrorCode::Success ? ErrorCode::Unknown : code;
    return r;
}

// ── Cache keys ──────────────────────────────────────────────────────────────

std::string cacheKey(const Request& request, CacheScope scope) {
    if (!request.hasFingerprint()) {
        return {};
    }
    if (scope == CacheScope::PerRequester) {
        return request.userId() + ":" + request.fingerprint();
    }
    return request.fingerprint();
}

}  // namespace rsb::service
