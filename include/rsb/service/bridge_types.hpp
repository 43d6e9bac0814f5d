#pragma once

/// @file bridge_types.hpp
/// @brief Core value types for the resilient bridge.
///
/// Defines the inbound Request, its content Fingerprint, the Response
/// handed back to callers and the cache scoping policy.

#include "rsb/foundation/error_code.hpp"
#include "rsb/foundation/service_result.hpp"
#include "rsb/foundation/types.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace rsb::service {

/// Free-form request metadata.
using Metadata = std::map<std::string, std::string>;

/// Requester identity used when the caller supplies none.
inline constexpr std::string_view kAnonymousUser = "anonymous";

/// Compute the lowercase hex SHA-256 digest of @p content.
///
/// @return The 64-character digest, or FingerprintFailed if the digest
///         could not be computed.
[[nodiscard]] foundation::ServiceResult<std::string> computeFingerprint(std::string_view content);

/// An inbound request. Immutable once constructed.
///
/// The fingerprint is derived from the content at construction. When the
/// digest cannot be computed the fingerprint is empty and the request
/// bypasses the result cache.
class Request {
public:
    explicit Request(std::string content,
                     std::string userId = std::string(kAnonymousUser),
                     Metadata metadata = {},
                     foundation::TimePoint createdAt = foundation::WallClock::now());

    [[nodiscard]] const std::string& content() const noexcept { return content_; }
    [[nodiscard]] const std::string& userId() const noexcept { return userId_; }
    [[nodiscard]] const Metadata& metadata() const noexcept { return metadata_; }
    [[nodiscard]] foundation::TimePoint createdAt() const noexcept { return createdAt_; }
    [[nodiscard]] const std::string& fingerprint() const noexcept { return fingerprint_; }

    /// True when the fingerprint was computed and the request may be cached.
    [[nodiscard]] bool hasFingerprint() const noexcept { return !fingerprint_.empty(); }

private:
    std::string content_;
    std::string userId_;
    Metadata metadata_;
    foundation::TimePoint createdAt_;
    std::string fingerprint_;
};

/// Outcome of one request. Immutable value type.
class Response {
public:
    /// Build a successful response.
    [[nodiscard]] static Response succeeded(std::string content,
                                            double confidence,
                                            double processingTime,
                                            std::vector<std::string> stagesUsed);

    /// Build a failed response. Confidence is 0 and no stages are listed.
    [[nodiscard]] static Response failed(foundation::ErrorCode code,
                                         std::string message,
                                         double processingTime);

    [[nodiscard]] const std::string& content() const noexcept { return content_; }

    /// Confidence in [0, 1].
    [[nodiscard]] double confidence() const noexcept { return confidence_; }

    /// Wall time spent producing the response, in seconds.
    [[nodiscard]] double processingTime() const noexcept { return processingTime_; }

    /// Identifiers of the processing stages that ran, in order.
    [[nodiscard]] const std::vector<std::string>& stagesUsed() const noexcept {
        return stagesUsed_;
    }

    [[nodiscard]] bool success() const noexcept { return success_; }

    /// ErrorCode::Success for successful responses.
    [[nodiscard]] foundation::ErrorCode errorCode() const noexcept { return errorCode_; }

    bool operator==(const Response&) const = default;

private:
    Response() = default;

    std::string content_;
    double confidence_{0.0};
    double processingTime_{0.0};
    std::vector<std::string> stagesUsed_;
    bool success_{false};
    foundation::ErrorCode errorCode_{foundation::ErrorCode::Unknown};
};

/// Result of a backend invocation.
using BackendResult = foundation::ServiceResult<Response>;

/// Namespace of cache keys.
enum class CacheScope : uint8_t {
    Global,       ///< Identical content shares one entry across requesters.
    PerRequester  ///< Entries are isolated per requester identity.
};

/// Derive the cache key for @p request under @p scope.
/// Returns an empty string when the request has no fingerprint.
[[nodiscard]] std::string cacheKey(const Request& request, CacheScope scope);

[[nodiscard]] constexpr std::string_view toString(CacheScope scope) {
    switch (scope) {
        case CacheScope::Global:
            return "global";
        case CacheScope::PerRequester:
            return "per_requester";
    }
    return "unknown";
}

}  // namespace rsb::service
