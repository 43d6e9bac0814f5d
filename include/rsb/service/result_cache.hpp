#pragma once

/// @file result_cache.hpp
/// @brief Thread-safe LRU result cache with TTL expiration.
///
/// Caches successful bridge responses keyed by request fingerprint
/// (optionally namespaced by requester, see CacheScope).

#include "rsb/foundation/service_result.hpp"
#include "rsb/foundation/types.hpp"
#include "rsb/service/bridge_types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace rsb::service {

/// Configuration for the result cache.
struct ResultCacheConfig {
    bool enabled = true;                         ///< Enable/disable caching.
    std::chrono::milliseconds ttl{300000};       ///< Default TTL (5 minutes).
    std::size_t maxEntries = 0;                  ///< LRU bound; 0 = unbounded.
    CacheScope scope = CacheScope::Global;       ///< Key namespace.

    /// Reject a negative TTL.
    [[nodiscard]] foundation::ServiceResult<void> validate() const;
};

/// Thread-safe LRU result cache with TTL-based expiration.
///
/// An entry is valid while `now - insertedAt < ttl`. Expired entries are
/// logically absent: get() evicts them lazily and purgeExpired() sweeps
/// them in bulk.
///
/// Usage:
/// @code
///   ResultCache cache(ResultCacheConfig{.ttl = std::chrono::seconds(60)});
///   cache.put(request.fingerprint(), response);
///   if (auto cached = cache.get(request.fingerprint())) { /* reuse */ }
/// @endcode
class ResultCache {
public:
    explicit ResultCache(ResultCacheConfig config = {},
                         foundation::TimeSource clock = foundation::wallClock());
    ~ResultCache();

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;
    ResultCache(ResultCache&&) noexcept;
    ResultCache& operator=(ResultCache&&) noexcept;

    /// Look up a cached response.
    ///
    /// @return The response if found and not expired, nullopt otherwise.
    [[nodiscard]] std::optional<Response> get(std::string_view key);

    /// Store a response with the configured TTL, replacing any existing entry.
    void put(std::string_view key, const Response& response);

    /// Store a response with a custom TTL.
    void put(std::string_view key, const Response& response, std::chrono::milliseconds ttl);

    /// Remove a specific entry.
    ///
    /// @return true if the entry was found and removed.
    bool invalidate(std::string_view key);

    /// Remove all expired entries.
    ///
    /// @return Number of entries removed.
    std::size_t purgeExpired();

    /// Remove all entries.
    void clear();

    /// Number of stored entries, including expired ones not yet evicted.
    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] uint64_t hitCount() const;
    [[nodiscard]] uint64_t missCount() const;

    /// Cache hit rate (0.0 to 1.0).
    [[nodiscard]] double hitRate() const;

    [[nodiscard]] const ResultCacheConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rsb::service
