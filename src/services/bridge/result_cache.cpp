/// @file result_cache.cpp
/// @brief ResultCache implementation using a doubly-linked list + hash map
///        for O(1) LRU eviction and lookup.

#include "rsb/service/result_cache.hpp"

#include "rsb/foundation/service_logger.hpp"

#include <atomic>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

namespace rsb::service {

using namespace rsb::foundation;

ServiceResult<void> ResultCacheConfig::validate() const {
    if (ttl.count() < 0) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::InvalidArgument, "cache TTL must not be negative"));
    }
    return ServiceResult<void>::ok();
}

// ── Cache entry stored in the LRU list ──────────────────────────────────────

namespace {

struct CacheEntry {
    std::string key;
    Response response;
    TimePoint insertedAt;
    std::chrono::milliseconds ttl;

    [[nodiscard]] bool expired(TimePoint now) const {
        // A clock stepped backwards leaves the entry valid.
        return now - insertedAt >= ttl;
    }
};

}  // anonymous namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct ResultCache::Impl {
    ResultCacheConfig config;
    TimeSource clock;

    // LRU list: front = most recently used, back = least recently used.
    std::list<CacheEntry> lruList;
    std::unordered_map<std::string, std::list<CacheEntry>::iterator> index;

    mutable std::mutex mutex;

    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};

    void touch(std::list<CacheEntry>::iterator it) {
        lruList.splice(lruList.begin(), lruList, it);
    }

    void evictLru() {
        if (lruList.empty()) {
            return;
        }
        index.erase(lruList.back().key);
        lruList.pop_back();
    }
};

// ── Construction / destruction / move ───────────────────────────────────────

ResultCache::ResultCache(ResultCacheConfig config, TimeSource clock)
    : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
    impl_->clock = std::move(clock);
}

ResultCache::~ResultCache() = default;

ResultCache::ResultCache(ResultCache&&) noexcept = default;
ResultCache& ResultCache::operator=(ResultCache&&) noexcept = default;

// ── get() ───────────────────────────────────────────────────────────────────

std::optional<Response> ResultCache::get(std::string_view key) {
    auto now = impl_->clock();
    std::lock_guard lock(impl_->mutex);

    auto it = impl_->index.find(std::string(key));
    if (it == impl_->index.end()) {
        impl_->misses.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    auto listIt = it->second;
    if (listIt->expired(now)) {
        impl_->lruList.erase(listIt);
        impl_->index.erase(it);
        impl_->misses.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    impl_->touch(listIt);
    impl_->hits.fetch_add(1, std::memory_order_relaxed);
    return listIt->response;
}

// ── put() ───────────────────────────────────────────────────────────────────

void ResultCache::put(std::string_view key, const Response& response) {
    put(key, response, impl_->config.ttl);
}

void ResultCache::put(std::string_view key, const Response& response,
                      std::chrono::milliseconds ttl) {
    auto now = impl_->clock();
    bool evicted = false;
    {
        std::lock_guard lock(impl_->mutex);

        auto keyStr = std::string(key);

        auto it = impl_->index.find(keyStr);
        if (it != impl_->index.end()) {
            auto listIt = it->second;
            listIt->response = response;
            listIt->insertedAt = now;
            listIt->ttl = ttl;
            impl_->touch(listIt);
            return;
        }

        if (impl_->config.maxEntries > 0 &&
            impl_->lruList.size() >= impl_->config.maxEntries) {
            impl_->evictLru();
            evicted = true;
        }

        impl_->lruList.push_front(CacheEntry{keyStr, response, now, ttl});
        impl_->index[std::move(keyStr)] = impl_->lruList.begin();
    }

    if (evicted) {
        RSB_LOG_DEBUG(LogCategory::Cache, "evicted least recently used entry");
    }
}

// ── invalidate() / purgeExpired() / clear() ─────────────────────────────────

bool ResultCache::invalidate(std::string_view key) {
    std::lock_guard lock(impl_->mutex);

    auto it = impl_->index.find(std::string(key));
    if (it == impl_->index.end()) {
        return false;
    }

    impl_->lruList.erase(it->second);
    impl_->index.erase(it);
    return true;
}

std::size_t ResultCache::purgeExpired() {
    auto now = impl_->clock();
    std::lock_guard lock(impl_->mutex);

    std::size_t count = 0;
    for (auto it = impl_->lruList.begin(); it != impl_->lruList.end();) {
        if (it->expired(now)) {
            impl_->index.erase(it->key);
            it = impl_->lruList.erase(it);
            ++count;
        } else {
            ++it;
        }
    }
    return count;
}

void ResultCache::clear() {
    std::lock_guard lock(impl_->mutex);
    impl_->lruList.clear();
    impl_->index.clear();
}

// ── Accessors ───────────────────────────────────────────────────────────────

std::size_t ResultCache::size() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->lruList.size();
}

uint64_t ResultCache::hitCount() const {
    return impl_->hits.load(std::memory_order_relaxed);
}

uint64_t ResultCache::missCount() const {
    return impl_->misses.load(std::memory_order_relaxed);
}

double ResultCache::hitRate() const {
    auto h = impl_->hits.load(std::memory_order_relaxed);
    auto m = impl_->misses.load(std::memory_order_relaxed);
    auto total = h + m;
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(h) / static_cast<double>(total);
}

const ResultCacheConfig& ResultCache::config() const noexcept {
    return impl_->config;
}

} // namespace rsb::service
