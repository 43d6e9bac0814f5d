/// @file result_cache_test.cpp
/// @brief Unit tests for ResultCache TTL and LRU behaviour.

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "common/manual_clock.hpp"
#include "rsb/service/result_cache.hpp"

using namespace rsb::service;
using namespace rsb::foundation;
using namespace std::chrono_literals;
using rsb::test::ManualClock;

namespace {

Response reply(const std::string& text) {
    return Response::succeeded(text, 0.9, 0.01, {"parser"});
}

}  // namespace

TEST(ResultCacheConfigTest, Defaults) {
    ResultCacheConfig config;
    EXPECT_TRUE(config.enabled);
    EXPECT_EQ(config.ttl, std::chrono::minutes(5));
    EXPECT_EQ(config.maxEntries, 0u);
    EXPECT_EQ(config.scope, CacheScope::Global);
    EXPECT_TRUE(config.validate().hasValue());
}

TEST(ResultCacheConfigTest, RejectsNegativeTtl) {
    ResultCacheConfig config{.ttl = std::chrono::milliseconds(-1)};
    auto result = config.validate();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

class ResultCacheTest : public ::testing::Test {
protected:
    ManualClock clock_;

    ResultCache makeCache(std::chrono::milliseconds ttl, std::size_t maxEntries = 0) {
        return ResultCache(ResultCacheConfig{.ttl = ttl, .maxEntries = maxEntries},
                           clock_.source());
    }
};

TEST_F(ResultCacheTest, MissThenHit) {
    auto cache = makeCache(10s);
    EXPECT_FALSE(cache.get("k").has_value());

    cache.put("k", reply("hello"));
    auto hit = cache.get("k");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->content(), "hello");
    EXPECT_EQ(cache.hitCount(), 1u);
    EXPECT_EQ(cache.missCount(), 1u);
    EXPECT_DOUBLE_EQ(cache.hitRate(), 0.5);
}

TEST_F(ResultCacheTest, HitRateZeroWhenUnused) {
    auto cache = makeCache(10s);
    EXPECT_DOUBLE_EQ(cache.hitRate(), 0.0);
}

TEST_F(ResultCacheTest, ReturnsEqualResponse) {
    auto cache = makeCache(10s);
    auto original = reply("same");
    cache.put("k", original);
    EXPECT_EQ(*cache.get("k"), original);
}

TEST_F(ResultCacheTest, ExpiresAtTtlBoundary) {
    auto cache = makeCache(1000ms);
    cache.put("k", reply("v"));

    clock_.advance(999ms);
    EXPECT_TRUE(cache.get("k").has_value());

    clock_.advance(1ms);
    EXPECT_FALSE(cache.get("k").has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ResultCacheTest, ZeroTtlNeverServes) {
    auto cache = makeCache(0ms);
    cache.put("k", reply("v"));
    EXPECT_FALSE(cache.get("k").has_value());
}

TEST_F(ResultCacheTest, BackwardsClockKeepsEntry) {
    auto cache = makeCache(1000ms);
    cache.put("k", reply("v"));
    clock_.advanceSeconds(-60.0);
    EXPECT_TRUE(cache.get("k").has_value());
}

TEST_F(ResultCacheTest, CustomTtlOverridesDefault) {
    auto cache = makeCache(10s);
    cache.put("short", reply("a"), 100ms);
    cache.put("long", reply("b"));

    clock_.advance(200ms);
    EXPECT_FALSE(cache.get("short").has_value());
    EXPECT_TRUE(cache.get("long").has_value());
}

TEST_F(ResultCacheTest, OverwriteRefreshesTimestamp) {
    auto cache = makeCache(1000ms);
    cache.put("k", reply("old"));
    clock_.advance(800ms);
    cache.put("k", reply("new"));
    clock_.advance(800ms);

    auto hit = cache.get("k");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->content(), "new");
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(ResultCacheTest, LruEvictsLeastRecentlyUsed) {
    auto cache = makeCache(10s, 2);
    cache.put("a", reply("A"));
    cache.put("b", reply("B"));
    ASSERT_TRUE(cache.get("a").has_value());  // a is now most recent

    cache.put("c", reply("C"));
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.get("a").has_value());
    EXPECT_FALSE(cache.get("b").has_value());
    EXPECT_TRUE(cache.get("c").has_value());
}

TEST_F(ResultCacheTest, UnboundedWhenMaxEntriesZero) {
    auto cache = makeCache(10s, 0);
    for (int i = 0; i < 500; ++i) {
        cache.put("k" + std::to_string(i), reply("v"));
    }
    EXPECT_EQ(cache.size(), 500u);
}

TEST_F(ResultCacheTest, InvalidateRemovesEntry) {
    auto cache = makeCache(10s);
    cache.put("k", reply("v"));
    EXPECT_TRUE(cache.invalidate("k"));
    EXPECT_FALSE(cache.invalidate("k"));
    EXPECT_FALSE(cache.get("k").has_value());
}

TEST_F(ResultCacheTest, PurgeExpiredSweepsOnlyExpired) {
    auto cache = makeCache(1000ms);
    cache.put("old1", reply("a"));
    cache.put("old2", reply("b"));
    clock_.advance(600ms);
    cache.put("fresh", reply("c"));
    clock_.advance(500ms);

    EXPECT_EQ(cache.purgeExpired(), 2u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.get("fresh").has_value());
}

TEST_F(ResultCacheTest, ClearRemovesEverything) {
    auto cache = makeCache(10s);
    cache.put("a", reply("A"));
    cache.put("b", reply("B"));
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ResultCacheTest, ConcurrentAccessIsSafe) {
    auto cache = makeCache(10s, 64);

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 200; ++i) {
                auto key = "k" + std::to_string((t * 7 + i) % 100);
                cache.put(key, reply(key));
                auto hit = cache.get(key);
                if (hit) {
                    EXPECT_EQ(hit->content(), key);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_LE(cache.size(), 64u);
}
