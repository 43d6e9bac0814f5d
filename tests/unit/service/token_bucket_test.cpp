/// @file token_bucket_test.cpp
/// @brief Unit tests for TokenBucket admission control.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "common/manual_clock.hpp"
#include "rsb/service/token_bucket.hpp"

using namespace rsb::service;
using namespace rsb::foundation;
using rsb::test::ManualClock;

// ===========================================================================
// Config validation
// ===========================================================================

TEST(TokenBucketConfigTest, DefaultsAreValid) {
    TokenBucketConfig config;
    EXPECT_DOUBLE_EQ(config.capacity, 1000.0);
    EXPECT_DOUBLE_EQ(config.refillRate, 100.0);
    EXPECT_TRUE(config.validate().hasValue());
}

TEST(TokenBucketConfigTest, RejectsNonPositiveCapacity) {
    auto zero = TokenBucketConfig{.capacity = 0.0, .refillRate = 1.0}.validate();
    ASSERT_TRUE(zero.hasError());
    EXPECT_EQ(zero.error().code(), ErrorCode::InvalidArgument);

    EXPECT_TRUE((TokenBucketConfig{.capacity = -5.0, .refillRate = 1.0}.validate().hasError()));
}

TEST(TokenBucketConfigTest, RejectsNegativeRateButAllowsZero) {
    EXPECT_TRUE((TokenBucketConfig{.capacity = 1.0, .refillRate = -0.1}.validate().hasError()));
    EXPECT_TRUE((TokenBucketConfig{.capacity = 1.0, .refillRate = 0.0}.validate().hasValue()));
}

// ===========================================================================
// Acquisition
// ===========================================================================

class TokenBucketTest : public ::testing::Test {
protected:
    ManualClock clock_;
};

TEST_F(TokenBucketTest, StartsFull) {
    TokenBucket bucket({.capacity = 5.0, .refillRate = 1.0}, clock_.source());
    EXPECT_DOUBLE_EQ(bucket.available(), 5.0);
    EXPECT_DOUBLE_EQ(bucket.capacity(), 5.0);
    EXPECT_DOUBLE_EQ(bucket.refillRate(), 1.0);
}

TEST_F(TokenBucketTest, BurstThenReject) {
    TokenBucket bucket({.capacity = 10.0, .refillRate = 0.0}, clock_.source());
    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(bucket.tryAcquire()) << "acquire " << i;
    }
    EXPECT_FALSE(bucket.tryAcquire());
    EXPECT_DOUBLE_EQ(bucket.available(), 0.0);
}

TEST_F(TokenBucketTest, RejectionLeavesTokensUnchanged) {
    TokenBucket bucket({.capacity = 3.0, .refillRate = 0.0}, clock_.source());
    EXPECT_FALSE(bucket.tryAcquire(5));
    EXPECT_DOUBLE_EQ(bucket.available(), 3.0);
    EXPECT_TRUE(bucket.tryAcquire(3));
}

TEST_F(TokenBucketTest, ZeroCostCountsAsOne) {
    TokenBucket bucket({.capacity = 2.0, .refillRate = 0.0}, clock_.source());
    EXPECT_TRUE(bucket.tryAcquire(0));
    EXPECT_DOUBLE_EQ(bucket.available(), 1.0);
}

TEST_F(TokenBucketTest, RefillsOverTime) {
    TokenBucket bucket({.capacity = 10.0, .refillRate = 2.0}, clock_.source());
    EXPECT_TRUE(bucket.tryAcquire(10));
    EXPECT_FALSE(bucket.tryAcquire());

    clock_.advanceSeconds(0.25);
    EXPECT_FALSE(bucket.tryAcquire());  // 0.5 tokens

    clock_.advanceSeconds(0.25);
    EXPECT_TRUE(bucket.tryAcquire());   // 1.0 token exactly
    EXPECT_FALSE(bucket.tryAcquire());
}

TEST_F(TokenBucketTest, RefillCapsAtCapacity) {
    TokenBucket bucket({.capacity = 4.0, .refillRate = 100.0}, clock_.source());
    EXPECT_TRUE(bucket.tryAcquire(4));
    clock_.advanceSeconds(60.0);
    EXPECT_DOUBLE_EQ(bucket.available(), 4.0);
}

TEST_F(TokenBucketTest, AvailableDoesNotMutate) {
    TokenBucket bucket({.capacity = 10.0, .refillRate = 1.0}, clock_.source());
    EXPECT_TRUE(bucket.tryAcquire(10));
    clock_.advanceSeconds(3.0);
    EXPECT_DOUBLE_EQ(bucket.available(), 3.0);
    EXPECT_DOUBLE_EQ(bucket.available(), 3.0);
    EXPECT_TRUE(bucket.tryAcquire(3));
    EXPECT_FALSE(bucket.tryAcquire());
}

TEST_F(TokenBucketTest, BackwardsClockAddsNothing) {
    TokenBucket bucket({.capacity = 10.0, .refillRate = 1.0}, clock_.source());
    EXPECT_TRUE(bucket.tryAcquire(10));

    clock_.advanceSeconds(-30.0);
    EXPECT_FALSE(bucket.tryAcquire());

    // Refill restarts from the stepped-back time.
    clock_.advanceSeconds(5.0);
    EXPECT_DOUBLE_EQ(bucket.available(), 5.0);
    EXPECT_TRUE(bucket.tryAcquire(5));
    EXPECT_FALSE(bucket.tryAcquire());
}

TEST_F(TokenBucketTest, RefillResumesAfterLargeBackwardsStep) {
    TokenBucket bucket({.capacity = 10.0, .refillRate = 10.0}, clock_.source());
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(bucket.tryAcquire());
    }

    clock_.advanceSeconds(-3600.0);
    EXPECT_FALSE(bucket.tryAcquire());

    clock_.advanceSeconds(5.0);
    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(bucket.tryAcquire()) << "acquire " << i;
    }
}

TEST_F(TokenBucketTest, ResetRefillsToCapacity) {
    TokenBucket bucket({.capacity = 5.0, .refillRate = 0.0}, clock_.source());
    EXPECT_TRUE(bucket.tryAcquire(5));
    bucket.reset();
    EXPECT_DOUBLE_EQ(bucket.available(), 5.0);
}

// ===========================================================================
// Concurrency
// ===========================================================================

TEST_F(TokenBucketTest, ConcurrentAcquireNeverOverspends) {
    constexpr int kCapacity = 500;
    TokenBucket bucket({.capacity = kCapacity, .refillRate = 0.0}, clock_.source());

    constexpr int kThreads = 8;
    constexpr int kAttempts = 200;
    std::atomic<int> admitted{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kAttempts; ++i) {
                if (bucket.tryAcquire()) {
                    admitted.fetch_add(1);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(admitted.load(), kCapacity);
}
