/// @file json_log_formatter_test.cpp
/// @brief Unit tests for JsonLogFormatter and correlation ID utilities.

#include <gtest/gtest.h>

#include <atomic>
#include <regex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "rsb/foundation/json_log_formatter.hpp"

using namespace rsb::foundation;

// ===========================================================================
// appendJsonString
// ===========================================================================

TEST(AppendJsonStringTest, EscapesQuotesBackslashesAndControls) {
    std::string out;
    appendJsonString(out, std::string("a\"b\\c\nd\te\x01", 10));
    EXPECT_EQ(out, "\"a\\\"b\\\\c\\nd\\te\\u0001\"");
}

TEST(AppendJsonStringTest, PassesUtf8Through) {
    std::string out;
    appendJsonString(out, "caf\xc3\xa9");
    EXPECT_EQ(out, "\"caf\xc3\xa9\"");
}

// ===========================================================================
// JsonLogFormatter
// ===========================================================================

TEST(JsonLogFormatterTest, ProducesValidJsonStructure) {
    auto json = JsonLogFormatter::format(LogLevel::Info, LogCategory::Core, "bridge starting");

    ASSERT_FALSE(json.empty());
    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_NE(json.find("\"timestamp\""), std::string::npos);
    EXPECT_NE(json.find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"Core\""), std::string::npos);
    EXPECT_NE(json.find("\"message\":\"bridge starting\""), std::string::npos);
}

TEST(JsonLogFormatterTest, TimestampIsIso8601) {
    auto json = JsonLogFormatter::format(LogLevel::Info, LogCategory::Core, "test");

    std::regex isoPattern(
        R"RE("timestamp":"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)")RE");
    EXPECT_TRUE(std::regex_search(json, isoPattern))
        << "Timestamp not in ISO 8601 format: " << json;
}

TEST(JsonLogFormatterTest, IncludesContextFields) {
    LogContext ctx;
    ctx.requestId = RequestId(17);
    ctx.userId = "bob";
    ctx.extra["reason"] = "breaker_open";

    auto json = JsonLogFormatter::format(LogLevel::Warning, LogCategory::Bridge,
                                         "request failed", ctx);

    EXPECT_NE(json.find("\"request_id\":17"), std::string::npos);
    EXPECT_NE(json.find("\"user_id\":\"bob\""), std::string::npos);
    EXPECT_NE(json.find("\"extra\":{\"reason\":\"breaker_open\"}"), std::string::npos);
}

TEST(JsonLogFormatterTest, OmitsEmptyContextFields) {
    LogContext ctx;
    auto json = JsonLogFormatter::format(LogLevel::Info, LogCategory::Core, "plain", ctx);

    EXPECT_EQ(json.find("\"request_id\""), std::string::npos);
    EXPECT_EQ(json.find("\"user_id\""), std::string::npos);
    EXPECT_EQ(json.find("\"extra\""), std::string::npos);
    EXPECT_EQ(json.find("\"correlation_id\""), std::string::npos);
}

TEST(JsonLogFormatterTest, EscapesMessageAndStaysSingleLine) {
    auto json = JsonLogFormatter::format(LogLevel::Info, LogCategory::Backend,
                                         "stage \"router\" said\nhello");

    EXPECT_NE(json.find("\\\"router\\\""), std::string::npos);
    EXPECT_NE(json.find("\\n"), std::string::npos);
    EXPECT_EQ(json.find('\n'), std::string::npos);
}

// ===========================================================================
// Correlation IDs
// ===========================================================================

TEST(CorrelationIdTest, GeneratesUuidV4Format) {
    auto id = generateCorrelationId();

    std::regex uuidPattern(
        R"([0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12})");
    EXPECT_TRUE(std::regex_match(id, uuidPattern)) << "Invalid UUID v4 format: " << id;
}

TEST(CorrelationIdTest, GeneratesUniqueIdsAcrossThreads) {
    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;

    std::vector<std::vector<std::string>> results(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&results, t] {
            for (int i = 0; i < kPerThread; ++i) {
                results[static_cast<std::size_t>(t)].push_back(generateCorrelationId());
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::set<std::string> all;
    for (const auto& ids : results) {
        all.insert(ids.begin(), ids.end());
    }
    EXPECT_EQ(all.size(), static_cast<std::size_t>(kThreads * kPerThread));
}

TEST(CorrelationScopeTest, NestingRestoresOuterScope) {
    EXPECT_TRUE(CorrelationScope::current().empty());
    {
        CorrelationScope outer("outer-id");
        {
            CorrelationScope inner("inner-id");
            EXPECT_EQ(CorrelationScope::current(), "inner-id");
        }
        EXPECT_EQ(CorrelationScope::current(), "outer-id");
    }
    EXPECT_TRUE(CorrelationScope::current().empty());
}

TEST(CorrelationScopeTest, ThreadLocalIsolation) {
    CorrelationScope scope("main-thread-id");

    std::string seenByWorker = "unset";
    std::thread t([&] { seenByWorker = CorrelationScope::current(); });
    t.join();

    EXPECT_TRUE(seenByWorker.empty());
    EXPECT_EQ(CorrelationScope::current(), "main-thread-id");
}

TEST(CorrelationScopeTest, FormatterUsesScopeUnlessContextOverrides) {
    CorrelationScope scope("thread-id");

    auto fromScope = JsonLogFormatter::format(LogLevel::Info, LogCategory::Core, "a");
    EXPECT_NE(fromScope.find("\"correlation_id\":\"thread-id\""), std::string::npos);

    LogContext ctx;
    ctx.traceId = "explicit-id";
    auto fromCtx = JsonLogFormatter::format(LogLevel::Info, LogCategory::Core, "b", ctx);
    EXPECT_NE(fromCtx.find("\"correlation_id\":\"explicit-id\""), std::string::npos);
    EXPECT_EQ(fromCtx.find("thread-id"), std::string::npos);
}
