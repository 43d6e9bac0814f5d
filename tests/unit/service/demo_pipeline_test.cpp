/// @file demo_pipeline_test.cpp
/// @brief Unit tests for the keyword-routing demo stages.

#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <memory>
#include <string>

#include "rsb/service/demo_pipeline.hpp"

using namespace rsb::service;
using namespace rsb::foundation;
using namespace std::chrono_literals;

TEST(NormalizeTextTest, TrimsCollapsesAndLowercases) {
    auto out = normalizeText("  Where IS\tmy \n Parcel  ");
    ASSERT_TRUE(out.hasValue());
    EXPECT_EQ(out.value(), "where is my parcel");
}

TEST(NormalizeTextTest, BlankInputFails) {
    auto out = normalizeText(" \t\n ");
    ASSERT_TRUE(out.hasError());
    EXPECT_EQ(out.error().code(), ErrorCode::StageFailed);
    EXPECT_EQ(out.error().message(), "empty message");

    EXPECT_TRUE(normalizeText("").hasError());
}

TEST(RouteTextTest, FirstKeywordInMapOrderWins) {
    std::map<std::string, std::string> routes{
        {"refund", "refunds take five days"},
        {"parcel", "your parcel is on its way"},
    };
    EXPECT_EQ(routeText("where is my parcel", routes), "your parcel is on its way");
    EXPECT_EQ(routeText("refund my parcel", routes), "refunds take five days");
}

TEST(RouteTextTest, FallbackWhenNothingMatches) {
    std::map<std::string, std::string> routes{{"refund", "r"}};
    EXPECT_EQ(routeText("hello there", routes), kFallbackReply);
    EXPECT_EQ(routeText("anything", {}), kFallbackReply);
}

TEST(RouteTextTest, EmptyKeywordIsIgnored) {
    std::map<std::string, std::string> routes{{"", "catch all"}};
    EXPECT_EQ(routeText("hello", routes), kFallbackReply);
}

class DemoStagesTest : public ::testing::Test {
protected:
    std::shared_ptr<JobScheduler> scheduler_ = std::make_shared<JobScheduler>(1);
    StagedBackend backend_{StagedBackendConfig{.name = "demo"}, scheduler_};

    void SetUp() override {
        installDemoStages(backend_, {{"hours", "we are open nine to five"}});
    }

    BackendResult run(const std::string& content) {
        auto future = backend_.handle(Request(content));
        EXPECT_EQ(future.wait_for(5s), std::future_status::ready);
        return future.get();
    }
};

TEST_F(DemoStagesTest, InstallsThreeStages) {
    EXPECT_EQ(backend_.stageCount(), 3u);
}

TEST_F(DemoStagesTest, RoutedReplyIsCapitalizedAndPunctuated) {
    auto result = run("What are your HOURS?");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().content(), "We are open nine to five.");

    const auto& stages = result.value().stagesUsed();
    ASSERT_EQ(stages.size(), 3u);
    EXPECT_EQ(stages[0], "parser");
    EXPECT_EQ(stages[1], "router");
    EXPECT_EQ(stages[2], "generator");
}

TEST_F(DemoStagesTest, FallbackKeepsExistingPunctuation) {
    auto result = run("hello");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().content(), kFallbackReply);
}

TEST_F(DemoStagesTest, BlankMessageFailsInParser) {
    auto result = run("   ");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::StageFailed);
}
