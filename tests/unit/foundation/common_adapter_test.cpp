#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <unordered_map>

#include "rsb/foundation/common_adapter.hpp"

using namespace rsb::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::AdmissionRejected), "Admission");
    EXPECT_EQ(errorSubsystem(ErrorCode::BreakerOpen), "Breaker");
    EXPECT_EQ(errorSubsystem(ErrorCode::BackendTimeout), "Backend");
    EXPECT_EQ(errorSubsystem(ErrorCode::StageFailed), "Backend");
    EXPECT_EQ(errorSubsystem(ErrorCode::FingerprintFailed), "Cache");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::JobCancelled), "Thread");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

TEST(ErrorCodeTest, StableNames) {
    EXPECT_EQ(errorCodeName(ErrorCode::AdmissionRejected), "admission_rejected");
    EXPECT_EQ(errorCodeName(ErrorCode::BreakerOpen), "breaker_open");
    EXPECT_EQ(errorCodeName(ErrorCode::BackendTimeout), "backend_timeout");
    EXPECT_EQ(errorCodeName(ErrorCode::BackendCancelled), "backend_cancelled");
    EXPECT_EQ(errorCodeName(ErrorCode::Success), "success");
}

// --- ServiceError tests ---

TEST(ServiceErrorTest, DefaultConstruction) {
    ServiceError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
}

TEST(ServiceErrorTest, CodeAndMessage) {
    ServiceError err(ErrorCode::BackendFailure, "stage blew up");
    EXPECT_EQ(err.code(), ErrorCode::BackendFailure);
    EXPECT_EQ(err.message(), "stage blew up");
    EXPECT_EQ(err.subsystem(), "Backend");
    EXPECT_FALSE(err.isSuccess());
}

TEST(ServiceErrorTest, TransientCodes) {
    EXPECT_TRUE(ServiceError(ErrorCode::AdmissionRejected).isTransient());
    EXPECT_TRUE(ServiceError(ErrorCode::BreakerOpen).isTransient());
    EXPECT_TRUE(ServiceError(ErrorCode::BackendTimeout).isTransient());
    EXPECT_TRUE(ServiceError(ErrorCode::BackendCancelled).isTransient());

    EXPECT_FALSE(ServiceError(ErrorCode::BackendFailure).isTransient());
    EXPECT_FALSE(ServiceError(ErrorCode::StageFailed).isTransient());
    EXPECT_FALSE(ServiceError(ErrorCode::InvalidArgument).isTransient());
    EXPECT_FALSE(ServiceError(ErrorCode::Success).isTransient());
}

TEST(ServiceErrorTest, Describe) {
    EXPECT_EQ(ServiceError(ErrorCode::BackendTimeout, "no result within 200 ms").describe(),
              "Backend/backend_timeout: no result within 200 ms");
    EXPECT_EQ(ServiceError(ErrorCode::BreakerOpen).describe(), "Breaker/breaker_open");
}

TEST(ServiceErrorTest, SuccessCheck) {
    ServiceError success(ErrorCode::Success);
    EXPECT_TRUE(success.isSuccess());
}

// --- ServiceResult tests ---

TEST(ServiceResultTest, OkValue) {
    auto result = ServiceResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 42);
}

TEST(ServiceResultTest, ErrorValue) {
    auto result = ServiceResult<int>::err(
        ServiceError(ErrorCode::InvalidArgument, "bad input"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message(), "bad input");
}

TEST(ServiceResultTest, VoidOk) {
    auto result = ServiceResult<void>::ok();
    EXPECT_TRUE(result.hasValue());
}

TEST(ServiceResultTest, VoidError) {
    auto result = ServiceResult<void>::err(
        ServiceError(ErrorCode::BackendTimeout, "timed out"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::BackendTimeout);
}

// --- StrongId / Types tests ---

TEST(StrongIdTest, DefaultInvalid) {
    RequestId id;
    EXPECT_FALSE(id.isValid());
    EXPECT_EQ(id.value(), 0u);
    EXPECT_EQ(id, (NULL_ID<RequestIdTag, uint64_t>));
}

TEST(StrongIdTest, ExplicitConstruction) {
    RequestId id(100);
    EXPECT_TRUE(id.isValid());
    EXPECT_EQ(id.value(), 100u);
}

TEST(StrongIdTest, EqualityAndOrdering) {
    RequestId a(1), b(1), c(2);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_LT(a, c);
}

TEST(StrongIdTest, HashWorks) {
    std::unordered_map<RequestId, std::string> map;
    map[RequestId(7)] = "request";
    EXPECT_EQ(map[RequestId(7)], "request");
    EXPECT_EQ(map.count(RequestId(8)), 0u);
}

TEST(TimeSourceTest, ElapsedSecondsClampsNegative) {
    auto t0 = WallClock::now();
    auto t1 = t0 + std::chrono::milliseconds(1500);
    EXPECT_DOUBLE_EQ(elapsedSeconds(t0, t1), 1.5);
    EXPECT_DOUBLE_EQ(elapsedSeconds(t1, t0), 0.0);
    EXPECT_DOUBLE_EQ(elapsedSeconds(t0, t0), 0.0);
}

TEST(TimeSourceTest, WallClockIsMonotonicEnough) {
    auto clock = wallClock();
    auto before = WallClock::now();
    auto reading = clock();
    EXPECT_GE(reading, before);
}

// --- ConfigManager tests ---

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Unique directory per test so ctest --parallel does not collide
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("rsb_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGet) {
    auto path = writeYaml("bridge.yaml", R"(
bridge:
  admission:
    capacity: 50
    refill_rate: 2.5
  breaker:
    name: "primary"
)");

    ConfigManager config;
    auto loadResult = config.load(path);
    ASSERT_TRUE(loadResult.hasValue());

    auto capacity = config.get<int>("bridge.admission.capacity");
    ASSERT_TRUE(capacity.hasValue());
    EXPECT_EQ(capacity.value(), 50);

    auto rate = config.get<double>("bridge.admission.refill_rate");
    ASSERT_TRUE(rate.hasValue());
    EXPECT_DOUBLE_EQ(rate.value(), 2.5);

    auto name = config.get<std::string>("bridge.breaker.name");
    ASSERT_TRUE(name.hasValue());
    EXPECT_EQ(name.value(), "primary");
}

TEST_F(ConfigManagerTest, LoadFromString) {
    ConfigManager config;
    auto loadResult = config.loadFromString("bridge:\n  backend_timeout_ms: 250\n");
    ASSERT_TRUE(loadResult.hasValue());

    auto timeout = config.get<long long>("bridge.backend_timeout_ms");
    ASSERT_TRUE(timeout.hasValue());
    EXPECT_EQ(timeout.value(), 250);
}

TEST_F(ConfigManagerTest, MalformedYamlFails) {
    ConfigManager config;
    auto result = config.loadFromString("bridge: [unterminated");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, ReloadReplacesEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("first: 1").hasValue());
    ASSERT_TRUE(config.loadFromString("second: 2").hasValue());

    EXPECT_FALSE(config.hasKey("first"));
    EXPECT_TRUE(config.hasKey("second"));
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    auto path = writeYaml("empty.yaml", "{}");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("nonexistent.key");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    auto path = writeYaml("types.yaml", "value: hello");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("value");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load("/nonexistent/path.yaml");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, SetAndGet) {
    ConfigManager config;
    config.set<int>("bridge.cache.max_entries", 64);

    auto result = config.get<int>("bridge.cache.max_entries");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 64);
}

TEST_F(ConfigManagerTest, HasKey) {
    auto path = writeYaml("check.yaml", "key: value");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    EXPECT_TRUE(config.hasKey("key"));
    EXPECT_FALSE(config.hasKey("missing"));
}

TEST_F(ConfigManagerTest, ChildKeys) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
backend:
  routes:
    refund: "Refunds take five days"
    track: "Your parcel is on its way"
  name: staged
)").hasValue());

    auto children = config.childKeys("backend.routes");
    ASSERT_EQ(children.size(), 2u);
    EXPECT_EQ(children[0], "refund");
    EXPECT_EQ(children[1], "track");

    auto top = config.childKeys("backend");
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0], "name");
    EXPECT_EQ(top[1], "routes");

    EXPECT_TRUE(config.childKeys("missing").empty());
}

TEST_F(ConfigManagerTest, WatchNotification) {
    ConfigManager config;
    bool notified = false;
    std::string notifiedKey;

    config.watch("logging.level", [&](std::string_view key) {
        notified = true;
        notifiedKey = std::string(key);
    });

    config.set<std::string>("logging.level", "debug");
    EXPECT_TRUE(notified);
    EXPECT_EQ(notifiedKey, "logging.level");
}
