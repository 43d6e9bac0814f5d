#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "rsb/foundation/service_result.hpp"
#include "rsb/rsb.hpp"

using rsb::foundation::ErrorCode;
using rsb::foundation::ServiceError;
using rsb::foundation::ServiceResult;

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(rsb::Version::major, 0);
    EXPECT_EQ(rsb::Version::minor, 1);
    EXPECT_EQ(rsb::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(rsb::Version::string, "0.1.0");
}

TEST(ResultTest, OkValue) {
    auto result = ServiceResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorKeepsCodeAndMessage) {
    auto result = ServiceResult<int>::err(ServiceError(ErrorCode::ConfigKeyNotFound, "no key"));
    EXPECT_TRUE(result.hasError());
    EXPECT_FALSE(static_cast<bool>(result));
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
    EXPECT_EQ(result.error().message(), "no key");
}

TEST(ResultTest, ValueOr) {
    auto ok = ServiceResult<double>::ok(2.5);
    auto err = ServiceResult<double>::err(ServiceError(ErrorCode::ConfigTypeMismatch));
    EXPECT_DOUBLE_EQ(ok.valueOr(100.0), 2.5);
    EXPECT_DOUBLE_EQ(err.valueOr(100.0), 100.0);
}

TEST(ResultTest, MoveOutValue) {
    auto result = ServiceResult<std::string>::ok("payload");
    std::string moved = std::move(result).value();
    EXPECT_EQ(moved, "payload");
}

TEST(ResultTest, ValueAndErrorOfSameShapeStayDistinct) {
    // A string success value and a string-bearing error never alias.
    auto ok = ServiceResult<std::string>::ok("Backend/backend_failure");
    EXPECT_TRUE(ok.hasValue());
    auto err = ServiceResult<std::string>::err(ServiceError(ErrorCode::BackendFailure));
    EXPECT_TRUE(err.hasError());
}

TEST(ResultVoidTest, OkAndError) {
    auto ok = ServiceResult<void>::ok();
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(ok.hasError());

    auto err = ServiceResult<void>::err(ServiceError(ErrorCode::LoggerFlushFailed, "void error"));
    EXPECT_TRUE(err.hasError());
    EXPECT_FALSE(err.hasValue());
    EXPECT_EQ(err.error().message(), "void error");
}
