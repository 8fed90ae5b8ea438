#include <gtest/gtest.h>

#include "adapters/s3/s3_error.hpp"

using coldsend::adapters::s3::S3Failure;
using coldsend::adapters::s3::classify;
using coldsend::infra::ErrorCode;

TEST(S3ErrorTest, AuthorizationIsFatal)
{
    EXPECT_EQ(classify({.http_status = 403, .exception_name = "AccessDenied"}), ErrorCode::AccessDenied);
    EXPECT_EQ(classify({.http_status = 400, .exception_name = "ExpiredToken"}), ErrorCode::AccessDenied);
    EXPECT_EQ(classify({.http_status = 401}), ErrorCode::AccessDenied);
}

TEST(S3ErrorTest, ThrottlingAndServerErrorsAreTransient)
{
    EXPECT_EQ(classify({.http_status = 503, .exception_name = "SlowDown"}), ErrorCode::Throttled);
    EXPECT_EQ(classify({.http_status = 429}), ErrorCode::Throttled);
    EXPECT_EQ(classify({.http_status = 500, .exception_name = "InternalError"}), ErrorCode::ServerError);
    EXPECT_EQ(classify({.http_status = 400, .exception_name = "RequestTimeout"}), ErrorCode::Timeout);
}

TEST(S3ErrorTest, NoResponseIsANetworkError)
{
    EXPECT_EQ(classify({.http_status = 0, .message = "Couldn't connect"}), ErrorCode::NetworkError);
}

TEST(S3ErrorTest, CorruptedBodyIsRetried)
{
    EXPECT_EQ(classify({.http_status = 400, .exception_name = "BadDigest"}), ErrorCode::NetworkError);
}

TEST(S3ErrorTest, MalformedRequestIsFatal)
{
    EXPECT_EQ(classify({.http_status = 400, .exception_name = "InvalidStorageClass"}), ErrorCode::BadRequest);
    EXPECT_EQ(classify({.http_status = 404, .exception_name = "NoSuchBucket"}), ErrorCode::BadRequest);
    EXPECT_EQ(classify({.http_status = 400, .exception_name = "Whatever", .sdk_says_retryable = true}),
              ErrorCode::NetworkError);
}

TEST(S3ErrorTest, MessageNamesOperationAndStatus)
{
    auto err = coldsend::adapters::s3::to_error("PutObject s3://b/k",
        {.http_status = 403, .exception_name = "AccessDenied", .message = "nope"});
    EXPECT_EQ(err.code, ErrorCode::AccessDenied);
    EXPECT_NE(err.message.find("PutObject s3://b/k"), std::string::npos);
    EXPECT_NE(err.message.find("403"), std::string::npos);
}
