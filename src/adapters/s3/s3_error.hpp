#pragma once

#include <string>
#include <string_view>
#include "infra/error_handler/error.hpp"

namespace coldsend::adapters::s3 {

/// What the SDK reports about a failed request, decoupled from SDK types
struct S3Failure {
    int http_status = 0;             // 0 when no response arrived
    std::string exception_name;      // e.g. "AccessDenied", "SlowDown"
    std::string message;
    bool sdk_says_retryable = false;
};

/// Maps a failed request onto the error taxonomy: throttling, 5xx, network
/// and timeouts are transient; authorization and malformed requests are not.
[[nodiscard]] auto classify(const S3Failure& failure) -> infra::ErrorCode;

[[nodiscard]] auto to_error(std::string_view operation, const S3Failure& failure) -> infra::Error;

} // namespace coldsend::adapters::s3
