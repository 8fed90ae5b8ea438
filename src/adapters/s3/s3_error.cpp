#include "s3_error.hpp"
#include <array>
#include <algorithm>
#include <fmt/core.h>

namespace coldsend::adapters::s3 {

namespace {

constexpr std::array<std::string_view, 8> kAuthErrors = {
    "AccessDenied", "InvalidAccessKeyId", "SignatureDoesNotMatch", "ExpiredToken",
    "InvalidToken", "MissingAuthenticationToken", "UnrecognizedClientException",
    "AllAccessDisabled",
};

constexpr std::array<std::string_view, 5> kThrottleErrors = {
    "SlowDown", "Throttling", "ThrottlingException", "RequestLimitExceeded",
    "TooManyRequestsException",
};

template<std::size_t N>
bool contains(const std::array<std::string_view, N>& names, std::string_view name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

auto classify(const S3Failure& failure) -> infra::ErrorCode {
    const std::string_view name = failure.exception_name;

    if (contains(kAuthErrors, name) || failure.http_status == 401 || failure.http_status == 403) {
        return infra::ErrorCode::AccessDenied;
    }
    if (contains(kThrottleErrors, name) || failure.http_status == 429 || failure.http_status == 503) {
        return infra::ErrorCode::Throttled;
    }
    if (name == "RequestTimeout" || name == "RequestTimeoutException" || failure.http_status == 408) {
        return infra::ErrorCode::Timeout;
    }
    // Body corrupted in transit; resending the same bytes is the fix
    if (name == "BadDigest" || name == "IncompleteBody") {
        return infra::ErrorCode::NetworkError;
    }
    if (failure.http_status >= 500) {
        return infra::ErrorCode::ServerError;
    }
    if (failure.http_status == 0) {
        return infra::ErrorCode::NetworkError;
    }
    if (failure.sdk_says_retryable) {
        return infra::ErrorCode::NetworkError;
    }
    return infra::ErrorCode::BadRequest;
}

auto to_error(std::string_view operation, const S3Failure& failure) -> infra::Error {
    return infra::make_error(classify(failure),
        fmt::format("{} failed (HTTP {}, {}): {}", operation, failure.http_status,
                    failure.exception_name.empty() ? "no error code" : failure.exception_name,
                    failure.message));
}

} // namespace coldsend::adapters::s3
