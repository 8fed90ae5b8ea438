#include "s3_object_store.hpp"
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/utils/HashingUtils.h>
#include <aws/core/utils/logging/LogLevel.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/StorageClass.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "s3_error.hpp"

namespace coldsend::adapters::s3 {

namespace {

constexpr const char* kAllocationTag = "coldsend";

template<typename Error>
auto failure_of(const Error& error) -> S3Failure {
    return S3Failure{
        .http_status = static_cast<int>(error.GetResponseCode()),
        .exception_name = error.GetExceptionName().c_str(),
        .message = error.GetMessage().c_str(),
        .sdk_says_retryable = error.ShouldRetry(),
    };
}

} // namespace

AwsSdkSession::AwsSdkSession(bool verbose) {
    options_.loggingOptions.logLevel = verbose ? Aws::Utils::Logging::LogLevel::Warn
                                               : Aws::Utils::Logging::LogLevel::Off;
    Aws::InitAPI(options_);
}

AwsSdkSession::~AwsSdkSession() {
    Aws::ShutdownAPI(options_);
}

S3ObjectStore::S3ObjectStore(S3Options options)
    : options_(std::move(options))
{
    Aws::Client::ClientConfiguration config;
    if (options_.region) {
        config.region = options_.region->c_str();
    }
    if (options_.endpoint) {
        std::string endpoint = *options_.endpoint;
        if (endpoint.starts_with("http://")) {
            config.scheme = Aws::Http::Scheme::HTTP;
            endpoint.erase(0, 7);
        } else if (endpoint.starts_with("https://")) {
            config.scheme = Aws::Http::Scheme::HTTPS;
            endpoint.erase(0, 8);
        }
        config.endpointOverride = endpoint.c_str();
    }
    config.requestTimeoutMs = static_cast<long>(options_.request_timeout.count());
    config.connectTimeoutMs = static_cast<long>(options_.connect_timeout.count());
    // Retries are ours (infra::with_retry), so they show up in the log and
    // respect the interrupt flag
    config.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(kAllocationTag, 0);

    client_ = std::make_unique<Aws::S3::S3Client>(
        config,
        Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
        /*useVirtualAddressing=*/!options_.path_style);

    spdlog::debug("S3 client for bucket '{}' (endpoint {}, {} addressing)",
                  options_.bucket, options_.endpoint.value_or("default"),
                  options_.path_style ? "path-style" : "virtual-host");
}

S3ObjectStore::~S3ObjectStore() = default;

auto S3ObjectStore::put_object(const PutObjectRequest& request) -> infra::VoidResult {
    const auto storage_class =
        Aws::S3::Model::StorageClassMapper::GetStorageClassForName(request.storage_class.c_str());
    if (storage_class == Aws::S3::Model::StorageClass::NOT_SET) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("unknown storage class '{}'", request.storage_class)));
    }

    // Content-MD5 lets the store reject a body damaged in transit
    request.body->clear();
    request.body->seekg(0);
    const auto md5 = Aws::Utils::HashingUtils::Base64Encode(
        Aws::Utils::HashingUtils::CalculateMD5(*request.body));
    request.body->clear();
    request.body->seekg(0);

    Aws::S3::Model::PutObjectRequest put;
    put.SetBucket(options_.bucket.c_str());
    put.SetKey(request.key.c_str());
    put.SetStorageClass(storage_class);
    put.SetContentLength(static_cast<long long>(request.size));
    put.SetContentType("application/octet-stream");
    put.SetContentMD5(md5);
    for (const auto& [key, value] : request.metadata) {
        put.AddMetadata(key.c_str(), value.c_str());
    }
    put.SetBody(request.body);

    auto outcome = client_->PutObject(put);
    if (!outcome.IsSuccess()) {
        return std::unexpected(to_error(fmt::format("PutObject s3://{}/{}", options_.bucket, request.key),
                                        failure_of(outcome.GetError())));
    }
    return {};
}

auto S3ObjectStore::list_objects(const std::string& prefix)
    -> infra::Result<std::vector<ObjectInfo>>
{
    Aws::S3::Model::ListObjectsV2Request req;
    req.SetBucket(options_.bucket.c_str());
    req.SetPrefix(prefix.c_str());

    std::vector<ObjectInfo> objects;
    for (;;) {
        auto outcome = client_->ListObjectsV2(req);
        if (!outcome.IsSuccess()) {
            return std::unexpected(to_error(fmt::format("ListObjectsV2 s3://{}/{}", options_.bucket, prefix),
                                            failure_of(outcome.GetError())));
        }

        const auto& result = outcome.GetResult();
        for (const auto& object : result.GetContents()) {
            objects.push_back(ObjectInfo{
                .key = object.GetKey().c_str(),
                .size = static_cast<std::uint64_t>(object.GetSize()),
            });
        }
        if (!result.GetIsTruncated()) {
            break;
        }
        req.SetContinuationToken(result.GetNextContinuationToken());
    }
    return objects;
}

} // namespace coldsend::adapters::s3
