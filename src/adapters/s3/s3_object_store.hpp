#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <aws/core/Aws.h>
#include <aws/s3/S3Client.h>
#include "adapters/object_store.hpp"

namespace coldsend::adapters::s3 {

/// Aws::InitAPI / ShutdownAPI for the lifetime of the process. Create one in
/// main before any S3ObjectStore.
class AwsSdkSession {
public:
    explicit AwsSdkSession(bool verbose);
    ~AwsSdkSession();

    AwsSdkSession(const AwsSdkSession&) = delete;
    AwsSdkSession& operator=(const AwsSdkSession&) = delete;

private:
    Aws::SDKOptions options_;
};

struct S3Options {
    std::string bucket;
    std::optional<std::string> region;
    std::optional<std::string> endpoint;   // e.g. http://localhost:9000 for minio
    bool path_style = false;
    std::chrono::milliseconds request_timeout{300'000};
    std::chrono::milliseconds connect_timeout{10'000};
};

class S3ObjectStore final : public ObjectStore {
public:
    explicit S3ObjectStore(S3Options options);
    ~S3ObjectStore() override;

    [[nodiscard]] auto put_object(const PutObjectRequest& request) -> infra::VoidResult override;

    [[nodiscard]] auto list_objects(const std::string& prefix)
        -> infra::Result<std::vector<ObjectInfo>> override;

private:
    S3Options options_;
    std::unique_ptr<Aws::S3::S3Client> client_;
};

} // namespace coldsend::adapters::s3
