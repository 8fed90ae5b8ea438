#pragma once

#include <cstdint>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "infra/error_handler/error.hpp"

namespace coldsend::adapters {

struct PutObjectRequest {
    std::string key;
    std::shared_ptr<std::iostream> body;  // positioned at 0 by the caller
    std::uint64_t size = 0;
    std::string storage_class;
    std::map<std::string, std::string> metadata;
};

struct ObjectInfo {
    std::string key;
    std::uint64_t size = 0;
};

/// Whole-object store. put_object() returns only once the store has
/// acknowledged durable storage; no multi-part uploads.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    /// Transient failures are reported with a transient ErrorCode and are not
    /// retried here.
    [[nodiscard]] virtual auto put_object(const PutObjectRequest& request) -> infra::VoidResult = 0;

    /// All keys under `prefix`, in key order.
    [[nodiscard]] virtual auto list_objects(const std::string& prefix)
        -> infra::Result<std::vector<ObjectInfo>> = 0;
};

} // namespace coldsend::adapters
