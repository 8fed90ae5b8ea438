#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include "adapters/object_store.hpp"
#include "core/chunker/chunker.hpp"
#include "core/state/backup_state.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/retry.hpp"

namespace coldsend::core {

struct UploadOptions {
    std::string object_prefix;
    std::string storage_class = "DEEP_ARCHIVE";
    infra::RetryPolicy retry{};
};

struct ChunkAck {
    std::string key;
    std::uint64_t index = 0;
    std::uint64_t size = 0;
    std::uint64_t digest = 0;
};

/// Called synchronously once the store confirmed a chunk. The next chunk is
/// not requested until it returns; an error aborts the run.
using AckCallback = std::function<infra::VoidResult(const ChunkAck&)>;

/// Stores each chunk as one whole object at object_key(prefix, pair, index).
class ChunkUploader {
public:
    ChunkUploader(adapters::ObjectStore& store, UploadOptions options);

    /// Retries transient failures with bounded exponential backoff. Returns
    /// RetriesExhausted, or the first non-transient error, without calling
    /// `on_ack`.
    [[nodiscard]] auto put(const SnapshotPair& pair, const Chunk& chunk,
                           const AckCallback& on_ack) -> infra::Result<ChunkAck>;

private:
    adapters::ObjectStore& store_;
    UploadOptions options_;
};

} // namespace coldsend::core
