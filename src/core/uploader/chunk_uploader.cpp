#include "chunk_uploader.hpp"
#include <iostream>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "infra/hash/xxhash_digest.hpp"

namespace coldsend::core {

ChunkUploader::ChunkUploader(adapters::ObjectStore& store, UploadOptions options)
    : store_(store), options_(std::move(options)) {}

auto ChunkUploader::put(const SnapshotPair& pair, const Chunk& chunk,
                        const AckCallback& on_ack) -> infra::Result<ChunkAck>
{
    adapters::PutObjectRequest request{
        .key = object_key(options_.object_prefix, pair, chunk.index),
        .body = chunk.body,
        .size = chunk.size,
        .storage_class = options_.storage_class,
        .metadata = {
            {"coldsend-chunk-index", fmt::format("{}", chunk.index)},
            {"coldsend-xxh64", infra::digest_to_hex(chunk.digest)},
            {"coldsend-target", pair.target},
        },
    };
    if (pair.base) {
        request.metadata.emplace("coldsend-base", *pair.base);
    }

    auto stored = infra::with_retry([&]() -> infra::VoidResult {
        // A failed attempt may have consumed part of the body
        request.body->clear();
        request.body->seekg(0);
        return store_.put_object(request);
    }, options_.retry, fmt::format("upload of {}", request.key));

    if (!stored) {
        return std::unexpected(std::move(stored.error()));
    }

    ChunkAck ack{
        .key = request.key,
        .index = chunk.index,
        .size = chunk.size,
        .digest = chunk.digest,
    };
    spdlog::info("Stored chunk {} ({} bytes) as {}", ack.index, ack.size, ack.key);

    if (on_ack) {
        if (auto committed = on_ack(ack); !committed) {
            return std::unexpected(std::move(committed.error()));
        }
    }
    return ack;
}

} // namespace coldsend::core
