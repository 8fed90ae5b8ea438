#include <gtest/gtest.h>

#include <sstream>
#include "core/uploader/chunk_uploader.hpp"
#include "infra/hash/xxhash_digest.hpp"
#include "support/memory_object_store.hpp"

using namespace coldsend::core;
using coldsend::infra::ErrorCode;
using coldsend::testing::MemoryObjectStore;

namespace {

const coldsend::infra::RetryPolicy kFastRetry{
    .max_attempts = 3,
    .initial_delay = std::chrono::milliseconds(1),
    .max_delay = std::chrono::milliseconds(2),
};

Chunk make_chunk(std::uint64_t index, const std::string& data) {
    auto body = std::make_shared<std::stringstream>(data, std::ios::in | std::ios::out | std::ios::binary);
    return Chunk{
        .index = index,
        .size = data.size(),
        .digest = coldsend::infra::Xxh64Digest::of(data),
        .body = body,
    };
}

const SnapshotPair kPair{"backup0", "backup1"};

} // namespace

TEST(ChunkUploaderTest, StoresObjectWithTierAndMetadata)
{
    MemoryObjectStore store;
    ChunkUploader uploader(store, UploadOptions{.object_prefix = "x/", .storage_class = "GLACIER",
                                                .retry = kFastRetry});

    int acks = 0;
    auto ack = uploader.put(kPair, make_chunk(3, "hello"), [&](const ChunkAck& a) {
        ++acks;
        EXPECT_EQ(a.index, 3u);
        return coldsend::infra::VoidResult{};
    });

    ASSERT_TRUE(ack.has_value()) << ack.error().message;
    EXPECT_EQ(ack->key, "x/backup0_backup1/3");
    EXPECT_EQ(acks, 1);

    const auto& stored = store.objects.at("x/backup0_backup1/3");
    EXPECT_EQ(stored.data, "hello");
    EXPECT_EQ(stored.storage_class, "GLACIER");
    EXPECT_EQ(stored.metadata.at("coldsend-chunk-index"), "3");
    EXPECT_EQ(stored.metadata.at("coldsend-base"), "backup0");
    EXPECT_EQ(stored.metadata.at("coldsend-target"), "backup1");
    EXPECT_EQ(stored.metadata.at("coldsend-xxh64"),
              coldsend::infra::digest_to_hex(coldsend::infra::Xxh64Digest::of("hello")));
}

TEST(ChunkUploaderTest, RetriesTransientFailuresWithFullBody)
{
    MemoryObjectStore store;
    store.transient_failures["backup0_backup1/0"] = 2;
    ChunkUploader uploader(store, UploadOptions{.retry = kFastRetry});

    auto ack = uploader.put(kPair, make_chunk(0, "0123456789"), nullptr);

    ASSERT_TRUE(ack.has_value()) << ack.error().message;
    EXPECT_EQ(store.attempts.size(), 3u);
    EXPECT_EQ(store.objects.at("backup0_backup1/0").data, "0123456789");
}

TEST(ChunkUploaderTest, ExhaustedRetriesDoNotAcknowledge)
{
    MemoryObjectStore store;
    store.transient_failures["backup0_backup1/0"] = 10;
    ChunkUploader uploader(store, UploadOptions{.retry = kFastRetry});

    bool acked = false;
    auto ack = uploader.put(kPair, make_chunk(0, "abc"), [&](const ChunkAck&) {
        acked = true;
        return coldsend::infra::VoidResult{};
    });

    ASSERT_FALSE(ack.has_value());
    EXPECT_EQ(ack.error().code, ErrorCode::RetriesExhausted);
    EXPECT_EQ(store.attempts.size(), 3u);
    EXPECT_FALSE(acked);
}

TEST(ChunkUploaderTest, PermanentFailureIsNotRetried)
{
    MemoryObjectStore store;
    store.permanent_failures.insert("backup0_backup1/0");
    ChunkUploader uploader(store, UploadOptions{.retry = kFastRetry});

    auto ack = uploader.put(kPair, make_chunk(0, "abc"), nullptr);

    ASSERT_FALSE(ack.has_value());
    EXPECT_EQ(ack.error().code, ErrorCode::AccessDenied);
    EXPECT_EQ(store.attempts.size(), 1u);
}

TEST(ChunkUploaderTest, AckCallbackErrorFailsThePut)
{
    MemoryObjectStore store;
    ChunkUploader uploader(store, UploadOptions{.retry = kFastRetry});

    auto ack = uploader.put(kPair, make_chunk(0, "abc"), [](const ChunkAck&) -> coldsend::infra::VoidResult {
        return std::unexpected(coldsend::infra::make_error(ErrorCode::StateWriteFailed, "disk full"));
    });

    ASSERT_FALSE(ack.has_value());
    EXPECT_EQ(ack.error().code, ErrorCode::StateWriteFailed);
    EXPECT_TRUE(store.objects.contains("backup0_backup1/0"));
}
