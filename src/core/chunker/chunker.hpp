#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <vector>
#include "adapters/snapshot_source.hpp"
#include "infra/error_handler/error.hpp"

namespace coldsend::core {

struct Chunk {
    std::uint64_t index = 0;
    std::uint64_t size = 0;
    std::uint64_t digest = 0;                 // XXH64 of the body
    std::shared_ptr<std::iostream> body;      // rewound to 0
};

/// Cuts a send stream into `chunk_size` pieces, the last one possibly short.
/// Bodies go to `spool_path` when given (one file, rewritten per chunk),
/// otherwise to memory.
class Chunker {
public:
    Chunker(adapters::ByteStream& stream, std::uint64_t chunk_size,
            std::optional<std::filesystem::path> spool_path = std::nullopt);
    ~Chunker();

    Chunker(const Chunker&) = delete;
    Chunker& operator=(const Chunker&) = delete;

    /// nullopt at end of stream. The producer's exit status is checked before
    /// the final chunk is returned, so a failed send never yields a short tail.
    [[nodiscard]] auto next_chunk() -> infra::Result<std::optional<Chunk>>;

    /// Discards `count` chunks, returning their digests. Ending early is
    /// StreamTruncated.
    [[nodiscard]] auto skip_chunks(std::uint64_t count) -> infra::Result<std::vector<std::uint64_t>>;

    [[nodiscard]] auto next_index() const -> std::uint64_t { return next_index_; }
    [[nodiscard]] auto bytes_consumed() const -> std::uint64_t { return bytes_consumed_; }
    [[nodiscard]] auto at_end() const -> bool { return eof_; }

private:
    using Sink = std::function<bool(const char*, std::size_t)>;

    [[nodiscard]] auto fill_(const Sink& sink) -> infra::Result<std::uint64_t>;
    [[nodiscard]] auto open_body_() -> infra::Result<std::shared_ptr<std::iostream>>;

    adapters::ByteStream& stream_;
    const std::uint64_t chunk_size_;
    std::optional<std::filesystem::path> spool_path_;
    std::vector<char> buffer_;
    std::uint64_t next_index_ = 0;
    std::uint64_t bytes_consumed_ = 0;
    bool eof_ = false;
};

} // namespace coldsend::core
