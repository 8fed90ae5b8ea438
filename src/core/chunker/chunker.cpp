#include "chunker.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "infra/hash/xxhash_digest.hpp"
#include "infra/interrupt.hpp"

namespace coldsend::core {

namespace {
constexpr std::size_t kReadBufferSize = 1024 * 1024;
}

Chunker::Chunker(adapters::ByteStream& stream, std::uint64_t chunk_size,
                 std::optional<std::filesystem::path> spool_path)
    : stream_(stream)
    , chunk_size_(chunk_size)
    , spool_path_(std::move(spool_path))
    , buffer_(static_cast<std::size_t>(std::min<std::uint64_t>(kReadBufferSize, std::max<std::uint64_t>(chunk_size, 1))))
{}

Chunker::~Chunker() {
    if (spool_path_) {
        std::error_code ec;
        std::filesystem::remove(*spool_path_, ec);
        if (ec) {
            spdlog::warn("Failed to remove spool file {}: {}", spool_path_->string(), ec.message());
        }
    }
}

auto Chunker::fill_(const Sink& sink) -> infra::Result<std::uint64_t> {
    std::uint64_t filled = 0;
    while (filled < chunk_size_ && !eof_) {
        const auto want = static_cast<std::size_t>(
            std::min<std::uint64_t>(buffer_.size(), chunk_size_ - filled));
        auto n = stream_.read(std::span<char>(buffer_.data(), want));
        if (!n) {
            return std::unexpected(std::move(n.error()));
        }
        if (*n == 0) {
            eof_ = true;
            if (auto finished = stream_.finish(); !finished) {
                return std::unexpected(std::move(finished.error()));
            }
            break;
        }
        if (!sink(buffer_.data(), *n)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                fmt::format("failed to buffer chunk {}", next_index_)));
        }
        filled += *n;
    }
    bytes_consumed_ += filled;
    return filled;
}

auto Chunker::open_body_() -> infra::Result<std::shared_ptr<std::iostream>> {
    if (!spool_path_) {
        return std::make_shared<std::stringstream>(
            std::ios::in | std::ios::out | std::ios::binary);
    }
    auto file = std::make_shared<std::fstream>(
        *spool_path_, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
    if (!*file) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("cannot open spool file {}", spool_path_->string())));
    }
    return file;
}

auto Chunker::next_chunk() -> infra::Result<std::optional<Chunk>> {
    if (eof_) {
        return std::nullopt;
    }

    auto body = open_body_();
    if (!body) {
        return std::unexpected(std::move(body.error()));
    }

    infra::Xxh64Digest digest;
    auto& out = **body;
    auto filled = fill_([&](const char* data, std::size_t len) {
        digest.update(data, len);
        out.write(data, static_cast<std::streamsize>(len));
        return static_cast<bool>(out);
    });
    if (!filled) {
        return std::unexpected(std::move(filled.error()));
    }
    if (*filled == 0) {
        return std::nullopt;
    }

    out.flush();
    out.seekg(0);
    if (!out) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("failed to rewind chunk {}", next_index_)));
    }

    Chunk chunk{
        .index = next_index_++,
        .size = *filled,
        .digest = digest.digest(),
        .body = std::move(*body),
    };
    spdlog::debug("Chunk {}: {} bytes, xxh64 {}", chunk.index, chunk.size,
                  infra::digest_to_hex(chunk.digest));
    return chunk;
}

auto Chunker::skip_chunks(std::uint64_t count) -> infra::Result<std::vector<std::uint64_t>> {
    std::vector<std::uint64_t> digests;
    digests.reserve(static_cast<std::size_t>(count));

    infra::Xxh64Digest digest;
    for (std::uint64_t i = 0; i < count; ++i) {
        if (infra::is_interrupted()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                fmt::format("interrupted while replaying chunk {} of {} already uploaded",
                            next_index_, count)));
        }
        digest.reset();
        auto filled = fill_([&](const char* data, std::size_t len) {
            digest.update(data, len);
            return true;
        });
        if (!filled) {
            return std::unexpected(std::move(filled.error()));
        }
        if (*filled == 0) {
            return std::unexpected(infra::make_error(infra::ErrorCode::StreamTruncated,
                fmt::format("send stream ended after {} chunks while skipping {} already uploaded",
                            next_index_, count)));
        }
        digests.push_back(digest.digest());
        ++next_index_;
    }
    return digests;
}

} // namespace coldsend::core
