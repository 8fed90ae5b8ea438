#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include "infra/error_handler/error.hpp"
#include "core/state/backup_state.hpp"

namespace coldsend::adapters {

/// Sequential, finite byte stream from the send tool. No seeking: replaying a
/// prefix means opening the same pair again.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /// Up to `buf.size()` bytes; 0 means the producer closed its output.
    [[nodiscard]] virtual auto read(std::span<char> buf) -> infra::Result<std::size_t> = 0;

    /// Reaps the producer once read() returned 0. A non-zero exit is
    /// StreamFailed: the bytes read so far must not be taken as complete.
    [[nodiscard]] virtual auto finish() -> infra::VoidResult = 0;
};

enum class SnapshotOutcome {
    Created,
    AlreadyExisted,
};

/// The dataset's snapshot mechanism.
class SnapshotSource {
public:
    virtual ~SnapshotSource() = default;

    /// Creates `name`, or accepts it if it already exists.
    [[nodiscard]] virtual auto ensure_snapshot(const std::string& name)
        -> infra::Result<SnapshotOutcome> = 0;

    /// Starts a raw send of `pair`. Output must be byte-identical across calls
    /// for the same pair.
    [[nodiscard]] virtual auto open(const core::SnapshotPair& pair)
        -> infra::Result<std::unique_ptr<ByteStream>> = 0;
};

} // namespace coldsend::adapters
