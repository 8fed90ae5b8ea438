#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "../../infra/error_handler/error.hpp"

namespace coldsend::core {

/// One backup step. `base == nullopt` is a full send of `target`,
/// otherwise the incremental delta base -> target.
struct SnapshotPair {
    std::optional<std::string> base;
    std::string target;

    [[nodiscard]] auto is_full() const -> bool { return !base.has_value(); }

    /// `base_target`, or just `target` for a full send
    [[nodiscard]] auto name() const -> std::string;

    bool operator==(const SnapshotPair&) const = default;
};

struct CompletedPair {
    SnapshotPair pair;
    std::uint64_t chunk_count = 0;
    std::uint64_t total_bytes = 0;

    bool operator==(const CompletedPair&) const = default;
};

struct InFlightRun {
    SnapshotPair pair;
    std::uint64_t chunk_size = 0;
    std::int64_t highest_durable_chunk = -1;   // -1: nothing acknowledged yet
    std::uint64_t bytes_streamed = 0;
    std::vector<std::uint64_t> chunk_digests;  // XXH64 per durable chunk, by index

    [[nodiscard]] auto durable_chunks() const -> std::uint64_t {
        return static_cast<std::uint64_t>(highest_durable_chunk + 1);
    }
    [[nodiscard]] auto next_chunk_index() const -> std::uint64_t { return durable_chunks(); }

    bool operator==(const InFlightRun&) const = default;
};

/// Fixed at init, stored alongside the state so the two cannot be mismatched
struct ChainConfig {
    std::string dataset;           // zpool/dataset
    std::string bucket;
    std::string snapshot_pattern = "backup{seq}";
    std::string object_prefix;

    bool operator==(const ChainConfig&) const = default;
};

struct BackupChainState {
    ChainConfig config;
    std::vector<CompletedPair> chain;
    std::optional<InFlightRun> in_flight;

    [[nodiscard]] auto head() const -> std::optional<std::string>;

    bool operator==(const BackupChainState&) const = default;
};

/// Checks chain linearity and in-flight consistency. Failures are StateCorrupted.
[[nodiscard]] auto validate(const BackupChainState& state) -> infra::VoidResult;

/// Records chunk `index` as durable. Must be exactly the next index.
[[nodiscard]] auto advance(InFlightRun run, std::uint64_t index,
                           std::uint64_t size, std::uint64_t digest)
    -> infra::Result<InFlightRun>;

/// Moves the in-flight pair onto the chain and clears it
[[nodiscard]] auto fold_in_flight(BackupChainState state)
    -> infra::Result<BackupChainState>;

// ---- object naming ----

/// `{prefix}{pair.name()}/`
[[nodiscard]] auto pair_key_prefix(std::string_view object_prefix, const SnapshotPair& pair)
    -> std::string;

/// `{prefix}{pair.name()}/{chunk_index}`
[[nodiscard]] auto object_key(std::string_view object_prefix, const SnapshotPair& pair,
                              std::uint64_t chunk_index) -> std::string;

/// Inverse of object_key for keys under pair_key_prefix. nullopt for foreign keys.
[[nodiscard]] auto parse_chunk_index(std::string_view key_prefix, std::string_view key)
    -> std::optional<std::uint64_t>;

// ---- snapshot naming ----

[[nodiscard]] auto validate_snapshot_pattern(std::string_view pattern) -> infra::VoidResult;

[[nodiscard]] auto make_snapshot_name(std::string_view pattern, std::uint64_t seq,
                                      std::chrono::system_clock::time_point now)
    -> infra::Result<std::string>;

// ---- storage tier ----

[[nodiscard]] auto is_known_storage_class(std::string_view name) -> bool;

} // namespace coldsend::core
