#include "backup_state.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <ctime>
#include <fmt/core.h>
#include <fmt/format.h>

namespace coldsend::core {

namespace {

constexpr std::array<std::string_view, 11> kStorageClasses = {
    "STANDARD", "REDUCED_REDUNDANCY", "STANDARD_IA", "ONEZONE_IA",
    "INTELLIGENT_TIERING", "GLACIER", "DEEP_ARCHIVE", "GLACIER_IR",
    "OUTPOSTS", "SNOW", "EXPRESS_ONEZONE",
};

auto corrupted(std::string_view msg) -> std::unexpected<infra::Error> {
    return std::unexpected(infra::make_error(infra::ErrorCode::StateCorrupted, msg));
}

// ZFS component names: alphanumerics plus _ - : .
bool is_valid_snapshot_name(std::string_view name) {
    if (name.empty() || name.size() > 255) return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '_' || c == '-' || c == ':' || c == '.';
    });
}

} // namespace

auto SnapshotPair::name() const -> std::string {
    if (base) {
        return fmt::format("{}_{}", *base, target);
    }
    return target;
}

auto BackupChainState::head() const -> std::optional<std::string> {
    if (chain.empty()) {
        return std::nullopt;
    }
    return chain.back().pair.target;
}

auto validate(const BackupChainState& state) -> infra::VoidResult {
    std::optional<std::string> head;
    for (std::size_t i = 0; i < state.chain.size(); ++i) {
        const auto& entry = state.chain[i];
        if (entry.pair.target.empty()) {
            return corrupted(fmt::format("chain entry {} has an empty target", i));
        }
        if (entry.pair.base != head) {
            return corrupted(fmt::format(
                "chain is not linear at entry {}: base '{}' does not follow '{}'",
                i, entry.pair.base.value_or("<none>"), head.value_or("<none>")));
        }
        if (entry.pair.base == entry.pair.target) {
            return corrupted(fmt::format("chain entry {} has base equal to target", i));
        }
        head = entry.pair.target;
    }

    if (!state.in_flight) {
        return {};
    }

    const auto& run = *state.in_flight;
    if (run.pair.target.empty()) {
        return corrupted("in-flight run has an empty target");
    }
    if (run.pair.base != head) {
        return corrupted(fmt::format(
            "in-flight pair {} does not continue the chain head '{}'",
            run.pair.name(), head.value_or("<none>")));
    }
    if (run.chunk_size == 0) {
        return corrupted("in-flight run has a zero chunk size");
    }
    if (run.highest_durable_chunk < -1) {
        return corrupted(fmt::format("in-flight run has invalid chunk index {}",
                                     run.highest_durable_chunk));
    }
    if (run.chunk_digests.size() != run.durable_chunks()) {
        return corrupted(fmt::format(
            "in-flight run records {} chunk digests for {} durable chunks",
            run.chunk_digests.size(), run.durable_chunks()));
    }
    // Every durable chunk but the last is full; a short one ends the stream
    if (run.durable_chunks() > 0) {
        const auto full = (run.durable_chunks() - 1) * run.chunk_size;
        if (run.bytes_streamed <= full || run.bytes_streamed > full + run.chunk_size) {
            return corrupted(fmt::format(
                "in-flight run streamed {} bytes, inconsistent with {} chunks of {} bytes",
                run.bytes_streamed, run.durable_chunks(), run.chunk_size));
        }
    } else if (run.bytes_streamed != 0) {
        return corrupted("in-flight run streamed bytes without any durable chunk");
    }
    return {};
}

auto advance(InFlightRun run, std::uint64_t index, std::uint64_t size,
             std::uint64_t digest) -> infra::Result<InFlightRun>
{
    if (index != run.next_chunk_index()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("chunk {} acknowledged out of order, expected {}",
                        index, run.next_chunk_index())));
    }
    if (size > run.chunk_size) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("chunk {} is {} bytes, larger than the chunk size {}",
                        index, size, run.chunk_size)));
    }
    run.highest_durable_chunk = static_cast<std::int64_t>(index);
    run.bytes_streamed += size;
    run.chunk_digests.push_back(digest);
    return run;
}

auto fold_in_flight(BackupChainState state) -> infra::Result<BackupChainState> {
    if (!state.in_flight) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                                                 "no in-flight run to finalize"));
    }
    if (state.in_flight->pair.base != state.head()) {
        return corrupted(fmt::format("refusing to finalize {}: chain head is '{}'",
                                     state.in_flight->pair.name(),
                                     state.head().value_or("<none>")));
    }

    state.chain.push_back(CompletedPair{
        .pair = state.in_flight->pair,
        .chunk_count = state.in_flight->durable_chunks(),
        .total_bytes = state.in_flight->bytes_streamed,
    });
    state.in_flight.reset();
    return state;
}

auto pair_key_prefix(std::string_view object_prefix, const SnapshotPair& pair) -> std::string {
    return fmt::format("{}{}/", object_prefix, pair.name());
}

auto object_key(std::string_view object_prefix, const SnapshotPair& pair,
                std::uint64_t chunk_index) -> std::string
{
    return fmt::format("{}{}/{}", object_prefix, pair.name(), chunk_index);
}

auto parse_chunk_index(std::string_view key_prefix, std::string_view key)
    -> std::optional<std::uint64_t>
{
    if (!key.starts_with(key_prefix)) {
        return std::nullopt;
    }
    auto rest = key.substr(key_prefix.size());
    if (rest.empty() || (rest.size() > 1 && rest.front() == '0')) {
        return std::nullopt;
    }
    std::uint64_t index = 0;
    auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), index);
    if (ec != std::errc{} || ptr != rest.data() + rest.size()) {
        return std::nullopt;
    }
    return index;
}

auto validate_snapshot_pattern(std::string_view pattern) -> infra::VoidResult {
    if (pattern.find("{seq}") == std::string_view::npos &&
        pattern.find("{timestamp}") == std::string_view::npos) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("snapshot pattern '{}' must contain {{seq}} or {{timestamp}}", pattern)));
    }
    auto rendered = make_snapshot_name(pattern, 0, std::chrono::system_clock::time_point{});
    if (!rendered) {
        return std::unexpected(std::move(rendered.error()));
    }
    return {};
}

auto make_snapshot_name(std::string_view pattern, std::uint64_t seq,
                        std::chrono::system_clock::time_point now)
    -> infra::Result<std::string>
{
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%dT%H%M%SZ", &tm);

    std::string name;
    try {
        name = fmt::format(fmt::runtime(pattern),
                           fmt::arg("seq", seq),
                           fmt::arg("timestamp", std::string_view(stamp)));
    } catch (const fmt::format_error& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("invalid snapshot pattern '{}': {}", pattern, e.what())));
    }

    if (!is_valid_snapshot_name(name)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("snapshot pattern '{}' produces invalid snapshot name '{}'", pattern, name)));
    }
    return name;
}

auto is_known_storage_class(std::string_view name) -> bool {
    return std::find(kStorageClasses.begin(), kStorageClasses.end(), name) != kStorageClasses.end();
}

} // namespace coldsend::core
