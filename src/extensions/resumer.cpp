#include "resumer.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace coldsend::extensions {

auto plan_run(const core::BackupChainState& state,
              std::uint64_t configured_chunk_size,
              std::chrono::system_clock::time_point now)
    -> infra::Result<RunPlan>
{
    if (state.in_flight) {
        const auto& run = *state.in_flight;
        if (configured_chunk_size != 0 && configured_chunk_size != run.chunk_size) {
            spdlog::warn("Resuming {} with its recorded chunk size {} (configured: {})",
                         run.pair.name(), run.chunk_size, configured_chunk_size);
        }
        return RunPlan{
            .action = RunAction::Resume,
            .pair = run.pair,
            .chunk_size = run.chunk_size,
            .skip_chunks = run.durable_chunks(),
            .skip_bytes = run.bytes_streamed,
        };
    }

    if (configured_chunk_size == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                                 "chunk size must be greater than zero"));
    }

    auto target = core::make_snapshot_name(state.config.snapshot_pattern,
                                           state.chain.size(), now);
    if (!target) {
        return std::unexpected(std::move(target.error()));
    }

    const auto head = state.head();
    if (head && *head == *target) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("snapshot pattern '{}' produced '{}' again, which is already the chain head",
                        state.config.snapshot_pattern, *target)));
    }

    return RunPlan{
        .action = RunAction::StartNew,
        .pair = core::SnapshotPair{.base = head, .target = std::move(*target)},
        .chunk_size = configured_chunk_size,
        .skip_chunks = 0,
        .skip_bytes = 0,
    };
}

auto fresh_in_flight(const RunPlan& plan) -> core::InFlightRun {
    return core::InFlightRun{
        .pair = plan.pair,
        .chunk_size = plan.chunk_size,
        .highest_durable_chunk = -1,
        .bytes_streamed = 0,
        .chunk_digests = {},
    };
}

} // namespace coldsend::extensions
