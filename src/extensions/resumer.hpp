#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "core/state/backup_state.hpp"
#include "infra/error_handler/error.hpp"

namespace coldsend::extensions {

enum class RunAction {
    Resume,     // an in-flight pair exists: replay it, skip what is durable
    StartNew,   // take a new snapshot and start the next pair
};

struct RunPlan {
    RunAction action = RunAction::StartNew;
    core::SnapshotPair pair;
    std::uint64_t chunk_size = 0;
    std::uint64_t skip_chunks = 0;   // highest_durable_chunk + 1
    std::uint64_t skip_bytes = 0;    // what those chunks covered in the stream
};

/// Decides what one `run` does from the persisted state alone.
///
/// Resuming keeps the recorded chunk size: chunk boundaries of an in-flight
/// pair cannot move. A new pair continues from the chain head and gets its
/// target name from the configured pattern.
[[nodiscard]] auto plan_run(const core::BackupChainState& state,
                            std::uint64_t configured_chunk_size,
                            std::chrono::system_clock::time_point now)
    -> infra::Result<RunPlan>;

[[nodiscard]] auto fresh_in_flight(const RunPlan& plan) -> core::InFlightRun;

} // namespace coldsend::extensions
