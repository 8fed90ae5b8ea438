#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "adapters/object_store.hpp"
#include "adapters/snapshot_source.hpp"
#include "core/state/backup_state.hpp"
#include "core/state/state_store.hpp"
#include "extensions/resumer.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "infra/retry.hpp"

namespace coldsend::core {

struct RunOptions {
    std::uint64_t chunk_size = 5ULL * 1000 * 1000 * 1000;
    std::optional<std::filesystem::path> temp_dir;   // spool directory; memory when empty
    std::string storage_class = "DEEP_ARCHIVE";
    infra::RetryPolicy retry{};
    std::function<std::chrono::system_clock::time_point()> clock = [] {
        return std::chrono::system_clock::now();
    };
};

struct RunSummary {
    extensions::RunAction action = extensions::RunAction::StartNew;
    SnapshotPair pair;
    bool snapshot_reused = false;        // the target already existed
    std::uint64_t chunks_skipped = 0;    // durable before this run
    std::uint64_t chunks_uploaded = 0;
    std::uint64_t bytes_uploaded = 0;
    std::uint64_t total_chunks = 0;
    std::uint64_t total_bytes = 0;
};

/// One backup step: resume the in-flight pair, or snapshot and start a new
/// one, then stream, chunk, upload and commit until the pair is finalized.
///
/// Every state transition reaches the state file before the next step that
/// depends on it: the InFlightRun before the first byte is streamed, each
/// chunk's progress after its object is acknowledged and before the next
/// chunk is read. Any error leaves the last committed InFlightRun in place.
class BackupEngine {
public:
    BackupEngine(RunOptions options,
                 const StateStore& store,
                 adapters::SnapshotSource& source,
                 adapters::ObjectStore& objects,
                 infra::ProgressMonitor* monitor = nullptr);

    [[nodiscard]] auto run() -> infra::Result<RunSummary>;

private:
    [[nodiscard]] auto start_new_(BackupChainState state, const extensions::RunPlan& plan,
                                  RunSummary& summary) -> infra::Result<BackupChainState>;
    [[nodiscard]] auto stream_pair_(BackupChainState state, const extensions::RunPlan& plan,
                                    RunSummary& summary) -> infra::Result<BackupChainState>;
    [[nodiscard]] auto spool_path_(const SnapshotPair& pair) const
        -> infra::Result<std::optional<std::filesystem::path>>;

    RunOptions options_;
    const StateStore& store_;
    adapters::SnapshotSource& source_;
    adapters::ObjectStore& objects_;
    infra::ProgressMonitor* monitor_;
};

} // namespace coldsend::core
