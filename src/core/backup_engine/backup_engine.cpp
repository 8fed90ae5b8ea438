#include "backup_engine.hpp"
#include <cerrno>
#include <cstdlib>
#include <unistd.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "core/chunker/chunker.hpp"
#include "core/uploader/chunk_uploader.hpp"
#include "infra/config/config.hpp"
#include "infra/hash/xxhash_digest.hpp"
#include "infra/interrupt.hpp"

namespace coldsend::core {

BackupEngine::BackupEngine(RunOptions options,
                           const StateStore& store,
                           adapters::SnapshotSource& source,
                           adapters::ObjectStore& objects,
                           infra::ProgressMonitor* monitor)
    : options_(std::move(options))
    , store_(store)
    , source_(source)
    , objects_(objects)
    , monitor_(monitor)
{}

auto BackupEngine::run() -> infra::Result<RunSummary> {
    auto loaded = store_.load();
    if (!loaded) {
        return std::unexpected(std::move(loaded.error()));
    }
    if (!*loaded) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StateNotFound,
            fmt::format("no state file at {}; run 'coldsend init' first", store_.path().string())));
    }
    auto state = std::move(**loaded);

    if (!is_known_storage_class(options_.storage_class)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("unknown storage class '{}'", options_.storage_class)));
    }

    auto plan = extensions::plan_run(state, options_.chunk_size, options_.clock());
    if (!plan) {
        return std::unexpected(std::move(plan.error()));
    }

    // A resumed run keeps its recorded chunk size, so check the plan, not the options
    if (!options_.temp_dir && plan->chunk_size > infra::kMaxInMemoryChunkSize) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("chunk size {} for {} needs a temp dir; at most {} bytes are buffered in memory",
                        plan->chunk_size, plan->pair.name(), infra::kMaxInMemoryChunkSize)));
    }

    RunSummary summary{.action = plan->action, .pair = plan->pair};

    if (plan->action == extensions::RunAction::Resume) {
        spdlog::info("Resuming {} at chunk {} ({} bytes already stored)",
                     plan->pair.name(), plan->skip_chunks, plan->skip_bytes);
    } else {
        auto started = start_new_(std::move(state), *plan, summary);
        if (!started) {
            return std::unexpected(std::move(started.error()));
        }
        state = std::move(*started);
    }

    auto finished = stream_pair_(std::move(state), *plan, summary);
    if (monitor_) {
        monitor_->finish();
    }
    if (!finished) {
        return std::unexpected(std::move(finished.error()));
    }

    const auto& completed = finished->chain.back();
    summary.total_chunks = completed.chunk_count;
    summary.total_bytes = completed.total_bytes;
    spdlog::info("Finalized {}: {} chunks, {} bytes", completed.pair.name(),
                 completed.chunk_count, completed.total_bytes);
    return summary;
}

auto BackupEngine::start_new_(BackupChainState state, const extensions::RunPlan& plan,
                              RunSummary& summary) -> infra::Result<BackupChainState>
{
    auto outcome = source_.ensure_snapshot(plan.pair.target);
    if (!outcome) {
        return std::unexpected(std::move(outcome.error()));
    }
    if (*outcome == adapters::SnapshotOutcome::AlreadyExisted) {
        summary.snapshot_reused = true;
        spdlog::warn("Snapshot {}@{} already exists; reusing it as the next target",
                     state.config.dataset, plan.pair.target);
    } else {
        spdlog::info("Took snapshot {}@{}", state.config.dataset, plan.pair.target);
    }

    auto committed = store_.commit_in_flight(std::move(state), extensions::fresh_in_flight(plan));
    if (!committed) {
        return std::unexpected(std::move(committed.error()));
    }
    spdlog::info("Started {} ({} send, chunk size {})", plan.pair.name(),
                 plan.pair.is_full() ? "full" : "incremental", plan.chunk_size);
    return committed;
}

auto BackupEngine::spool_path_(const SnapshotPair& pair) const
    -> infra::Result<std::optional<std::filesystem::path>>
{
    if (!options_.temp_dir) {
        return std::nullopt;
    }
    std::error_code ec;
    std::filesystem::create_directories(*options_.temp_dir, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("cannot create temp dir {}: {}", options_.temp_dir->string(), ec.message())));
    }
    // Unique per run; other runs may share temp_dir
    auto path = (*options_.temp_dir / fmt::format("coldsend-{}.XXXXXX", pair.name())).string();
    const int fd = ::mkstemp(path.data());
    if (fd < 0) {
        return std::unexpected(infra::make_system_error(infra::ErrorCode::InvalidArgument,
            fmt::format("cannot create spool file in {}", options_.temp_dir->string()), errno));
    }
    if (::close(fd) != 0) {
        const int err = errno;
        std::filesystem::remove(path, ec);
        return std::unexpected(infra::make_system_error(infra::ErrorCode::Unknown,
            fmt::format("cannot close spool file {}", path), err));
    }
    return std::filesystem::path(path);
}

auto BackupEngine::stream_pair_(BackupChainState state, const extensions::RunPlan& plan,
                                RunSummary& summary) -> infra::Result<BackupChainState>
{
    auto stream = source_.open(plan.pair);
    if (!stream) {
        return std::unexpected(std::move(stream.error()));
    }

    // The Chunker owns the spool file from here on and removes it
    auto spool = spool_path_(plan.pair);
    if (!spool) {
        return std::unexpected(std::move(spool.error()));
    }

    if (monitor_) {
        monitor_->begin(plan.pair.name());
    }

    Chunker chunker(**stream, plan.chunk_size, std::move(*spool));

    // Replay the already stored prefix and make sure it is the same stream
    if (plan.skip_chunks > 0) {
        auto skipped = chunker.skip_chunks(plan.skip_chunks);
        if (!skipped) {
            return std::unexpected(std::move(skipped.error()));
        }
        const auto& recorded = state.in_flight->chunk_digests;
        for (std::size_t i = 0; i < skipped->size(); ++i) {
            if ((*skipped)[i] != recorded[i]) {
                return std::unexpected(infra::make_error(infra::ErrorCode::StreamMismatch,
                    fmt::format("replayed chunk {} of {} hashes to {}, but {} was uploaded; "
                                "the send stream is not deterministic",
                                i, plan.pair.name(), infra::digest_to_hex((*skipped)[i]),
                                infra::digest_to_hex(recorded[i]))));
            }
        }
        if (chunker.bytes_consumed() != plan.skip_bytes) {
            return std::unexpected(infra::make_error(infra::ErrorCode::StreamMismatch,
                fmt::format("replayed {} bytes of {}, but {} were recorded",
                            chunker.bytes_consumed(), plan.pair.name(), plan.skip_bytes)));
        }
        summary.chunks_skipped = plan.skip_chunks;
        if (monitor_) {
            monitor_->add_skipped(plan.skip_chunks, plan.skip_bytes);
        }
        spdlog::debug("Skipped {} chunks of {}", plan.skip_chunks, plan.pair.name());
    }

    ChunkUploader uploader(objects_, UploadOptions{
        .object_prefix = state.config.object_prefix,
        .storage_class = options_.storage_class,
        .retry = options_.retry,
    });

    for (;;) {
        if (infra::is_interrupted()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                fmt::format("interrupted before chunk {} of {}; run again to resume",
                            chunker.next_index(), plan.pair.name())));
        }

        auto chunk = chunker.next_chunk();
        if (!chunk) {
            return std::unexpected(std::move(chunk.error()));
        }
        if (!*chunk) {
            break;
        }

        // Commit only after the object is acknowledged, before the next read
        auto acked = uploader.put(plan.pair, **chunk, [&](const ChunkAck& ack) -> infra::VoidResult {
            auto advanced = advance(*state.in_flight, ack.index, ack.size, ack.digest);
            if (!advanced) {
                return std::unexpected(std::move(advanced.error()));
            }
            auto committed = store_.commit_in_flight(std::move(state), *advanced);
            if (!committed) {
                return std::unexpected(std::move(committed.error()));
            }
            state = std::move(*committed);
            return {};
        });
        if (!acked) {
            return std::unexpected(std::move(acked.error()));
        }

        ++summary.chunks_uploaded;
        summary.bytes_uploaded += acked->size;
        if (monitor_) {
            monitor_->add_uploaded(1, acked->size);
        }
    }

    return store_.finalize_run(std::move(state));
}

} // namespace coldsend::core
