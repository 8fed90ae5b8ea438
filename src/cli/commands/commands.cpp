#include "commands.hpp"
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "adapters/s3/s3_object_store.hpp"
#include "adapters/zfs/zfs_source.hpp"
#include "core/state/state_store.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace coldsend::cli {

namespace {

auto load_existing(const core::StateStore& store) -> infra::Result<core::BackupChainState> {
    auto loaded = store.load();
    if (!loaded) {
        return std::unexpected(std::move(loaded.error()));
    }
    if (!*loaded) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StateNotFound,
            fmt::format("no state file at {}; run 'coldsend init' first", store.path().string())));
    }
    return std::move(**loaded);
}

auto s3_options(const core::ChainConfig& chain, const infra::Config& config)
    -> adapters::s3::S3Options
{
    adapters::s3::S3Options options{
        .bucket = chain.bucket,
        .region = config.region,
        .endpoint = config.endpoint,
        .path_style = config.path_style.value_or(false),
    };
    if (config.request_timeout_ms) {
        options.request_timeout = std::chrono::milliseconds(*config.request_timeout_ms);
    }
    if (config.connect_timeout_ms) {
        options.connect_timeout = std::chrono::milliseconds(*config.connect_timeout_ms);
    }
    return options;
}

auto retry_policy(const infra::Config& config) -> infra::RetryPolicy {
    infra::RetryPolicy policy{};
    if (config.max_attempts) policy.max_attempts = *config.max_attempts;
    if (config.initial_backoff_ms) policy.initial_delay = std::chrono::milliseconds(*config.initial_backoff_ms);
    if (config.max_backoff_ms) policy.max_delay = std::chrono::milliseconds(*config.max_backoff_ms);
    return policy;
}

} // namespace

auto initial_state(const args_parser::CLIArgs& args) -> infra::Result<core::BackupChainState> {
    if (args.dataset.empty() || args.dataset.find('@') != std::string::npos) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("'{}' is not a dataset name", args.dataset)));
    }
    if (args.bucket.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                                 "bucket must not be empty"));
    }

    core::BackupChainState state;
    state.config.dataset = args.dataset;
    state.config.bucket = args.bucket;
    state.config.object_prefix = args.object_prefix;
    if (args.snapshot_pattern) {
        state.config.snapshot_pattern = *args.snapshot_pattern;
    }
    if (auto valid = core::validate_snapshot_pattern(state.config.snapshot_pattern); !valid) {
        return std::unexpected(std::move(valid.error()));
    }
    return state;
}

auto run_options(const infra::Config& config) -> core::RunOptions {
    core::RunOptions options;
    options.chunk_size = config.chunk_size.value_or(infra::kDefaultChunkSize);
    if (config.temp_dir) {
        options.temp_dir = std::filesystem::path(*config.temp_dir);
    }
    if (config.storage_class) {
        options.storage_class = *config.storage_class;
    }
    options.retry = retry_policy(config);
    return options;
}

auto format_status(const core::BackupChainState& state) -> std::string {
    std::string out;
    out += fmt::format("Dataset:        {}\n", state.config.dataset);
    out += fmt::format("Bucket:         {}\n", state.config.bucket);
    out += fmt::format("Object prefix:  {}\n", state.config.object_prefix.empty() ? "(none)" : state.config.object_prefix);
    out += fmt::format("Snapshot names: {}\n", state.config.snapshot_pattern);

    if (state.chain.empty()) {
        out += "Chain:          empty\n";
    } else {
        out += fmt::format("Chain:          {} pairs\n", state.chain.size());
        std::uint64_t cumulative = 0;
        for (const auto& entry : state.chain) {
            cumulative += entry.total_bytes;
            out += fmt::format("  {:<40} {:>6} chunks {:>12} (total {})\n",
                               entry.pair.name(), entry.chunk_count,
                               infra::format_bytes(entry.total_bytes),
                               infra::format_bytes(cumulative));
        }
    }

    if (state.in_flight) {
        const auto& run = *state.in_flight;
        out += fmt::format("In flight:      {} ({})\n", run.pair.name(),
                           run.pair.is_full() ? "full" : "incremental");
        out += fmt::format("  chunk size {}, {} chunks stored, {} streamed\n",
                           infra::format_bytes(run.chunk_size), run.durable_chunks(),
                           infra::format_bytes(run.bytes_streamed));
    } else {
        out += "In flight:      none\n";
    }
    return out;
}

auto format_audit(const extensions::AuditReport& report) -> std::string {
    std::string out;
    for (const auto& pair : report.pairs) {
        out += fmt::format("{} {}{}: {} chunks expected\n",
                           pair.ok() ? "OK  " : "FAIL", pair.pair.name(),
                           pair.in_flight ? " (in flight)" : "", pair.expected_chunks);
        if (!pair.missing.empty()) {
            out += fmt::format("     missing chunks: {}\n", fmt::join(pair.missing, ", "));
        }
        if (!pair.unexpected.empty()) {
            out += fmt::format("     unexpected chunks: {}\n", fmt::join(pair.unexpected, ", "));
        }
        if (pair.missing.empty() && pair.stored_bytes != pair.expected_bytes) {
            out += fmt::format("     stored {} bytes, state records {}\n",
                               pair.stored_bytes, pair.expected_bytes);
        }
        for (const auto& key : pair.foreign_keys) {
            out += fmt::format("     not a chunk object: {}\n", key);
        }
        if (pair.uncommitted) {
            out += fmt::format("     chunk {} acknowledged but not committed; the next run re-uploads it\n",
                               *pair.uncommitted);
        }
    }
    if (report.pairs.empty()) {
        out += "Nothing stored yet\n";
    }
    return out;
}

auto cmd_init(const args_parser::CLIArgs& args) -> infra::VoidResult {
    auto state = initial_state(args);
    if (!state) {
        return std::unexpected(std::move(state.error()));
    }
    core::StateStore store(args.state_file);
    if (auto created = store.create(*state); !created) {
        return created;
    }
    spdlog::info("Created {} for {} -> s3://{}/{}", args.state_file, state->config.dataset,
                 state->config.bucket, state->config.object_prefix);
    return {};
}

auto cmd_run(const args_parser::CLIArgs& args, const infra::Config& config)
    -> infra::Result<core::RunSummary>
{
    core::StateStore store(args.state_file);
    auto state = load_existing(store);
    if (!state) {
        return std::unexpected(std::move(state.error()));
    }

    adapters::zfs::ZfsOptions zfs_options{.dataset = state->config.dataset};
    if (config.zfs_binary) zfs_options.zfs_binary = *config.zfs_binary;
    if (config.stream_timeout_s) {
        zfs_options.stream_timeout = std::chrono::seconds(*config.stream_timeout_s);
    }
    adapters::zfs::ZfsSnapshotSource source(std::move(zfs_options));
    adapters::s3::S3ObjectStore objects(s3_options(state->config, config));

    infra::ProgressMonitor monitor(config.progress, config.quiet);
    core::BackupEngine engine(run_options(config), store, source, objects, &monitor);
    return engine.run();
}

auto cmd_status(const args_parser::CLIArgs& args) -> infra::VoidResult {
    core::StateStore store(args.state_file);
    auto state = load_existing(store);
    if (!state) {
        return std::unexpected(std::move(state.error()));
    }
    fmt::print("{}", format_status(*state));
    return {};
}

auto cmd_verify(const args_parser::CLIArgs& args, const infra::Config& config)
    -> infra::Result<extensions::AuditReport>
{
    core::StateStore store(args.state_file);
    auto state = load_existing(store);
    if (!state) {
        return std::unexpected(std::move(state.error()));
    }

    adapters::s3::S3ObjectStore objects(s3_options(state->config, config));
    auto report = extensions::verify_chain(*state, objects, retry_policy(config));
    if (!report) {
        return report;
    }
    fmt::print("{}", format_audit(*report));
    return report;
}

} // namespace coldsend::cli
