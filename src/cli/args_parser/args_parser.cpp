#include "args_parser.hpp"
#include <cstdio>
#include <CLI/CLI.hpp>

namespace coldsend::args_parser {

namespace {

void add_state_file(CLI::App* cmd, CLIArgs& args) {
    cmd->add_option("-f,--state-file", args.state_file, "Path of the backup state file")
        ->required();
}

void add_store_options(CLI::App* cmd, CLIArgs& args) {
    auto* group = cmd->add_option_group("Object store");
    group->add_option("--endpoint", args.endpoint, "S3 endpoint URL (for S3-compatible stores)");
    group->add_option("--region", args.region, "S3 region");
    group->add_flag("--path-style", args.path_style, "Use path-style bucket addressing");
    group->add_option("--max-attempts", args.max_attempts, "Attempts per request before giving up")
        ->check(CLI::PositiveNumber);
    group->add_option("--initial-backoff-ms", args.initial_backoff_ms, "First retry delay");
    group->add_option("--max-backoff-ms", args.max_backoff_ms, "Upper bound of the retry delay");
    group->add_option("--request-timeout-ms", args.request_timeout_ms, "Per-request timeout");
    group->add_option("--connect-timeout-ms", args.connect_timeout_ms, "Connect timeout");
}

} // namespace

auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int> {
    CLIArgs args;

    CLI::App app{"coldsend: resumable ZFS snapshot backups to S3 cold storage"};
    app.require_subcommand(0, 1);
    app.add_flag("-v,--verbose", args.verbose, "Debug logging");
    app.add_flag("-q,--quiet", args.quiet, "Warnings and errors only, no progress");
    app.add_flag("--version", args.version, "Print build information and exit");

    auto* init = app.add_subcommand("init", "Create a new state file for a dataset");
    add_state_file(init, args);
    init->add_option("--dataset", args.dataset, "ZFS dataset, e.g. tank/home")->required();
    init->add_option("--bucket", args.bucket, "Destination bucket")->required();
    init->add_option("--object-prefix", args.object_prefix, "Prefix of every object key");
    init->add_option("--snapshot-pattern", args.snapshot_pattern,
                     "Snapshot name pattern using {seq} and/or {timestamp}");
    init->callback([&] { args.command = Command::Init; });

    auto* run = app.add_subcommand("run", "Resume the in-flight backup or start the next one");
    add_state_file(run, args);
    run->add_option("--chunk-size", args.chunk_size, "Bytes per object (e.g. 64MiB, 5GB)")
        ->transform(CLI::AsSizeValue(false));
    run->add_option("--temp-dir", args.temp_dir, "Spool chunks here instead of in memory");
    run->add_option("--storage-class", args.storage_class, "S3 storage class, e.g. DEEP_ARCHIVE");
    run->add_option("--stream-timeout", args.stream_timeout_s,
                    "Seconds without output from zfs send before giving up");
    run->add_option("--zfs-binary", args.zfs_binary, "zfs executable");
    run->add_flag("--no-progress", args.no_progress, "Do not draw the progress line");
    add_store_options(run, args);
    run->callback([&] { args.command = Command::Run; });

    auto* status = app.add_subcommand("status", "Show the backup chain and in-flight progress");
    add_state_file(status, args);
    status->callback([&] { args.command = Command::Status; });

    auto* verify = app.add_subcommand("verify", "Check stored objects against the state file");
    add_state_file(verify, args);
    add_store_options(verify, args);
    verify->callback([&] { args.command = Command::Verify; });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return std::unexpected(app.exit(e));
    }

    if (args.command == Command::None && !args.version) {
        std::fputs(app.help().c_str(), stderr);
        return std::unexpected(2);
    }
    return args;
}

} // namespace coldsend::args_parser
