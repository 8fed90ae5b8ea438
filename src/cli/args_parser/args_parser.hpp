#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <expected>
#include <optional>

namespace coldsend::args_parser {

enum class Command {
    None,     // only --version / --help
    Init,
    Run,
    Status,
    Verify,
};

struct CLIArgs
{
    Command command{Command::None};
    std::string state_file;                          // --state-file (all commands)

    // init
    std::string dataset;                             // --dataset pool/ds
    std::string bucket;                              // --bucket
    std::string object_prefix;                       // --object-prefix
    std::optional<std::string> snapshot_pattern;     // --snapshot-pattern

    // run / verify
    std::optional<std::uint64_t> chunk_size;         // --chunk-size=SIZE (64MiB, 5GB, ...)
    std::optional<std::string> temp_dir;             // --temp-dir
    std::optional<std::string> storage_class;        // --storage-class
    std::optional<std::string> endpoint;             // --endpoint
    std::optional<std::string> region;               // --region
    bool path_style{false};                          // --path-style
    std::optional<int> max_attempts;                 // --max-attempts
    std::optional<std::uint64_t> initial_backoff_ms; // --initial-backoff-ms
    std::optional<std::uint64_t> max_backoff_ms;     // --max-backoff-ms
    std::optional<std::uint64_t> request_timeout_ms; // --request-timeout-ms
    std::optional<std::uint64_t> connect_timeout_ms; // --connect-timeout-ms
    std::optional<std::uint64_t> stream_timeout_s;   // --stream-timeout
    std::optional<std::string> zfs_binary;           // --zfs-binary
    bool no_progress{false};                         // --no-progress

    // global
    bool verbose{false};                             // -v, --verbose
    bool quiet{false};                               // -q, --quiet
    bool version{false};                             // --version
};

/// Parses command-line arguments. On --help or a usage error the message is
/// already printed and the process exit code is returned instead.
[[nodiscard]] auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int>;

} // namespace coldsend::args_parser
