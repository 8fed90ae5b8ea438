#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace coldsend::args_parser {
    struct CLIArgs;
}

namespace coldsend::infra {

// S3 single-PUT limit; a chunk is always one object
inline constexpr std::uint64_t kMaxChunkSize = 5ULL * 1024 * 1024 * 1024;
inline constexpr std::uint64_t kDefaultChunkSize = kMaxChunkSize;
// Largest chunk buffered in memory when no temp_dir is configured
inline constexpr std::uint64_t kMaxInMemoryChunkSize = 64ULL * 1024 * 1024;

/// Settings for `run` and `verify`. Everything that identifies the backup
/// chain (dataset, bucket, naming) lives in the state file instead.
struct Config {
    // Chunking
    std::optional<std::uint64_t> chunk_size;   // bytes
    std::optional<std::string> temp_dir;
    std::optional<std::string> storage_class;

    // Object store
    std::optional<std::string> endpoint;
    std::optional<std::string> region;
    std::optional<bool> path_style;
    std::optional<int> max_attempts;
    std::optional<std::uint64_t> initial_backoff_ms;
    std::optional<std::uint64_t> max_backoff_ms;
    std::optional<std::uint64_t> request_timeout_ms;
    std::optional<std::uint64_t> connect_timeout_ms;

    // Send tool
    std::optional<std::uint64_t> stream_timeout_s;
    std::optional<std::string> zfs_binary;

    // Output
    bool progress = true;
    bool quiet = false;

    // Merge with another Config (e.g. from the CLI); `other` wins
    void merge_with(const Config& other);

    /// Range checks on the merged result
    [[nodiscard]] auto validate() const -> std::expected<void, std::string>;
    // validate() plus the settings only `run` needs
    [[nodiscard]] auto validate_run() const -> std::expected<void, std::string>;
};

/// Loads configuration from a YAML file.
/// Looks in order for:
///   1. ./.coldsend.yaml
///   2. $XDG_CONFIG_HOME/coldsend/config.yaml, else ~/.config/coldsend/config.yaml
/// Returns an empty Config if neither exists.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Parses one YAML file. Unknown keys are logged and ignored.
[[nodiscard]] auto load_config_from(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Builds a Config from CLI arguments
[[nodiscard]] auto config_from_cli(const coldsend::args_parser::CLIArgs& args) -> Config;

} // namespace coldsend::infra
