#include <yaml-cpp/yaml.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <array>
#include <algorithm>
#include <cstdlib>
#include <system_error>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace coldsend::infra {
    void Config::merge_with(const Config& other) {
        if (other.chunk_size) chunk_size = other.chunk_size;
        if (other.temp_dir) temp_dir = other.temp_dir;
        if (other.storage_class) storage_class = other.storage_class;
        if (other.endpoint) endpoint = other.endpoint;
        if (other.region) region = other.region;
        if (other.path_style) path_style = other.path_style;
        if (other.max_attempts) max_attempts = other.max_attempts;
        if (other.initial_backoff_ms) initial_backoff_ms = other.initial_backoff_ms;
        if (other.max_backoff_ms) max_backoff_ms = other.max_backoff_ms;
        if (other.request_timeout_ms) request_timeout_ms = other.request_timeout_ms;
        if (other.connect_timeout_ms) connect_timeout_ms = other.connect_timeout_ms;
        if (other.stream_timeout_s) stream_timeout_s = other.stream_timeout_s;
        if (other.zfs_binary) zfs_binary = other.zfs_binary;
        if (!other.progress) progress = false; // the CLI can only turn it off
        if (other.quiet) quiet = true;
    }

    auto Config::validate() const -> std::expected<void, std::string> {
        if (chunk_size && (*chunk_size == 0 || *chunk_size > kMaxChunkSize)) {
            return std::unexpected(fmt::format(
                "chunk_size must be between 1 and {} bytes, got {}", kMaxChunkSize, *chunk_size));
        }
        if (max_attempts && *max_attempts < 1) {
            return std::unexpected(fmt::format("max_attempts must be at least 1, got {}", *max_attempts));
        }
        if (initial_backoff_ms && max_backoff_ms && *initial_backoff_ms > *max_backoff_ms) {
            return std::unexpected("initial_backoff_ms is larger than max_backoff_ms");
        }
        if (stream_timeout_s && *stream_timeout_s == 0) {
            return std::unexpected("stream_timeout_s must be greater than zero");
        }
        return {};
    }

    auto Config::validate_run() const -> std::expected<void, std::string> {
        if (auto valid = validate(); !valid) {
            return valid;
        }
        const auto effective = chunk_size.value_or(kDefaultChunkSize);
        if (!temp_dir && effective > kMaxInMemoryChunkSize) {
            return std::unexpected(fmt::format(
                "chunk_size {} needs a temp_dir to spool to; without one chunks are held "
                "in memory and must be at most {} bytes", effective, kMaxInMemoryChunkSize));
        }
        return {};
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Local file
        paths.push_back(".coldsend.yaml");

        // 2. Per-user file
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "coldsend" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "coldsend" / "config.yaml");
            }
        }

        return paths;
    }

    static constexpr std::array<std::string_view, 15> kKnownKeys = {
        "chunk_size", "temp_dir", "storage_class", "endpoint", "region", "path_style",
        "max_attempts", "initial_backoff_ms", "max_backoff_ms", "request_timeout_ms",
        "connect_timeout_ms", "stream_timeout_s", "zfs_binary", "progress", "quiet",
    };

    auto load_config_from(const std::filesystem::path& path) -> std::expected<Config, std::string> {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};
            if (config.IsNull()) {
                return cfg;
            }
            if (!config.IsMap()) {
                return std::unexpected(fmt::format("{}: expected a mapping at the top level", path.string()));
            }

            for (const auto& entry : config) {
                const auto key = entry.first.as<std::string>();
                if (std::find(kKnownKeys.begin(), kKnownKeys.end(), key) == kKnownKeys.end()) {
                    spdlog::warn("{}: ignoring unknown key '{}'", path.string(), key);
                }
            }

            if (config["chunk_size"]) cfg.chunk_size = config["chunk_size"].as<std::uint64_t>();
            if (config["temp_dir"]) cfg.temp_dir = config["temp_dir"].as<std::string>();
            if (config["storage_class"]) cfg.storage_class = config["storage_class"].as<std::string>();

            if (config["endpoint"]) cfg.endpoint = config["endpoint"].as<std::string>();
            if (config["region"]) cfg.region = config["region"].as<std::string>();
            if (config["path_style"]) cfg.path_style = config["path_style"].as<bool>();
            if (config["max_attempts"]) cfg.max_attempts = config["max_attempts"].as<int>();
            if (config["initial_backoff_ms"]) cfg.initial_backoff_ms = config["initial_backoff_ms"].as<std::uint64_t>();
            if (config["max_backoff_ms"]) cfg.max_backoff_ms = config["max_backoff_ms"].as<std::uint64_t>();
            if (config["request_timeout_ms"]) cfg.request_timeout_ms = config["request_timeout_ms"].as<std::uint64_t>();
            if (config["connect_timeout_ms"]) cfg.connect_timeout_ms = config["connect_timeout_ms"].as<std::uint64_t>();

            if (config["stream_timeout_s"]) cfg.stream_timeout_s = config["stream_timeout_s"].as<std::uint64_t>();
            if (config["zfs_binary"]) cfg.zfs_binary = config["zfs_binary"].as<std::string>();

            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const YAML::Exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            return load_config_from(path);
        }

        // No file is not an error
        return Config{};
    }

    auto config_from_cli(const coldsend::args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.chunk_size = args.chunk_size;
        cfg.temp_dir = args.temp_dir;
        cfg.storage_class = args.storage_class;
        cfg.endpoint = args.endpoint;
        cfg.region = args.region;
        if (args.path_style) cfg.path_style = true;
        cfg.max_attempts = args.max_attempts;
        cfg.initial_backoff_ms = args.initial_backoff_ms;
        cfg.max_backoff_ms = args.max_backoff_ms;
        cfg.request_timeout_ms = args.request_timeout_ms;
        cfg.connect_timeout_ms = args.connect_timeout_ms;
        cfg.stream_timeout_s = args.stream_timeout_s;
        cfg.zfs_binary = args.zfs_binary;
        cfg.progress = !args.no_progress;
        cfg.quiet = args.quiet;
        return cfg;
    }

} // namespace coldsend::infra
