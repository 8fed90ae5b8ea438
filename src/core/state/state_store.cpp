#include "state_store.hpp"
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <yaml-cpp/yaml.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../infra/hash/xxhash_digest.hpp"

namespace coldsend::core {

namespace {

constexpr int kStateVersion = 1;

void emit_pair(YAML::Emitter& out, const SnapshotPair& pair) {
    if (pair.base) {
        out << YAML::Key << "base" << YAML::Value << *pair.base;
    }
    out << YAML::Key << "target" << YAML::Value << pair.target;
}

auto read_pair(const YAML::Node& node) -> SnapshotPair {
    SnapshotPair pair;
    if (node["base"] && !node["base"].IsNull()) {
        pair.base = node["base"].as<std::string>();
    }
    pair.target = node["target"].as<std::string>();
    return pair;
}

auto required(const YAML::Node& node, const char* key) -> YAML::Node {
    YAML::Node child = node[key];
    if (!child) {
        throw YAML::Exception(node.Mark(), fmt::format("missing key '{}'", key));
    }
    return child;
}

// Keeps the fd closed on every exit path
struct FdGuard {
    int fd = -1;
    ~FdGuard() { if (fd >= 0) ::close(fd); }
    int release() { int f = fd; fd = -1; return f; }
};

} // namespace

auto encode_state(const BackupChainState& state) -> std::string {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << kStateVersion;

    out << YAML::Key << "config" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "dataset" << YAML::Value << state.config.dataset;
    out << YAML::Key << "bucket" << YAML::Value << state.config.bucket;
    out << YAML::Key << "snapshot_pattern" << YAML::Value << YAML::DoubleQuoted
        << state.config.snapshot_pattern;
    out << YAML::Key << "object_prefix" << YAML::Value << YAML::DoubleQuoted
        << state.config.object_prefix;
    out << YAML::EndMap;

    out << YAML::Key << "chain" << YAML::Value << YAML::BeginSeq;
    for (const auto& entry : state.chain) {
        out << YAML::BeginMap;
        emit_pair(out, entry.pair);
        out << YAML::Key << "chunk_count" << YAML::Value << entry.chunk_count;
        out << YAML::Key << "total_bytes" << YAML::Value << entry.total_bytes;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    if (state.in_flight) {
        const auto& run = *state.in_flight;
        out << YAML::Key << "in_flight" << YAML::Value << YAML::BeginMap;
        emit_pair(out, run.pair);
        out << YAML::Key << "chunk_size" << YAML::Value << run.chunk_size;
        out << YAML::Key << "highest_durable_chunk" << YAML::Value << run.highest_durable_chunk;
        out << YAML::Key << "bytes_streamed" << YAML::Value << run.bytes_streamed;
        out << YAML::Key << "chunk_digests" << YAML::Value << YAML::Flow << YAML::BeginSeq;
        for (auto digest : run.chunk_digests) {
            out << infra::digest_to_hex(digest);
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;
    }

    out << YAML::EndMap;
    std::string text = out.c_str();
    text.push_back('\n');
    return text;
}

auto decode_state(std::string_view text) -> infra::Result<BackupChainState> {
    BackupChainState state;
    try {
        YAML::Node root = YAML::Load(std::string(text));
        if (!root.IsMap()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::StateCorrupted,
                                                     "state file is not a YAML mapping"));
        }
        const auto version = required(root, "version").as<int>();
        if (version != kStateVersion) {
            return std::unexpected(infra::make_error(infra::ErrorCode::StateCorrupted,
                fmt::format("unsupported state file version {}", version)));
        }

        const YAML::Node config = required(root, "config");
        state.config.dataset = required(config, "dataset").as<std::string>();
        state.config.bucket = required(config, "bucket").as<std::string>();
        state.config.snapshot_pattern = required(config, "snapshot_pattern").as<std::string>();
        state.config.object_prefix = required(config, "object_prefix").as<std::string>();

        if (root["chain"]) {
            for (const auto& item : root["chain"]) {
                state.chain.push_back(CompletedPair{
                    .pair = read_pair(item),
                    .chunk_count = required(item, "chunk_count").as<std::uint64_t>(),
                    .total_bytes = required(item, "total_bytes").as<std::uint64_t>(),
                });
            }
        }

        if (root["in_flight"] && !root["in_flight"].IsNull()) {
            const YAML::Node node = root["in_flight"];
            InFlightRun run;
            run.pair = read_pair(node);
            run.chunk_size = required(node, "chunk_size").as<std::uint64_t>();
            run.highest_durable_chunk = required(node, "highest_durable_chunk").as<std::int64_t>();
            run.bytes_streamed = required(node, "bytes_streamed").as<std::uint64_t>();
            if (node["chunk_digests"]) {
                for (const auto& item : node["chunk_digests"]) {
                    auto digest = infra::digest_from_hex(item.as<std::string>());
                    if (!digest) {
                        return std::unexpected(infra::make_error(infra::ErrorCode::StateCorrupted,
                            fmt::format("invalid chunk digest '{}'", item.as<std::string>())));
                    }
                    run.chunk_digests.push_back(*digest);
                }
            }
            state.in_flight = std::move(run);
        }
    } catch (const YAML::Exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StateCorrupted,
                                                 fmt::format("cannot parse state: {}", e.what())));
    }

    if (auto valid = validate(state); !valid) {
        return std::unexpected(std::move(valid.error()));
    }
    return state;
}

StateStore::StateStore(std::filesystem::path path)
    : path_(std::move(path)) {}

auto StateStore::load() const -> infra::Result<std::optional<BackupChainState>> {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::StateCorrupted,
                fmt::format("cannot stat {}: {}", path_.string(), ec.message())));
        }
        return std::nullopt;
    }

    FdGuard file{::open(path_.c_str(), O_RDONLY | O_CLOEXEC)};
    if (file.fd < 0) {
        return std::unexpected(infra::make_system_error(infra::ErrorCode::StateCorrupted,
            fmt::format("cannot open {}", path_.string()), errno));
    }

    std::string text;
    char buffer[64 * 1024];
    for (;;) {
        ssize_t n = ::read(file.fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_system_error(infra::ErrorCode::StateCorrupted,
                fmt::format("cannot read {}", path_.string()), errno));
        }
        if (n == 0) break;
        text.append(buffer, static_cast<std::size_t>(n));
    }

    auto state = decode_state(text);
    if (!state) {
        auto err = std::move(state.error());
        err.message = fmt::format("{}: {}", path_.string(), err.message);
        return std::unexpected(std::move(err));
    }
    return std::optional<BackupChainState>(std::move(*state));
}

auto StateStore::create(const BackupChainState& state) const -> infra::VoidResult {
    if (auto valid = validate(state); !valid) {
        return valid;
    }
    auto tmp = write_temp_(state);
    if (!tmp) {
        return std::unexpected(std::move(tmp.error()));
    }

    // link() refuses to replace an existing file, unlike rename()
    if (::link(tmp->c_str(), path_.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp->c_str());
        if (err == EEXIST) {
            return std::unexpected(infra::make_error(infra::ErrorCode::StateExists,
                fmt::format("{} already exists; refusing to overwrite it", path_.string())));
        }
        return std::unexpected(infra::make_system_error(infra::ErrorCode::StateWriteFailed,
            fmt::format("cannot create {}", path_.string()), err));
    }
    ::unlink(tmp->c_str());
    return sync_directory_();
}

auto StateStore::commit_in_flight(BackupChainState state, const InFlightRun& run) const
    -> infra::Result<BackupChainState>
{
    state.in_flight = run;
    if (auto valid = validate(state); !valid) {
        return std::unexpected(std::move(valid.error()));
    }
    if (auto written = write_atomic_(state); !written) {
        return std::unexpected(std::move(written.error()));
    }
    spdlog::debug("Committed in-flight {}: highest durable chunk {}, {} bytes",
                  run.pair.name(), run.highest_durable_chunk, run.bytes_streamed);
    return state;
}

auto StateStore::finalize_run(BackupChainState state) const -> infra::Result<BackupChainState> {
    auto folded = fold_in_flight(std::move(state));
    if (!folded) {
        return folded;
    }
    if (auto valid = validate(*folded); !valid) {
        return std::unexpected(std::move(valid.error()));
    }
    if (auto written = write_atomic_(*folded); !written) {
        return std::unexpected(std::move(written.error()));
    }
    return folded;
}

auto StateStore::write_temp_(const BackupChainState& state) const
    -> infra::Result<std::filesystem::path>
{
    const auto text = encode_state(state);
    auto tmp = path_;
    tmp += fmt::format(".tmp.{}", ::getpid());

    FdGuard file{::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600)};
    if (file.fd < 0) {
        return std::unexpected(infra::make_system_error(infra::ErrorCode::StateWriteFailed,
            fmt::format("cannot create {}", tmp.string()), errno));
    }

    const char* ptr = text.data();
    std::size_t remaining = text.size();
    while (remaining > 0) {
        ssize_t n = ::write(file.fd, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            ::unlink(tmp.c_str());
            return std::unexpected(infra::make_system_error(infra::ErrorCode::StateWriteFailed,
                fmt::format("cannot write {}", tmp.string()), err));
        }
        ptr += n;
        remaining -= static_cast<std::size_t>(n);
    }

    if (::fsync(file.fd) != 0) {
        const int err = errno;
        ::unlink(tmp.c_str());
        return std::unexpected(infra::make_system_error(infra::ErrorCode::StateWriteFailed,
            fmt::format("cannot fsync {}", tmp.string()), err));
    }
    if (::close(file.release()) != 0) {
        const int err = errno;
        ::unlink(tmp.c_str());
        return std::unexpected(infra::make_system_error(infra::ErrorCode::StateWriteFailed,
            fmt::format("cannot close {}", tmp.string()), err));
    }
    return tmp;
}

auto StateStore::sync_directory_() const -> infra::VoidResult {
    auto dir = path_.parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    FdGuard handle{::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC)};
    if (handle.fd < 0) {
        return std::unexpected(infra::make_system_error(infra::ErrorCode::StateWriteFailed,
            fmt::format("cannot open directory {}", dir.string()), errno));
    }
    if (::fsync(handle.fd) != 0) {
        return std::unexpected(infra::make_system_error(infra::ErrorCode::StateWriteFailed,
            fmt::format("cannot fsync directory {}", dir.string()), errno));
    }
    return {};
}

auto StateStore::write_atomic_(const BackupChainState& state) const -> infra::VoidResult {
    auto tmp = write_temp_(state);
    if (!tmp) {
        return std::unexpected(std::move(tmp.error()));
    }
    if (::rename(tmp->c_str(), path_.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp->c_str());
        return std::unexpected(infra::make_system_error(infra::ErrorCode::StateWriteFailed,
            fmt::format("cannot replace {}", path_.string()), err));
    }
    return sync_directory_();
}

} // namespace coldsend::core
