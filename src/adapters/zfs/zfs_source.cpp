#include "zfs_source.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "adapters/process.hpp"

namespace coldsend::adapters::zfs {

namespace {

class ZfsSendStream final : public ByteStream {
public:
    ZfsSendStream(Subprocess process, std::chrono::milliseconds timeout)
        : process_(std::move(process)), timeout_(timeout) {}

    auto read(std::span<char> buf) -> infra::Result<std::size_t> override {
        return process_.read(buf, timeout_);
    }

    auto finish() -> infra::VoidResult override {
        auto code = process_.wait();
        if (!code) {
            return std::unexpected(std::move(code.error()));
        }
        if (*code != 0) {
            return std::unexpected(infra::make_error(infra::ErrorCode::StreamFailed,
                fmt::format("'{}' exited with status {}", process_.command(), *code)));
        }
        return {};
    }

private:
    Subprocess process_;
    std::chrono::milliseconds timeout_;
};

auto trim(std::string s) -> std::string {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
        s.pop_back();
    }
    return s;
}

} // namespace

ZfsSnapshotSource::ZfsSnapshotSource(ZfsOptions options)
    : options_(std::move(options)) {}

auto ZfsSnapshotSource::qualified_(const std::string& name) const -> std::string {
    return fmt::format("{}@{}", options_.dataset, name);
}

auto ZfsSnapshotSource::snapshot_exists(const std::string& name) -> infra::Result<bool> {
    auto out = run_command({options_.zfs_binary, "list", "-H", "-t", "snapshot", "-o", "name",
                            qualified_(name)},
                           options_.command_timeout);
    if (!out) {
        return std::unexpected(std::move(out.error()));
    }
    return out->exit_code == 0;
}

auto ZfsSnapshotSource::ensure_snapshot(const std::string& name)
    -> infra::Result<SnapshotOutcome>
{
    const auto snapshot = qualified_(name);
    auto out = run_command({options_.zfs_binary, "snapshot", snapshot}, options_.command_timeout);
    if (!out) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SnapshotFailed,
            fmt::format("cannot run zfs snapshot {}: {}", snapshot, out.error().message)));
    }
    if (out->exit_code == 0) {
        return SnapshotOutcome::Created;
    }

    // Left behind by a run that died before persisting its in-flight record
    auto exists = snapshot_exists(name);
    if (exists && *exists) {
        return SnapshotOutcome::AlreadyExisted;
    }
    return std::unexpected(infra::make_error(infra::ErrorCode::SnapshotFailed,
        fmt::format("zfs snapshot {} failed with status {}: {}",
                    snapshot, out->exit_code, trim(out->output))));
}

auto ZfsSnapshotSource::send_command(const core::SnapshotPair& pair) const
    -> std::vector<std::string>
{
    std::vector<std::string> argv = {options_.zfs_binary, "send", "-w"};
    if (pair.base) {
        argv.push_back("-i");
        argv.push_back(qualified_(*pair.base));
    }
    argv.push_back(qualified_(pair.target));
    return argv;
}

auto ZfsSnapshotSource::open(const core::SnapshotPair& pair)
    -> infra::Result<std::unique_ptr<ByteStream>>
{
    auto process = Subprocess::spawn(send_command(pair));
    if (!process) {
        return std::unexpected(std::move(process.error()));
    }
    return std::make_unique<ZfsSendStream>(std::move(*process), options_.stream_timeout);
}

} // namespace coldsend::adapters::zfs
