#pragma once

#include <chrono>
#include <string>
#include "adapters/snapshot_source.hpp"

namespace coldsend::adapters::zfs {

struct ZfsOptions {
    std::string zfs_binary = "zfs";
    std::string dataset;                                    // zpool/dataset
    std::chrono::milliseconds stream_timeout{600'000};      // no-output limit for send
    std::chrono::milliseconds command_timeout{120'000};
};

/// `zfs snapshot` and `zfs send -w` for one dataset. Raw sends keep encrypted
/// datasets encrypted, so bytes pass through unmodified.
class ZfsSnapshotSource final : public SnapshotSource {
public:
    explicit ZfsSnapshotSource(ZfsOptions options);

    [[nodiscard]] auto ensure_snapshot(const std::string& name)
        -> infra::Result<SnapshotOutcome> override;

    [[nodiscard]] auto open(const core::SnapshotPair& pair)
        -> infra::Result<std::unique_ptr<ByteStream>> override;

    [[nodiscard]] auto snapshot_exists(const std::string& name) -> infra::Result<bool>;

    [[nodiscard]] auto send_command(const core::SnapshotPair& pair) const
        -> std::vector<std::string>;

private:
    [[nodiscard]] auto qualified_(const std::string& name) const -> std::string;

    ZfsOptions options_;
};

} // namespace coldsend::adapters::zfs
