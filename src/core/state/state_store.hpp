#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "backup_state.hpp"
#include "../../infra/error_handler/error.hpp"

namespace coldsend::core {

/// YAML encoding of the state file. Exposed for tests and `status`.
[[nodiscard]] auto encode_state(const BackupChainState& state) -> std::string;
[[nodiscard]] auto decode_state(std::string_view text) -> infra::Result<BackupChainState>;

/// The single state file of one dataset. Every write is write-temp, fsync,
/// rename, fsync-directory, so a reader sees either the old or the new record.
///
/// Operations take the state by value and return the state that is now on
/// disk; nothing is cached here.
class StateStore {
public:
    explicit StateStore(std::filesystem::path path);

    /// nullopt when the file does not exist. A file that does not parse or
    /// fails validation is StateCorrupted, never a fresh start.
    [[nodiscard]] auto load() const -> infra::Result<std::optional<BackupChainState>>;

    /// Writes the initial record. Fails with StateExists rather than overwrite.
    [[nodiscard]] auto create(const BackupChainState& state) const -> infra::VoidResult;

    [[nodiscard]] auto commit_in_flight(BackupChainState state, const InFlightRun& run) const
        -> infra::Result<BackupChainState>;

    [[nodiscard]] auto finalize_run(BackupChainState state) const
        -> infra::Result<BackupChainState>;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    [[nodiscard]] auto write_temp_(const BackupChainState& state) const
        -> infra::Result<std::filesystem::path>;
    [[nodiscard]] auto sync_directory_() const -> infra::VoidResult;
    [[nodiscard]] auto write_atomic_(const BackupChainState& state) const -> infra::VoidResult;

    std::filesystem::path path_;
};

} // namespace coldsend::core
