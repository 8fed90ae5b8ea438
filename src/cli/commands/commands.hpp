#pragma once

#include <string>
#include "cli/args_parser/args_parser.hpp"
#include "core/backup_engine/backup_engine.hpp"
#include "core/state/backup_state.hpp"
#include "extensions/verifier.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"

namespace coldsend::cli {

/// The state written by `init`: configuration only, empty chain
[[nodiscard]] auto initial_state(const args_parser::CLIArgs& args)
    -> infra::Result<core::BackupChainState>;

/// Merged configuration with defaults applied
[[nodiscard]] auto run_options(const infra::Config& config) -> core::RunOptions;

[[nodiscard]] auto format_status(const core::BackupChainState& state) -> std::string;
[[nodiscard]] auto format_audit(const extensions::AuditReport& report) -> std::string;

[[nodiscard]] auto cmd_init(const args_parser::CLIArgs& args) -> infra::VoidResult;

[[nodiscard]] auto cmd_run(const args_parser::CLIArgs& args, const infra::Config& config)
    -> infra::Result<core::RunSummary>;

[[nodiscard]] auto cmd_status(const args_parser::CLIArgs& args) -> infra::VoidResult;

/// Prints the audit; the report tells whether the store is consistent
[[nodiscard]] auto cmd_verify(const args_parser::CLIArgs& args, const infra::Config& config)
    -> infra::Result<extensions::AuditReport>;

} // namespace coldsend::cli
