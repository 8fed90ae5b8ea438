#include <fmt/core.h>

#include "adapters/s3/s3_object_store.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "cli/commands/commands.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

using GIT = coldsend::build_info::GitInfo;
using ARGS = coldsend::args_parser::CLIArgs;
using coldsend::args_parser::Command;

constexpr auto git = coldsend::build_info::get_git_info();

static auto
out_git_verse(const GIT& git)
-> void {
    fmt::print("coldsend {}\n", coldsend::build_info::project_version);
    fmt::print("Git branch: {}\n", git.branch);
    fmt::print("Git commit: {}\n", git.commit);
    fmt::print("Git dirty: {}\n", git.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", git.timestamp);
}

static auto
fail(coldsend::infra::Error err)
-> int {
    return coldsend::infra::log_and_return(std::move(err)).to_exit_code();
}

static auto
report_run(const coldsend::core::RunSummary& summary, std::chrono::milliseconds elapsed)
-> void {
    using coldsend::infra::format_bytes;
    spdlog::info("Backup of {} complete: {} chunks, {}", summary.pair.name(),
                 summary.total_chunks, format_bytes(summary.total_bytes));
    if (summary.chunks_skipped > 0) {
        spdlog::info("Resumed after {} chunks already stored", summary.chunks_skipped);
    }
    spdlog::info("Uploaded {} chunks ({}) in {:.1f} s", summary.chunks_uploaded,
                 format_bytes(summary.bytes_uploaded), elapsed.count() / 1000.0);
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        coldsend::infra::install_signal_handler();

        auto args_res = coldsend::args_parser::parse_args(argc, argv);
        if (!args_res) {
            return args_res.error(); // --help or usage error
        }
        const ARGS& args = *args_res;

        if (args.verbose) {
            spdlog::set_level(spdlog::level::debug);
        } else if (args.quiet) {
            spdlog::set_level(spdlog::level::warn);
        }

        if (args.version) {
            out_git_verse(git);
            return 0;
        }

        switch (args.command) {
            case Command::Init: {
                auto created = coldsend::cli::cmd_init(args);
                return created ? 0 : fail(created.error());
            }
            case Command::Status: {
                auto shown = coldsend::cli::cmd_status(args);
                return shown ? 0 : fail(shown.error());
            }
            case Command::Run:
            case Command::Verify:
                break;
            case Command::None:
                return 2;
        }

        // 1. From the config file
        auto config_res = coldsend::infra::load_config_from_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 2;
        }
        auto config = config_res.value();

        // 2. CLI overrides
        config.merge_with(coldsend::infra::config_from_cli(args));
        auto valid = args.command == Command::Run ? config.validate_run() : config.validate();
        if (!valid) {
            spdlog::error("Config error: {}", valid.error());
            return 2;
        }
        if (args.quiet) {
            config.quiet = true;
        }

        coldsend::adapters::s3::AwsSdkSession aws(args.verbose);

        if (args.command == Command::Verify) {
            auto report = coldsend::cli::cmd_verify(args, config);
            if (!report) {
                return fail(report.error());
            }
            if (!report->ok()) {
                spdlog::error("Object store does not match {}", args.state_file);
                return 1;
            }
            return 0;
        }

        spdlog::debug("Build {} ({})", git.commit_short, git.branch);
        auto start_time = std::chrono::steady_clock::now();
        auto summary = coldsend::cli::cmd_run(args, config);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        if (!summary) {
            return fail(summary.error());
        }
        report_run(*summary, elapsed);
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
