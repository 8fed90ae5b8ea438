#pragma once

#include <chrono>
#include <cstddef>
#include <span>
#include <string>
#include <vector>
#include <sys/types.h>
#include "infra/error_handler/error.hpp"

namespace coldsend::adapters {

struct SpawnOptions {
    bool merge_stderr = false;   // stderr into the same pipe, else inherited
};

/// A child process whose stdout is read through a pipe. The child is killed
/// and reaped if the object goes away before wait().
class Subprocess {
public:
    [[nodiscard]] static auto spawn(const std::vector<std::string>& argv,
                                    const SpawnOptions& options = {})
        -> infra::Result<Subprocess>;

    Subprocess(Subprocess&& other) noexcept;
    Subprocess& operator=(Subprocess&& other) noexcept;
    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;
    ~Subprocess();

    /// Blocks until output arrives, EOF (returns 0) or `timeout` passes
    /// without any output (Timeout).
    [[nodiscard]] auto read(std::span<char> buf, std::chrono::milliseconds timeout)
        -> infra::Result<std::size_t>;

    /// Exit code, or 128 + signal number.
    [[nodiscard]] auto wait() -> infra::Result<int>;

    void kill();

    [[nodiscard]] auto pid() const -> pid_t { return pid_; }
    [[nodiscard]] auto command() const -> const std::string& { return command_; }

private:
    Subprocess(pid_t pid, int out_fd, std::string command);
    void close_output_();

    pid_t pid_ = -1;
    int out_fd_ = -1;
    std::string command_;
};

struct CommandOutput {
    int exit_code = -1;
    std::string output;   // stdout and stderr, interleaved
};

/// Runs a short command to completion. `timeout` bounds each wait for output.
[[nodiscard]] auto run_command(const std::vector<std::string>& argv,
                               std::chrono::milliseconds timeout)
    -> infra::Result<CommandOutput>;

} // namespace coldsend::adapters
