#include "process.hpp"
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

extern char** environ;

namespace coldsend::adapters {

namespace {

void close_safe(int* fd) {
    if (*fd >= 0) {
        ::close(*fd);
    }
    *fd = -1;
}

} // namespace

auto Subprocess::spawn(const std::vector<std::string>& argv, const SpawnOptions& options)
    -> infra::Result<Subprocess>
{
    if (argv.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                                 "empty command line"));
    }
    const std::string command = fmt::format("{}", fmt::join(argv, " "));

    int out_pfd[2] = {-1, -1};
    if (::pipe2(out_pfd, O_CLOEXEC) < 0) {
        return std::unexpected(infra::make_system_error(infra::ErrorCode::StreamFailed,
                                                        "failed to create pipe", errno));
    }

    posix_spawn_file_actions_t file_actions;
    if (int err = posix_spawn_file_actions_init(&file_actions)) {
        close_safe(&out_pfd[0]);
        close_safe(&out_pfd[1]);
        return std::unexpected(infra::make_system_error(infra::ErrorCode::StreamFailed,
            "failed to set up process descriptors", err));
    }

    int err = posix_spawn_file_actions_adddup2(&file_actions, out_pfd[1], STDOUT_FILENO);
    if (!err && options.merge_stderr) {
        err = posix_spawn_file_actions_adddup2(&file_actions, out_pfd[1], STDERR_FILENO);
    }

    pid_t pid = -1;
    if (!err) {
        std::vector<char*> cargv;
        cargv.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            cargv.push_back(const_cast<char*>(arg.c_str()));
        }
        cargv.push_back(nullptr);
        err = posix_spawnp(&pid, cargv[0], &file_actions, nullptr, cargv.data(), environ);
    }
    posix_spawn_file_actions_destroy(&file_actions);
    close_safe(&out_pfd[1]);

    if (err) {
        close_safe(&out_pfd[0]);
        return std::unexpected(infra::make_system_error(infra::ErrorCode::StreamFailed,
            fmt::format("failed to start '{}'", command), err));
    }

    spdlog::debug("Started '{}' (pid {})", command, pid);
    return Subprocess(pid, out_pfd[0], command);
}

Subprocess::Subprocess(pid_t pid, int out_fd, std::string command)
    : pid_(pid), out_fd_(out_fd), command_(std::move(command)) {}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : pid_(other.pid_), out_fd_(other.out_fd_), command_(std::move(other.command_))
{
    other.pid_ = -1;
    other.out_fd_ = -1;
}

Subprocess& Subprocess::operator=(Subprocess&& other) noexcept {
    if (this != &other) {
        kill();
        pid_ = other.pid_;
        out_fd_ = other.out_fd_;
        command_ = std::move(other.command_);
        other.pid_ = -1;
        other.out_fd_ = -1;
    }
    return *this;
}

Subprocess::~Subprocess() {
    kill();
}

void Subprocess::close_output_() {
    close_safe(&out_fd_);
}

void Subprocess::kill() {
    close_output_();
    if (pid_ > 0) {
        ::kill(pid_, SIGTERM);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
        spdlog::debug("Terminated '{}' (pid {})", command_, pid_);
        pid_ = -1;
    }
}

auto Subprocess::read(std::span<char> buf, std::chrono::milliseconds timeout)
    -> infra::Result<std::size_t>
{
    if (out_fd_ < 0) {
        return 0;
    }

    for (;;) {
        struct pollfd pfd = {out_fd_, POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_system_error(infra::ErrorCode::StreamFailed,
                fmt::format("failed to poll output of '{}'", command_), errno));
        }
        if (ready == 0) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Timeout,
                fmt::format("'{}' produced no output for {} ms", command_, timeout.count())));
        }

        ssize_t n = ::read(out_fd_, buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return std::unexpected(infra::make_system_error(infra::ErrorCode::StreamFailed,
                fmt::format("failed to read output of '{}'", command_), errno));
        }
        if (n == 0) {
            close_output_();
        }
        return static_cast<std::size_t>(n);
    }
}

auto Subprocess::wait() -> infra::Result<int> {
    close_output_();
    if (pid_ <= 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("'{}' was already reaped", command_)));
    }

    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::unexpected(infra::make_system_error(infra::ErrorCode::StreamFailed,
                fmt::format("failed to wait for '{}'", command_), errno));
        }
    }
    pid_ = -1;

    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    } else if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

auto run_command(const std::vector<std::string>& argv, std::chrono::milliseconds timeout)
    -> infra::Result<CommandOutput>
{
    auto process = Subprocess::spawn(argv, SpawnOptions{.merge_stderr = true});
    if (!process) {
        return std::unexpected(std::move(process.error()));
    }

    CommandOutput result;
    char buffer[4096];
    for (;;) {
        auto n = process->read(buffer, timeout);
        if (!n) {
            return std::unexpected(std::move(n.error()));
        }
        if (*n == 0) break;
        result.output.append(buffer, *n);
    }

    auto code = process->wait();
    if (!code) {
        return std::unexpected(std::move(code.error()));
    }
    result.exit_code = *code;
    return result;
}

} // namespace coldsend::adapters
