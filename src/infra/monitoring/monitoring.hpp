#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace coldsend::infra {

/// Single-line progress on stderr while a pair is being uploaded. The stream
/// length is not known up front, so there is no bar and no ETA.
class ProgressMonitor {
public:
    struct Stats {
        std::string pair;
        std::uint64_t chunks_uploaded = 0;
        std::uint64_t chunks_skipped = 0;
        std::uint64_t bytes_uploaded = 0;
        std::uint64_t bytes_skipped = 0;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    /// Resets the counters and starts rendering for `pair`
    void begin(const std::string& pair);
    void add_skipped(std::uint64_t chunks, std::uint64_t bytes);
    void add_uploaded(std::uint64_t chunks, std::uint64_t bytes);
    /// Stops rendering and leaves the final line on screen
    void finish();

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

private:
    void render_() const;
    void start_rendering_thread_();
    void stop_rendering_thread_();

    std::atomic<std::uint64_t> chunks_uploaded_{0};
    std::atomic<std::uint64_t> chunks_skipped_{0};
    std::atomic<std::uint64_t> bytes_uploaded_{0};
    std::atomic<std::uint64_t> bytes_skipped_{0};

    mutable std::mutex pair_mutex_;
    std::string pair_;

    const bool enabled_;
    std::chrono::steady_clock::time_point start_time_;
    std::atomic<bool> active_{false};
    std::unique_ptr<std::jthread> render_thread_;
};

[[nodiscard]] auto format_bytes(std::uint64_t bytes) -> std::string;
[[nodiscard]] auto format_duration(std::chrono::seconds elapsed) -> std::string;

} // namespace coldsend::infra
