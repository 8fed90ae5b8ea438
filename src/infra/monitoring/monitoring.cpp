#include "monitoring.hpp"
#include <cstdio>
#include <iterator>
#include <fmt/core.h>

namespace coldsend::infra {

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , start_time_(std::chrono::steady_clock::now())
{
}

ProgressMonitor::~ProgressMonitor() {
    finish();
}

void ProgressMonitor::begin(const std::string& pair) {
    finish();
    {
        std::lock_guard lock(pair_mutex_);
        pair_ = pair;
    }
    chunks_uploaded_ = 0;
    chunks_skipped_ = 0;
    bytes_uploaded_ = 0;
    bytes_skipped_ = 0;
    start_time_ = std::chrono::steady_clock::now();
    active_ = true;
    if (enabled_) {
        start_rendering_thread_();
    }
}

void ProgressMonitor::add_skipped(std::uint64_t chunks, std::uint64_t bytes) {
    chunks_skipped_ += chunks;
    bytes_skipped_ += bytes;
}

void ProgressMonitor::add_uploaded(std::uint64_t chunks, std::uint64_t bytes) {
    chunks_uploaded_ += chunks;
    bytes_uploaded_ += bytes;
}

void ProgressMonitor::finish() {
    if (!active_.exchange(false)) {
        return;
    }
    stop_rendering_thread_();
    if (enabled_) {
        render_();
        std::fputs("\n", stderr);
    }
}

auto ProgressMonitor::get_stats() const -> Stats {
    std::lock_guard lock(pair_mutex_);
    return Stats{
        .pair = pair_,
        .chunks_uploaded = chunks_uploaded_.load(),
        .chunks_skipped = chunks_skipped_.load(),
        .bytes_uploaded = bytes_uploaded_.load(),
        .bytes_skipped = bytes_skipped_.load(),
        .start_time = start_time_,
    };
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (!st.stop_requested()) {
            render_();
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    if (render_thread_) {
        render_thread_->request_stop();
        render_thread_.reset();   // joins
    }
}

void ProgressMonitor::render_() const {
    const auto stats = get_stats();

    const auto elapsed = std::chrono::steady_clock::now() - stats.start_time;
    const double elapsed_sec = std::chrono::duration<double>(elapsed).count();
    const double rate = elapsed_sec > 0 ? stats.bytes_uploaded / elapsed_sec : 0.0;

    std::string line = fmt::format("{}: {} chunks, {} uploaded, {}/s, {}",
        stats.pair,
        stats.chunks_uploaded,
        format_bytes(stats.bytes_uploaded),
        format_bytes(static_cast<std::uint64_t>(rate)),
        format_duration(std::chrono::duration_cast<std::chrono::seconds>(elapsed)));
    if (stats.chunks_skipped > 0) {
        line += fmt::format(" ({} chunks already stored)", stats.chunks_skipped);
    }

    // ANSI: clear the line
    fmt::print(stderr, "\r\033[K{}", line);
    std::fflush(stderr);
}

auto format_bytes(std::uint64_t bytes) -> std::string {
    constexpr const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0) {
        return fmt::format("{} B", bytes);
    }
    return fmt::format("{:.1f} {}", value, units[unit]);
}

auto format_duration(std::chrono::seconds elapsed) -> std::string {
    const auto total = elapsed.count();
    const auto hours = total / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto seconds = total % 60;
    if (hours > 0) {
        return fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
    }
    return fmt::format("{:02d}:{:02d}", minutes, seconds);
}

} // namespace coldsend::infra
