#pragma once

#include "error_handler/error.hpp"
#include "interrupt.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>
#include <functional>
#include <optional>
#include <fmt/core.h>

namespace coldsend::infra {
/*

auto res = infra::with_retry([&]() {
    return store.put_object(request);
}, infra::RetryPolicy{ .max_attempts = 5 });


*/
struct RetryPolicy {
    int max_attempts = 8;
    std::chrono::milliseconds initial_delay = std::chrono::milliseconds(500);
    std::chrono::milliseconds max_delay = std::chrono::milliseconds(60'000);
    double backoff_factor = 2.0; // exponential backoff
};

[[nodiscard]] inline auto backoff_delay(const RetryPolicy& policy, int attempt)
    -> std::chrono::milliseconds
{
    const double scaled = static_cast<double>(policy.initial_delay.count()) *
                          std::pow(policy.backoff_factor, attempt);
    const double capped = std::min(scaled, static_cast<double>(policy.max_delay.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
}

// Retries transient errors only. A transient error on the last attempt becomes
// RetriesExhausted so callers never mistake it for something retryable.
template<typename F>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy = {},
                              std::string_view what = "operation")
    -> decltype(operation())
{
    const int attempts = std::max(policy.max_attempts, 1);

    for (int attempt = 0; attempt < attempts; ++attempt) {
        auto result = operation();
        if (result.has_value()) {
            return result;
        }

        auto& err = result.error();
        if (!err.is_transient()) {
            return result;
        }
        if (attempt == attempts - 1) {
            return std::unexpected(make_error(ErrorCode::RetriesExhausted,
                fmt::format("{} failed after {} attempts: {}", what, attempts, err.message)));
        }
        if (is_interrupted()) {
            return std::unexpected(make_error(ErrorCode::Interrupted,
                fmt::format("{} interrupted while retrying: {}", what, err.message)));
        }

        auto delay = backoff_delay(policy, attempt);
        spdlog::warn("{} attempt {}/{} failed ({}: {}), retrying in {} ms",
                     what, attempt + 1, attempts, to_string(err.code), err.message, delay.count());
        std::this_thread::sleep_for(delay);
    }

    return std::unexpected(make_error(ErrorCode::Unknown, "retry loop exited without a result"));
}

} // namespace coldsend::infra
