#include "error.hpp"
#include <fmt/core.h>
#include <cstdlib>
#include <cstring>

namespace coldsend::infra {

auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::NetworkError:     return "network error";
        case ErrorCode::Throttled:        return "throttled";
        case ErrorCode::ServerError:      return "server error";
        case ErrorCode::Timeout:          return "timeout";
        case ErrorCode::AccessDenied:     return "access denied";
        case ErrorCode::BadRequest:       return "bad request";
        case ErrorCode::RetriesExhausted: return "retries exhausted";
        case ErrorCode::SnapshotFailed:   return "snapshot failed";
        case ErrorCode::StreamFailed:     return "send stream failed";
        case ErrorCode::StreamTruncated:  return "send stream truncated";
        case ErrorCode::StreamMismatch:   return "send stream mismatch";
        case ErrorCode::StateNotFound:    return "state file not found";
        case ErrorCode::StateCorrupted:   return "state file corrupted";
        case ErrorCode::StateWriteFailed: return "state write failed";
        case ErrorCode::StateExists:      return "state file exists";
        case ErrorCode::InvalidArgument:  return "invalid argument";
        case ErrorCode::Interrupted:      return "interrupted";
        case ErrorCode::Unknown:          return "unknown error";
    }
    return "unknown error";
}

bool Error::is_fatal() const {
    return !is_transient() && code != ErrorCode::Interrupted;
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::NetworkError:
        case ErrorCode::Throttled:
        case ErrorCode::ServerError:
        case ErrorCode::Timeout:
        case ErrorCode::RetriesExhausted: return 10;
        case ErrorCode::AccessDenied:
        case ErrorCode::BadRequest:       return 11;
        case ErrorCode::SnapshotFailed:
        case ErrorCode::StreamFailed:
        case ErrorCode::StreamTruncated:  return 20;
        case ErrorCode::StreamMismatch:   return 21;
        case ErrorCode::StateNotFound:
        case ErrorCode::StateExists:      return 30;
        case ErrorCode::StateCorrupted:   return 31;
        case ErrorCode::StateWriteFailed: return 32;
        case ErrorCode::InvalidArgument:  return 2;
        case ErrorCode::Interrupted:      return 130; // SIGINT
        case ErrorCode::Unknown:          return EXIT_FAILURE;
    }
    return EXIT_FAILURE;
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error make_system_error(ErrorCode code, std::string_view what, int errnum,
                        const std::source_location& loc) {
    return Error{code, fmt::format("{}: {}", what, std::strerror(errnum)), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level, "{}: {}", to_string(err.code), err.message);
    spdlog::debug("  at {}:{} ({})", err.file, err.line, err.function);
    return std::move(err);
}

} // namespace coldsend::infra
