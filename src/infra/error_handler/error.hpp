#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace coldsend::infra {

enum class ErrorCode {
    // Transient: retried with backoff by the uploader
    NetworkError,
    Throttled,
    ServerError,
    Timeout,

    // Fatal object store errors
    AccessDenied,
    BadRequest,
    RetriesExhausted,

    // External snapshot/send tool
    SnapshotFailed,
    StreamFailed,
    StreamTruncated,
    StreamMismatch,

    // State file
    StateNotFound,
    StateCorrupted,
    StateWriteFailed,
    StateExists,

    InvalidArgument,
    Interrupted,
    Unknown,
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;

    [[nodiscard]] auto is_transient() const -> bool {
        return code == ErrorCode::NetworkError ||
               code == ErrorCode::Throttled ||
               code == ErrorCode::ServerError ||
               code == ErrorCode::Timeout;
    }
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// errno-style failures from POSIX calls
[[nodiscard]] auto make_system_error(
    ErrorCode code,
    std::string_view what,
    int errnum,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Logs at error for fatal codes and warn otherwise, then hands the error back
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace coldsend::infra
