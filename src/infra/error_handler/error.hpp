#pragma once

#include <string>
#include <string_view>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace xferacct::infra {

enum class ErrorCode {
    // Фатальные: запуск невозможен
    InvalidPath,
    InvalidConfig,
    PermissionDenied,

    // Ошибки отдельных файлов: считаются и пропускаются
    FileNotFound,
    ReadFailed,
    WriteFailed,
    DeleteFailed,
    SizeMismatch,

    // Временные, повторяются через with_retry
    FileLocked,
    ResourceBusy,

    Interrupted,
    Unknown,
};

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
    [[nodiscard]] auto is_transient() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирует ошибку (err для фатальных, warn для остальных) и возвращает её дальше
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace xferacct::infra
