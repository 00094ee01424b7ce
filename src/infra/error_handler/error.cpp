#include "error.hpp"
#include <cstdlib>
#include <fmt/core.h>

namespace xferacct::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::InvalidPath:
        case ErrorCode::InvalidConfig:
        case ErrorCode::PermissionDenied:
            return true;
        default:
            return false;
    }
}

bool Error::is_transient() const {
    return code == ErrorCode::FileLocked ||
           code == ErrorCode::ResourceBusy;
}

int Error::to_exit_code() const {
    if (is_fatal()) return EXIT_FAILURE;
    switch (code) {
        case ErrorCode::SizeMismatch: return 22;
        case ErrorCode::Interrupted:  return 130; // SIGINT
        default:                      return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::InvalidPath:      return "invalid path";
        case ErrorCode::InvalidConfig:    return "invalid config";
        case ErrorCode::PermissionDenied: return "permission denied";
        case ErrorCode::FileNotFound:     return "file not found";
        case ErrorCode::ReadFailed:       return "read failed";
        case ErrorCode::WriteFailed:      return "write failed";
        case ErrorCode::DeleteFailed:     return "delete failed";
        case ErrorCode::SizeMismatch:     return "size mismatch";
        case ErrorCode::FileLocked:       return "file locked";
        case ErrorCode::ResourceBusy:     return "resource busy";
        case ErrorCode::Interrupted:      return "interrupted";
        case ErrorCode::Unknown:          break;
    }
    return "unknown";
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace xferacct::infra
