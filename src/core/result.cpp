#include "cloudsync/core/result.hpp"

namespace cloudsync {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::AlreadyExists: return "already_exists";
        case ErrorCode::Precondition: return "precondition";
        case ErrorCode::Unreachable: return "unreachable";
        case ErrorCode::SpawnFailed: return "spawn_failed";
        case ErrorCode::ProcessFailed: return "process_failed";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::Io: return "io";
        case ErrorCode::Parse: return "parse";
    }
    return "unknown";
}

} // namespace cloudsync
