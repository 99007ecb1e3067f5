#include "types/Error.hpp"

namespace stratus::types {

std::string to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DuplicatePath: return "duplicate_path";
        case ErrorKind::DriveNotFound: return "drive_not_found";
        case ErrorKind::InvalidCredential: return "invalid_credential";
        case ErrorKind::TransferFailed: return "transfer_failed";
        case ErrorKind::ConflictDetected: return "conflict_detected";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::StoreUnavailable: return "store_unavailable";
        case ErrorKind::PathNotFound: return "path_not_found";
        case ErrorKind::DrivePaused: return "drive_paused";
    }
    return "unknown";
}

Error::Error(const ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

}
