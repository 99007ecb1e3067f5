#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace stratus::types {

enum class ErrorKind {
    DuplicatePath,
    DriveNotFound,
    InvalidCredential,
    TransferFailed,
    ConflictDetected,
    Cancelled,
    Timeout,
    StoreUnavailable,
    PathNotFound,
    DrivePaused
};

std::string to_string(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Value-form outcome used where results travel through futures and channels.
struct OpResult {
    bool ok = true;
    std::optional<ErrorKind> error;
    std::string message;

    static OpResult success() { return {}; }
    static OpResult failure(ErrorKind kind, std::string msg) { return {false, kind, std::move(msg)}; }
    static OpResult from(const Error& e) { return failure(e.kind(), e.what()); }
};

}
