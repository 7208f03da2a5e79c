#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace funnel {

enum class ErrorCode {
    PermissionDenied,
    CaptureFailure,
    ConnectionFailure,
    EncodingFailure,
    RecordingTooShort,
    BackendUnavailable,
    FinalizeTimeout,
    DuplicateSession,
    UnknownSession,
    AlreadyFinalized,
    InvalidState,
    ProtocolError,
    ConfigError
};

/// Wire/diagnostic name of an error code, e.g. "BACKEND_UNAVAILABLE".
const char* to_string(ErrorCode code);

/// Inverse of to_string(); std::nullopt for names this build does not know.
std::optional<ErrorCode> error_code_from_string(const std::string& name);

/// HTTP status used when the error is reported by the finalize endpoint.
int http_status_for(ErrorCode code);

class FunnelError : public std::runtime_error {
public:
    FunnelError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace funnel
