#include "common/errors.hpp"

namespace funnel {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::PermissionDenied:   return "PERMISSION_DENIED";
        case ErrorCode::CaptureFailure:     return "CAPTURE_FAILURE";
        case ErrorCode::ConnectionFailure:  return "CONNECTION_FAILURE";
        case ErrorCode::EncodingFailure:    return "ENCODING_FAILURE";
        case ErrorCode::RecordingTooShort:  return "RECORDING_TOO_SHORT";
        case ErrorCode::BackendUnavailable: return "BACKEND_UNAVAILABLE";
        case ErrorCode::FinalizeTimeout:    return "FINALIZE_TIMEOUT";
        case ErrorCode::DuplicateSession:   return "DUPLICATE_SESSION";
        case ErrorCode::UnknownSession:     return "UNKNOWN_SESSION";
        case ErrorCode::AlreadyFinalized:   return "ALREADY_FINALIZED";
        case ErrorCode::InvalidState:       return "INVALID_STATE";
        case ErrorCode::ProtocolError:      return "PROTOCOL_ERROR";
        case ErrorCode::ConfigError:        return "CONFIG_ERROR";
    }
    return "UNKNOWN";
}

std::optional<ErrorCode> error_code_from_string(const std::string& name) {
    for (int i = 0; i <= static_cast<int>(ErrorCode::ConfigError); ++i) {
        auto code = static_cast<ErrorCode>(i);
        if (name == to_string(code)) return code;
    }
    return std::nullopt;
}

int http_status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::UnknownSession:
            return 404;
        case ErrorCode::InvalidState:
        case ErrorCode::AlreadyFinalized:
        case ErrorCode::DuplicateSession:
            return 409;
        case ErrorCode::ProtocolError:
            return 400;
        default:
            return 500;
    }
}

} // namespace funnel
