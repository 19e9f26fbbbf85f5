#pragma once

#include <string>

namespace rms {

/**
 * @brief Failure categories shared by the server engine and the upload client
 *
 * The first block is the transfer taxonomy every component reports with.
 * The second block covers request validation and the HTTP surface.
 * The last block only appears on the client side.
 */
enum class ErrorCode {
    InvalidSize,
    SessionNotFound,
    SessionTerminal,
    IndexOutOfRange,
    IncompleteUpload,
    StorageFailure,
    SessionExpired,

    InvalidArgument,
    Unauthorized,
    Conflict,
    PayloadTooLarge,
    RangeNotSatisfiable,
    NotYetAvailable,

    Cancelled,
    TransportFailure
};

struct Error {
    ErrorCode code = ErrorCode::StorageFailure;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidSize: return "InvalidSize";
        case ErrorCode::SessionNotFound: return "SessionNotFound";
        case ErrorCode::SessionTerminal: return "SessionTerminal";
        case ErrorCode::IndexOutOfRange: return "IndexOutOfRange";
        case ErrorCode::IncompleteUpload: return "IncompleteUpload";
        case ErrorCode::StorageFailure: return "StorageFailure";
        case ErrorCode::SessionExpired: return "SessionExpired";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::Conflict: return "Conflict";
        case ErrorCode::PayloadTooLarge: return "PayloadTooLarge";
        case ErrorCode::RangeNotSatisfiable: return "RangeNotSatisfiable";
        case ErrorCode::NotYetAvailable: return "NotYetAvailable";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::TransportFailure: return "TransportFailure";
    }
    return "Unknown";
}

/**
 * @brief Parse the wire name produced by to_string()
 *
 * Unknown names map to StorageFailure so a newer server never makes an
 * older client treat a failure as terminal.
 */
inline ErrorCode error_code_from_string(const std::string& name) {
    static const ErrorCode all[] = {
        ErrorCode::InvalidSize, ErrorCode::SessionNotFound, ErrorCode::SessionTerminal,
        ErrorCode::IndexOutOfRange, ErrorCode::IncompleteUpload, ErrorCode::StorageFailure,
        ErrorCode::SessionExpired, ErrorCode::InvalidArgument, ErrorCode::Unauthorized,
        ErrorCode::Conflict, ErrorCode::PayloadTooLarge, ErrorCode::RangeNotSatisfiable,
        ErrorCode::NotYetAvailable, ErrorCode::Cancelled, ErrorCode::TransportFailure,
    };
    for (auto code : all) {
        if (name == to_string(code)) {
            return code;
        }
    }
    return ErrorCode::StorageFailure;
}

/// Transient failures the client retries with backoff.
inline bool is_retryable(ErrorCode code) {
    return code == ErrorCode::StorageFailure ||
           code == ErrorCode::TransportFailure ||
           code == ErrorCode::NotYetAvailable;
}

} // namespace rms
