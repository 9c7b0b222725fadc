#include "mediaxfer/core/errors.hpp"

#include <unordered_map>

namespace mediaxfer {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::BadCredentials: return "BadCredentials";
        case ErrorKind::MalformedRequest: return "MalformedRequest";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::NotEmpty: return "NotEmpty";
        case ErrorKind::InvalidIdentifier: return "InvalidIdentifier";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::Network: return "Network";
        case ErrorKind::Throttled: return "Throttled";
        case ErrorKind::ServerError: return "ServerError";
        case ErrorKind::ShortRead: return "ShortRead";
        case ErrorKind::LocalIo: return "LocalIo";
        case ErrorKind::Unknown: return "Unknown";
    }
    return "Unknown";
}

bool is_fatal(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PermissionDenied:
        case ErrorKind::BadCredentials:
        case ErrorKind::MalformedRequest:
        case ErrorKind::NotFound:
        case ErrorKind::NotEmpty:
        case ErrorKind::InvalidIdentifier:
        case ErrorKind::LocalIo:
            return true;
        default:
            return false;
    }
}

std::string TransferError::describe() const {
    std::string out = error_kind_name(kind);
    if (!message.empty()) {
        out += ": " + message;
    }
    if (!provider_code.empty()) {
        out += " [" + provider_code + "]";
    } else if (http_status != 0) {
        out += " [HTTP " + std::to_string(http_status) + "]";
    }
    if (attempts > 1) {
        out += " (after " + std::to_string(attempts) + " attempts)";
    }
    return out;
}

ErrorKind error_kind_from_provider_code(const std::string& code) {
    static const std::unordered_map<std::string, ErrorKind> table = {
        {"AccessDenied", ErrorKind::PermissionDenied},
        {"AllAccessDisabled", ErrorKind::PermissionDenied},
        {"InvalidAccessKeyId", ErrorKind::BadCredentials},
        {"SignatureDoesNotMatch", ErrorKind::BadCredentials},
        {"TokenRefreshRequired", ErrorKind::BadCredentials},
        {"ExpiredToken", ErrorKind::BadCredentials},
        {"InvalidToken", ErrorKind::BadCredentials},
        {"InvalidArgument", ErrorKind::MalformedRequest},
        {"InvalidRange", ErrorKind::MalformedRequest},
        {"MalformedXML", ErrorKind::MalformedRequest},
        {"EntityTooSmall", ErrorKind::MalformedRequest},
        {"InvalidPart", ErrorKind::MalformedRequest},
        {"NoSuchKey", ErrorKind::NotFound},
        {"NoSuchBucket", ErrorKind::NotFound},
        {"NoSuchUpload", ErrorKind::NotFound},
        {"NotFound", ErrorKind::NotFound},
        {"BucketNotEmpty", ErrorKind::NotEmpty},
        {"InvalidBucketName", ErrorKind::InvalidIdentifier},
        {"KeyTooLongError", ErrorKind::InvalidIdentifier},
        {"SlowDown", ErrorKind::Throttled},
        {"Throttling", ErrorKind::Throttled},
        {"RequestLimitExceeded", ErrorKind::Throttled},
        {"RequestTimeout", ErrorKind::Timeout},
        {"RequestTimeTooSkewed", ErrorKind::Network},
        {"InternalError", ErrorKind::ServerError},
        {"ServiceUnavailable", ErrorKind::Throttled},
    };
    auto it = table.find(code);
    return it == table.end() ? ErrorKind::Unknown : it->second;
}

ErrorKind error_kind_from_http_status(int status) {
    if (status >= 200 && status < 400) return ErrorKind::None;
    switch (status) {
        case 400: return ErrorKind::MalformedRequest;
        case 401: return ErrorKind::BadCredentials;
        case 403: return ErrorKind::PermissionDenied;
        case 404: return ErrorKind::NotFound;
        case 408: return ErrorKind::Timeout;
        case 409: return ErrorKind::NotEmpty;
        case 416: return ErrorKind::MalformedRequest;
        case 429: return ErrorKind::Throttled;
        case 503: return ErrorKind::Throttled;
        case 504: return ErrorKind::Timeout;
        default: break;
    }
    if (status >= 500) return ErrorKind::ServerError;
    return ErrorKind::Unknown;
}

}  // namespace mediaxfer
