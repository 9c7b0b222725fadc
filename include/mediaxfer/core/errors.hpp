#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace mediaxfer {

// Closed set of failure kinds produced by object-store adapters.
// Retry classification operates on this enum only.
enum class ErrorKind {
    None,
    PermissionDenied,   // AccessDenied, HTTP 403
    BadCredentials,     // bad key id, signature mismatch, expired token
    MalformedRequest,   // InvalidArgument, HTTP 400
    NotFound,           // NoSuchKey, NoSuchBucket, HTTP 404
    NotEmpty,           // BucketNotEmpty, HTTP 409
    InvalidIdentifier,  // InvalidBucketName, unparseable reference
    Timeout,
    Network,
    Throttled,          // SlowDown, HTTP 429 / 503
    ServerError,        // HTTP 5xx
    ShortRead,          // ranged read returned fewer bytes than requested
    LocalIo,            // destination/source file error on this host
    Unknown
};

const char* error_kind_name(ErrorKind kind);

// Fatal kinds are never retried.
bool is_fatal(ErrorKind kind);

// Error carried by every transfer result.
struct TransferError {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    int http_status = 0;
    std::string provider_code;  // e.g. "NoSuchKey"
    uint32_t attempts = 0;      // set by RetryPolicy

    bool empty() const { return kind == ErrorKind::None; }
    bool fatal() const { return is_fatal(kind); }

    // "<Kind>: <message> [code] (after N attempts)"
    std::string describe() const;

    static TransferError make(ErrorKind kind, std::string message) {
        TransferError e;
        e.kind = kind;
        e.message = std::move(message);
        return e;
    }
};

/// Map an S3 error code (from the XML error body) to an ErrorKind.
/// Returns ErrorKind::Unknown for codes not in the table.
ErrorKind error_kind_from_provider_code(const std::string& code);

/// Map an HTTP status to an ErrorKind (ErrorKind::None for 2xx/3xx).
ErrorKind error_kind_from_http_status(int status);

/// Thrown by metadata stores when the backing store cannot be reached or
/// queried. Aborts an integrity scan.
class MetadataStoreUnavailable : public std::runtime_error {
public:
    explicit MetadataStoreUnavailable(const std::string& what)
        : std::runtime_error(what) {}
};

}  // namespace mediaxfer
