#pragma once

#include "mediaxfer/core/constants.hpp"
#include "mediaxfer/core/errors.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace mediaxfer {

// Location of one object. Keys are opaque to this layer.
struct ObjectRef {
    std::string bucket;
    std::string key;

    // s3://bucket/key
    std::string uri() const;

    // Accepts s3://bucket/key, virtual-hosted (dotted bucket names included)
    // and path-style S3 URLs, and any other http(s) URL whose first host
    // label names the bucket.
    // Keys are URL-decoded. Returns nullopt if bucket or key is empty.
    static std::optional<ObjectRef> from_url(const std::string& url);

    bool operator==(const ObjectRef&) const = default;
};

// Metadata about a stored object
struct ObjectMetadata {
    uint64_t size = 0;
    std::string content_type;
    std::string etag;
    std::map<std::string, std::string> user_metadata;
};

// Result of a head operation
struct HeadResult {
    bool success = false;
    ObjectMetadata metadata;
    TransferError error;
};

// Result of a ranged read
struct GetResult {
    bool success = false;
    std::vector<uint8_t> data;
    TransferError error;
};

// Result of a streamed whole-object read
struct StreamResult {
    bool success = false;
    uint64_t bytes = 0;
    TransferError error;
};

// Result of a put, an uploaded part, or a completed multipart upload
struct PutResult {
    bool success = false;
    std::string etag;
    TransferError error;
};

struct MultipartResult {
    bool success = false;
    std::string upload_id;
    TransferError error;
};

// Result of operations with no payload (remove, abort)
struct OpResult {
    bool success = false;
    TransferError error;
};

struct PresignResult {
    bool success = false;
    std::string url;
    TransferError error;
};

struct BucketListResult {
    bool success = false;
    std::vector<std::string> buckets;  // sorted by name
    TransferError error;
};

// Options for put and multipart-create operations
struct PutOptions {
    std::string content_type = constants::DEFAULT_CONTENT_TYPE;
    std::map<std::string, std::string> metadata;  // x-amz-meta-* on S3
};

struct CompletedPart {
    uint32_t number = 0;
    std::string etag;
};

// Receives object bytes in order. Return false to abort the read.
using ChunkSink = std::function<bool(const uint8_t* data, size_t size)>;

// Abstract object store. Implementations make exactly one remote call per
// operation and report failures as a classified TransferError; retry and
// admission control live above this interface.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Get the store type name (for logging)
    virtual std::string type_name() const = 0;

    // Size and metadata; a missing object is an error of kind NotFound
    virtual HeadResult head(const ObjectRef& ref) const = 0;

    // Stream the whole object into sink
    virtual StreamResult get(const ObjectRef& ref, const ChunkSink& sink) const = 0;

    // Read the inclusive byte range [start, end]
    virtual GetResult get_range(const ObjectRef& ref, uint64_t start, uint64_t end) const = 0;

    // Single-request write
    virtual PutResult put(const ObjectRef& ref,
                          std::span<const uint8_t> data,
                          const PutOptions& options = {}) = 0;

    // Multipart write
    virtual MultipartResult create_multipart(const ObjectRef& ref,
                                             const PutOptions& options = {}) = 0;
    virtual PutResult upload_part(const ObjectRef& ref,
                                  const std::string& upload_id,
                                  uint32_t part_number,
                                  std::span<const uint8_t> data) = 0;
    virtual PutResult complete_multipart(const ObjectRef& ref,
                                         const std::string& upload_id,
                                         const std::vector<CompletedPart>& parts) = 0;
    virtual OpResult abort_multipart(const ObjectRef& ref, const std::string& upload_id) = 0;

    // Deleting a missing object succeeds
    virtual OpResult remove(const ObjectRef& ref) = 0;

    // Time-limited read URL
    virtual PresignResult presign_get(const ObjectRef& ref, uint32_t ttl_seconds) const = 0;

    // Public location of an object (no network call)
    virtual std::string location(const ObjectRef& ref) const = 0;

    // Buckets visible to the configured credentials
    virtual BucketListResult list_buckets() const = 0;
};

// S3-compatible store settings
struct S3StoreConfig {
    std::string region = constants::DEFAULT_REGION;
    std::string endpoint;           // Empty for AWS, custom for MinIO/etc
    std::string access_key;
    std::string secret_key;
    std::string session_token;      // STS/temporary credentials
    bool use_path_style = false;    // For MinIO compatibility
    bool verify_ssl = true;
    bool unsigned_payload = false;  // Skip SHA-256 payload hashing on PUTs
    uint32_t connect_timeout_secs = constants::DEFAULT_CONNECT_TIMEOUT_SECS;
    uint32_t request_timeout_secs = constants::DEFAULT_REQUEST_TIMEOUT_SECS;
};

// Factory for creating object stores from configuration
class ObjectStoreFactory {
public:
    // Create a store from a configuration map. Throws std::runtime_error on
    // unknown type or missing required parameters.
    static std::unique_ptr<ObjectStore> create(
        const std::string& type,
        const std::map<std::string, std::string>& params);

    // Directory tree <root>/<bucket>/<key>
    static std::unique_ptr<ObjectStore> create_local(const std::filesystem::path& root);

    static std::unique_ptr<ObjectStore> create_s3(const S3StoreConfig& config);
};

} // namespace mediaxfer
