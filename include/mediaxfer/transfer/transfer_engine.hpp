#pragma once

#include "mediaxfer/core/constants.hpp"
#include "mediaxfer/core/errors.hpp"
#include "mediaxfer/storage/object_store.hpp"
#include "mediaxfer/transfer/concurrency_governor.hpp"
#include "mediaxfer/transfer/retry_policy.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace mediaxfer {

class MetricsExporter;

// ============================================================================
// Upload sources
// ============================================================================

/// Pull interface for upload payloads of known size.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual uint64_t size() const = 0;

    /// Original file name, recorded as provenance metadata.
    virtual std::string name() const = 0;

    /// Read up to len bytes. Returns the count read (0 at end of data).
    /// On failure returns 0 and sets error.
    virtual size_t read(uint8_t* buf, size_t len, TransferError& error) = 0;
};

/// Reads a local file in order.
class FileSource : public ByteSource {
public:
    explicit FileSource(const std::filesystem::path& path);

    uint64_t size() const override { return size_; }
    std::string name() const override { return path_.filename().string(); }
    size_t read(uint8_t* buf, size_t len, TransferError& error) override;

    /// Empty if the file was opened and sized.
    const TransferError& open_error() const { return open_error_; }

private:
    std::filesystem::path path_;
    std::ifstream file_;
    uint64_t size_ = 0;
    TransferError open_error_;
};

/// Non-owning view over an in-memory payload.
class BufferSource : public ByteSource {
public:
    BufferSource(std::span<const uint8_t> data, std::string name)
        : data_(data), name_(std::move(name)) {}

    uint64_t size() const override { return data_.size(); }
    std::string name() const override { return name_; }
    size_t read(uint8_t* buf, size_t len, TransferError& error) override;

private:
    std::span<const uint8_t> data_;
    std::string name_;
    size_t offset_ = 0;
};

// ============================================================================
// Results and plans
// ============================================================================

struct TransferOptions {
    size_t upload_part_size = constants::DEFAULT_UPLOAD_PART_SIZE_MB * constants::MIB;
    size_t upload_parts_in_flight = constants::DEFAULT_UPLOAD_PARTS_IN_FLIGHT;
    size_t download_part_size = constants::DEFAULT_DOWNLOAD_PART_SIZE_MB * constants::MIB;
    size_t download_concurrency = 0;  // 0 = download class capacity

    // Targets of upload_audio_file / upload_video_file
    std::string audio_bucket;
    std::string video_bucket;
    std::string audio_key_prefix;     // used when the caller passes none
    std::string video_key_prefix;
};

struct UploadResult {
    bool success = false;
    std::string location;
    std::string uri;
    std::string bucket;
    std::string key;
    uint64_t bytes = 0;
    uint32_t parts = 0;       // 0 for a single PUT
    uint32_t attempts = 0;    // most attempts any single request needed
    TransferError error;
};

/// Byte ranges [0, total_size) split into part_count contiguous parts.
struct RangedDownloadPlan {
    uint64_t total_size = 0;
    uint64_t part_size = 0;
    uint32_t part_count = 0;
    std::filesystem::path destination;

    /// Inclusive [start, end] of part index.
    std::pair<uint64_t, uint64_t> part_range(uint32_t index) const;
};

/// part_count = ceil(total_size / part_size). A part_size of 0 is taken as
/// 1, and part_size grows when the object would need more than
/// MAX_DOWNLOAD_PARTS parts.
RangedDownloadPlan plan_ranged_download(uint64_t total_size,
                                        uint64_t part_size,
                                        const std::filesystem::path& destination);

struct DownloadResult {
    bool success = false;
    uint64_t bytes = 0;
    bool ranged = false;                   // false when the streamed fallback ran
    uint32_t parts_total = 0;
    uint32_t parts_completed = 0;
    std::vector<uint32_t> part_attempts;   // per part; 0 = never started
    TransferError error;
};

struct ExistsResult {
    bool success = false;
    bool exists = false;
    TransferError error;
};

struct TextResult {
    bool success = false;
    std::string text;
    TransferError error;
};

/// Map a file extension to a content type (case-insensitive).
/// Unknown extensions map to application/octet-stream.
std::string infer_content_type(const std::string& filename);

/// "episodes/42" + "a.mp3" -> "episodes/42/a.mp3"; an empty prefix leaves
/// the file name alone, and a trailing '/' on the prefix is not doubled.
std::string prefixed_key(const std::string& prefix, const std::string& filename);

/// Delete a local file, then remove parent directories left empty, walking
/// up to but never removing prune_root (default: the working directory).
/// Directories outside prune_root are left alone. A missing file is an
/// error of kind NotFound; failures while pruning are logged and ignored.
OpResult remove_local(const std::filesystem::path& file,
                      const std::filesystem::path& prune_root = {});

// ============================================================================
// TransferEngine
// ============================================================================

/// Governed, retried transfers against an ObjectStore.
///
/// Every remote call is made while holding a ConcurrencyGovernor permit of
/// the matching class, inside a RetryPolicy loop. Failures come back as
/// result structs; nothing here throws for a failed transfer.
class TransferEngine {
public:
    struct Stats {
        uint64_t uploads_succeeded = 0;
        uint64_t uploads_failed = 0;
        uint64_t downloads_succeeded = 0;
        uint64_t downloads_failed = 0;
        uint64_t bytes_uploaded = 0;
        uint64_t bytes_downloaded = 0;
        uint64_t parts_completed = 0;
        uint64_t retries = 0;
    };

    TransferEngine(ObjectStore& store,
                   ConcurrencyGovernor& governor,
                   RetryPolicy retry,
                   TransferOptions options = {});

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    /// Optional metrics (not owned). Set before starting transfers.
    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    /// Stream source to dest. Payloads larger than one part use multipart
    /// with at most upload_parts_in_flight parts buffered at once. An empty
    /// content_type is inferred from the source name.
    UploadResult upload(ByteSource& source,
                        const ObjectRef& dest,
                        const std::string& content_type = "");

    UploadResult upload_file(const std::filesystem::path& path,
                             const ObjectRef& dest,
                             const std::string& content_type = "");

    /// upload_file into the configured audio or video bucket under
    /// prefixed_key(key_prefix, file name). An empty key_prefix uses the
    /// configured default prefix for that bucket.
    UploadResult upload_audio_file(const std::filesystem::path& path,
                                   const std::string& key_prefix = "");
    UploadResult upload_video_file(const std::filesystem::path& path,
                                   const std::string& key_prefix = "");

    /// Parallel ranged download into destination. 0 for part_size or
    /// concurrency means the configured default. On failure the partial
    /// destination file is removed.
    DownloadResult download_ranged(const ObjectRef& source,
                                   const std::filesystem::path& destination,
                                   uint64_t part_size = 0,
                                   size_t concurrency = 0);

    /// NotFound is a successful answer with exists=false.
    ExistsResult exists(const ObjectRef& target);

    OpResult remove(const ObjectRef& target);

    PresignResult presigned_read_url(const ObjectRef& target,
                                     uint32_t ttl_seconds = constants::DEFAULT_PRESIGN_TTL_SECONDS);

    /// Governed as a Head request.
    BucketListResult list_buckets();

    /// Whole-object read into memory (manifests and other small text).
    TextResult read_text(const ObjectRef& target);

    /// Ranged-download parts completed since construction.
    uint64_t parts_completed() const { return parts_completed_.load(std::memory_order_relaxed); }

    Stats stats() const;

    ObjectStore& store() { return store_; }
    ConcurrencyGovernor& governor() { return governor_; }
    const TransferOptions& options() const { return options_; }

private:
    UploadResult upload_single(ByteSource& source, const ObjectRef& dest,
                               const PutOptions& put_options, UploadResult result);
    UploadResult upload_multipart(ByteSource& source, const ObjectRef& dest,
                                  const PutOptions& put_options, UploadResult result);
    UploadResult upload_media(const char* kind, const std::string& bucket,
                              const std::filesystem::path& path, const std::string& key_prefix);
    DownloadResult download_streamed(const ObjectRef& source,
                                     const std::filesystem::path& destination,
                                     DownloadResult result);

    AttemptHook retry_hook(const std::string& operation, const std::string& target);
    void finish_upload(const UploadResult& result);
    void finish_download(const ObjectRef& source, const DownloadResult& result);
    void record(const char* operation, bool success, uint64_t bytes);

    ObjectStore& store_;
    ConcurrencyGovernor& governor_;
    RetryPolicy retry_;
    TransferOptions options_;
    MetricsExporter* metrics_ = nullptr;

    std::atomic<uint64_t> uploads_succeeded_{0};
    std::atomic<uint64_t> uploads_failed_{0};
    std::atomic<uint64_t> downloads_succeeded_{0};
    std::atomic<uint64_t> downloads_failed_{0};
    std::atomic<uint64_t> bytes_uploaded_{0};
    std::atomic<uint64_t> bytes_downloaded_{0};
    std::atomic<uint64_t> parts_completed_{0};
    std::atomic<uint64_t> retries_{0};
};

} // namespace mediaxfer
