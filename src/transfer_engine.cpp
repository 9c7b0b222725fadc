#include "mediaxfer/transfer/transfer_engine.hpp"
#include "mediaxfer/core/log.hpp"
#include "mediaxfer/core/metrics.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <unordered_map>

namespace mediaxfer {

// ============================================================================
// Helpers
// ============================================================================

namespace {

// Owns a file descriptor; close() reports the result of ::close
class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() {
        if (fd_ >= 0) ::close(fd_);
    }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    bool close() {
        int fd = fd_;
        fd_ = -1;
        return fd < 0 || ::close(fd) == 0;
    }

private:
    int fd_;
};

bool pwrite_all(int fd, const uint8_t* data, size_t len, uint64_t offset) {
    while (len > 0) {
        ssize_t n = ::pwrite(fd, data, len, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
        offset += static_cast<uint64_t>(n);
    }
    return true;
}

bool write_all(int fd, const uint8_t* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

TransferError local_io_error(const std::string& what) {
    return TransferError::make(ErrorKind::LocalIo, what + ": " + std::strerror(errno));
}

void discard_file(const std::filesystem::path& path) {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        log_warn("failed to remove partial file %s: %s", path.c_str(), std::strerror(errno));
    }
}

// Read exactly len bytes unless the source ends or fails first
size_t read_fully(ByteSource& source, uint8_t* buf, size_t len, TransferError& error) {
    size_t total = 0;
    while (total < len) {
        size_t n = source.read(buf + total, len - total, error);
        if (n == 0) break;
        total += n;
    }
    return total;
}

// Grow the part size when the object would need more parts than S3 allows
uint64_t effective_part_size(uint64_t object_size, uint64_t configured) {
    uint64_t part_size = std::max<uint64_t>(1, configured);
    uint64_t max_parts = constants::MAX_MULTIPART_PARTS;
    if ((object_size + part_size - 1) / part_size > max_parts) {
        part_size = (object_size + max_parts - 1) / max_parts;
        part_size = (part_size + constants::MIB - 1) / constants::MIB * constants::MIB;
    }
    return part_size;
}

} // namespace

// ============================================================================
// Upload sources
// ============================================================================

FileSource::FileSource(const std::filesystem::path& path)
    : path_(path) {
    std::error_code ec;
    size_ = std::filesystem::file_size(path_, ec);
    if (ec) {
        size_ = 0;
        open_error_ = TransferError::make(ErrorKind::LocalIo,
            "cannot stat " + path_.string() + ": " + ec.message());
        return;
    }
    file_.open(path_, std::ios::binary);
    if (!file_) {
        open_error_ = TransferError::make(ErrorKind::LocalIo, "cannot open " + path_.string());
    }
}

size_t FileSource::read(uint8_t* buf, size_t len, TransferError& error) {
    if (!open_error_.empty()) {
        error = open_error_;
        return 0;
    }
    file_.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
    if (file_.bad()) {
        error = TransferError::make(ErrorKind::LocalIo, "read failed: " + path_.string());
        return 0;
    }
    return static_cast<size_t>(file_.gcount());
}

size_t BufferSource::read(uint8_t* buf, size_t len, TransferError& /*error*/) {
    size_t n = std::min(len, data_.size() - offset_);
    if (n > 0) {
        std::memcpy(buf, data_.data() + offset_, n);
        offset_ += n;
    }
    return n;
}

// ============================================================================
// Content types and plans
// ============================================================================

std::string infer_content_type(const std::string& filename) {
    static const std::unordered_map<std::string, std::string> table = {
        {".mp4", "video/mp4"},
        {".mp3", "audio/mpeg"},
        {".opus", "audio/opus"},
        {".json", "application/json"},
        {".txt", "text/plain"},
        {".jpeg", "image/jpeg"},
        {".jpg", "image/jpeg"},
        {".m3u8", "application/vnd.apple.mpegurl"},
        {".ts", "video/mp2t"},
    };

    std::string ext = std::filesystem::path(filename).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    auto it = table.find(ext);
    return it == table.end() ? std::string(constants::DEFAULT_CONTENT_TYPE) : it->second;
}

std::string prefixed_key(const std::string& prefix, const std::string& filename) {
    if (prefix.empty()) return filename;
    if (prefix.back() == '/') return prefix + filename;
    return prefix + "/" + filename;
}

OpResult remove_local(const std::filesystem::path& file, const std::filesystem::path& prune_root) {
    namespace fs = std::filesystem;
    OpResult result;
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        result.error = TransferError::make(ErrorKind::NotFound, "no such file: " + file.string());
        return result;
    }

    fs::path dir = fs::weakly_canonical(fs::absolute(file, ec).parent_path(), ec);
    std::error_code remove_ec;
    if (!fs::remove(file, remove_ec)) {
        result.error = TransferError::make(ErrorKind::LocalIo, "cannot delete " + file.string() +
                                           ": " + (remove_ec ? remove_ec.message() : "already gone"));
        return result;
    }
    log_debug("Deleted local file %s", file.c_str());
    result.success = true;

    fs::path root = prune_root;
    if (!ec && root.empty()) root = fs::current_path(ec);
    if (!ec) root = fs::weakly_canonical(root, ec);

    // Prune while dir is strictly inside root and empty
    while (!ec) {
        auto rel = dir.lexically_relative(root);
        if (rel.empty() || rel == "." || *rel.begin() == "..") break;
        if (!fs::is_empty(dir, ec) || ec) break;
        if (!fs::remove(dir, ec)) break;
        log_debug("Removed empty directory %s", dir.c_str());
        dir = dir.parent_path();
    }
    if (ec) {
        log_debug("Stopped pruning at %s: %s", dir.c_str(), ec.message().c_str());
    }
    return result;
}

RangedDownloadPlan plan_ranged_download(uint64_t total_size,
                                        uint64_t part_size,
                                        const std::filesystem::path& destination) {
    RangedDownloadPlan plan;
    plan.total_size = total_size;
    plan.part_size = std::max<uint64_t>(1, part_size);
    const uint64_t max_parts = constants::MAX_DOWNLOAD_PARTS;
    if ((total_size + plan.part_size - 1) / plan.part_size > max_parts) {
        plan.part_size = (total_size + max_parts - 1) / max_parts;
    }
    plan.part_count = static_cast<uint32_t>((total_size + plan.part_size - 1) / plan.part_size);
    plan.destination = destination;
    return plan;
}

std::pair<uint64_t, uint64_t> RangedDownloadPlan::part_range(uint32_t index) const {
    uint64_t start = static_cast<uint64_t>(index) * part_size;
    uint64_t end = std::min(total_size - 1, start + part_size - 1);
    return {start, end};
}

// ============================================================================
// TransferEngine
// ============================================================================

TransferEngine::TransferEngine(ObjectStore& store,
                               ConcurrencyGovernor& governor,
                               RetryPolicy retry,
                               TransferOptions options)
    : store_(store)
    , governor_(governor)
    , retry_(std::move(retry))
    , options_(options) {}

AttemptHook TransferEngine::retry_hook(const std::string& operation, const std::string& target) {
    return [this, operation, target](const AttemptInfo& info) {
        retries_.fetch_add(1, std::memory_order_relaxed);
        if (metrics_) {
            metrics_->record_retry(operation);
        }
        log_warn("%s retry %u/%u in %lldms for %s: %s",
                 operation.c_str(), info.attempt, info.attempt + info.attempts_remaining,
                 static_cast<long long>(info.delay.count()), target.c_str(),
                 info.error ? info.error->describe().c_str() : "");
    };
}

void TransferEngine::record(const char* operation, bool success, uint64_t bytes) {
    if (metrics_) {
        metrics_->record_transfer(operation, success, bytes);
    }
}

// --- Upload ---

UploadResult TransferEngine::upload_file(const std::filesystem::path& path,
                                         const ObjectRef& dest,
                                         const std::string& content_type) {
    FileSource source(path);
    if (!source.open_error().empty()) {
        UploadResult result;
        result.bucket = dest.bucket;
        result.key = dest.key;
        result.error = source.open_error();
        finish_upload(result);
        return result;
    }
    return upload(source, dest, content_type);
}

UploadResult TransferEngine::upload_audio_file(const std::filesystem::path& path,
                                               const std::string& key_prefix) {
    return upload_media("audio", options_.audio_bucket, path,
                        key_prefix.empty() ? options_.audio_key_prefix : key_prefix);
}

UploadResult TransferEngine::upload_video_file(const std::filesystem::path& path,
                                               const std::string& key_prefix) {
    return upload_media("video", options_.video_bucket, path,
                        key_prefix.empty() ? options_.video_key_prefix : key_prefix);
}

UploadResult TransferEngine::upload_media(const char* kind, const std::string& bucket,
                                          const std::filesystem::path& path,
                                          const std::string& key_prefix) {
    ObjectRef dest{bucket, prefixed_key(key_prefix, path.filename().string())};
    if (bucket.empty()) {
        UploadResult result;
        result.key = dest.key;
        result.error = TransferError::make(ErrorKind::InvalidIdentifier,
                                           std::string("no ") + kind + " bucket configured");
        finish_upload(result);
        return result;
    }
    return upload_file(path, dest);
}

UploadResult TransferEngine::upload(ByteSource& source,
                                    const ObjectRef& dest,
                                    const std::string& content_type) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->transfer_duration("upload"));

    UploadResult result;
    result.bucket = dest.bucket;
    result.key = dest.key;

    PutOptions put_options;
    put_options.content_type = content_type.empty() ? infer_content_type(source.name()) : content_type;
    put_options.metadata["upload-timestamp"] = iso8601_utc(std::chrono::system_clock::now());
    put_options.metadata["original-filename"] = source.name();
    put_options.metadata["file-size"] = std::to_string(source.size());

    // One upload slot per object; parts in flight are bounded separately
    auto permit = governor_.acquire(ResourceClass::Upload);

    uint64_t part_size = effective_part_size(source.size(), options_.upload_part_size);
    if (source.size() <= part_size) {
        result = upload_single(source, dest, put_options, std::move(result));
    } else {
        result = upload_multipart(source, dest, put_options, std::move(result));
    }

    finish_upload(result);
    return result;
}

UploadResult TransferEngine::upload_single(ByteSource& source, const ObjectRef& dest,
                                           const PutOptions& put_options, UploadResult result) {
    std::vector<uint8_t> buffer(source.size());
    TransferError read_error;
    size_t got = read_fully(source, buffer.data(), buffer.size(), read_error);
    if (!read_error.empty()) {
        result.error = read_error;
        return result;
    }
    if (got != buffer.size()) {
        result.error = TransferError::make(ErrorKind::LocalIo,
            "source ended after " + std::to_string(got) + " of " +
            std::to_string(buffer.size()) + " bytes");
        return result;
    }

    auto put = retry_.execute(
        [&] { return store_.put(dest, buffer, put_options); },
        classify_default, retry_hook("upload", dest.uri()), &result.attempts);
    if (!put.success) {
        result.error = put.error;
        return result;
    }

    result.success = true;
    result.bytes = buffer.size();
    result.uri = dest.uri();
    result.location = store_.location(dest);
    return result;
}

UploadResult TransferEngine::upload_multipart(ByteSource& source, const ObjectRef& dest,
                                              const PutOptions& put_options, UploadResult result) {
    auto hook = retry_hook("upload", dest.uri());
    const uint64_t part_size = effective_part_size(source.size(), options_.upload_part_size);
    const size_t max_in_flight = std::max<size_t>(1, options_.upload_parts_in_flight);

    uint32_t attempts = 0;
    auto created = retry_.execute(
        [&] { return store_.create_multipart(dest, put_options); },
        classify_default, hook, &attempts);
    result.attempts = attempts;
    if (!created.success) {
        result.error = created.error;
        return result;
    }
    const std::string upload_id = created.upload_id;

    struct PartOutcome {
        uint32_t number = 0;
        PutResult put;
        uint32_t attempts = 0;
    };

    std::deque<std::future<PartOutcome>> in_flight;
    std::vector<CompletedPart> completed;
    TransferError failure;

    auto collect = [&]() {
        PartOutcome outcome = in_flight.front().get();
        in_flight.pop_front();
        result.attempts = std::max(result.attempts, outcome.attempts);
        if (!outcome.put.success) {
            if (failure.empty()) {
                failure = outcome.put.error;
                failure.message = "part " + std::to_string(outcome.number) + ": " + failure.message;
            }
            return;
        }
        completed.push_back({outcome.number, outcome.put.etag});
    };

    uint64_t remaining = source.size();
    uint32_t number = 0;
    while (remaining > 0 && failure.empty()) {
        // Bound buffered parts before reading the next one
        if (in_flight.size() >= max_in_flight) {
            collect();
            if (!failure.empty()) break;
        }

        size_t chunk = static_cast<size_t>(std::min(part_size, remaining));
        std::vector<uint8_t> buffer(chunk);
        TransferError read_error;
        size_t got = read_fully(source, buffer.data(), chunk, read_error);
        if (!read_error.empty() || got != chunk) {
            failure = !read_error.empty() ? read_error
                : TransferError::make(ErrorKind::LocalIo, "source ended before its declared size");
            break;
        }
        remaining -= chunk;
        ++number;

        in_flight.push_back(std::async(std::launch::async,
            [this, &dest, &upload_id, &hook, number, data = std::move(buffer)]() {
                PartOutcome outcome;
                outcome.number = number;
                outcome.put = retry_.execute(
                    [&] { return store_.upload_part(dest, upload_id, number, data); },
                    classify_default, hook, &outcome.attempts);
                return outcome;
            }));
    }

    // Parts already dispatched always run to completion
    while (!in_flight.empty()) {
        collect();
    }

    if (failure.empty()) {
        std::sort(completed.begin(), completed.end(),
                  [](const CompletedPart& a, const CompletedPart& b) { return a.number < b.number; });
        auto done = retry_.execute(
            [&] { return store_.complete_multipart(dest, upload_id, completed); },
            classify_default, hook, &attempts);
        result.attempts = std::max(result.attempts, attempts);
        if (done.success) {
            result.success = true;
            result.bytes = source.size();
            result.parts = number;
            result.uri = dest.uri();
            result.location = store_.location(dest);
            return result;
        }
        failure = done.error;
    }

    auto aborted = store_.abort_multipart(dest, upload_id);
    if (!aborted.success) {
        log_warn("failed to abort multipart upload %s for %s: %s",
                 upload_id.c_str(), dest.uri().c_str(), aborted.error.describe().c_str());
    }
    result.error = failure;
    return result;
}

void TransferEngine::finish_upload(const UploadResult& result) {
    if (result.success) {
        uploads_succeeded_.fetch_add(1, std::memory_order_relaxed);
        bytes_uploaded_.fetch_add(result.bytes, std::memory_order_relaxed);
        log_info("Uploaded %s (%.2f MB%s)", result.uri.c_str(),
                 static_cast<double>(result.bytes) / constants::MIB,
                 result.parts > 0 ? (", " + std::to_string(result.parts) + " parts").c_str() : "");
    } else {
        uploads_failed_.fetch_add(1, std::memory_order_relaxed);
        log_error("Failed to upload s3://%s/%s: %s", result.bucket.c_str(), result.key.c_str(),
                  result.error.describe().c_str());
    }
    record("upload", result.success, result.bytes);
}

// --- Download ---

DownloadResult TransferEngine::download_ranged(const ObjectRef& source,
                                               const std::filesystem::path& destination,
                                               uint64_t part_size,
                                               size_t concurrency) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->transfer_duration("download"));

    DownloadResult result;
    if (part_size == 0) part_size = options_.download_part_size;
    if (concurrency == 0) concurrency = options_.download_concurrency;
    if (concurrency == 0) concurrency = governor_.capacity(ResourceClass::Download);

    auto head = retry_.execute(
        [&] {
            auto permit = governor_.acquire(ResourceClass::Head);
            return store_.head(source);
        },
        classify_default, retry_hook("head", source.uri()));
    if (!head.success) {
        result.error = head.error;
        finish_download(source, result);
        return result;
    }

    std::error_code ec;
    if (destination.has_parent_path()) {
        std::filesystem::create_directories(destination.parent_path(), ec);
        if (ec) {
            result.error = TransferError::make(ErrorKind::LocalIo,
                "cannot create " + destination.parent_path().string() + ": " + ec.message());
            finish_download(source, result);
            return result;
        }
    }

    if (head.metadata.size == 0) {
        result = download_streamed(source, destination, std::move(result));
        finish_download(source, result);
        return result;
    }

    const RangedDownloadPlan plan = plan_ranged_download(head.metadata.size, part_size, destination);
    result.ranged = true;
    result.parts_total = plan.part_count;
    result.part_attempts.assign(plan.part_count, 0);

    ScopedFd fd(::open(destination.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.valid()) {
        result.error = local_io_error("cannot open " + destination.string());
        finish_download(source, result);
        return result;
    }

    // Pre-allocate (best effort)
    if (::ftruncate(fd.get(), static_cast<off_t>(plan.total_size)) != 0) {
        log_debug("preallocation of %s failed: %s", destination.c_str(), std::strerror(errno));
    }

    auto hook = retry_hook("download", source.uri());
    std::atomic<uint32_t> next_part{0};
    std::atomic<uint32_t> completed{0};
    std::atomic<bool> aborted{false};
    std::mutex failure_mutex;
    TransferError failure;

    auto fail = [&](uint32_t index, TransferError error) {
        std::lock_guard<std::mutex> lock(failure_mutex);
        if (failure.empty()) {
            failure = std::move(error);
            failure.message = "part " + std::to_string(index + 1) + "/" +
                              std::to_string(plan.part_count) + ": " + failure.message;
        }
        aborted.store(true);
    };

    auto run_part = [&](uint32_t index) {
        const auto range = plan.part_range(index);
        const uint64_t start = range.first;
        const uint64_t end = range.second;
        const uint64_t expected = end - start + 1;

        uint32_t attempts = 0;
        auto part = retry_.execute(
            [&] {
                auto permit = governor_.acquire(ResourceClass::Download);
                auto r = store_.get_range(source, start, end);
                if (r.success && r.data.size() != expected) {
                    r.success = false;
                    r.error = TransferError::make(ErrorKind::ShortRead,
                        "expected " + std::to_string(expected) + " bytes, got " +
                        std::to_string(r.data.size()));
                }
                return r;
            },
            classify_default, hook, &attempts);
        result.part_attempts[index] = attempts;

        if (!part.success) {
            fail(index, part.error);
            return false;
        }
        if (!pwrite_all(fd.get(), part.data.data(), part.data.size(), start)) {
            fail(index, local_io_error("write to " + destination.string() + " failed"));
            return false;
        }
        completed.fetch_add(1);
        parts_completed_.fetch_add(1, std::memory_order_relaxed);
        return true;
    };

    // Once any part fails no new part is claimed
    auto worker = [&]() {
        while (!aborted.load()) {
            uint32_t index = next_part.fetch_add(1);
            if (index >= plan.part_count || aborted.load()) break;
            try {
                if (!run_part(index)) break;
            } catch (const std::exception& e) {
                fail(index, TransferError::make(ErrorKind::Unknown,
                    std::string("ranged read raised: ") + e.what()));
                break;
            }
        }
    };

    size_t workers = std::min<size_t>(std::max<size_t>(1, concurrency), plan.part_count);
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        try {
            pool.emplace_back(worker);
        } catch (const std::system_error& e) {
            if (pool.empty()) {
                std::lock_guard<std::mutex> lock(failure_mutex);
                failure = TransferError::make(ErrorKind::LocalIo,
                    std::string("cannot start download worker: ") + e.what());
            } else {
                log_warn("download of %s continues with %zu workers: %s",
                         source.uri().c_str(), pool.size(), e.what());
            }
            break;
        }
    }
    for (auto& t : pool) {
        t.join();
    }

    result.parts_completed = completed.load();
    if (!fd.close() && failure.empty()) {
        failure = local_io_error("close of " + destination.string() + " failed");
    }

    if (!failure.empty()) {
        discard_file(destination);
        result.error = failure;
    } else {
        result.success = true;
        result.bytes = plan.total_size;
    }
    finish_download(source, result);
    return result;
}

DownloadResult TransferEngine::download_streamed(const ObjectRef& source,
                                                 const std::filesystem::path& destination,
                                                 DownloadResult result) {
    ScopedFd fd(::open(destination.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.valid()) {
        result.error = local_io_error("cannot open " + destination.string());
        return result;
    }

    TransferError write_error;
    auto streamed = retry_.execute(
        [&] {
            auto permit = governor_.acquire(ResourceClass::Download);
            // Each attempt starts from an empty file
            if (::ftruncate(fd.get(), 0) != 0 || ::lseek(fd.get(), 0, SEEK_SET) < 0) {
                StreamResult r;
                r.error = write_error = local_io_error("cannot reset " + destination.string());
                return r;
            }
            return store_.get(source, [&](const uint8_t* data, size_t size) {
                if (!write_all(fd.get(), data, size)) {
                    write_error = local_io_error("write to " + destination.string() + " failed");
                    return false;
                }
                return true;
            });
        },
        [&](const TransferError& error) {
            return write_error.empty() ? classify_default(error) : RetryDecision::Abort;
        },
        retry_hook("download", source.uri()));

    bool closed = fd.close();
    if (!streamed.success || !write_error.empty() || !closed) {
        discard_file(destination);
        if (!write_error.empty()) {
            result.error = write_error;
        } else if (!streamed.success) {
            result.error = streamed.error;
        } else {
            result.error = local_io_error("close of " + destination.string() + " failed");
        }
        return result;
    }

    result.success = true;
    result.bytes = streamed.bytes;
    return result;
}

void TransferEngine::finish_download(const ObjectRef& source, const DownloadResult& result) {
    if (result.success) {
        downloads_succeeded_.fetch_add(1, std::memory_order_relaxed);
        bytes_downloaded_.fetch_add(result.bytes, std::memory_order_relaxed);
        log_info("Downloaded %s (%.2f MB, %u parts)", source.uri().c_str(),
                 static_cast<double>(result.bytes) / constants::MIB, result.parts_total);
    } else {
        downloads_failed_.fetch_add(1, std::memory_order_relaxed);
        log_error("Failed to download %s: %s", source.uri().c_str(),
                  result.error.describe().c_str());
    }
    record("download", result.success, result.bytes);
}

// --- Small operations ---

ExistsResult TransferEngine::exists(const ObjectRef& target) {
    ExistsResult result;
    auto head = retry_.execute(
        [&] {
            auto permit = governor_.acquire(ResourceClass::Head);
            return store_.head(target);
        },
        classify_default, retry_hook("head", target.uri()));

    if (head.success) {
        result.success = true;
        result.exists = true;
    } else if (head.error.kind == ErrorKind::NotFound) {
        result.success = true;
        result.exists = false;
    } else {
        result.error = head.error;
        log_error("Existence check failed for %s: %s", target.uri().c_str(),
                  head.error.describe().c_str());
    }
    record("head", result.success, 0);
    return result;
}

OpResult TransferEngine::remove(const ObjectRef& target) {
    auto result = retry_.execute(
        [&] {
            auto permit = governor_.acquire(ResourceClass::Delete);
            return store_.remove(target);
        },
        classify_default, retry_hook("delete", target.uri()));

    if (result.success) {
        log_info("Deleted %s", target.uri().c_str());
    } else {
        log_error("Failed to delete %s: %s", target.uri().c_str(), result.error.describe().c_str());
    }
    record("delete", result.success, 0);
    return result;
}

PresignResult TransferEngine::presigned_read_url(const ObjectRef& target, uint32_t ttl_seconds) {
    auto result = retry_.execute(
        [&] {
            auto permit = governor_.acquire(ResourceClass::Download);
            return store_.presign_get(target, ttl_seconds);
        },
        classify_default, retry_hook("presign", target.uri()));

    if (!result.success) {
        log_error("Failed to generate presigned URL for %s: %s", target.uri().c_str(),
                  result.error.describe().c_str());
    }
    record("presign", result.success, 0);
    return result;
}

BucketListResult TransferEngine::list_buckets() {
    auto result = retry_.execute(
        [&] {
            auto permit = governor_.acquire(ResourceClass::Head);
            return store_.list_buckets();
        },
        classify_default, retry_hook("list_buckets", store_.type_name()));

    if (!result.success) {
        log_error("Failed to list buckets: %s", result.error.describe().c_str());
    }
    record("list_buckets", result.success, 0);
    return result;
}

TextResult TransferEngine::read_text(const ObjectRef& target) {
    TextResult result;
    std::string text;
    auto streamed = retry_.execute(
        [&] {
            auto permit = governor_.acquire(ResourceClass::Download);
            text.clear();
            return store_.get(target, [&text](const uint8_t* data, size_t size) {
                text.append(reinterpret_cast<const char*>(data), size);
                return true;
            });
        },
        classify_default, retry_hook("read", target.uri()));

    if (streamed.success) {
        result.success = true;
        result.text = std::move(text);
        bytes_downloaded_.fetch_add(streamed.bytes, std::memory_order_relaxed);
    } else {
        result.error = streamed.error;
    }
    record("read", result.success, streamed.bytes);
    return result;
}

TransferEngine::Stats TransferEngine::stats() const {
    Stats s;
    s.uploads_succeeded = uploads_succeeded_.load(std::memory_order_relaxed);
    s.uploads_failed = uploads_failed_.load(std::memory_order_relaxed);
    s.downloads_succeeded = downloads_succeeded_.load(std::memory_order_relaxed);
    s.downloads_failed = downloads_failed_.load(std::memory_order_relaxed);
    s.bytes_uploaded = bytes_uploaded_.load(std::memory_order_relaxed);
    s.bytes_downloaded = bytes_downloaded_.load(std::memory_order_relaxed);
    s.parts_completed = parts_completed_.load(std::memory_order_relaxed);
    s.retries = retries_.load(std::memory_order_relaxed);
    return s;
}

} // namespace mediaxfer
