// Scripted in-memory object store for engine and integrity tests.
//
// Faults are queued per operation name ("head", "get", "put",
// "upload_part", "complete_multipart", "remove", "presign") or for one
// ranged read ("get_range@<start>"), plus "list_buckets"; each queued fault fails exactly one
// call. Every call is counted.

#pragma once

#include "mediaxfer/storage/object_store.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace mediaxfer::testing {

class FakeObjectStore : public ObjectStore {
public:
    void add(const ObjectRef& ref, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        objects_[ref.uri()] = std::vector<uint8_t>(content.begin(), content.end());
    }

    std::optional<std::string> content(const ObjectRef& ref) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find(ref.uri());
        if (it == objects_.end()) return std::nullopt;
        return std::string(it->second.begin(), it->second.end());
    }

    /// Fail the next `times` calls of op with kind.
    void fail_next(const std::string& op, ErrorKind kind, int times = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (int i = 0; i < times; ++i) {
            faults_[op].push_back(kind);
        }
    }

    /// The next `times` ranged reads return one byte less than asked.
    void short_read_next(int times = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        short_reads_ += times;
    }

    /// The ranged read starting at start throws instead of returning.
    void throw_on_range(uint64_t start) {
        std::lock_guard<std::mutex> lock(mutex_);
        throw_at_ = start;
    }

    /// Hold every ranged read for delay (to observe overlap).
    void set_range_delay(std::chrono::milliseconds delay) { range_delay_ = delay; }

    int calls(const std::string& op) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(op);
        return it == calls_.end() ? 0 : it->second;
    }

    size_t max_concurrent_ranges() const { return max_ranges_.load(); }
    PutOptions last_put_options() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_put_options_;
    }

    // --- ObjectStore ---

    std::string type_name() const override { return "fake"; }

    HeadResult head(const ObjectRef& ref) const override {
        HeadResult r;
        if (inject("head", r.error)) return r;
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find(ref.uri());
        if (it == objects_.end()) {
            r.error = TransferError::make(ErrorKind::NotFound, "no such key " + ref.uri());
            r.error.http_status = 404;
            return r;
        }
        r.success = true;
        r.metadata.size = it->second.size();
        return r;
    }

    StreamResult get(const ObjectRef& ref, const ChunkSink& sink) const override {
        StreamResult r;
        if (inject("get", r.error)) return r;
        std::vector<uint8_t> data;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = objects_.find(ref.uri());
            if (it == objects_.end()) {
                r.error = TransferError::make(ErrorKind::NotFound, "no such key " + ref.uri());
                return r;
            }
            data = it->second;
        }
        if (!data.empty() && !sink(data.data(), data.size())) {
            r.error = TransferError::make(ErrorKind::LocalIo, "sink aborted");
            return r;
        }
        r.success = true;
        r.bytes = data.size();
        return r;
    }

    GetResult get_range(const ObjectRef& ref, uint64_t start, uint64_t end) const override {
        GetResult r;
        if (inject("get_range@" + std::to_string(start), r.error) || inject("get_range", r.error)) {
            return r;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (throw_at_ && *throw_at_ == start) {
                throw std::runtime_error("connection pool exhausted");
            }
        }

        size_t now = ++active_ranges_;
        size_t seen = max_ranges_.load();
        while (now > seen && !max_ranges_.compare_exchange_weak(seen, now)) {}
        if (range_delay_.count() > 0) std::this_thread::sleep_for(range_delay_);
        --active_ranges_;

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find(ref.uri());
        if (it == objects_.end()) {
            r.error = TransferError::make(ErrorKind::NotFound, "no such key " + ref.uri());
            return r;
        }
        const auto& data = it->second;
        if (start >= data.size()) {
            r.error = TransferError::make(ErrorKind::MalformedRequest, "range not satisfiable");
            r.error.http_status = 416;
            return r;
        }
        uint64_t last = std::min<uint64_t>(end, data.size() - 1);
        if (short_reads_ > 0 && last > start) {
            --short_reads_;
            --last;
        }
        r.data.assign(data.begin() + start, data.begin() + last + 1);
        r.success = true;
        return r;
    }

    PutResult put(const ObjectRef& ref, std::span<const uint8_t> data,
                  const PutOptions& options = {}) override {
        PutResult r;
        if (inject("put", r.error)) return r;
        std::lock_guard<std::mutex> lock(mutex_);
        objects_[ref.uri()] = std::vector<uint8_t>(data.begin(), data.end());
        last_put_options_ = options;
        r.success = true;
        r.etag = "\"etag-" + std::to_string(data.size()) + "\"";
        return r;
    }

    MultipartResult create_multipart(const ObjectRef& ref, const PutOptions& options = {}) override {
        MultipartResult r;
        if (inject("create_multipart", r.error)) return r;
        std::lock_guard<std::mutex> lock(mutex_);
        r.upload_id = "upload-" + std::to_string(++next_upload_);
        uploads_[r.upload_id].target = ref.uri();
        last_put_options_ = options;
        r.success = true;
        return r;
    }

    PutResult upload_part(const ObjectRef& /*ref*/, const std::string& upload_id,
                          uint32_t part_number, std::span<const uint8_t> data) override {
        PutResult r;
        if (inject("upload_part", r.error)) return r;
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = uploads_.find(upload_id);
        if (it == uploads_.end()) {
            r.error = TransferError::make(ErrorKind::NotFound, "no such upload " + upload_id);
            return r;
        }
        it->second.parts[part_number] = std::vector<uint8_t>(data.begin(), data.end());
        r.success = true;
        r.etag = "\"part-" + std::to_string(part_number) + "\"";
        return r;
    }

    PutResult complete_multipart(const ObjectRef& ref, const std::string& upload_id,
                                 const std::vector<CompletedPart>& parts) override {
        PutResult r;
        if (inject("complete_multipart", r.error)) return r;
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = uploads_.find(upload_id);
        if (it == uploads_.end()) {
            r.error = TransferError::make(ErrorKind::NotFound, "no such upload " + upload_id);
            return r;
        }
        std::vector<uint8_t> assembled;
        for (const auto& part : parts) {
            auto p = it->second.parts.find(part.number);
            if (p == it->second.parts.end()) {
                r.error = TransferError::make(ErrorKind::MalformedRequest,
                                              "part " + std::to_string(part.number) + " not uploaded");
                return r;
            }
            assembled.insert(assembled.end(), p->second.begin(), p->second.end());
        }
        objects_[ref.uri()] = std::move(assembled);
        uploads_.erase(it);
        r.success = true;
        r.etag = "\"multipart\"";
        return r;
    }

    OpResult abort_multipart(const ObjectRef& /*ref*/, const std::string& upload_id) override {
        OpResult r;
        count("abort_multipart");
        std::lock_guard<std::mutex> lock(mutex_);
        uploads_.erase(upload_id);
        r.success = true;
        return r;
    }

    OpResult remove(const ObjectRef& ref) override {
        OpResult r;
        if (inject("remove", r.error)) return r;
        std::lock_guard<std::mutex> lock(mutex_);
        objects_.erase(ref.uri());
        r.success = true;
        return r;
    }

    PresignResult presign_get(const ObjectRef& ref, uint32_t ttl_seconds) const override {
        PresignResult r;
        if (inject("presign", r.error)) return r;
        r.success = true;
        r.url = location(ref) + "?X-Amz-Expires=" + std::to_string(ttl_seconds);
        return r;
    }

    std::string location(const ObjectRef& ref) const override {
        return "https://" + ref.bucket + ".fake.local/" + ref.key;
    }

    /// Buckets holding at least one object, plus any added empty.
    BucketListResult list_buckets() const override {
        BucketListResult r;
        if (inject("list_buckets", r.error)) return r;
        std::lock_guard<std::mutex> lock(mutex_);
        std::set<std::string> names(empty_buckets_.begin(), empty_buckets_.end());
        for (const auto& [uri, data] : objects_) {
            auto rest = uri.substr(5);  // s3://
            names.insert(rest.substr(0, rest.find('/')));
        }
        r.buckets.assign(names.begin(), names.end());
        r.success = true;
        return r;
    }

    void add_bucket(const std::string& bucket) {
        std::lock_guard<std::mutex> lock(mutex_);
        empty_buckets_.push_back(bucket);
    }

    size_t open_uploads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return uploads_.size();
    }

private:
    struct Upload {
        std::string target;
        std::map<uint32_t, std::vector<uint8_t>> parts;
    };

    void count(const std::string& op) const {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_[op];
    }

    // Counts the call and pops a queued fault for op, if any
    bool inject(const std::string& op, TransferError& error) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto base = op.substr(0, op.find('@'));
        if (op == base) ++calls_[op];
        auto it = faults_.find(op);
        if (it == faults_.end() || it->second.empty()) return false;
        ErrorKind kind = it->second.front();
        it->second.pop_front();
        error = TransferError::make(kind, "injected " + std::string(error_kind_name(kind)));
        if (op != base) ++calls_[base];
        return true;
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<uint8_t>> objects_;
    std::map<std::string, Upload> uploads_;
    std::vector<std::string> empty_buckets_;
    mutable std::map<std::string, std::deque<ErrorKind>> faults_;
    mutable std::map<std::string, int> calls_;
    mutable int short_reads_ = 0;
    std::optional<uint64_t> throw_at_;
    uint64_t next_upload_ = 0;
    PutOptions last_put_options_;

    std::chrono::milliseconds range_delay_{0};
    mutable std::atomic<size_t> active_ranges_{0};
    mutable std::atomic<size_t> max_ranges_{0};
};

} // namespace mediaxfer::testing
