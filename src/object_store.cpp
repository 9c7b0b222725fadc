#include "mediaxfer/storage/object_store.hpp"
#include "mediaxfer/core/log.hpp"
#include "mediaxfer/net/url.hpp"
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace mediaxfer {

// ============================================================================
// ObjectRef
// ============================================================================

std::string ObjectRef::uri() const {
    return "s3://" + bucket + "/" + key;
}

static std::string strip_query_and_fragment(const std::string& s) {
    return s.substr(0, s.find_first_of("?#"));
}

std::optional<ObjectRef> ObjectRef::from_url(const std::string& url) {
    ObjectRef ref;

    if (url.starts_with("s3://")) {
        std::string rest = strip_query_and_fragment(url.substr(5));
        size_t slash = rest.find('/');
        if (slash == std::string::npos) return std::nullopt;
        ref.bucket = rest.substr(0, slash);
        ref.key = net::percent_decode(rest.substr(slash + 1));
    } else {
        auto parsed = net::Url::parse(url);
        if (!parsed || (parsed->scheme != "http" && parsed->scheme != "https")) {
            return std::nullopt;
        }

        std::string host = parsed->host;
        std::transform(host.begin(), host.end(), host.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        std::string path = parsed->path.empty() ? "" : parsed->path.substr(1);

        // Path-style: s3.amazonaws.com or s3[.-]<region>.amazonaws.com
        bool path_style = host.ends_with(".amazonaws.com") &&
                          (host.starts_with("s3.") || host.starts_with("s3-"));
        if (path_style) {
            size_t slash = path.find('/');
            if (slash == std::string::npos) return std::nullopt;
            ref.bucket = path.substr(0, slash);
            ref.key = net::percent_decode(path.substr(slash + 1));
        } else if (host.ends_with(".amazonaws.com")) {
            // Virtual-hosted: bucket names may contain dots, so strip the
            // .s3[.-<region>].amazonaws.com suffix rather than split labels
            size_t suffix = std::min(host.rfind(".s3."), host.rfind(".s3-"));
            if (suffix == std::string::npos || suffix == 0) return std::nullopt;
            ref.bucket = host.substr(0, suffix);
            ref.key = net::percent_decode(path);
        } else {
            // Other hosts: first label is the bucket
            ref.bucket = host.substr(0, host.find('.'));
            ref.key = net::percent_decode(path);
        }
    }

    if (ref.bucket.empty() || ref.key.empty()) {
        return std::nullopt;
    }
    return ref;
}

// ============================================================================
// LocalObjectStore - directory tree <root>/<bucket>/<key>
// ============================================================================

// Sidecar metadata lives under <root>/.meta, multipart staging under
// <root>/.uploads/<upload-id>.
class LocalObjectStore : public ObjectStore {
public:
    explicit LocalObjectStore(const std::filesystem::path& root)
        : root_(std::filesystem::absolute(root)) {
        std::filesystem::create_directories(root_);
    }

    std::string type_name() const override { return "local"; }

    HeadResult head(const ObjectRef& ref) const override {
        HeadResult result;
        std::filesystem::path path;
        if (!resolve(ref, path, result.error)) return result;

        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            result.error = not_found_or_io(ec, ref);
            return result;
        }

        result.success = true;
        result.metadata.size = size;
        result.metadata.content_type = constants::DEFAULT_CONTENT_TYPE;
        read_sidecar(ref, result.metadata);
        return result;
    }

    StreamResult get(const ObjectRef& ref, const ChunkSink& sink) const override {
        StreamResult result;
        std::filesystem::path path;
        if (!resolve(ref, path, result.error)) return result;

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            result.error = missing_or_unreadable(path, ref);
            return result;
        }

        std::vector<char> buffer(1024 * 1024);
        while (file) {
            file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto n = static_cast<size_t>(file.gcount());
            if (n == 0) break;
            if (!sink(reinterpret_cast<const uint8_t*>(buffer.data()), n)) {
                result.error = TransferError::make(ErrorKind::LocalIo,
                    "GET " + ref.uri() + ": sink rejected data");
                return result;
            }
            result.bytes += n;
        }
        if (file.bad()) {
            result.error = TransferError::make(ErrorKind::LocalIo,
                "GET " + ref.uri() + ": read failed");
            return result;
        }

        result.success = true;
        return result;
    }

    GetResult get_range(const ObjectRef& ref, uint64_t start, uint64_t end) const override {
        GetResult result;
        std::filesystem::path path;
        if (!resolve(ref, path, result.error)) return result;

        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file) {
            result.error = missing_or_unreadable(path, ref);
            return result;
        }

        auto tellg_val = file.tellg();
        if (tellg_val < 0) {
            result.error = TransferError::make(ErrorKind::LocalIo,
                "cannot determine size of " + ref.uri());
            return result;
        }
        uint64_t file_size = static_cast<uint64_t>(tellg_val);

        if (end < start || start >= file_size) {
            result.error = TransferError::make(ErrorKind::MalformedRequest,
                "range " + std::to_string(start) + "-" + std::to_string(end) +
                " not satisfiable for " + ref.uri());
            result.error.http_status = 416;
            return result;
        }

        end = std::min(end, file_size - 1);
        uint64_t length = end - start + 1;

        file.seekg(static_cast<std::streamoff>(start));
        result.data.resize(length);
        file.read(reinterpret_cast<char*>(result.data.data()), static_cast<std::streamsize>(length));
        if (!file) {
            result.data.clear();
            result.error = TransferError::make(ErrorKind::LocalIo, "failed to read " + ref.uri());
            return result;
        }

        result.success = true;
        return result;
    }

    PutResult put(const ObjectRef& ref,
                  std::span<const uint8_t> data,
                  const PutOptions& options) override {
        PutResult result;
        std::filesystem::path path;
        if (!resolve(ref, path, result.error)) return result;

        if (!write_atomic(path, data, result.error)) return result;
        if (!write_sidecar(ref, options, result.error)) return result;

        result.success = true;
        result.etag = "\"" + md5_hex(data) + "\"";
        return result;
    }

    MultipartResult create_multipart(const ObjectRef& ref,
                                     const PutOptions& options) override {
        MultipartResult result;
        std::filesystem::path path;
        if (!resolve(ref, path, result.error)) return result;

        std::string upload_id = std::to_string(::getpid()) + "-" +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "-" +
            std::to_string(next_upload_.fetch_add(1));
        auto staging = staging_dir(upload_id);

        std::error_code ec;
        std::filesystem::create_directories(staging, ec);
        if (ec) {
            result.error = TransferError::make(ErrorKind::LocalIo,
                "cannot create staging directory: " + ec.message());
            return result;
        }

        nlohmann::json manifest;
        manifest["bucket"] = ref.bucket;
        manifest["key"] = ref.key;
        manifest["content_type"] = options.content_type;
        manifest["metadata"] = options.metadata;
        std::string text = manifest.dump();
        if (!write_atomic(staging / "upload.json",
                          std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()),
                                                   text.size()),
                          result.error)) {
            return result;
        }

        result.success = true;
        result.upload_id = upload_id;
        return result;
    }

    PutResult upload_part(const ObjectRef& ref,
                          const std::string& upload_id,
                          uint32_t part_number,
                          std::span<const uint8_t> data) override {
        PutResult result;
        auto staging = staging_dir(upload_id);
        if (!std::filesystem::exists(staging / "upload.json")) {
            result.error = no_such_upload(ref, upload_id);
            return result;
        }
        if (part_number < 1 || part_number > constants::MAX_MULTIPART_PARTS) {
            result.error = TransferError::make(ErrorKind::MalformedRequest,
                "part number " + std::to_string(part_number) + " out of range");
            return result;
        }

        if (!write_atomic(staging / std::to_string(part_number), data, result.error)) {
            return result;
        }

        result.success = true;
        result.etag = "\"" + md5_hex(data) + "\"";
        return result;
    }

    PutResult complete_multipart(const ObjectRef& ref,
                                 const std::string& upload_id,
                                 const std::vector<CompletedPart>& parts) override {
        PutResult result;
        std::filesystem::path path;
        if (!resolve(ref, path, result.error)) return result;

        auto staging = staging_dir(upload_id);
        std::ifstream manifest_file(staging / "upload.json");
        if (!manifest_file) {
            result.error = no_such_upload(ref, upload_id);
            return result;
        }
        nlohmann::json manifest = nlohmann::json::parse(manifest_file, nullptr, false);
        if (manifest.is_discarded()) {
            result.error = TransferError::make(ErrorKind::LocalIo,
                "corrupt multipart manifest for upload " + upload_id);
            return result;
        }

        if (parts.empty()) {
            result.error = TransferError::make(ErrorKind::MalformedRequest,
                "CompleteMultipartUpload " + ref.uri() + ": no parts");
            return result;
        }

        auto tmp_path = path.string() + ".tmp." + upload_id;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            result.error = TransferError::make(ErrorKind::LocalIo, "cannot create " + tmp_path);
            return result;
        }

        std::string etag_concat;
        uint32_t previous = 0;
        for (const auto& part : parts) {
            if (part.number <= previous) {
                out.close();
                discard(tmp_path);
                result.error = TransferError::make(ErrorKind::MalformedRequest,
                    "parts must be listed in ascending order");
                result.error.provider_code = "InvalidPartOrder";
                return result;
            }
            previous = part.number;

            auto part_path = staging / std::to_string(part.number);
            std::ifstream in(part_path, std::ios::binary);
            std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                                      std::istreambuf_iterator<char>());
            if (!in.is_open() || "\"" + md5_hex(data) + "\"" != part.etag) {
                out.close();
                discard(tmp_path);
                result.error = TransferError::make(ErrorKind::MalformedRequest,
                    "part " + std::to_string(part.number) + " missing or ETag mismatch");
                result.error.provider_code = "InvalidPart";
                return result;
            }
            out.write(reinterpret_cast<const char*>(data.data()),
                      static_cast<std::streamsize>(data.size()));
            etag_concat += part.etag;
        }
        out.close();
        if (!out) {
            discard(tmp_path);
            result.error = TransferError::make(ErrorKind::LocalIo, "failed to write " + tmp_path);
            return result;
        }

        std::error_code ec;
        std::filesystem::rename(tmp_path, path, ec);
        if (ec) {
            discard(tmp_path);
            result.error = TransferError::make(ErrorKind::LocalIo,
                "failed to rename file: " + ec.message());
            return result;
        }

        PutOptions options;
        options.content_type = manifest.value("content_type", std::string(constants::DEFAULT_CONTENT_TYPE));
        options.metadata = manifest.value("metadata", std::map<std::string, std::string>{});
        if (!write_sidecar(ref, options, result.error)) return result;

        std::filesystem::remove_all(staging, ec);
        if (ec) {
            log_warn("failed to remove staging directory %s: %s",
                     staging.c_str(), ec.message().c_str());
        }

        result.success = true;
        result.etag = "\"" + md5_hex(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(etag_concat.data()), etag_concat.size())) +
            "-" + std::to_string(parts.size()) + "\"";
        return result;
    }

    OpResult abort_multipart(const ObjectRef& ref, const std::string& upload_id) override {
        OpResult result;
        auto staging = staging_dir(upload_id);

        std::error_code ec;
        auto removed = std::filesystem::remove_all(staging, ec);
        if (ec) {
            result.error = TransferError::make(ErrorKind::LocalIo,
                "failed to remove staging directory: " + ec.message());
            return result;
        }
        if (removed == 0) {
            result.error = no_such_upload(ref, upload_id);
            return result;
        }
        result.success = true;
        return result;
    }

    OpResult remove(const ObjectRef& ref) override {
        OpResult result;
        std::filesystem::path path;
        if (!resolve(ref, path, result.error)) return result;

        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            result.error = TransferError::make(ErrorKind::LocalIo,
                "failed to remove " + ref.uri() + ": " + ec.message());
            return result;
        }
        std::filesystem::remove(sidecar_path(ref), ec);
        if (ec) {
            log_warn("failed to remove metadata for %s: %s", ref.uri().c_str(), ec.message().c_str());
        }
        result.success = true;
        return result;
    }

    PresignResult presign_get(const ObjectRef& ref, uint32_t ttl_seconds) const override {
        PresignResult result;
        if (ttl_seconds > constants::MAX_PRESIGN_TTL_SECONDS) {
            result.error = TransferError::make(ErrorKind::MalformedRequest,
                "presign TTL " + std::to_string(ttl_seconds) + "s exceeds maximum of " +
                std::to_string(constants::MAX_PRESIGN_TTL_SECONDS) + "s");
            return result;
        }
        std::filesystem::path path;
        if (!resolve(ref, path, result.error)) return result;

        result.success = true;
        result.url = "file://" + path.string();
        return result;
    }

    std::string location(const ObjectRef& ref) const override {
        return "file://" + (root_ / ref.bucket / ref.key).string();
    }

    // Top-level directories; .meta and .uploads are not buckets
    BucketListResult list_buckets() const override {
        BucketListResult result;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
            auto name = it->path().filename().string();
            if (name.empty() || name.front() == '.') continue;
            std::error_code type_ec;
            if (it->is_directory(type_ec)) result.buckets.push_back(std::move(name));
        }
        if (ec) {
            result.error = TransferError::make(ErrorKind::LocalIo,
                "cannot list " + root_.string() + ": " + ec.message());
            result.buckets.clear();
            return result;
        }
        std::sort(result.buckets.begin(), result.buckets.end());
        result.success = true;
        return result;
    }

private:
    // Map ref to a path under root_, rejecting anything that could escape it
    bool resolve(const ObjectRef& ref, std::filesystem::path& out, TransferError& error) const {
        auto bad = [&](const std::string& why) {
            error = TransferError::make(ErrorKind::InvalidIdentifier, why + ": " + ref.uri());
            return false;
        };
        if (ref.bucket.empty() || ref.key.empty()) return bad("empty bucket or key");
        if (ref.bucket.find('/') != std::string::npos || ref.bucket.front() == '.') {
            return bad("invalid bucket name");
        }
        if (ref.key.front() == '/' || ref.key.back() == '/') return bad("invalid key");
        std::stringstream segments(ref.key);
        std::string segment;
        while (std::getline(segments, segment, '/')) {
            if (segment.empty() || segment == "." || segment == "..") {
                return bad("invalid key");
            }
        }
        out = root_ / ref.bucket / ref.key;
        return true;
    }

    std::filesystem::path staging_dir(const std::string& upload_id) const {
        return root_ / ".uploads" / upload_id;
    }

    std::filesystem::path sidecar_path(const ObjectRef& ref) const {
        return root_ / ".meta" / ref.bucket / (ref.key + ".json");
    }

    bool write_sidecar(const ObjectRef& ref, const PutOptions& options, TransferError& error) const {
        nlohmann::json meta;
        meta["content_type"] = options.content_type;
        meta["metadata"] = options.metadata;
        std::string text = meta.dump();
        return write_atomic(sidecar_path(ref),
                            std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()),
                                                     text.size()),
                            error);
    }

    void read_sidecar(const ObjectRef& ref, ObjectMetadata& metadata) const {
        std::ifstream in(sidecar_path(ref));
        if (!in) return;
        auto meta = nlohmann::json::parse(in, nullptr, false);
        if (meta.is_discarded() || !meta.is_object()) {
            log_warn("ignoring corrupt metadata for %s", ref.uri().c_str());
            return;
        }
        metadata.content_type = meta.value("content_type", metadata.content_type);
        if (meta.contains("metadata") && meta["metadata"].is_object()) {
            for (const auto& [k, v] : meta["metadata"].items()) {
                if (v.is_string()) metadata.user_metadata[k] = v.get<std::string>();
            }
        }
    }

    // Write to temp file then rename (atomic)
    static bool write_atomic(const std::filesystem::path& path,
                             std::span<const uint8_t> data,
                             TransferError& error) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            error = TransferError::make(ErrorKind::LocalIo,
                "cannot create " + path.parent_path().string() + ": " + ec.message());
            return false;
        }

        auto temp_path = path.string() + ".tmp." +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        {
            std::ofstream file(temp_path, std::ios::binary);
            if (!file) {
                error = TransferError::make(ErrorKind::LocalIo, "failed to create " + temp_path);
                return false;
            }
            file.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
            if (!file) {
                file.close();
                discard(temp_path);
                error = TransferError::make(ErrorKind::LocalIo, "failed to write " + temp_path);
                return false;
            }
        }

        std::filesystem::rename(temp_path, path, ec);
        if (ec) {
            discard(temp_path);
            error = TransferError::make(ErrorKind::LocalIo,
                "failed to rename file: " + ec.message());
            return false;
        }
        return true;
    }

    static void discard(const std::string& path) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            log_warn("failed to remove %s: %s", path.c_str(), ec.message().c_str());
        }
    }

    static TransferError not_found_or_io(const std::error_code& ec, const ObjectRef& ref) {
        if (ec == std::errc::no_such_file_or_directory) {
            auto err = TransferError::make(ErrorKind::NotFound, "object not found: " + ref.uri());
            err.provider_code = "NoSuchKey";
            return err;
        }
        return TransferError::make(ErrorKind::LocalIo, ref.uri() + ": " + ec.message());
    }

    static TransferError missing_or_unreadable(const std::filesystem::path& path, const ObjectRef& ref) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return not_found_or_io(std::make_error_code(std::errc::no_such_file_or_directory), ref);
        }
        return TransferError::make(ErrorKind::LocalIo, "cannot open " + ref.uri());
    }

    static TransferError no_such_upload(const ObjectRef& ref, const std::string& upload_id) {
        auto err = TransferError::make(ErrorKind::NotFound,
            "no such upload " + upload_id + " for " + ref.uri());
        err.provider_code = "NoSuchUpload";
        return err;
    }

    static std::string md5_hex(std::span<const uint8_t> data) {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        EVP_Digest(data.data(), data.size(), digest, &len, EVP_md5(), nullptr);

        static const char* hex = "0123456789abcdef";
        std::string out;
        out.reserve(len * 2);
        for (unsigned int i = 0; i < len; ++i) {
            out += hex[digest[i] >> 4];
            out += hex[digest[i] & 0x0f];
        }
        return out;
    }

    std::filesystem::path root_;
    std::atomic<uint64_t> next_upload_{1};
};

// ============================================================================
// ObjectStoreFactory
// ============================================================================

static bool param_flag(const std::string& value) {
    return value == "true" || value == "1";
}

static uint32_t param_u32(const std::string& name, const std::string& value) {
    try {
        size_t pos = 0;
        unsigned long v = std::stoul(value, &pos);
        if (pos == value.size() && v <= UINT32_MAX) {
            return static_cast<uint32_t>(v);
        }
    } catch (const std::logic_error&) {
        // fall through to the error below
    }
    throw std::runtime_error("Invalid value for '" + name + "': " + value);
}

std::unique_ptr<ObjectStore> ObjectStoreFactory::create(
    const std::string& type,
    const std::map<std::string, std::string>& params) {

    if (type == "local") {
        auto it = params.find("path");
        if (it == params.end() || it->second.empty()) {
            throw std::runtime_error("Local store requires 'path' config");
        }
        return create_local(it->second);
    }

    if (type == "s3") {
        S3StoreConfig s3_config;

        auto it = params.find("access_key");
        auto secret = params.find("secret_key");
        if (it == params.end() || it->second.empty() ||
            secret == params.end() || secret->second.empty()) {
            throw std::runtime_error("S3 store requires 'access_key' and 'secret_key' config");
        }
        s3_config.access_key = it->second;
        s3_config.secret_key = secret->second;

        if ((it = params.find("region")) != params.end() && !it->second.empty()) {
            s3_config.region = it->second;
        }
        if ((it = params.find("endpoint")) != params.end()) {
            s3_config.endpoint = it->second;
        }
        if ((it = params.find("session_token")) != params.end()) {
            s3_config.session_token = it->second;
        }
        if ((it = params.find("use_path_style")) != params.end()) {
            s3_config.use_path_style = param_flag(it->second);
        }
        if ((it = params.find("verify_ssl")) != params.end()) {
            s3_config.verify_ssl = param_flag(it->second);
        }
        if ((it = params.find("unsigned_payload")) != params.end()) {
            s3_config.unsigned_payload = param_flag(it->second);
        }
        if ((it = params.find("connect_timeout")) != params.end()) {
            s3_config.connect_timeout_secs = param_u32("connect_timeout", it->second);
        }
        if ((it = params.find("request_timeout")) != params.end()) {
            s3_config.request_timeout_secs = param_u32("request_timeout", it->second);
        }

        return create_s3(s3_config);
    }

    throw std::runtime_error("Unknown object store type: " + type);
}

std::unique_ptr<ObjectStore> ObjectStoreFactory::create_local(const std::filesystem::path& root) {
    return std::make_unique<LocalObjectStore>(root);
}

} // namespace mediaxfer
