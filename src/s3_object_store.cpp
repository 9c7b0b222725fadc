#include "mediaxfer/storage/object_store.hpp"
#include "mediaxfer/core/log.hpp"
#include "mediaxfer/net/http.hpp"
#include "mediaxfer/net/sigv4.hpp"
#include "mediaxfer/net/url.hpp"

#include <algorithm>
#include <string_view>
#include <vector>

namespace mediaxfer {

namespace {

std::string xml_unescape(std::string_view raw) {
    std::string out;
    static const std::pair<std::string_view, char> entities[] = {
        {"&lt;", '<'}, {"&gt;", '>'}, {"&amp;", '&'}, {"&quot;", '"'}, {"&apos;", '\''}};
    for (size_t i = 0; i < raw.size();) {
        bool replaced = false;
        if (raw[i] == '&') {
            for (const auto& [entity, c] : entities) {
                if (raw.substr(i, entity.size()) == entity) {
                    out += c;
                    i += entity.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) out += raw[i++];
    }
    return out;
}

// S3 documents are small and flat; a tag scan is enough.
// Every <tag>...</tag> in document order.
std::vector<std::string> xml_all(std::string_view doc, std::string_view tag) {
    std::string open = "<" + std::string(tag) + ">";
    std::string close = "</" + std::string(tag) + ">";
    std::vector<std::string> out;
    size_t pos = 0;
    while ((pos = doc.find(open, pos)) != std::string_view::npos) {
        pos += open.size();
        auto end = doc.find(close, pos);
        if (end == std::string_view::npos) break;
        out.push_back(xml_unescape(doc.substr(pos, end - pos)));
        pos = end + close.size();
    }
    return out;
}

std::string xml_text(std::string_view doc, std::string_view tag) {
    auto all = xml_all(doc, tag);
    return all.empty() ? "" : all.front();
}

std::string xml_escape(std::string_view s) {
    std::string out;
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string quoted(std::string etag) {
    if (etag.empty()) return etag;
    if (etag.front() != '"') etag.insert(etag.begin(), '"');
    if (etag.back() != '"' || etag.size() == 1) etag.push_back('"');
    return etag;
}

// Transport failures are Timeout or Network. Otherwise the provider code
// from the XML error body wins over the HTTP status.
TransferError classify(const net::HttpResponse& response, const std::string& what) {
    TransferError err;
    err.http_status = static_cast<int>(response.status);

    if (response.transport_failed()) {
        err.kind = response.timed_out ? ErrorKind::Timeout : ErrorKind::Network;
        err.message = what + ": " + response.transport_error;
        return err;
    }

    std::string doc = response.text();
    err.provider_code = xml_text(doc, "Code");
    if (!err.provider_code.empty()) {
        err.kind = error_kind_from_provider_code(err.provider_code);
    }
    if (err.kind == ErrorKind::None || err.kind == ErrorKind::Unknown) {
        err.kind = error_kind_from_http_status(err.http_status);
    }
    if (err.kind == ErrorKind::None) {
        err.kind = ErrorKind::Unknown;
    }

    std::string detail = xml_text(doc, "Message");
    err.message = what + ": " + (detail.empty() ? "HTTP " + std::to_string(response.status) : detail);
    return err;
}

std::span<const uint8_t> as_bytes(const std::string& s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

} // namespace

// S3 and S3-compatible stores (MinIO, Ceph RGW) over libcurl with SigV4.
class S3ObjectStore : public ObjectStore {
public:
    explicit S3ObjectStore(const S3StoreConfig& config)
        : config_(config)
        , signer_(net::AwsCredentials{config.access_key, config.secret_key, config.session_token},
                  config.region)
        , http_("mediaxfer/1.0") {
        // Credentials live in the signer only
        config_.access_key.clear();
        config_.secret_key.clear();
        config_.session_token.clear();
    }

    std::string type_name() const override { return "s3"; }

    HeadResult head(const ObjectRef& ref) const override {
        HeadResult result;
        auto response = call(prepare("HEAD", ref));
        if (!response.ok()) {
            result.error = classify(response, "HEAD " + ref.uri());
            return result;
        }

        result.success = true;
        result.metadata.size = response.content_length().value_or(0);
        result.metadata.etag = response.header("etag");
        result.metadata.content_type = response.header("content-type", constants::DEFAULT_CONTENT_TYPE);
        constexpr std::string_view meta = "x-amz-meta-";
        for (const auto& [name, value] : response.headers) {
            if (name.starts_with(meta)) {
                result.metadata.user_metadata[name.substr(meta.size())] = value;
            }
        }
        return result;
    }

    StreamResult get(const ObjectRef& ref, const ChunkSink& sink) const override {
        StreamResult result;
        auto request = prepare("GET", ref);
        request.on_body = [&](const uint8_t* data, size_t size) {
            result.bytes += size;
            return sink(data, size);
        };

        auto response = call(std::move(request));
        if (!response.ok()) {
            result.bytes = 0;
            result.error = classify(response, "GET " + ref.uri());
            return result;
        }
        result.success = true;
        return result;
    }

    GetResult get_range(const ObjectRef& ref, uint64_t start, uint64_t end) const override {
        GetResult result;
        auto request = prepare("GET", ref);
        request.range = {start, end};

        auto response = call(std::move(request));
        if (!response.ok()) {
            result.error = classify(response, "GET " + ref.uri() + " bytes=" +
                                    std::to_string(start) + "-" + std::to_string(end));
            return result;
        }
        result.success = true;
        result.data = std::move(response.body);
        return result;
    }

    PutResult put(const ObjectRef& ref, std::span<const uint8_t> data,
                  const PutOptions& options) override {
        PutResult result;
        auto request = prepare("PUT", ref);
        request.body = data;
        describe(request, options);
        unsigned_payload(request);

        auto response = call(std::move(request));
        if (!response.ok()) {
            result.error = classify(response, "PUT " + ref.uri());
            return result;
        }
        result.success = true;
        result.etag = response.header("etag");
        return result;
    }

    MultipartResult create_multipart(const ObjectRef& ref, const PutOptions& options) override {
        MultipartResult result;
        auto request = prepare("POST", ref, "uploads");
        describe(request, options);

        auto response = call(std::move(request));
        if (!response.ok()) {
            result.error = classify(response, "CreateMultipartUpload " + ref.uri());
            return result;
        }
        result.upload_id = xml_text(response.text(), "UploadId");
        if (result.upload_id.empty()) {
            result.error = TransferError::make(ErrorKind::Unknown,
                "CreateMultipartUpload " + ref.uri() + ": response has no UploadId");
            return result;
        }
        result.success = true;
        return result;
    }

    PutResult upload_part(const ObjectRef& ref, const std::string& upload_id,
                          uint32_t part_number, std::span<const uint8_t> data) override {
        PutResult result;
        std::string what = "UploadPart " + std::to_string(part_number) + " " + ref.uri();
        auto request = prepare("PUT", ref, "partNumber=" + std::to_string(part_number) +
                                           "&uploadId=" + net::percent_encode(upload_id));
        request.body = data;
        unsigned_payload(request);

        auto response = call(std::move(request));
        if (!response.ok()) {
            result.error = classify(response, what);
            return result;
        }
        // CompleteMultipartUpload wants the quoted form
        result.etag = quoted(response.header("etag"));
        if (result.etag.empty()) {
            result.error = TransferError::make(ErrorKind::Unknown, what + ": response has no ETag");
            return result;
        }
        result.success = true;
        return result;
    }

    PutResult complete_multipart(const ObjectRef& ref, const std::string& upload_id,
                                 const std::vector<CompletedPart>& parts) override {
        PutResult result;
        std::string doc = "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">";
        for (const auto& part : parts) {
            doc += "<Part><PartNumber>" + std::to_string(part.number) + "</PartNumber><ETag>" +
                   xml_escape(part.etag) + "</ETag></Part>";
        }
        doc += "</CompleteMultipartUpload>";

        auto request = prepare("POST", ref, "uploadId=" + net::percent_encode(upload_id));
        request.body = as_bytes(doc);
        request.set_header("content-type", "application/xml");

        auto response = call(std::move(request));
        std::string what = "CompleteMultipartUpload " + ref.uri();
        std::string text = response.text();

        // A completion can fail after S3 has already sent 200 OK
        if (!response.ok() || text.find("<Error>") != std::string::npos) {
            result.error = classify(response, what);
            if (response.ok() && result.error.kind == ErrorKind::Unknown) {
                result.error.kind = ErrorKind::ServerError;
            }
            return result;
        }
        result.success = true;
        result.etag = quoted(xml_text(text, "ETag"));
        return result;
    }

    OpResult abort_multipart(const ObjectRef& ref, const std::string& upload_id) override {
        OpResult result;
        auto response = call(prepare("DELETE", ref, "uploadId=" + net::percent_encode(upload_id)));
        if (!response.ok()) {
            result.error = classify(response, "AbortMultipartUpload " + ref.uri());
            return result;
        }
        result.success = true;
        return result;
    }

    OpResult remove(const ObjectRef& ref) override {
        OpResult result;
        auto response = call(prepare("DELETE", ref));
        if (!response.ok()) {
            auto err = classify(response, "DELETE " + ref.uri());
            // A missing key is already deleted; a missing bucket is not
            if (err.kind != ErrorKind::NotFound || err.provider_code == "NoSuchBucket") {
                result.error = err;
                return result;
            }
        }
        result.success = true;
        return result;
    }

    PresignResult presign_get(const ObjectRef& ref, uint32_t ttl_seconds) const override {
        PresignResult result;
        if (ttl_seconds == 0) ttl_seconds = constants::DEFAULT_PRESIGN_TTL_SECONDS;
        if (ttl_seconds > constants::MAX_PRESIGN_TTL_SECONDS) {
            result.error = TransferError::make(ErrorKind::MalformedRequest,
                "presign TTL " + std::to_string(ttl_seconds) + "s exceeds maximum of " +
                std::to_string(constants::MAX_PRESIGN_TTL_SECONDS) + "s");
            return result;
        }

        result.url = signer_.presign(location(ref), ttl_seconds);
        if (result.url.empty()) {
            result.error = TransferError::make(ErrorKind::InvalidIdentifier,
                                               "cannot presign " + ref.uri());
            return result;
        }
        result.success = true;
        return result;
    }

    std::string location(const ObjectRef& ref) const override {
        std::string key = net::percent_encode(ref.key, true);

        if (config_.endpoint.empty()) {
            if (config_.use_path_style) {
                return "https://s3." + config_.region + ".amazonaws.com/" + ref.bucket + "/" + key;
            }
            return "https://" + ref.bucket + ".s3." + config_.region + ".amazonaws.com/" + key;
        }

        std::string endpoint = config_.endpoint;
        while (!endpoint.empty() && endpoint.back() == '/') endpoint.pop_back();
        auto parsed = net::Url::parse(endpoint);
        if (config_.use_path_style || !parsed) {
            return endpoint + "/" + ref.bucket + "/" + key;
        }
        return parsed->scheme + "://" + ref.bucket + "." + parsed->authority() + parsed->path + "/" + key;
    }

    // GET on the service root (ListBuckets)
    BucketListResult list_buckets() const override {
        BucketListResult result;
        net::HttpRequest request;
        request.method = "GET";
        request.url = service_root();
        request.connect_timeout_ms = static_cast<long>(config_.connect_timeout_secs) * 1000;
        request.timeout_ms = static_cast<long>(config_.request_timeout_secs) * 1000;
        request.verify_tls = config_.verify_ssl;

        auto response = call(std::move(request));
        if (!response.ok()) {
            result.error = classify(response, "ListBuckets");
            return result;
        }
        // Bucket names are the only <Name> elements in the document
        result.buckets = xml_all(response.text(), "Name");
        std::sort(result.buckets.begin(), result.buckets.end());
        result.success = true;
        return result;
    }

private:
    std::string service_root() const {
        if (config_.endpoint.empty()) {
            return "https://s3." + config_.region + ".amazonaws.com/";
        }
        std::string endpoint = config_.endpoint;
        while (!endpoint.empty() && endpoint.back() == '/') endpoint.pop_back();
        return endpoint + "/";
    }

    net::HttpRequest prepare(const std::string& method, const ObjectRef& ref,
                             const std::string& query = "") const {
        net::HttpRequest request;
        request.method = method;
        request.url = location(ref);
        if (!query.empty()) request.url += "?" + query;
        request.connect_timeout_ms = static_cast<long>(config_.connect_timeout_secs) * 1000;
        request.timeout_ms = static_cast<long>(config_.request_timeout_secs) * 1000;
        request.verify_tls = config_.verify_ssl;
        return request;
    }

    net::HttpResponse call(net::HttpRequest request) const {
        if (!signer_.sign(request)) {
            net::HttpResponse response;
            response.status = 400;
            log_error("S3: cannot sign request for %s", request.url.c_str());
            return response;
        }
        return http_.perform(request);
    }

    static void describe(net::HttpRequest& request, const PutOptions& options) {
        request.set_header("content-type", options.content_type.empty()
            ? std::string(constants::DEFAULT_CONTENT_TYPE) : options.content_type);
        for (const auto& [name, value] : options.metadata) {
            request.set_header("x-amz-meta-" + name, value);
        }
    }

    void unsigned_payload(net::HttpRequest& request) const {
        if (config_.unsigned_payload) {
            request.set_header("x-amz-content-sha256", "UNSIGNED-PAYLOAD");
        }
    }

    S3StoreConfig config_;
    net::SigV4Signer signer_;
    net::HttpClient http_;
};

std::unique_ptr<ObjectStore> ObjectStoreFactory::create_s3(const S3StoreConfig& config) {
    return std::make_unique<S3ObjectStore>(config);
}

} // namespace mediaxfer
