#include "mediaxfer/net/http.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <string_view>

namespace mediaxfer::net {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string HttpResponse::header(const std::string& name, const std::string& fallback) const {
    auto it = headers.find(lowercase(name));
    return it == headers.end() ? fallback : it->second;
}

std::optional<uint64_t> HttpResponse::content_length() const {
    auto it = headers.find("content-length");
    if (it == headers.end()) return std::nullopt;
    uint64_t value = 0;
    const auto& s = it->second;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

namespace {

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

// Per-request state shared with the curl callbacks
struct Exchange {
    CURL* handle = nullptr;
    const HttpRequest* request = nullptr;
    HttpResponse* response = nullptr;

    size_t upload_offset = 0;
    bool status_checked = false;
    bool streaming = false;
    bool sink_rejected = false;
};

size_t on_header(char* buffer, size_t size, size_t count, void* userdata) {
    auto* ex = static_cast<Exchange*>(userdata);
    size_t n = size * count;
    std::string_view line(buffer, n);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    // Each status line (100-continue, redirects) starts a new header block
    if (line.starts_with("HTTP/")) {
        ex->response->headers.clear();
        return n;
    }
    auto colon = line.find(':');
    if (colon == std::string_view::npos) return n;

    std::string_view value = line.substr(colon + 1);
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    ex->response->headers[lowercase(std::string(line.substr(0, colon)))] = std::string(value);
    return n;
}

size_t on_body(char* data, size_t size, size_t count, void* userdata) {
    auto* ex = static_cast<Exchange*>(userdata);
    size_t n = size * count;

    // Decide once, on the first chunk: only success bodies go to the
    // sink, error bodies are kept for the XML error document
    if (!ex->status_checked) {
        ex->status_checked = true;
        long status = 0;
        curl_easy_getinfo(ex->handle, CURLINFO_RESPONSE_CODE, &status);
        ex->streaming = ex->request->on_body && status >= 200 && status < 300;
    }

    auto* bytes = reinterpret_cast<const uint8_t*>(data);
    if (ex->streaming) {
        if (!ex->request->on_body(bytes, n)) {
            ex->sink_rejected = true;
            return 0;
        }
        return n;
    }
    ex->response->body.insert(ex->response->body.end(), bytes, bytes + n);
    return n;
}

size_t on_upload(char* buffer, size_t size, size_t count, void* userdata) {
    auto* ex = static_cast<Exchange*>(userdata);
    const auto& body = ex->request->body;
    size_t n = std::min(size * count, body.size() - ex->upload_offset);
    if (n > 0) {
        std::memcpy(buffer, body.data() + ex->upload_offset, n);
        ex->upload_offset += n;
    }
    return n;
}

} // namespace

HttpClient::HttpClient(std::string user_agent, size_t max_idle_handles)
    : user_agent_(std::move(user_agent)), max_idle_handles_(max_idle_handles) {
    static std::once_flag init;
    std::call_once(init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpClient::~HttpClient() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (CURL* handle : idle_) {
        curl_easy_cleanup(handle);
    }
}

CURL* HttpClient::checkout() const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_.empty()) {
            CURL* handle = idle_.back();
            idle_.pop_back();
            return handle;
        }
    }
    return curl_easy_init();
}

void HttpClient::checkin(CURL* handle) const {
    curl_easy_reset(handle);
    std::lock_guard<std::mutex> lock(mutex_);
    if (idle_.size() < max_idle_handles_) {
        idle_.push_back(handle);
    } else {
        curl_easy_cleanup(handle);
    }
}

HttpResponse HttpClient::perform(const HttpRequest& request) const {
    HttpResponse response;

    CURL* curl = checkout();
    if (!curl) {
        response.transport_error = "curl_easy_init failed";
        return response;
    }

    Exchange ex;
    ex.handle = curl;
    ex.request = &request;
    ex.response = &response;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, request.connect_timeout_ms);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, request.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, request.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, request.verify_tls ? 2L : 0L);
    if (!user_agent_.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    }

    const auto& method = request.method;
    if (method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else if (method == "PUT") {
        // Length is always explicit, zero included, or S3 answers 411
        curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(curl, CURLOPT_READFUNCTION, on_upload);
        curl_easy_setopt(curl, CURLOPT_READDATA, &ex);
        curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
    } else if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
    } else if (method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    SlistPtr headers;
    auto append = [&headers](const std::string& line) {
        curl_slist* next = curl_slist_append(headers.get(), line.c_str());
        if (next) {
            headers.release();
            headers.reset(next);
        }
    };
    for (const auto& [name, value] : request.headers) {
        append(name + ": " + value);
    }
    append("Expect:");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());

    std::string range;
    if (request.range) {
        range = std::to_string(request.range->first) + "-" + std::to_string(request.range->second);
        curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ex);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ex);

    CURLcode rc = curl_easy_perform(curl);
    if (rc == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    } else if (ex.sink_rejected) {
        response.transport_error = "response body rejected by sink";
    } else {
        response.transport_error = curl_easy_strerror(rc);
        response.timed_out = rc == CURLE_OPERATION_TIMEDOUT;
    }

    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
    checkin(curl);
    return response;
}

} // namespace mediaxfer::net
