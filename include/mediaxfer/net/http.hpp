#pragma once

#include <curl/curl.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace mediaxfer::net {

// Header names are stored lowercased, which is also the order SigV4
// signs them in.
using HeaderMap = std::map<std::string, std::string>;

std::string lowercase(std::string s);

struct HttpRequest {
    std::string method = "GET";  // GET, HEAD, PUT, POST or DELETE
    std::string url;
    HeaderMap headers;

    // Not owned; must outlive perform()
    std::span<const uint8_t> body;

    // Inclusive byte range
    std::optional<std::pair<uint64_t, uint64_t>> range;

    // A 2xx body is handed here chunk by chunk instead of buffered.
    // Returning false aborts the transfer.
    std::function<bool(const uint8_t*, size_t)> on_body;

    long connect_timeout_ms = 10000;
    long timeout_ms = 120000;
    bool verify_tls = true;

    void set_header(const std::string& name, const std::string& value) {
        headers[lowercase(name)] = value;
    }
};

struct HttpResponse {
    long status = 0;
    HeaderMap headers;
    std::vector<uint8_t> body;

    // Set when no HTTP status was received
    std::string transport_error;
    bool timed_out = false;

    bool ok() const { return status >= 200 && status < 300; }
    bool transport_failed() const { return !transport_error.empty(); }

    std::string header(const std::string& name, const std::string& fallback = "") const;
    std::optional<uint64_t> content_length() const;
    std::string text() const { return std::string(body.begin(), body.end()); }
};

// Blocking libcurl client. Easy handles are reused across requests so
// connections stay warm; perform() may be called from any thread.
class HttpClient {
public:
    explicit HttpClient(std::string user_agent, size_t max_idle_handles = 32);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse perform(const HttpRequest& request) const;

private:
    CURL* checkout() const;
    void checkin(CURL* handle) const;

    std::string user_agent_;
    size_t max_idle_handles_;

    mutable std::mutex mutex_;
    mutable std::vector<CURL*> idle_;
};

} // namespace mediaxfer::net
