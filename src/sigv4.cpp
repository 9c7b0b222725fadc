#include "mediaxfer/net/sigv4.hpp"
#include "mediaxfer/net/url.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <ctime>
#include <map>
#include <string_view>
#include <vector>

namespace mediaxfer::net {

namespace {

constexpr const char* ALGORITHM = "AWS4-HMAC-SHA256";

std::string hex(const unsigned char* data, size_t len) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

std::string sha256_hex(std::string_view data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
    return hex(digest, sizeof(digest));
}

std::string hmac(std::string_view key, std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &len);
    return std::string(reinterpret_cast<const char*>(digest), len);
}

// "YYYYMMDDTHHMMSSZ"
std::string amz_date(SigV4Signer::Clock::time_point now) {
    std::time_t t = SigV4Signer::Clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[17];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

// Parameters arrive already encoded. Sorted by name; a bare name gets an
// empty value ("uploads" signs as "uploads=").
std::string canonical_query(const std::string& query) {
    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string_view param(query.data() + pos, amp - pos);
        if (!param.empty()) {
            auto eq = param.find('=');
            if (eq == std::string_view::npos) {
                params[std::string(param)] = "";
            } else {
                params[std::string(param.substr(0, eq))] = std::string(param.substr(eq + 1));
            }
        }
        pos = amp + 1;
    }

    std::string out;
    for (const auto& [name, value] : params) {
        if (!out.empty()) out += '&';
        out += name + "=" + value;
    }
    return out;
}

} // namespace

SigV4Signer::SigV4Signer(AwsCredentials credentials, std::string region, std::string service)
    : credentials_(std::move(credentials))
    , region_(std::move(region))
    , service_(std::move(service)) {}

std::string SigV4Signer::scope(const std::string& date) const {
    return date + "/" + region_ + "/" + service_ + "/aws4_request";
}

std::string SigV4Signer::signature(const std::string& date, const std::string& timestamp,
                                   const std::string& canonical_request) const {
    std::string string_to_sign = std::string(ALGORITHM) + "\n" + timestamp + "\n" +
                                 scope(date) + "\n" + sha256_hex(canonical_request);

    std::string key = hmac("AWS4" + credentials_.secret_key, date);
    key = hmac(key, region_);
    key = hmac(key, service_);
    key = hmac(key, "aws4_request");

    std::string sig = hmac(key, string_to_sign);
    return hex(reinterpret_cast<const unsigned char*>(sig.data()), sig.size());
}

bool SigV4Signer::sign(HttpRequest& request, Clock::time_point now) const {
    auto url = Url::parse(request.url);
    if (!url) return false;

    std::string timestamp = amz_date(now);
    std::string date = timestamp.substr(0, 8);

    request.headers.erase("authorization");
    request.set_header("host", url->authority());
    request.set_header("x-amz-date", timestamp);
    if (!credentials_.session_token.empty()) {
        request.set_header("x-amz-security-token", credentials_.session_token);
    }

    auto preset = request.headers.find("x-amz-content-sha256");
    if (preset == request.headers.end() || preset->second.empty()) {
        std::string_view body(reinterpret_cast<const char*>(request.body.data()), request.body.size());
        request.set_header("x-amz-content-sha256", sha256_hex(body));
    }

    // HeaderMap is keyed by lowercase name, so iteration is canonical order
    std::string canonical_headers;
    std::string signed_headers;
    for (const auto& [name, value] : request.headers) {
        canonical_headers += name + ":" + value + "\n";
        if (!signed_headers.empty()) signed_headers += ';';
        signed_headers += name;
    }

    std::string canonical_request =
        request.method + "\n" +
        (url->path.empty() ? "/" : url->path) + "\n" +
        canonical_query(url->query) + "\n" +
        canonical_headers + "\n" +
        signed_headers + "\n" +
        request.headers["x-amz-content-sha256"];

    request.set_header("authorization",
        std::string(ALGORITHM) + " Credential=" + credentials_.access_key + "/" + scope(date) +
        ", SignedHeaders=" + signed_headers +
        ", Signature=" + signature(date, timestamp, canonical_request));
    return true;
}

std::string SigV4Signer::presign(const std::string& url, uint32_t expires_seconds,
                                 Clock::time_point now) const {
    auto parsed = Url::parse(url);
    if (!parsed) return "";

    std::string timestamp = amz_date(now);
    std::string date = timestamp.substr(0, 8);

    std::string query = parsed->query;
    auto add = [&query](const std::string& name, const std::string& value) {
        if (!query.empty()) query += '&';
        query += name + "=" + percent_encode(value);
    };
    add("X-Amz-Algorithm", ALGORITHM);
    add("X-Amz-Credential", credentials_.access_key + "/" + scope(date));
    add("X-Amz-Date", timestamp);
    add("X-Amz-Expires", std::to_string(expires_seconds));
    if (!credentials_.session_token.empty()) {
        add("X-Amz-Security-Token", credentials_.session_token);
    }
    add("X-Amz-SignedHeaders", "host");

    std::string canonical_request =
        "GET\n" +
        (parsed->path.empty() ? std::string("/") : parsed->path) + "\n" +
        canonical_query(query) + "\n" +
        "host:" + parsed->authority() + "\n\n" +
        "host\n" +
        "UNSIGNED-PAYLOAD";

    std::string base = url.substr(0, url.find_first_of("?#"));
    return base + "?" + query + "&X-Amz-Signature=" + signature(date, timestamp, canonical_request);
}

} // namespace mediaxfer::net
