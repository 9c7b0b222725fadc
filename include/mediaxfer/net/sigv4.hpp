#pragma once

#include "mediaxfer/net/http.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace mediaxfer::net {

struct AwsCredentials {
    std::string access_key;
    std::string secret_key;
    std::string session_token;  // STS only
};

// AWS Signature Version 4 for a single region/service pair.
class SigV4Signer {
public:
    using Clock = std::chrono::system_clock;

    SigV4Signer(AwsCredentials credentials, std::string region, std::string service = "s3");

    // Adds host, x-amz-date, x-amz-content-sha256 (unless preset, e.g.
    // UNSIGNED-PAYLOAD), x-amz-security-token and authorization headers.
    // Returns false if the request URL cannot be parsed.
    bool sign(HttpRequest& request, Clock::time_point now = Clock::now()) const;

    // Query-string signed GET URL; empty if url cannot be parsed
    std::string presign(const std::string& url, uint32_t expires_seconds,
                        Clock::time_point now = Clock::now()) const;

private:
    std::string scope(const std::string& date) const;
    std::string signature(const std::string& date, const std::string& amz_date,
                          const std::string& canonical_request) const;

    AwsCredentials credentials_;
    std::string region_;
    std::string service_;
};

} // namespace mediaxfer::net
