#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mediaxfer::net {

// scheme://host[:port]/path?query, the pieces an object-store request needs.
// Userinfo and fragments are discarded.
struct Url {
    std::string scheme;  // lowercased
    std::string host;    // without IPv6 brackets
    uint16_t port = 0;   // 0 when the URL names none
    std::string path;    // starts with '/' or is empty
    std::string query;   // raw, without '?'

    static std::optional<Url> parse(std::string_view text);

    // host[:port] for the Host header; default ports are omitted
    std::string authority() const;
};

// RFC 3986 percent-encoding of everything but unreserved characters.
// With keep_slash, '/' passes through (object keys used as paths).
std::string percent_encode(std::string_view text, bool keep_slash = false);

// Invalid escapes are kept literally, "%00" is dropped.
std::string percent_decode(std::string_view text);

} // namespace mediaxfer::net
