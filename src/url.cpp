#include "mediaxfer/net/url.hpp"

#include <cctype>
#include <charconv>

namespace mediaxfer::net {

namespace {

constexpr char HEX_DIGITS[] = "0123456789ABCDEF";

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool parse_port(std::string_view text, uint16_t& port) {
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
    return ec == std::errc() && ptr == text.data() + text.size();
}

} // namespace

std::optional<Url> Url::parse(std::string_view text) {
    auto sep = text.find("://");
    if (sep == std::string_view::npos || sep == 0) return std::nullopt;

    Url url;
    for (char c : text.substr(0, sep)) {
        url.scheme += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    std::string_view rest = text.substr(sep + 3);
    rest = rest.substr(0, rest.find('#'));

    auto authority_end = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, authority_end);
    rest = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }
    if (authority.empty()) return std::nullopt;

    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        url.host = std::string(authority.substr(1, close - 1));
        std::string_view tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':' || !parse_port(tail.substr(1), url.port)) return std::nullopt;
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        url.host = std::string(authority.substr(0, colon));
        if (!parse_port(authority.substr(colon + 1), url.port)) return std::nullopt;
    } else {
        url.host = std::string(authority);
    }
    if (url.host.empty()) return std::nullopt;

    auto q = rest.find('?');
    url.path = std::string(rest.substr(0, q));
    if (q != std::string_view::npos) {
        url.query = std::string(rest.substr(q + 1));
    }
    return url;
}

std::string Url::authority() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    bool default_port = port == 0 || (scheme == "https" && port == 443) ||
                        (scheme == "http" && port == 80);
    return default_port ? h : h + ":" + std::to_string(port);
}

std::string percent_encode(std::string_view text, bool keep_slash) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (is_unreserved(c) || (keep_slash && c == '/')) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX_DIGITS[c >> 4];
            out += HEX_DIGITS[c & 0x0F];
        }
    }
    return out;
}

std::string percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                char c = static_cast<char>((hi << 4) | lo);
                if (c != '\0') out += c;
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

} // namespace mediaxfer::net
