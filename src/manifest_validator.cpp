#include "mediaxfer/integrity/manifest_validator.hpp"
#include "mediaxfer/core/log.hpp"
#include "mediaxfer/net/url.hpp"
#include "mediaxfer/transfer/transfer_engine.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace mediaxfer {

namespace {

constexpr const char* STREAM_INF_TAG = "#EXT-X-STREAM-INF";
constexpr const char* EXTINF_TAG = "#EXTINF:";

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

// Attribute list: KEY=VALUE pairs separated by commas; quoted values may
// contain commas (CODECS="avc1.64001f,mp4a.40.2")
std::vector<std::pair<std::string, std::string>> parse_attributes(const std::string& list) {
    std::vector<std::pair<std::string, std::string>> attrs;
    size_t i = 0;
    while (i < list.size()) {
        size_t eq = list.find('=', i);
        if (eq == std::string::npos) break;
        std::string name = trim(list.substr(i, eq - i));

        size_t j = eq + 1;
        std::string value;
        if (j < list.size() && list[j] == '"') {
            size_t close = list.find('"', j + 1);
            if (close == std::string::npos) close = list.size();
            value = list.substr(j + 1, close - j - 1);
            j = close + 1;
            size_t comma = list.find(',', j);
            j = comma == std::string::npos ? list.size() : comma + 1;
        } else {
            size_t comma = list.find(',', j);
            size_t stop = comma == std::string::npos ? list.size() : comma;
            value = trim(list.substr(j, stop - j));
            j = comma == std::string::npos ? list.size() : comma + 1;
        }
        attrs.emplace_back(std::move(name), std::move(value));
        i = j;
    }
    return attrs;
}

std::optional<uint64_t> parse_u64(const std::string& s) {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

uint64_t variant_bandwidth(const std::string& attribute_list) {
    std::optional<uint64_t> bandwidth;
    std::optional<uint64_t> average;
    for (const auto& [name, value] : parse_attributes(attribute_list)) {
        if (name == "BANDWIDTH") bandwidth = parse_u64(value);
        else if (name == "AVERAGE-BANDWIDTH") average = parse_u64(value);
    }
    if (bandwidth) return *bandwidth;
    if (average) return *average;
    return 0;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(trim(line));
    }
    return lines;
}

ManifestCheckResult failure(const char* code, std::string message, nlohmann::json details) {
    ManifestCheckResult r;
    r.code = code;
    r.message = std::move(message);
    r.details = std::move(details);
    return r;
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

std::vector<ManifestVariant> parse_master_manifest(const std::string& text) {
    std::vector<ManifestVariant> variants;
    std::optional<uint64_t> pending;

    for (const auto& line : split_lines(text)) {
        if (line.empty()) continue;
        if (starts_with(line, STREAM_INF_TAG)) {
            size_t colon = line.find(':');
            pending = variant_bandwidth(colon == std::string::npos ? "" : line.substr(colon + 1));
            continue;
        }
        if (line[0] == '#') continue;
        if (pending) {
            variants.push_back({*pending, line});
            pending.reset();
        }
    }
    return variants;
}

const ManifestVariant* select_best_variant(const std::vector<ManifestVariant>& variants) {
    const ManifestVariant* best = nullptr;
    for (const auto& v : variants) {
        if (!best || v.bandwidth > best->bandwidth) {
            best = &v;
        }
    }
    return best;
}

std::optional<ObjectRef> resolve_variant_ref(const ObjectRef& master, const std::string& uri) {
    if (uri.empty()) return std::nullopt;
    if (uri.find("://") != std::string::npos) {
        return ObjectRef::from_url(uri);
    }

    std::string path = uri.substr(0, uri.find_first_of("?#"));
    std::string joined;
    if (!path.empty() && path[0] == '/') {
        joined = path;
    } else {
        size_t slash = master.key.rfind('/');
        joined = (slash == std::string::npos ? "" : master.key.substr(0, slash + 1)) + path;
    }

    std::vector<std::string> segments;
    std::istringstream in(joined);
    std::string seg;
    while (std::getline(in, seg, '/')) {
        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            if (segments.empty()) return std::nullopt;
            segments.pop_back();
            continue;
        }
        segments.push_back(net::percent_decode(seg));
    }
    if (segments.empty()) return std::nullopt;

    ObjectRef ref;
    ref.bucket = master.bucket;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) ref.key += '/';
        ref.key += segments[i];
    }
    return ref;
}

std::vector<double> parse_extinf_durations(const std::string& media_playlist) {
    std::vector<double> durations;
    for (const auto& line : split_lines(media_playlist)) {
        if (!starts_with(line, EXTINF_TAG)) continue;
        std::string value = line.substr(std::strlen(EXTINF_TAG));
        value = value.substr(0, value.find(','));

        const char* begin = value.c_str();
        char* end = nullptr;
        double d = std::strtod(begin, &end);
        if (end == begin || !std::isfinite(d)) {
            log_debug("skipping unparseable EXTINF value '%s'", value.c_str());
            continue;
        }
        durations.push_back(d);
    }
    return durations;
}

int64_t sum_extinf(const std::vector<double>& durations) {
    double total = 0.0;
    for (double d : durations) {
        total += d;
    }
    return std::llround(total);
}

int64_t sum_extinf(const std::string& media_playlist) {
    return sum_extinf(parse_extinf_durations(media_playlist));
}

// ============================================================================
// ManifestValidator
// ============================================================================

ManifestCheckResult ManifestValidator::fetch_variants(const ObjectRef& master,
                                                      std::vector<ManifestVariant>& variants) {
    auto text = engine_.read_text(master);
    if (!text.success) {
        return failure("MANIFEST_FETCH_FAILED",
                       "Failed to fetch master manifest " + master.uri() + ": " + text.error.describe(),
                       {{"master", master.uri()}, {"error", text.error.describe()}});
    }

    variants = parse_master_manifest(text.text);
    if (variants.empty()) {
        return failure("MANIFEST_NO_VARIANTS",
                       "Master manifest has no variants: " + master.uri(),
                       {{"master", master.uri()}});
    }

    ManifestCheckResult ok;
    ok.passed = true;
    ok.variant_count = variants.size();
    ok.details = {{"master", master.uri()}, {"variantCount", variants.size()}};
    return ok;
}

ManifestCheckResult ManifestValidator::inspect_master(const ObjectRef& master) {
    std::vector<ManifestVariant> variants;
    return fetch_variants(master, variants);
}

ManifestCheckResult ManifestValidator::validate(const ObjectRef& master,
                                                int64_t recorded_duration_ms,
                                                double tolerance_seconds) {
    std::vector<ManifestVariant> variants;
    auto result = fetch_variants(master, variants);
    if (!result.passed) {
        return result;
    }

    const ManifestVariant* best = select_best_variant(variants);
    auto media = resolve_variant_ref(master, best->uri);
    if (!media) {
        result = failure("MANIFEST_VARIANT_UNRESOLVABLE",
                         "Cannot resolve variant '" + best->uri + "' of " + master.uri(),
                         {{"master", master.uri()}, {"variant", best->uri}});
        result.variant_count = variants.size();
        return result;
    }

    auto playlist = engine_.read_text(*media);
    if (!playlist.success) {
        result = failure("MEDIA_PLAYLIST_FETCH_FAILED",
                         "Failed to fetch media playlist " + media->uri() + ": " +
                             playlist.error.describe(),
                         {{"master", master.uri()}, {"playlist", media->uri()},
                          {"error", playlist.error.describe()}});
        result.variant_count = variants.size();
        return result;
    }

    const int64_t manifest_seconds = sum_extinf(playlist.text);
    const int64_t recorded_seconds = std::llround(static_cast<double>(recorded_duration_ms) / 1000.0);
    const int64_t diff = manifest_seconds - recorded_seconds;

    nlohmann::json details = {
        {"master", master.uri()},
        {"playlist", media->uri()},
        {"bandwidth", best->bandwidth},
        {"manifestSeconds", manifest_seconds},
        {"recordedSeconds", recorded_seconds},
        {"diffSeconds", diff},
        {"toleranceSeconds", tolerance_seconds},
    };

    if (static_cast<double>(std::llabs(diff)) > tolerance_seconds) {
        result = failure("DURATION_MISMATCH",
                         "Manifest duration " + std::to_string(manifest_seconds) +
                             "s differs from recorded " + std::to_string(recorded_seconds) +
                             "s by " + std::to_string(diff) + "s",
                         std::move(details));
    } else {
        result.passed = true;
        result.details = std::move(details);
    }
    result.variant_count = variants.size();
    result.manifest_seconds = manifest_seconds;
    result.recorded_seconds = recorded_seconds;
    return result;
}

} // namespace mediaxfer
