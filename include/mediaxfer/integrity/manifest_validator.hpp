#pragma once

#include "mediaxfer/storage/object_store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mediaxfer {

class TransferEngine;

// ============================================================================
// HLS parsing
// ============================================================================

struct ManifestVariant {
    uint64_t bandwidth = 0;
    std::string uri;   // absolute URL or path relative to the master
};

/// Each #EXT-X-STREAM-INF line is paired with the next line that is neither
/// blank nor a comment. BANDWIDTH is used, then AVERAGE-BANDWIDTH, else 0.
/// A declaration with no following URI is dropped.
std::vector<ManifestVariant> parse_master_manifest(const std::string& text);

/// Highest bandwidth; ties keep the first declared. nullptr if empty.
const ManifestVariant* select_best_variant(const std::vector<ManifestVariant>& variants);

/// Absolute URIs are mapped with ObjectRef::from_url. Relative URIs are
/// joined to the directory of the master's key with "." and ".." resolved;
/// a path that climbs above the bucket root is unresolvable.
std::optional<ObjectRef> resolve_variant_ref(const ObjectRef& master, const std::string& uri);

/// Values of every #EXTINF tag, in order. Unparseable values are skipped.
std::vector<double> parse_extinf_durations(const std::string& media_playlist);

/// Sum in floating point, then round the total once to whole seconds.
int64_t sum_extinf(const std::vector<double>& durations);
int64_t sum_extinf(const std::string& media_playlist);

// ============================================================================
// ManifestValidator
// ============================================================================

struct ManifestCheckResult {
    bool passed = false;
    std::string code;             // empty when passed
    std::string message;
    nlohmann::json details = nlohmann::json::object();
    size_t variant_count = 0;
    int64_t manifest_seconds = 0;
    int64_t recorded_seconds = 0;
};

/// Reconciles the duration of a published HLS rendition with the duration
/// recorded for the episode. Fetches go through TransferEngine::read_text,
/// so they are governed and retried. Failures come back as result codes:
/// MANIFEST_FETCH_FAILED, MANIFEST_NO_VARIANTS, MANIFEST_VARIANT_UNRESOLVABLE,
/// MEDIA_PLAYLIST_FETCH_FAILED, DURATION_MISMATCH.
class ManifestValidator {
public:
    explicit ManifestValidator(TransferEngine& engine) : engine_(engine) {}

    ManifestCheckResult validate(const ObjectRef& master,
                                 int64_t recorded_duration_ms,
                                 double tolerance_seconds);

    /// Master fetch and variant parse only (no duration check).
    ManifestCheckResult inspect_master(const ObjectRef& master);

private:
    ManifestCheckResult fetch_variants(const ObjectRef& master,
                                       std::vector<ManifestVariant>& variants);

    TransferEngine& engine_;
};

} // namespace mediaxfer
