#pragma once

#include "mediaxfer/core/constants.hpp"
#include "mediaxfer/core/metrics.hpp"
#include "mediaxfer/integrity/metadata_store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mediaxfer {

class ConcurrencyGovernor;
class TransferEngine;

enum class IssueSeverity {
    Error,
    Warn
};

const char* issue_severity_name(IssueSeverity severity);

struct IntegrityIssue {
    std::string episode_id;
    IssueSeverity severity = IssueSeverity::Error;
    std::string code;
    std::string message;
    std::optional<nlohmann::json> details;
};

struct IntegritySummary {
    size_t scanned = 0;
    size_t ok = 0;
    size_t warnings = 0;
    size_t errors = 0;
    std::vector<IntegrityIssue> issues;
    std::string started_at;
    std::string finished_at;
    int64_t duration_ms = 0;

    /// {scanned, ok, warnings, errors, issues[{episodeId, severity, code,
    /// message, details?}], startedAt, finishedAt, durationMs}
    nlohmann::json to_json() const;
};

struct ScanOptions {
    size_t limit = constants::DEFAULT_SCAN_LIMIT;
    std::optional<std::string> created_after;       // ISO-8601 lower bound
    std::vector<std::string> required_keys;

    bool check_core_fields = true;
    bool check_required_keys = true;
    bool enforce_video_with_master = true;
    bool check_duration = true;
    bool check_processing_flags = true;

    /// Existence check for every referenced URL (network I/O per record)
    bool verify_objects = false;
    /// Set to enable the manifest duration reconciliation
    std::optional<double> duration_tolerance_seconds;
    size_t deep_check_concurrency = constants::DEFAULT_DEEP_CHECK_CONCURRENCY;
};

/// Rules that look only at the record (no I/O), in rule order.
std::vector<IntegrityIssue> check_record(const EpisodeRecord& record, const ScanOptions& options);

/// URLs referenced by the record: values starting with "http" or "s3://"
/// from the URL columns and the known additional-data keys, arrays
/// flattened, duplicates removed in first-seen order.
std::vector<std::string> extract_urls(const EpisodeRecord& record);

/// "ok" count: scanned minus distinct (episode, code) pairs, never negative.
size_t count_ok(size_t scanned, const std::vector<IntegrityIssue>& issues);

/// Batch consistency sweep over the most recent metadata records.
///
/// Record rules never abort the scan; the summary is always returned.
/// Only MetadataStoreUnavailable escapes scan(). Deep checks need a
/// TransferEngine; without one they are skipped with a warning.
class IntegrityScanner {
public:
    IntegrityScanner(MetadataStore& store,
                     ConcurrencyGovernor& governor,
                     TransferEngine* engine = nullptr,
                     MetricsSink* metrics = nullptr,
                     std::string environment = "development");

    IntegritySummary scan(const ScanOptions& options);

private:
    std::vector<IntegrityIssue> deep_check(const EpisodeRecord& record, const ScanOptions& options);
    std::vector<IntegrityIssue> check_manifest(const EpisodeRecord& record, double tolerance);
    void emit(const char* name, double value);
    void log_outcome(const IntegritySummary& summary);

    MetadataStore& store_;
    ConcurrencyGovernor& governor_;
    TransferEngine* engine_;
    MetricsSink* metrics_;
    std::string environment_;
};

} // namespace mediaxfer
