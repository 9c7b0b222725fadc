#include "mediaxfer/integrity/integrity_scanner.hpp"
#include "mediaxfer/core/errors.hpp"
#include "mediaxfer/core/log.hpp"
#include "mediaxfer/integrity/manifest_validator.hpp"
#include "mediaxfer/transfer/concurrency_governor.hpp"
#include "mediaxfer/transfer/transfer_engine.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <unordered_set>
#include <utility>

namespace mediaxfer {

namespace {

constexpr const char* URL_ADDITIONAL_KEYS[] = {
    "videoLocation", "master_m3u8", "thumbnail", "hlsMaster", "hls_master"};

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

// Present with a value that is not null and not a blank string
bool has_value(const nlohmann::json& data, const std::string& key) {
    if (!data.is_object()) return false;
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) return false;
    if (it->is_string()) return !is_blank(it->get<std::string>());
    return true;
}

// Truthiness of a loosely typed field: null, false, 0 and "" are unset
bool truthy(const nlohmann::json& data, const char* key) {
    if (!data.is_object()) return false;
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) return false;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number()) return it->get<double>() != 0.0;
    if (it->is_string()) return !it->get<std::string>().empty();
    return true;
}

IntegrityIssue make_issue(const std::string& id, IssueSeverity severity, const char* code,
                          std::string message, std::optional<nlohmann::json> details = std::nullopt) {
    IntegrityIssue issue;
    issue.episode_id = id;
    issue.severity = severity;
    issue.code = code;
    issue.message = std::move(message);
    issue.details = std::move(details);
    return issue;
}

// Run fn(0..count-1) on at most `workers` threads
template <typename Fn>
void run_bounded(size_t count, size_t workers, Fn&& fn) {
    if (count == 0) return;
    workers = std::min(std::max<size_t>(1, workers), count);
    if (workers == 1) {
        for (size_t i = 0; i < count; ++i) fn(i);
        return;
    }

    std::atomic<size_t> next{0};
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        pool.emplace_back([&] {
            for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
                fn(i);
            }
        });
    }
    for (auto& t : pool) {
        t.join();
    }
}

} // namespace

const char* issue_severity_name(IssueSeverity severity) {
    return severity == IssueSeverity::Warn ? "warn" : "error";
}

nlohmann::json IntegritySummary::to_json() const {
    nlohmann::json out_issues = nlohmann::json::array();
    for (const auto& issue : issues) {
        nlohmann::json j = {
            {"episodeId", issue.episode_id},
            {"severity", issue_severity_name(issue.severity)},
            {"code", issue.code},
            {"message", issue.message},
        };
        if (issue.details) {
            j["details"] = *issue.details;
        }
        out_issues.push_back(std::move(j));
    }

    return {
        {"scanned", scanned},
        {"ok", ok},
        {"warnings", warnings},
        {"errors", errors},
        {"issues", std::move(out_issues)},
        {"startedAt", started_at},
        {"finishedAt", finished_at},
        {"durationMs", duration_ms},
    };
}

// ============================================================================
// Record rules
// ============================================================================

std::vector<IntegrityIssue> check_record(const EpisodeRecord& record, const ScanOptions& options) {
    std::vector<IntegrityIssue> issues;
    const auto& add = record.additional_data;
    const std::string& id = record.id;

    if (options.check_core_fields && (is_blank(record.title) || is_blank(record.channel_id))) {
        issues.push_back(make_issue(id, IssueSeverity::Error, "MISSING_CORE",
                                    "Missing episodeTitle or channelId"));
    }

    if (options.check_required_keys) {
        for (const auto& key : options.required_keys) {
            if (!has_value(add, key)) {
                issues.push_back(make_issue(id, IssueSeverity::Error, "MISSING_AD_KEY",
                                            "Missing additionalData." + key));
            }
        }
    }

    if (options.enforce_video_with_master &&
        truthy(add, constants::KEY_MASTER_MANIFEST) && !truthy(add, constants::KEY_MEDIA_LOCATION)) {
        issues.push_back(make_issue(id, IssueSeverity::Error, "MASTER_WITHOUT_VIDEO",
                                    "master_m3u8 present but videoLocation missing"));
    }

    if (options.check_duration && record.duration_ms.value_or(0) <= 0) {
        nlohmann::json details = {{"durationMillis", nullptr}};
        if (record.duration_ms) details["durationMillis"] = *record.duration_ms;
        issues.push_back(make_issue(id, IssueSeverity::Warn, "DURATION_ZERO",
                                    "durationMillis is zero or undefined", std::move(details)));
    }

    if (options.check_processing_flags && record.processing_done &&
        (!truthy(add, constants::KEY_MASTER_MANIFEST) || !truthy(add, constants::KEY_MEDIA_LOCATION))) {
        nlohmann::json keys = nlohmann::json::array();
        if (add.is_object()) {
            for (auto it = add.begin(); it != add.end(); ++it) keys.push_back(it.key());
        }
        issues.push_back(make_issue(id, IssueSeverity::Warn, "PROCESSING_DONE_MISSING_URLS",
                                    "processingDone=true but required URLs missing",
                                    nlohmann::json{{"processingDone", true}, {"addKeys", keys}}));
    }

    return issues;
}

std::vector<std::string> extract_urls(const EpisodeRecord& record) {
    std::vector<std::string> urls;
    std::unordered_set<std::string> seen;

    auto push = [&](const std::string& value) {
        bool url_shaped = value.rfind("http", 0) == 0 || value.rfind("s3://", 0) == 0;
        if (url_shaped && seen.insert(value).second) {
            urls.push_back(value);
        }
    };
    auto push_json = [&](const nlohmann::json& value, auto&& self) -> void {
        if (value.is_string()) {
            push(value.get<std::string>());
        } else if (value.is_array()) {
            for (const auto& v : value) self(v, self);
        }
    };

    push(record.episode_uri);
    push(record.transcript_uri);
    push(record.processed_transcript_uri);
    push(record.summary_audio_uri);
    push(record.summary_transcript_uri);
    for (const auto& image : record.episode_images) {
        push(image);
    }
    if (record.additional_data.is_object()) {
        for (const char* key : URL_ADDITIONAL_KEYS) {
            auto it = record.additional_data.find(key);
            if (it != record.additional_data.end()) {
                push_json(*it, push_json);
            }
        }
    }
    return urls;
}

size_t count_ok(size_t scanned, const std::vector<IntegrityIssue>& issues) {
    std::set<std::pair<std::string, std::string>> distinct;
    for (const auto& issue : issues) {
        distinct.emplace(issue.episode_id, issue.code);
    }
    return scanned > distinct.size() ? scanned - distinct.size() : 0;
}

// ============================================================================
// IntegrityScanner
// ============================================================================

IntegrityScanner::IntegrityScanner(MetadataStore& store,
                                   ConcurrencyGovernor& governor,
                                   TransferEngine* engine,
                                   MetricsSink* metrics,
                                   std::string environment)
    : store_(store)
    , governor_(governor)
    , engine_(engine)
    , metrics_(metrics)
    , environment_(std::move(environment)) {}

std::vector<IntegrityIssue> IntegrityScanner::deep_check(const EpisodeRecord& record,
                                                         const ScanOptions& options) {
    std::vector<IntegrityIssue> issues;

    if (options.verify_objects) {
        auto urls = extract_urls(record);
        std::vector<std::optional<IntegrityIssue>> found(urls.size());

        run_bounded(urls.size(), options.deep_check_concurrency, [&](size_t i) {
            const std::string& url = urls[i];
            auto ref = ObjectRef::from_url(url);
            if (!ref) {
                found[i] = make_issue(record.id, IssueSeverity::Warn, "S3_URL_UNPARSEABLE",
                                      "Cannot map URL to an object: " + url,
                                      nlohmann::json{{"url", url}});
                return;
            }
            auto exists = engine_->exists(*ref);
            if (!exists.success) {
                found[i] = make_issue(record.id, IssueSeverity::Error, "S3_CHECK_FAILED",
                                      "Existence check failed for " + url + ": " + exists.error.describe(),
                                      nlohmann::json{{"url", url}, {"error", exists.error.describe()}});
            } else if (!exists.exists) {
                found[i] = make_issue(record.id, IssueSeverity::Error, "S3_MISSING",
                                      "Referenced S3 object missing: " + url);
            }
        });

        for (auto& issue : found) {
            if (issue) issues.push_back(std::move(*issue));
        }
    }

    if (options.duration_tolerance_seconds) {
        auto manifest = check_manifest(record, *options.duration_tolerance_seconds);
        issues.insert(issues.end(), manifest.begin(), manifest.end());
    }
    return issues;
}

std::vector<IntegrityIssue> IntegrityScanner::check_manifest(const EpisodeRecord& record,
                                                             double tolerance) {
    const auto& add = record.additional_data;
    if (!add.is_object()) return {};
    auto it = add.find(constants::KEY_MASTER_MANIFEST);
    if (it == add.end() || !it->is_string() || it->get<std::string>().empty()) {
        return {};
    }

    const std::string url = it->get<std::string>();
    auto master = ObjectRef::from_url(url);
    if (!master) {
        return {make_issue(record.id, IssueSeverity::Error, "MANIFEST_FETCH_FAILED",
                           "Cannot map master manifest URL to an object: " + url,
                           nlohmann::json{{"master", url}})};
    }

    ManifestValidator validator(*engine_);
    auto result = validator.validate(*master, record.duration_ms.value_or(0), tolerance);
    if (result.passed) {
        log_debug("episode %s: manifest duration %llds within %.1fs of record",
                  record.id.c_str(), static_cast<long long>(result.manifest_seconds), tolerance);
        return {};
    }
    return {make_issue(record.id, IssueSeverity::Error, result.code.c_str(), result.message,
                       result.details)};
}

void IntegrityScanner::emit(const char* name, double value) {
    if (!metrics_) return;
    try {
        metrics_->emit_counter(name, value, {{"Environment", environment_},
                                             {"Stage", "integrity_scan"}});
    } catch (const std::exception& e) {
        log_warn("Failed to emit %s: %s", name, e.what());
    }
}

void IntegrityScanner::log_outcome(const IntegritySummary& summary) {
    if (summary.errors > 0) {
        log_error("Integrity validation completed with errors: scanned=%zu errors=%zu warnings=%zu",
                  summary.scanned, summary.errors, summary.warnings);
    } else if (summary.warnings > 0) {
        log_warn("Integrity validation completed with warnings: scanned=%zu warnings=%zu",
                 summary.scanned, summary.warnings);
    } else {
        log_info("Integrity validation passed: scanned=%zu", summary.scanned);
    }
}

IntegritySummary IntegrityScanner::scan(const ScanOptions& options) {
    const auto started = std::chrono::system_clock::now();
    const auto steady_start = std::chrono::steady_clock::now();

    bool deep = options.verify_objects || options.duration_tolerance_seconds.has_value();
    if (deep && !engine_) {
        log_warn("Integrity scan: no object store configured; skipping object and manifest checks");
        deep = false;
    }

    IntegritySummary summary;
    try {
        std::vector<std::string> ids;
        {
            auto permit = governor_.acquire(ResourceClass::MetadataQuery);
            ids = store_.list_recent(options.limit, options.created_after);
        }

        for (const auto& id : ids) {
            std::optional<EpisodeRecord> record;
            {
                auto permit = governor_.acquire(ResourceClass::MetadataQuery);
                record = store_.get_by_id(id);
            }
            if (!record) {
                log_debug("episode %s disappeared during scan", id.c_str());
                continue;
            }
            ++summary.scanned;

            auto issues = check_record(*record, options);
            if (deep) {
                auto more = deep_check(*record, options);
                issues.insert(issues.end(), std::make_move_iterator(more.begin()),
                              std::make_move_iterator(more.end()));
            }
            summary.issues.insert(summary.issues.end(), std::make_move_iterator(issues.begin()),
                                  std::make_move_iterator(issues.end()));
        }
    } catch (const MetadataStoreUnavailable& e) {
        log_error("Integrity scan aborted: %s", e.what());
        emit("IntegrityScanFailed", 1);
        throw;
    }

    for (const auto& issue : summary.issues) {
        if (issue.severity == IssueSeverity::Error) ++summary.errors;
        else ++summary.warnings;
    }
    summary.ok = count_ok(summary.scanned, summary.issues);
    summary.started_at = iso8601_utc(started);
    summary.finished_at = iso8601_utc(std::chrono::system_clock::now());
    summary.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - steady_start).count();

    log_outcome(summary);
    emit("IntegrityScanTotal", static_cast<double>(summary.scanned));
    emit("IntegrityScanErrors", static_cast<double>(summary.errors));
    emit("IntegrityScanWarnings", static_cast<double>(summary.warnings));
    return summary;
}

} // namespace mediaxfer
