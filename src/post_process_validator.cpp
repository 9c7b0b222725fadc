#include "mediaxfer/integrity/post_process_validator.hpp"
#include "mediaxfer/core/errors.hpp"
#include "mediaxfer/core/log.hpp"
#include "mediaxfer/integrity/manifest_validator.hpp"
#include "mediaxfer/transfer/concurrency_governor.hpp"
#include "mediaxfer/transfer/transfer_engine.hpp"

#include <algorithm>
#include <cctype>

namespace mediaxfer {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool missing_or_blank(const nlohmann::json& data, const std::string& key) {
    if (!data.is_object()) return true;
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) return true;
    if (it->is_string()) {
        return it->get<std::string>().find_first_not_of(" \t\r\n") == std::string::npos;
    }
    return false;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // namespace

std::optional<EpisodeRecord> PostProcessValidator::check_record(const PostProcessRequest& request,
                                                                PostProcessResult& result) {
    if (!store_) {
        log_warn("Validation: metadata store unavailable; skipping record checks");
        return std::nullopt;
    }

    std::optional<EpisodeRecord> record;
    try {
        auto permit = governor_.acquire(ResourceClass::MetadataQuery);
        record = store_->get_by_id(request.episode_id);
    } catch (const MetadataStoreUnavailable& e) {
        result.errors.push_back("metadata: error fetching episode " + request.episode_id + ": " + e.what());
        return std::nullopt;
    }

    if (!record) {
        result.errors.push_back("metadata: episode not found: " + request.episode_id);
        return std::nullopt;
    }

    result.details["episode"] = {{"id", record->id}, {"title", record->title}};
    for (const auto& key : request.expect_additional_data) {
        if (missing_or_blank(record->additional_data, key)) {
            result.errors.push_back("metadata: missing/empty additionalData." + key);
        }
    }
    if (request.require_processing_done && !record->processing_done) {
        result.errors.push_back("metadata: processingDone not true");
    }
    if (request.require_video_content && lowercase(record->content_type) != "video") {
        result.errors.push_back("metadata: contentType not video (got '" + record->content_type + "')");
    }

    result.details["durationMillis"] = record->duration_ms ? nlohmann::json(*record->duration_ms)
                                                           : nlohmann::json(nullptr);
    nlohmann::json keys = nlohmann::json::array();
    if (record->additional_data.is_object()) {
        for (auto it = record->additional_data.begin(); it != record->additional_data.end(); ++it) {
            keys.push_back(it.key());
        }
    }
    result.details["additionalData"] = std::move(keys);
    return record;
}

void PostProcessValidator::check_objects(const PostProcessRequest& request, PostProcessResult& result) {
    if (request.urls.empty()) return;
    if (!engine_) {
        log_warn("Validation: object store unavailable; skipping object checks");
        return;
    }

    for (const auto& url : request.urls) {
        auto ref = ObjectRef::from_url(url);
        if (!ref) {
            result.errors.push_back("S3: cannot parse URL " + url);
            continue;
        }
        auto exists = engine_->exists(*ref);
        if (!exists.success) {
            result.errors.push_back("S3: error checking " + url + ": " + exists.error.describe());
        } else if (!exists.exists) {
            result.errors.push_back("S3: object missing " + url);
        }
    }
}

void PostProcessValidator::check_stream(const PostProcessRequest& request,
                                        const std::optional<EpisodeRecord>& record,
                                        PostProcessResult& result) {
    const bool expects_master = std::find(request.expect_additional_data.begin(),
                                          request.expect_additional_data.end(),
                                          constants::KEY_MASTER_MANIFEST) !=
                                request.expect_additional_data.end();
    const bool want_stream = request.validate_stream && expects_master;
    const bool want_duration = request.duration_tolerance_seconds.has_value() && record.has_value();
    if (!engine_ || (!want_stream && !want_duration)) return;

    auto master_url = std::find_if(request.urls.begin(), request.urls.end(),
                                   [](const std::string& u) { return ends_with(u, ".m3u8"); });
    if (master_url == request.urls.end()) {
        result.errors.push_back("HLS: master playlist URL not found among provided URLs");
        return;
    }
    auto master = ObjectRef::from_url(*master_url);
    if (!master) {
        result.errors.push_back("HLS: cannot parse master playlist URL " + *master_url);
        return;
    }

    ManifestValidator validator(*engine_);
    if (want_stream) {
        auto inspected = validator.inspect_master(*master);
        result.details["hlsVariantCount"] = inspected.variant_count;
        if (!inspected.passed) {
            result.errors.push_back("HLS: " + inspected.message);
            return;
        }
    }

    if (want_duration) {
        auto checked = validator.validate(*master, record->duration_ms.value_or(0),
                                          *request.duration_tolerance_seconds);
        result.details["manifestSeconds"] = checked.manifest_seconds;
        if (!checked.passed) {
            result.errors.push_back("HLS: " + checked.message);
        }
    }
}

PostProcessResult PostProcessValidator::validate_after_processing(const PostProcessRequest& request) {
    PostProcessResult result;

    auto record = check_record(request, result);
    check_objects(request, result);
    check_stream(request, record, result);

    result.ok = result.errors.empty();
    if (result.ok) {
        log_info("Post-process validation OK: %s", request.episode_id.c_str());
    } else {
        log_error("Post-process validation FAILED: %s (%zu errors)",
                  request.episode_id.c_str(), result.errors.size());
        for (const auto& e : result.errors) {
            log_error("  %s", e.c_str());
        }
    }
    return result;
}

} // namespace mediaxfer
