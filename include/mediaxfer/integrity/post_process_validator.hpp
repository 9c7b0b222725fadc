#pragma once

#include "mediaxfer/integrity/metadata_store.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mediaxfer {

class ConcurrencyGovernor;
class TransferEngine;

struct PostProcessRequest {
    std::string episode_id;
    std::vector<std::string> expect_additional_data;  // e.g. videoLocation, master_m3u8
    std::vector<std::string> urls;                    // objects that must exist
    bool validate_stream = false;         // master playlist among urls has variants
    bool require_processing_done = false;
    bool require_video_content = false;   // content_type == "video"
    std::optional<double> duration_tolerance_seconds;
};

struct PostProcessResult {
    bool ok = false;
    std::vector<std::string> errors;
    nlohmann::json details = nlohmann::json::object();
};

/// Checks one episode right after the pipeline finished publishing it.
/// Every problem is reported in the result; nothing here throws for a
/// record-level failure. A null store or engine skips those checks.
class PostProcessValidator {
public:
    PostProcessValidator(MetadataStore* store, ConcurrencyGovernor& governor,
                         TransferEngine* engine)
        : store_(store), governor_(governor), engine_(engine) {}

    PostProcessResult validate_after_processing(const PostProcessRequest& request);

private:
    std::optional<EpisodeRecord> check_record(const PostProcessRequest& request,
                                              PostProcessResult& result);
    void check_objects(const PostProcessRequest& request, PostProcessResult& result);
    void check_stream(const PostProcessRequest& request,
                      const std::optional<EpisodeRecord>& record,
                      PostProcessResult& result);

    MetadataStore* store_;
    ConcurrencyGovernor& governor_;
    TransferEngine* engine_;
};

} // namespace mediaxfer
