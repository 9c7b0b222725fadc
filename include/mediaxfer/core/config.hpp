#pragma once

#include "mediaxfer/integrity/integrity_scanner.hpp"
#include "mediaxfer/transfer/concurrency_governor.hpp"
#include "mediaxfer/transfer/retry_policy.hpp"
#include "mediaxfer/transfer/transfer_engine.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mediaxfer {

/// Object store selection, passed to ObjectStoreFactory.
struct BackendConfig {
    std::string type;  // "s3", "local"
    std::map<std::string, std::string> params;

    bool empty() const { return type.empty(); }

    /// Validate required fields for this backend type.
    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Configuration for the mediaxfer CLI and the components it wires up.
///
/// Sources, lowest to highest precedence: compiled defaults, environment,
/// JSON file (--config), command-line flags.
struct PipelineConfig {
    // Command line: mediaxfer <command> [args...] [options]
    std::string command;
    std::vector<std::string> args;

    BackendConfig store;

    // Admission limits per class (0 = computed from available cores)
    GovernorLimits limits;

    // Retry
    uint32_t retry_attempts = constants::DEFAULT_RETRY_ATTEMPTS;
    uint32_t retry_base_delay_ms = constants::DEFAULT_RETRY_BASE_DELAY_MS;

    // Transfers
    size_t upload_part_size_mb = constants::DEFAULT_UPLOAD_PART_SIZE_MB;
    size_t upload_parts_in_flight = constants::DEFAULT_UPLOAD_PARTS_IN_FLIGHT;
    size_t download_part_size_mb = constants::DEFAULT_DOWNLOAD_PART_SIZE_MB;
    size_t download_concurrency = 0;   // 0 = download class limit
    std::string content_type;          // upload override
    uint32_t presign_ttl_secs = constants::DEFAULT_PRESIGN_TTL_SECONDS;
    bool delete_local = false;         // remove the source file after an upload

    // Media buckets (upload-audio, upload-video)
    std::string audio_bucket;
    std::string video_bucket;
    std::string audio_key_prefix;
    std::string video_key_prefix;

    // Integrity
    size_t integrity_limit = constants::DEFAULT_SCAN_LIMIT;
    std::optional<std::string> created_after;
    std::vector<std::string> required_keys;
    bool verify_objects = false;
    std::optional<double> duration_tolerance_secs;
    size_t deep_check_concurrency = constants::DEFAULT_DEEP_CHECK_CONCURRENCY;

    // Post-process validation
    std::vector<std::string> urls;     // objects that must exist (--url)
    bool validate_stream = false;
    bool require_processing_done = false;
    bool require_video_content = false;

    // Metadata store
    std::filesystem::path metadata_db;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECS;
    std::string environment = "dev";

    bool verbose = false;
    std::filesystem::path log_file;

    PipelineConfig();

    /// Parse the command, its arguments and options.
    /// Returns empty optional on error or --help (prints usage to stderr).
    static std::optional<PipelineConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Overlay recognized environment variables onto current values.
    void apply_env();

    /// Clamp part sizes to the multipart minimum and fill derived defaults.
    void apply_defaults();

    /// Validate what the selected command needs. Returns error message or
    /// empty string.
    std::string validate() const;

    RetryOptions retry_options() const;
    TransferOptions transfer_options() const;
    ScanOptions scan_options() const;
};

/// "a, b,,c" -> {"a", "b", "c"}
std::vector<std::string> split_list(const std::string& value);

}  // namespace mediaxfer
