#include "mediaxfer/core/config.hpp"
#include "mediaxfer/core/log.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <set>
#include <nlohmann/json.hpp>

namespace mediaxfer {

// --- BackendConfig ---

std::string BackendConfig::validate() const {
    if (type.empty()) return "store type is required";
    if (type == "s3") {
        if (params.count("access_key") == 0 || params.at("access_key").empty() ||
            params.count("secret_key") == 0 || params.at("secret_key").empty())
            return "s3 store requires access_key and secret_key "
                   "(--access-key/--secret-key or AWS_ACCESS_KEY_ID/AWS_SECRET_ACCESS_KEY)";
    } else if (type == "local") {
        if (params.count("path") == 0 || params.at("path").empty())
            return "local store requires 'path' (--local-path)";
    } else {
        return "unknown store type: " + type;
    }
    return {};
}

// --- Helpers ---

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        std::string item = value.substr(start, comma - start);
        size_t b = item.find_first_not_of(" \t");
        size_t e = item.find_last_not_of(" \t");
        if (b != std::string::npos) {
            out.push_back(item.substr(b, e - b + 1));
        }
        start = comma + 1;
    }
    return out;
}

namespace {

template <typename T>
bool parse_uint(const char* text, T& out) {
    if (!text || !*text) return false;
    const char* end = text + std::strlen(text);
    T value{};
    auto [ptr, ec] = std::from_chars(text, end, value);
    if (ec != std::errc() || ptr != end) return false;
    out = value;
    return true;
}

bool parse_double(const char* text, double& out) {
    if (!text || !*text) return false;
    char* end = nullptr;
    double value = std::strtod(text, &end);
    if (end == text || *end != '\0') return false;
    out = value;
    return true;
}

bool parse_flag(const std::string& value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

// Read a numeric environment variable; malformed values are ignored
template <typename T>
void env_uint(const char* name, T& target) {
    const char* v = std::getenv(name);
    if (!v || !*v) return;
    if (!parse_uint(v, target)) {
        log_warn("ignoring invalid %s=%s", name, v);
    }
}

void env_string(const char* name, std::string& target) {
    if (const char* v = std::getenv(name); v && *v) {
        target = v;
    }
}

std::string json_scalar(const nlohmann::json& v) {
    return v.is_string() ? v.get<std::string>() : v.dump();
}

const std::set<std::string> COMMANDS = {
    "scan", "upload", "upload-audio", "upload-video", "download", "exists", "delete",
    "presign", "buckets", "validate"};

void print_usage() {
    std::cerr <<
        "Usage: mediaxfer <command> [args] [options]\n"
        "\n"
        "Commands:\n"
        "  scan                             Integrity scan of recent episodes (JSON summary on stdout)\n"
        "  upload <file> <url>              Upload a file (s3://bucket/key or https URL)\n"
        "  upload-audio <file> [prefix]     Upload to the audio bucket as [prefix/]<file name>\n"
        "  upload-video <file> [prefix]     Upload to the video bucket as [prefix/]<file name>\n"
        "  download <url> <file>            Parallel ranged download\n"
        "  exists <url>                     Exit 0 if the object exists, 1 if not\n"
        "  delete <url>                     Delete an object\n"
        "  presign <url>                    Print a presigned GET URL\n"
        "  buckets                          List buckets, one per line\n"
        "  validate <episode-id>            Post-process validation of one episode\n"
        "\n"
        "Object store:\n"
        "  --config <path>                  JSON config file\n"
        "  --store-type <s3|local>          Object store type (default: s3)\n"
        "  --bucket <name>                  Default bucket (or S3_ARTIFACT_BUCKET env)\n"
        "  --region <region>                Region (default: us-east-1, or AWS_REGION env)\n"
        "  --endpoint <url>                 Custom S3 endpoint\n"
        "  --access-key <key>               Access key (or AWS_ACCESS_KEY_ID env)\n"
        "  --secret-key <key>               Secret key (or AWS_SECRET_ACCESS_KEY env)\n"
        "  --session-token <token>          Session token (or AWS_SESSION_TOKEN env)\n"
        "  --path-style                     Path-style S3 URLs\n"
        "  --no-verify-ssl                  Skip SSL verification\n"
        "  --unsigned-payload               Sign requests with UNSIGNED-PAYLOAD\n"
        "  --local-path <path>              Root directory of the local store\n"
        "  --audio-bucket <name>            Audio bucket (or S3_AUDIO_BUCKET env)\n"
        "  --video-bucket <name>            Video bucket (or S3_VIDEO_BUCKET env)\n"
        "\n"
        "Concurrency (0 = computed from available cores):\n"
        "  --upload-limit <N>               Concurrent uploads\n"
        "  --download-limit <N>             Concurrent download requests\n"
        "  --head-limit <N>                 Concurrent existence checks\n"
        "  --delete-limit <N>               Concurrent deletes\n"
        "  --metadata-limit <N>             Concurrent metadata queries\n"
        "\n"
        "Transfers:\n"
        "  --retry-attempts <N>             Attempts per request (default: 3)\n"
        "  --retry-base-delay-ms <N>        Backoff base delay (default: 500)\n"
        "  --upload-part-mb <N>             Multipart part size in MiB (default: 16, min 5)\n"
        "  --parts-in-flight <N>            Upload parts buffered at once (default: 8)\n"
        "  --download-part-mb <N>           Ranged download part size in MiB (default: 16, min 5)\n"
        "  --download-workers <N>           Ranged download workers (default: download limit)\n"
        "  --content-type <type>            Upload content type (default: from extension)\n"
        "  --ttl <secs>                     Presigned URL lifetime (default: 3600)\n"
        "  --delete-local                   Delete the uploaded file and its emptied directories\n"
        "\n"
        "Integrity:\n"
        "  --db <path>                      Metadata database (or METADATA_DB_PATH env)\n"
        "  --limit <N>                      Episodes to scan (default: 200)\n"
        "  --created-after <iso-time>       Only episodes created at or after this time\n"
        "  --required-keys <a,b,...>        Required additionalData keys\n"
        "                                   (default: videoLocation,master_m3u8)\n"
        "  --verify-objects                 Check every referenced object exists\n"
        "  --duration-tolerance <secs>      Reconcile HLS duration with the record\n"
        "  --deep-check-concurrency <N>     Parallel object checks per episode (default: 4)\n"
        "  --url <url>                      Object that must exist (validate; repeatable)\n"
        "  --validate-stream                Master playlist must list variants (validate)\n"
        "  --require-processing-done        processingDone must be true (validate)\n"
        "  --require-video                  contentType must be video (validate)\n"
        "\n"
        "General:\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --environment <name>             Environment label for metrics (default: dev)\n"
        "  --verbose                        Verbose output\n"
        "  --log-file <path>                Log file path\n"
        "  --help                           Show this help\n";
}

}  // namespace

// --- PipelineConfig ---

PipelineConfig::PipelineConfig() {
    store.type = "s3";
    required_keys = split_list(constants::DEFAULT_REQUIRED_KEYS);
}

void PipelineConfig::apply_env() {
    // Upload and download fall back to the shared limit
    size_t shared = 0;
    env_uint("SEMAPHORE_MAX_CONCURRENCY", shared);
    if (shared > 0) {
        limits.upload = shared;
        limits.download = shared;
    }
    env_uint("S3_UPLOAD_CONCURRENCY", limits.upload);
    env_uint("S3_DOWNLOAD_CONCURRENCY", limits.download);
    env_uint("S3_HEAD_CONCURRENCY", limits.head);
    env_uint("S3_DELETE_CONCURRENCY", limits.remove);
    env_uint("DB_MAX_INFLIGHT", limits.metadata_query);

    env_uint("RETRY_ATTEMPTS", retry_attempts);
    env_uint("RETRY_BASE_DELAY_MS", retry_base_delay_ms);
    env_uint("S3_UPLOAD_PART_SIZE_MB", upload_part_size_mb);
    env_uint("S3_UPLOAD_QUEUE_SIZE", upload_parts_in_flight);
    env_uint("S3_DOWNLOAD_PART_SIZE_MB", download_part_size_mb);

    env_uint("INTEGRITY_LIMIT", integrity_limit);
    if (const char* v = std::getenv("INTEGRITY_CREATED_AFTER"); v && *v) {
        created_after = v;
    }
    if (const char* v = std::getenv("INTEGRITY_VERIFY_S3"); v && *v) {
        verify_objects = parse_flag(v);
    }
    if (const char* v = std::getenv("INTEGRITY_REQUIRED_KEYS"); v && *v) {
        required_keys = split_list(v);
    }
    if (const char* v = std::getenv("INTEGRITY_DURATION_TOLERANCE"); v && *v) {
        double tolerance = 0;
        if (parse_double(v, tolerance)) {
            duration_tolerance_secs = tolerance;
        } else {
            log_warn("ignoring invalid INTEGRITY_DURATION_TOLERANCE=%s", v);
        }
    }

    env_string("AWS_ACCESS_KEY_ID", store.params["access_key"]);
    env_string("AWS_SECRET_ACCESS_KEY", store.params["secret_key"]);
    env_string("AWS_SESSION_TOKEN", store.params["session_token"]);
    env_string("AWS_REGION", store.params["region"]);
    env_string("S3_ARTIFACT_BUCKET", store.params["bucket"]);
    env_string("S3_AUDIO_BUCKET", audio_bucket);
    env_string("S3_VIDEO_BUCKET", video_bucket);
    env_string("S3_AUDIO_KEY_PREFIX", audio_key_prefix);
    env_string("S3_VIDEO_KEY_PREFIX", video_key_prefix);

    if (const char* v = std::getenv("METADATA_DB_PATH"); v && *v) {
        metadata_db = v;
    }
    env_string("ENVIRONMENT", environment);
}

std::optional<PipelineConfig> PipelineConfig::from_args(int argc, char* argv[]) {
    PipelineConfig config;
    config.apply_env();

    // The JSON file sits between the environment and the flags
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            if (!config.load_json(argv[i + 1])) return std::nullopt;
        }
    }

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    auto bad_value = [](const char* name, const char* value) {
        std::cerr << "Error: invalid value for " << name << ": " << value << "\n";
    };

    // Numeric option: true when handled, sets ok=false on a bad value
    auto numeric = [&](int& i, const std::string& arg, const char* name, auto& target, bool& ok) {
        if (arg != name) return false;
        auto* v = next_arg(i, name);
        if (!v) {
            ok = false;
        } else if (!parse_uint(v, target)) {
            bad_value(name, v);
            ok = false;
        }
        return true;
    };

    auto value_param = [&](int& i, const std::string& arg, const char* name,
                           const char* param, bool& ok) {
        if (arg != name) return false;
        auto* v = next_arg(i, name);
        if (!v) ok = false;
        else config.store.params[param] = v;
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool ok = true;

        if (arg.empty() || arg[0] != '-') {
            if (config.command.empty()) config.command = arg;
            else config.args.push_back(arg);
            continue;
        }

        if (numeric(i, arg, "--upload-limit", config.limits.upload, ok) ||
            numeric(i, arg, "--download-limit", config.limits.download, ok) ||
            numeric(i, arg, "--head-limit", config.limits.head, ok) ||
            numeric(i, arg, "--delete-limit", config.limits.remove, ok) ||
            numeric(i, arg, "--metadata-limit", config.limits.metadata_query, ok) ||
            numeric(i, arg, "--retry-attempts", config.retry_attempts, ok) ||
            numeric(i, arg, "--retry-base-delay-ms", config.retry_base_delay_ms, ok) ||
            numeric(i, arg, "--upload-part-mb", config.upload_part_size_mb, ok) ||
            numeric(i, arg, "--parts-in-flight", config.upload_parts_in_flight, ok) ||
            numeric(i, arg, "--download-part-mb", config.download_part_size_mb, ok) ||
            numeric(i, arg, "--download-workers", config.download_concurrency, ok) ||
            numeric(i, arg, "--ttl", config.presign_ttl_secs, ok) ||
            numeric(i, arg, "--limit", config.integrity_limit, ok) ||
            numeric(i, arg, "--deep-check-concurrency", config.deep_check_concurrency, ok) ||
            numeric(i, arg, "--metrics-interval", config.metrics_interval_secs, ok) ||
            value_param(i, arg, "--bucket", "bucket", ok) ||
            value_param(i, arg, "--region", "region", ok) ||
            value_param(i, arg, "--endpoint", "endpoint", ok) ||
            value_param(i, arg, "--access-key", "access_key", ok) ||
            value_param(i, arg, "--secret-key", "secret_key", ok) ||
            value_param(i, arg, "--session-token", "session_token", ok) ||
            value_param(i, arg, "--local-path", "path", ok)) {
            if (!ok) return std::nullopt;
            continue;
        }

        if (arg == "--config") {
            ++i;  // loaded above
        } else if (arg == "--store-type") {
            auto* v = next_arg(i, "--store-type");
            if (!v) return std::nullopt;
            config.store.type = v;
        } else if (arg == "--path-style") {
            config.store.params["use_path_style"] = "true";
        } else if (arg == "--no-verify-ssl") {
            config.store.params["verify_ssl"] = "false";
        } else if (arg == "--unsigned-payload") {
            config.store.params["unsigned_payload"] = "true";
        } else if (arg == "--audio-bucket") {
            auto* v = next_arg(i, "--audio-bucket");
            if (!v) return std::nullopt;
            config.audio_bucket = v;
        } else if (arg == "--video-bucket") {
            auto* v = next_arg(i, "--video-bucket");
            if (!v) return std::nullopt;
            config.video_bucket = v;
        } else if (arg == "--delete-local") {
            config.delete_local = true;
        } else if (arg == "--content-type") {
            auto* v = next_arg(i, "--content-type");
            if (!v) return std::nullopt;
            config.content_type = v;
        } else if (arg == "--db") {
            auto* v = next_arg(i, "--db");
            if (!v) return std::nullopt;
            config.metadata_db = v;
        } else if (arg == "--created-after") {
            auto* v = next_arg(i, "--created-after");
            if (!v) return std::nullopt;
            config.created_after = std::string(v);
        } else if (arg == "--required-keys") {
            auto* v = next_arg(i, "--required-keys");
            if (!v) return std::nullopt;
            config.required_keys = split_list(v);
        } else if (arg == "--verify-objects") {
            config.verify_objects = true;
        } else if (arg == "--duration-tolerance") {
            auto* v = next_arg(i, "--duration-tolerance");
            if (!v) return std::nullopt;
            double tolerance = 0;
            if (!parse_double(v, tolerance)) {
                bad_value("--duration-tolerance", v);
                return std::nullopt;
            }
            config.duration_tolerance_secs = tolerance;
        } else if (arg == "--url") {
            auto* v = next_arg(i, "--url");
            if (!v) return std::nullopt;
            config.urls.push_back(v);
        } else if (arg == "--validate-stream") {
            config.validate_stream = true;
        } else if (arg == "--require-processing-done") {
            config.require_processing_done = true;
        } else if (arg == "--require-video") {
            config.require_video_content = true;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--environment") {
            auto* v = next_arg(i, "--environment");
            if (!v) return std::nullopt;
            config.environment = v;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--log-file") {
            auto* v = next_arg(i, "--log-file");
            if (!v) return std::nullopt;
            config.log_file = v;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return std::nullopt;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    config.apply_defaults();
    return config;
}

bool PipelineConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("store") && j["store"].is_object()) {
            auto& js = j["store"];
            if (js.contains("type")) store.type = js["type"].get<std::string>();
            for (auto& [key, val] : js.items()) {
                if (key != "type") {
                    store.params[key] = json_scalar(val);
                }
            }
        }

        if (j.contains("concurrency") && j["concurrency"].is_object()) {
            auto& jc = j["concurrency"];
            if (jc.contains("upload")) limits.upload = jc["upload"].get<size_t>();
            if (jc.contains("download")) limits.download = jc["download"].get<size_t>();
            if (jc.contains("head")) limits.head = jc["head"].get<size_t>();
            if (jc.contains("delete")) limits.remove = jc["delete"].get<size_t>();
            if (jc.contains("metadata_query")) limits.metadata_query = jc["metadata_query"].get<size_t>();
        }

        if (j.contains("retry") && j["retry"].is_object()) {
            auto& jr = j["retry"];
            if (jr.contains("attempts")) retry_attempts = jr["attempts"].get<uint32_t>();
            if (jr.contains("base_delay_ms")) retry_base_delay_ms = jr["base_delay_ms"].get<uint32_t>();
        }

        if (j.contains("upload") && j["upload"].is_object()) {
            auto& ju = j["upload"];
            if (ju.contains("part_size_mb")) upload_part_size_mb = ju["part_size_mb"].get<size_t>();
            if (ju.contains("parts_in_flight")) upload_parts_in_flight = ju["parts_in_flight"].get<size_t>();
        }

        if (j.contains("download") && j["download"].is_object()) {
            auto& jd = j["download"];
            if (jd.contains("part_size_mb")) download_part_size_mb = jd["part_size_mb"].get<size_t>();
            if (jd.contains("concurrency")) download_concurrency = jd["concurrency"].get<size_t>();
        }

        if (j.contains("media") && j["media"].is_object()) {
            auto& jm = j["media"];
            if (jm.contains("audio_bucket")) audio_bucket = jm["audio_bucket"].get<std::string>();
            if (jm.contains("video_bucket")) video_bucket = jm["video_bucket"].get<std::string>();
            if (jm.contains("audio_key_prefix")) audio_key_prefix = jm["audio_key_prefix"].get<std::string>();
            if (jm.contains("video_key_prefix")) video_key_prefix = jm["video_key_prefix"].get<std::string>();
        }

        if (j.contains("integrity") && j["integrity"].is_object()) {
            auto& ji = j["integrity"];
            if (ji.contains("limit")) integrity_limit = ji["limit"].get<size_t>();
            if (ji.contains("created_after")) created_after = ji["created_after"].get<std::string>();
            if (ji.contains("required_keys")) {
                required_keys = ji["required_keys"].get<std::vector<std::string>>();
            }
            if (ji.contains("verify_objects")) verify_objects = ji["verify_objects"].get<bool>();
            if (ji.contains("duration_tolerance_secs")) {
                duration_tolerance_secs = ji["duration_tolerance_secs"].get<double>();
            }
            if (ji.contains("deep_check_concurrency")) {
                deep_check_concurrency = ji["deep_check_concurrency"].get<size_t>();
            }
        }

        if (j.contains("metadata_db")) metadata_db = j["metadata_db"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();
        if (j.contains("environment")) environment = j["environment"].get<std::string>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void PipelineConfig::apply_defaults() {
    upload_part_size_mb = std::max(upload_part_size_mb, constants::MIN_PART_SIZE_MB);
    download_part_size_mb = std::max(download_part_size_mb, constants::MIN_PART_SIZE_MB);
    upload_parts_in_flight = std::max<size_t>(1, upload_parts_in_flight);
    retry_attempts = std::max<uint32_t>(1, retry_attempts);
    retry_base_delay_ms = std::max<uint32_t>(1, retry_base_delay_ms);

    if (store.type == "s3") {
        auto& region = store.params["region"];
        if (region.empty()) region = constants::DEFAULT_REGION;
    }

    // Drop empty params so factory defaults apply
    for (auto it = store.params.begin(); it != store.params.end();) {
        if (it->second.empty()) it = store.params.erase(it);
        else ++it;
    }
}

std::string PipelineConfig::validate() const {
    if (command.empty()) {
        return "a command is required (scan, upload, upload-audio, upload-video, download, "
               "exists, delete, presign, buckets, validate)";
    }
    if (COMMANDS.count(command) == 0) return "unknown command: " + command;

    const bool media_upload = command == "upload-audio" || command == "upload-video";
    if (media_upload) {
        if (args.empty() || args.size() > 2) {
            return command + " expects 1 or 2 argument(s), got " + std::to_string(args.size());
        }
        const auto& bucket = command == "upload-audio" ? audio_bucket : video_bucket;
        if (bucket.empty()) {
            return command == "upload-audio"
                ? "upload-audio requires --audio-bucket or S3_AUDIO_BUCKET"
                : "upload-video requires --video-bucket or S3_VIDEO_BUCKET";
        }
    } else {
        size_t expected = 0;
        if (command == "upload" || command == "download") expected = 2;
        else if (command != "scan" && command != "buckets") expected = 1;
        if (args.size() != expected) {
            return command + " expects " + std::to_string(expected) + " argument(s), got " +
                   std::to_string(args.size());
        }
    }

    bool needs_store = command != "scan" && command != "validate";
    if (command == "scan") {
        needs_store = verify_objects || duration_tolerance_secs.has_value();
    }
    if (command == "validate") {
        needs_store = !urls.empty() || validate_stream || duration_tolerance_secs.has_value();
    }
    if (needs_store) {
        auto err = store.validate();
        if (!err.empty()) return err;
    }

    if ((command == "scan" || command == "validate") && metadata_db.empty()) {
        return command + " requires a metadata database (--db or METADATA_DB_PATH)";
    }
    if (duration_tolerance_secs && *duration_tolerance_secs < 0) {
        return "duration tolerance must not be negative";
    }
    if (presign_ttl_secs > constants::MAX_PRESIGN_TTL_SECONDS) {
        return "--ttl must be at most " + std::to_string(constants::MAX_PRESIGN_TTL_SECONDS);
    }
    return {};
}

RetryOptions PipelineConfig::retry_options() const {
    RetryOptions options;
    options.max_attempts = retry_attempts;
    options.base_delay = std::chrono::milliseconds(retry_base_delay_ms);
    return options;
}

TransferOptions PipelineConfig::transfer_options() const {
    TransferOptions options;
    options.upload_part_size = upload_part_size_mb * constants::MIB;
    options.upload_parts_in_flight = upload_parts_in_flight;
    options.download_part_size = download_part_size_mb * constants::MIB;
    options.download_concurrency = download_concurrency;
    options.audio_bucket = audio_bucket;
    options.video_bucket = video_bucket;
    options.audio_key_prefix = audio_key_prefix;
    options.video_key_prefix = video_key_prefix;
    return options;
}

ScanOptions PipelineConfig::scan_options() const {
    ScanOptions options;
    options.limit = integrity_limit;
    options.created_after = created_after;
    options.required_keys = required_keys;
    options.verify_objects = verify_objects;
    options.duration_tolerance_seconds = duration_tolerance_secs;
    options.deep_check_concurrency = deep_check_concurrency;
    return options;
}

}  // namespace mediaxfer
