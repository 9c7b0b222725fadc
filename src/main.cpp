#include "mediaxfer/core/config.hpp"
#include "mediaxfer/core/errors.hpp"
#include "mediaxfer/core/log.hpp"
#include "mediaxfer/core/metrics.hpp"
#include "mediaxfer/integrity/integrity_scanner.hpp"
#include "mediaxfer/integrity/metadata_store.hpp"
#include "mediaxfer/integrity/post_process_validator.hpp"
#include "mediaxfer/storage/object_store.hpp"
#include "mediaxfer/transfer/concurrency_governor.hpp"
#include "mediaxfer/transfer/retry_policy.hpp"
#include "mediaxfer/transfer/transfer_engine.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>

namespace {

using namespace mediaxfer;

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_ERRORS = 2;
constexpr int EXIT_CONFIG = 99;

bool is_secret(const std::string& key) {
    return key.find("key") != std::string::npos || key.find("secret") != std::string::npos ||
           key.find("token") != std::string::npos;
}

void print_config(const PipelineConfig& config) {
    log_debug("command: %s", config.command.c_str());
    log_debug("  store-type: %s", config.store.type.c_str());
    for (auto& [k, v] : config.store.params) {
        // Mask secrets in log output
        log_debug("  store-%s: %s", k.c_str(), is_secret(k) ? "****" : v.c_str());
    }
    log_debug("  retry: %u attempts, %ums base delay",
              config.retry_attempts, config.retry_base_delay_ms);
    log_debug("  upload: %zu MiB parts, %zu in flight",
              config.upload_part_size_mb, config.upload_parts_in_flight);
    log_debug("  download: %zu MiB parts", config.download_part_size_mb);
    if (!config.metadata_db.empty()) {
        log_debug("  metadata-db: %s", config.metadata_db.c_str());
    }
    if (!config.metrics_file.empty()) {
        log_debug("  metrics-file: %s (every %zus)",
                  config.metrics_file.c_str(), config.metrics_interval_secs);
    }
}

// s3://bucket/key or an http(s) object URL; a bare key uses the configured bucket
std::optional<ObjectRef> resolve_ref(const PipelineConfig& config, const std::string& arg) {
    if (auto ref = ObjectRef::from_url(arg)) return ref;
    if (arg.find("://") != std::string::npos) return std::nullopt;

    auto it = config.store.params.find("bucket");
    if (it == config.store.params.end() || it->second.empty()) return std::nullopt;
    auto start = arg.find_first_not_of('/');
    if (start == std::string::npos) return std::nullopt;
    return ObjectRef{it->second, arg.substr(start)};
}

// The uploaded file goes away with any directories it leaves empty
int finish_local_upload(const PipelineConfig& config, const UploadResult& result) {
    if (!result.success) return EXIT_FAILED;
    std::cout << result.location << "\n";
    if (config.delete_local) {
        auto removed = remove_local(config.args[0]);
        if (!removed.success) {
            log_error("delete-local %s: %s", config.args[0].c_str(),
                      removed.error.describe().c_str());
            return EXIT_FAILED;
        }
    }
    return EXIT_OK;
}

int run_transfer(const PipelineConfig& config, TransferEngine& engine) {
    const auto& cmd = config.command;

    if (cmd == "buckets") {
        auto result = engine.list_buckets();
        if (!result.success) return EXIT_FAILED;
        for (const auto& name : result.buckets) std::cout << name << "\n";
        return EXIT_OK;
    }
    if (cmd == "upload-audio" || cmd == "upload-video") {
        const std::string prefix = config.args.size() > 1 ? config.args[1] : "";
        auto result = cmd == "upload-audio" ? engine.upload_audio_file(config.args[0], prefix)
                                            : engine.upload_video_file(config.args[0], prefix);
        return finish_local_upload(config, result);
    }

    // Every transfer command names the remote object in one position
    const std::string& remote = cmd == "upload" ? config.args[1] : config.args[0];
    auto ref = resolve_ref(config, remote);
    if (!ref) {
        std::cerr << "Error: cannot resolve object URL: " << remote
                  << " (use s3://bucket/key, or --bucket with a bare key)\n";
        return EXIT_CONFIG;
    }

    if (cmd == "upload") {
        auto result = engine.upload_file(config.args[0], *ref, config.content_type);
        return finish_local_upload(config, result);
    }
    if (cmd == "download") {
        auto result = engine.download_ranged(*ref, config.args[1]);
        return result.success ? EXIT_OK : EXIT_FAILED;
    }
    if (cmd == "exists") {
        auto result = engine.exists(*ref);
        if (!result.success) {
            log_error("exists %s: %s", ref->uri().c_str(), result.error.describe().c_str());
            return EXIT_FAILED;
        }
        std::cout << (result.exists ? "true" : "false") << "\n";
        return result.exists ? EXIT_OK : EXIT_FAILED;
    }
    if (cmd == "delete") {
        auto result = engine.remove(*ref);
        if (!result.success) {
            log_error("delete %s: %s", ref->uri().c_str(), result.error.describe().c_str());
            return EXIT_FAILED;
        }
        log_info("Deleted %s", ref->uri().c_str());
        return EXIT_OK;
    }
    // presign
    auto result = engine.presigned_read_url(*ref, config.presign_ttl_secs);
    if (!result.success) {
        log_error("presign %s: %s", ref->uri().c_str(), result.error.describe().c_str());
        return EXIT_FAILED;
    }
    std::cout << result.url << "\n";
    return EXIT_OK;
}

int run_scan(const PipelineConfig& config, MetadataStore& store, ConcurrencyGovernor& governor,
             TransferEngine* engine, MetricsSink* metrics) {
    IntegrityScanner scanner(store, governor, engine, metrics, config.environment);
    try {
        auto summary = scanner.scan(config.scan_options());
        std::cout << summary.to_json().dump(2) << std::endl;
        if (summary.errors > 0) return EXIT_ERRORS;
        if (summary.warnings > 0) return EXIT_FAILED;
        return EXIT_OK;
    } catch (const std::exception& e) {
        std::cerr << "Integrity scan failed: " << e.what() << std::endl;
        return EXIT_CONFIG;
    }
}

int run_validate(const PipelineConfig& config, MetadataStore& store, ConcurrencyGovernor& governor,
                 TransferEngine* engine) {
    PostProcessRequest request;
    request.episode_id = config.args[0];
    request.expect_additional_data = config.required_keys;
    request.validate_stream = config.validate_stream;
    request.require_processing_done = config.require_processing_done;
    request.require_video_content = config.require_video_content;
    request.duration_tolerance_seconds = config.duration_tolerance_secs;
    request.urls = config.urls;

    if (request.urls.empty() && engine) {
        // Fall back to every object the record references
        try {
            auto permit = governor.acquire(ResourceClass::MetadataQuery);
            if (auto record = store.get_by_id(request.episode_id)) {
                request.urls = extract_urls(*record);
            }
        } catch (const MetadataStoreUnavailable& e) {
            log_warn("Cannot list referenced objects for %s: %s",
                     request.episode_id.c_str(), e.what());
        }
    }

    PostProcessValidator validator(&store, governor, engine);
    auto result = validator.validate_after_processing(request);

    nlohmann::json out = {{"ok", result.ok}, {"errors", result.errors}, {"details", result.details}};
    std::cout << out.dump(2) << std::endl;
    return result.ok ? EXIT_OK : EXIT_ERRORS;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = PipelineConfig::from_args(argc, argv);
    if (!config_opt) {
        return EXIT_CONFIG;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return EXIT_CONFIG;
    }

    set_log_verbose(config.verbose);
    // Commands that print results keep stdout clean
    const bool prints_result = config.command == "scan" || config.command == "validate" ||
                               config.command == "presign" || config.command == "exists" ||
                               config.command == "upload" || config.command == "buckets" ||
                               config.command == "upload-audio" || config.command == "upload-video";
    set_log_to_stderr(prints_result);
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.log_file.parent_path(), ec);
        if (!set_log_file(config.log_file.string())) {
            std::cerr << "Cannot open log file: " << config.log_file << "\n";
            return EXIT_CONFIG;
        }
    }
    print_config(config);

    ConcurrencyGovernor governor(config.limits);
    governor.log_configuration();

    std::unique_ptr<ObjectStore> object_store;
    if (config.store.validate().empty()) {
        try {
            object_store = ObjectStoreFactory::create(config.store.type, config.store.params);
        } catch (const std::exception& e) {
            std::cerr << "Failed to create object store: " << e.what() << "\n";
            return EXIT_CONFIG;
        }
    }

    std::unique_ptr<TransferEngine> engine;
    if (object_store) {
        engine = std::make_unique<TransferEngine>(*object_store, governor,
                                                  RetryPolicy(config.retry_options()),
                                                  config.transfer_options());
    }

    std::unique_ptr<MetricsExporter> exporter;
    if (!config.metrics_file.empty()) {
        exporter = std::make_unique<MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"environment", config.environment}});
        exporter->set_governor(&governor);
        if (engine) {
            exporter->set_engine(engine.get());
            engine->set_metrics(exporter.get());
        }
        exporter->start();
    }

    int rc = EXIT_OK;
    if (config.command == "scan" || config.command == "validate") {
        std::unique_ptr<SqliteMetadataStore> store;
        try {
            store = std::make_unique<SqliteMetadataStore>(config.metadata_db);
        } catch (const MetadataStoreUnavailable& e) {
            std::cerr << "Cannot open metadata database: " << e.what() << "\n";
            if (exporter) exporter->stop();
            return config.command == "scan" ? EXIT_CONFIG : EXIT_ERRORS;
        }

        if (config.command == "scan") {
            std::unique_ptr<AsyncMetricsSink> sink;
            if (exporter) sink = std::make_unique<AsyncMetricsSink>(*exporter);
            rc = run_scan(config, *store, governor, engine.get(), sink.get());
            if (sink) sink->flush();
        } else {
            rc = run_validate(config, *store, governor, engine.get());
        }
    } else {
        rc = run_transfer(config, *engine);
    }

    if (exporter) exporter->stop();
    return rc;
}
