// Test suite for the integrity layer.
//
// Tests:
//   1. HLS parsing: variant selection, EXTINF sums, relative resolution
//   2. ManifestValidator against the scripted in-memory store
//   3. Record rules, URL extraction and the ok count
//   4. SqliteMetadataStore on a temp file
//   5. IntegrityScanner end to end (records, objects, manifests, metrics)
//   6. PostProcessValidator

#include "test_support.hpp"
#include "fake_object_store.hpp"

#include "mediaxfer/core/errors.hpp"
#include "mediaxfer/core/metrics.hpp"
#include "mediaxfer/integrity/integrity_scanner.hpp"
#include "mediaxfer/integrity/manifest_validator.hpp"
#include "mediaxfer/integrity/metadata_store.hpp"
#include "mediaxfer/integrity/post_process_validator.hpp"
#include "mediaxfer/transfer/concurrency_governor.hpp"
#include "mediaxfer/transfer/retry_policy.hpp"
#include "mediaxfer/transfer/transfer_engine.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <vector>

using namespace mediaxfer;
using mediaxfer::testing::FakeObjectStore;

namespace {

const char* MASTER_TEXT =
    "#EXTM3U\n"
    "#EXT-X-VERSION:3\n"
    "#EXT-X-STREAM-INF:BANDWIDTH=500000,RESOLUTION=426x240\n"
    "240p/index.m3u8\n"
    "#EXT-X-STREAM-INF:BANDWIDTH=1200000,CODECS=\"avc1.4d401f,mp4a.40.2\",RESOLUTION=1280x720\n"
    "720p/index.m3u8\n"
    "#EXT-X-STREAM-INF:BANDWIDTH=800000,RESOLUTION=640x360\n"
    "360p/index.m3u8\n";

// 60 segments of 10s = 600s
std::string media_playlist(int segments, double seconds) {
    std::string out = "#EXTM3U\n#EXT-X-TARGETDURATION:10\n";
    for (int i = 0; i < segments; ++i) {
        out += "#EXTINF:" + std::to_string(seconds) + ",\n";
        out += "seg" + std::to_string(i) + ".ts\n";
    }
    out += "#EXT-X-ENDLIST\n";
    return out;
}

RetryPolicy fast_retry() {
    return RetryPolicy({3, std::chrono::milliseconds(1)},
                       [](std::chrono::milliseconds) {});
}

GovernorLimits small_limits() {
    GovernorLimits limits;
    limits.upload = 2;
    limits.download = 4;
    limits.head = 4;
    limits.remove = 2;
    limits.metadata_query = 2;
    return limits;
}

EpisodeRecord good_record(const std::string& id, const std::string& created_at) {
    EpisodeRecord r;
    r.id = id;
    r.title = "Episode " + id;
    r.channel_id = "channel-1";
    r.duration_ms = 600400;
    r.processing_done = true;
    r.content_type = "video";
    r.episode_uri = "s3://media/" + id + "/episode.mp4";
    r.additional_data = {
        {"videoLocation", "s3://media/" + id + "/episode.mp4"},
        {"master_m3u8", "s3://media/" + id + "/hls/master.m3u8"},
    };
    r.created_at = created_at;
    return r;
}

/// Publish the objects good_record() references.
void publish(FakeObjectStore& store, const std::string& id, int segments = 60) {
    store.add(ObjectRef{"media", id + "/episode.mp4"}, "video-bytes");
    store.add(ObjectRef{"media", id + "/hls/master.m3u8"}, MASTER_TEXT);
    store.add(ObjectRef{"media", id + "/hls/720p/index.m3u8"}, media_playlist(segments, 10.0));
}

size_t count_code(const std::vector<IntegrityIssue>& issues, const std::string& code) {
    return static_cast<size_t>(std::count_if(issues.begin(), issues.end(),
        [&](const IntegrityIssue& i) { return i.code == code; }));
}

class RecordingSink : public MetricsSink {
public:
    void emit_counter(const std::string& name, double value,
                      const MetricDimensions& dimensions) override {
        std::lock_guard<std::mutex> lock(mutex);
        values[name] = value;
        last_dimensions = dimensions;
    }

    std::mutex mutex;
    std::map<std::string, double> values;
    MetricDimensions last_dimensions;
};

/// Store whose backend is down.
class UnavailableStore : public MetadataStore {
public:
    std::optional<EpisodeRecord> get_by_id(const std::string&) override {
        throw MetadataStoreUnavailable("connection refused");
    }
    std::vector<std::string> list_recent(size_t, const std::optional<std::string>&) override {
        throw MetadataStoreUnavailable("connection refused");
    }
    bool update(const std::string&, const RecordPatch&) override {
        throw MetadataStoreUnavailable("connection refused");
    }
};

}  // namespace

// ---------------------------------------------------------------------------
// 1. HLS parsing
// ---------------------------------------------------------------------------

static void test_hls_parsing() {
    std::cout << "\n=== HLS parsing ===" << std::endl;

    {
        TEST(parse_master_variants);
        auto variants = parse_master_manifest(MASTER_TEXT);
        ASSERT_EQ(variants.size(), 3u, "three variants");
        ASSERT_EQ(variants[0].bandwidth, 500000u, "first bandwidth");
        ASSERT_EQ(variants[1].bandwidth, 1200000u, "quoted codecs do not break parsing");
        ASSERT_EQ(variants[1].uri, "720p/index.m3u8", "uri paired");
        PASS();
    }
    {
        TEST(select_highest_bandwidth);
        auto variants = parse_master_manifest(MASTER_TEXT);
        auto* best = select_best_variant(variants);
        ASSERT_TRUE(best != nullptr, "a variant is chosen");
        ASSERT_EQ(best->bandwidth, 1200000u, "highest bandwidth");
        ASSERT_EQ(best->uri, "720p/index.m3u8", "its uri");
        ASSERT_TRUE(select_best_variant({}) == nullptr, "no variants");
        PASS();
    }
    {
        TEST(ties_keep_first_declared);
        std::vector<ManifestVariant> variants = {{800000, "a.m3u8"}, {800000, "b.m3u8"}, {1, "c.m3u8"}};
        ASSERT_EQ(select_best_variant(variants)->uri, "a.m3u8", "first of equals");
        PASS();
    }
    {
        TEST(average_bandwidth_fallback_and_orphans);
        const char* text =
            "#EXTM3U\n"
            "#EXT-X-STREAM-INF:AVERAGE-BANDWIDTH=300000\n"
            "\n"
            "# comment\n"
            "low.m3u8\n"
            "#EXT-X-STREAM-INF:RESOLUTION=1x1\n"
            "none.m3u8\n"
            "#EXT-X-STREAM-INF:BANDWIDTH=900000\n";
        auto variants = parse_master_manifest(text);
        ASSERT_EQ(variants.size(), 2u, "declaration without uri dropped");
        ASSERT_EQ(variants[0].bandwidth, 300000u, "average bandwidth used");
        ASSERT_EQ(variants[0].uri, "low.m3u8", "blank and comment lines skipped");
        ASSERT_EQ(variants[1].bandwidth, 0u, "no bandwidth attribute");
        PASS();
    }
    {
        TEST(extinf_sum_rounds_total_once);
        ASSERT_EQ(sum_extinf(std::vector<double>{9.009, 9.009, 4.004}), 22, "22.022 -> 22");
        ASSERT_EQ(sum_extinf(std::vector<double>{1.4, 1.4}), 3, "2.8 -> 3, not 1 + 1");
        ASSERT_EQ(sum_extinf(std::vector<double>{}), 0, "empty");
        ASSERT_EQ(sum_extinf(std::string("#EXTM3U\n#EXTINF:10.0,\na.ts\n#EXTINF:5.5,title\nb.ts\n")),
                  16, "15.5 -> 16");
        auto durations = parse_extinf_durations("#EXTINF:abc,\n#EXTINF:4.0,\n");
        ASSERT_EQ(durations.size(), 1u, "unparseable value skipped");
        PASS();
    }
    {
        TEST(resolve_relative_variants);
        ObjectRef master{"media", "ep1/hls/master.m3u8"};
        auto a = resolve_variant_ref(master, "720p/index.m3u8");
        ASSERT_TRUE(a.has_value(), "relative resolves");
        ASSERT_EQ(a->bucket, "media", "same bucket");
        ASSERT_EQ(a->key, "ep1/hls/720p/index.m3u8", "joined to master dir");

        auto b = resolve_variant_ref(master, "../audio/./a%20b.m3u8?token=1");
        ASSERT_TRUE(b.has_value(), "dot segments resolve");
        ASSERT_EQ(b->key, "ep1/audio/a b.m3u8", "normalized and decoded");

        auto c = resolve_variant_ref(master, "/shared/x.m3u8");
        ASSERT_TRUE(c.has_value(), "root-relative resolves");
        ASSERT_EQ(c->key, "shared/x.m3u8", "from bucket root");

        auto d = resolve_variant_ref(master, "s3://other/y.m3u8");
        ASSERT_TRUE(d.has_value(), "absolute resolves");
        ASSERT_EQ(d->bucket, "other", "absolute bucket");

        ASSERT_TRUE(!resolve_variant_ref(master, "../../../x.m3u8").has_value(), "escape rejected");
        ASSERT_TRUE(!resolve_variant_ref(master, "").has_value(), "empty rejected");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. ManifestValidator
// ---------------------------------------------------------------------------

static void test_manifest_validator() {
    std::cout << "\n=== ManifestValidator ===" << std::endl;

    ObjectRef master{"media", "ep1/hls/master.m3u8"};

    {
        TEST(duration_within_tolerance);
        FakeObjectStore store;
        publish(store, "ep1");
        ConcurrencyGovernor governor(small_limits(), 1);
        TransferEngine engine(store, governor, fast_retry());
        ManifestValidator validator(engine);

        auto result = validator.validate(master, 600400, 2.0);
        ASSERT_TRUE(result.passed, "passes: " + result.message);
        ASSERT_EQ(result.manifest_seconds, 600, "manifest seconds");
        ASSERT_EQ(result.recorded_seconds, 600, "recorded seconds rounded");
        ASSERT_EQ(result.variant_count, 3u, "variants counted");
        ASSERT_EQ(result.details["bandwidth"].get<uint64_t>(), 1200000u, "best variant used");
        PASS();
    }
    {
        TEST(duration_mismatch_reported);
        FakeObjectStore store;
        publish(store, "ep1");
        ConcurrencyGovernor governor(small_limits(), 1);
        TransferEngine engine(store, governor, fast_retry());
        ManifestValidator validator(engine);

        auto result = validator.validate(master, 590000, 2.0);
        ASSERT_TRUE(!result.passed, "fails");
        ASSERT_EQ(result.code, "DURATION_MISMATCH", "code");
        ASSERT_EQ(result.details["diffSeconds"].get<int64_t>(), 10, "diff");
        ASSERT_EQ(result.details["playlist"].get<std::string>(), "s3://media/ep1/hls/720p/index.m3u8",
                  "playlist named");
        ASSERT_EQ(result.details["toleranceSeconds"].get<double>(), 2.0, "tolerance named");
        PASS();
    }
    {
        TEST(tolerance_boundary_is_inclusive);
        FakeObjectStore store;
        publish(store, "ep1");
        ConcurrencyGovernor governor(small_limits(), 1);
        TransferEngine engine(store, governor, fast_retry());
        ManifestValidator validator(engine);
        ASSERT_TRUE(validator.validate(master, 598000, 2.0).passed, "diff equal to tolerance passes");
        ASSERT_TRUE(!validator.validate(master, 597000, 2.0).passed, "diff above tolerance fails");
        PASS();
    }
    {
        TEST(missing_master_fails_fetch);
        FakeObjectStore store;
        ConcurrencyGovernor governor(small_limits(), 1);
        TransferEngine engine(store, governor, fast_retry());
        ManifestValidator validator(engine);
        auto result = validator.validate(master, 600000, 2.0);
        ASSERT_EQ(result.code, "MANIFEST_FETCH_FAILED", "code");
        ASSERT_EQ(store.calls("get"), 1, "NotFound not retried");
        PASS();
    }
    {
        TEST(master_without_variants);
        FakeObjectStore store;
        store.add(master, "#EXTM3U\n#EXT-X-VERSION:3\n");
        ConcurrencyGovernor governor(small_limits(), 1);
        TransferEngine engine(store, governor, fast_retry());
        ManifestValidator validator(engine);
        ASSERT_EQ(validator.validate(master, 600000, 2.0).code, "MANIFEST_NO_VARIANTS", "validate");
        auto inspected = validator.inspect_master(master);
        ASSERT_TRUE(!inspected.passed, "inspect fails");
        ASSERT_EQ(inspected.code, "MANIFEST_NO_VARIANTS", "inspect code");
        PASS();
    }
    {
        TEST(missing_media_playlist);
        FakeObjectStore store;
        store.add(master, MASTER_TEXT);
        ConcurrencyGovernor governor(small_limits(), 1);
        TransferEngine engine(store, governor, fast_retry());
        ManifestValidator validator(engine);
        auto result = validator.validate(master, 600000, 2.0);
        ASSERT_EQ(result.code, "MEDIA_PLAYLIST_FETCH_FAILED", "code");
        ASSERT_EQ(result.variant_count, 3u, "variants still counted");
        PASS();
    }
    {
        TEST(transient_fetch_failure_retried);
        FakeObjectStore store;
        publish(store, "ep1");
        store.fail_next("get", ErrorKind::Throttled);
        ConcurrencyGovernor governor(small_limits(), 1);
        TransferEngine engine(store, governor, fast_retry());
        ManifestValidator validator(engine);
        ASSERT_TRUE(validator.validate(master, 600000, 2.0).passed, "recovers");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 3. Record rules
// ---------------------------------------------------------------------------

static void test_record_rules() {
    std::cout << "\n=== Record rules ===" << std::endl;

    ScanOptions options;
    options.required_keys = {"videoLocation", "master_m3u8"};

    {
        TEST(clean_record_has_no_issues);
        auto issues = check_record(good_record("ep1", "2024-05-01T00:00:00Z"), options);
        ASSERT_TRUE(issues.empty(), "no issues");
        PASS();
    }
    {
        TEST(missing_core_reported_once);
        auto r = good_record("ep1", "2024-05-01T00:00:00Z");
        r.title = "";
        r.channel_id = "  ";
        auto issues = check_record(r, options);
        ASSERT_EQ(count_code(issues, "MISSING_CORE"), 1u, "exactly one");
        ASSERT_TRUE(issues[0].severity == IssueSeverity::Error, "error severity");
        ASSERT_EQ(issues[0].message, "Missing episodeTitle or channelId", "message");
        PASS();
    }
    {
        TEST(missing_required_keys);
        auto r = good_record("ep1", "2024-05-01T00:00:00Z");
        r.additional_data = {{"videoLocation", ""}, {"other", 1}};
        auto issues = check_record(r, options);
        ASSERT_EQ(count_code(issues, "MISSING_AD_KEY"), 2u, "blank and absent both missing");
        auto it = std::find_if(issues.begin(), issues.end(),
                               [](const IntegrityIssue& i) { return i.code == "MISSING_AD_KEY"; });
        ASSERT_EQ(it->message, "Missing additionalData.videoLocation", "key named");
        PASS();
    }
    {
        TEST(master_without_video);
        auto r = good_record("ep1", "2024-05-01T00:00:00Z");
        r.additional_data.erase("videoLocation");
        options.required_keys = {};
        auto issues = check_record(r, options);
        options.required_keys = {"videoLocation", "master_m3u8"};
        ASSERT_EQ(count_code(issues, "MASTER_WITHOUT_VIDEO"), 1u, "reported");
        PASS();
    }
    {
        TEST(duration_zero_is_warning);
        auto r = good_record("ep1", "2024-05-01T00:00:00Z");
        r.duration_ms.reset();
        auto issues = check_record(r, options);
        ASSERT_EQ(issues.size(), 1u, "one issue");
        ASSERT_EQ(issues[0].code, "DURATION_ZERO", "code");
        ASSERT_TRUE(issues[0].severity == IssueSeverity::Warn, "warn");
        ASSERT_TRUE(issues[0].details.has_value() && (*issues[0].details)["durationMillis"].is_null(),
                    "absent duration is null");

        r.duration_ms = 0;
        issues = check_record(r, options);
        ASSERT_EQ((*issues[0].details)["durationMillis"].get<int64_t>(), 0, "zero recorded");
        PASS();
    }
    {
        TEST(processing_done_missing_urls_once);
        auto r = good_record("ep1", "2024-05-01T00:00:00Z");
        r.additional_data = {{"thumbnail", "s3://media/t.jpg"}};
        options.required_keys = {};
        auto issues = check_record(r, options);
        options.required_keys = {"videoLocation", "master_m3u8"};
        ASSERT_EQ(issues.size(), 1u, "exactly one issue");
        ASSERT_EQ(issues[0].code, "PROCESSING_DONE_MISSING_URLS", "code");
        ASSERT_TRUE(issues[0].severity == IssueSeverity::Warn, "warn");
        ASSERT_EQ((*issues[0].details)["addKeys"][0].get<std::string>(), "thumbnail", "keys listed");
        PASS();
    }
    {
        TEST(toggles_disable_rules);
        EpisodeRecord empty;
        empty.id = "x";
        empty.processing_done = true;
        ScanOptions off;
        off.check_core_fields = false;
        off.check_required_keys = false;
        off.enforce_video_with_master = false;
        off.check_duration = false;
        off.check_processing_flags = false;
        off.required_keys = {"videoLocation"};
        ASSERT_TRUE(check_record(empty, off).empty(), "every rule off");
        PASS();
    }
    {
        TEST(extract_urls_dedups_in_order);
        auto r = good_record("ep1", "2024-05-01T00:00:00Z");
        r.transcript_uri = "https://media.s3.amazonaws.com/ep1/transcript.json";
        r.summary_audio_uri = "not-a-url";
        r.episode_images = {"s3://media/ep1/a.jpg", "s3://media/ep1/a.jpg"};
        r.additional_data["thumbnail"] = nlohmann::json::array({"s3://media/ep1/t1.jpg", 5});
        auto urls = extract_urls(r);
        ASSERT_EQ(urls.size(), 5u, "five distinct urls");
        ASSERT_EQ(urls[0], "s3://media/ep1/episode.mp4", "episode first");
        ASSERT_EQ(urls[1], "https://media.s3.amazonaws.com/ep1/transcript.json", "transcript");
        ASSERT_EQ(urls[2], "s3://media/ep1/a.jpg", "image once");
        ASSERT_EQ(urls[3], "s3://media/ep1/hls/master.m3u8", "videoLocation was a duplicate");
        ASSERT_EQ(urls[4], "s3://media/ep1/t1.jpg", "array flattened");
        PASS();
    }
    {
        TEST(ok_counts_distinct_pairs_and_clamps);
        std::vector<IntegrityIssue> issues(3);
        issues[0].episode_id = "a"; issues[0].code = "MISSING_AD_KEY";
        issues[1].episode_id = "a"; issues[1].code = "MISSING_AD_KEY";
        issues[2].episode_id = "b"; issues[2].code = "DURATION_ZERO";
        ASSERT_EQ(count_ok(3, issues), 1u, "3 scanned - 2 distinct");
        issues.push_back(issues[2]);
        issues.back().code = "MISSING_CORE";
        ASSERT_EQ(count_ok(2, issues), 0u, "never negative");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. SqliteMetadataStore
// ---------------------------------------------------------------------------

static void test_sqlite_store() {
    std::cout << "\n=== SqliteMetadataStore ===" << std::endl;

    {
        TEST(upsert_and_read_back);
        TempDir tmp("mediaxfer-db");
        const fs::path dir = tmp.path();
        {
            SqliteMetadataStore store(dir / "meta.db");
            auto r = good_record("ep1", "2024-05-01T00:00:00Z");
            r.episode_images = {"s3://media/ep1/a.jpg"};
            store.upsert(r);

            auto back = store.get_by_id("ep1");
            ASSERT_TRUE(back.has_value(), "found");
            ASSERT_EQ(back->title, "Episode ep1", "title");
            ASSERT_EQ(back->channel_id, "channel-1", "channel");
            ASSERT_TRUE(back->duration_ms == 600400, "duration");
            ASSERT_TRUE(back->processing_done, "processing flag");
            ASSERT_EQ(back->additional_data["master_m3u8"].get<std::string>(),
                      "s3://media/ep1/hls/master.m3u8", "additional data");
            ASSERT_EQ(back->episode_images.size(), 1u, "images");
            ASSERT_TRUE(!back->deleted_at.has_value(), "not deleted");
            ASSERT_TRUE(!store.get_by_id("nope").has_value(), "unknown id");
        }
        PASS();
    }
    {
        TEST(list_recent_newest_first);
        TempDir tmp("mediaxfer-db");
        const fs::path dir = tmp.path();
        {
            SqliteMetadataStore store(dir / "meta.db");
            store.upsert(good_record("old", "2024-01-01T00:00:00Z"));
            store.upsert(good_record("mid", "2024-03-01T00:00:00Z"));
            store.upsert(good_record("new", "2024-05-01T00:00:00Z"));
            auto gone = good_record("gone", "2024-06-01T00:00:00Z");
            gone.deleted_at = "2024-06-02T00:00:00Z";
            store.upsert(gone);

            auto ids = store.list_recent(10, std::nullopt);
            ASSERT_EQ(ids.size(), 3u, "soft-deleted excluded");
            ASSERT_EQ(ids[0], "new", "newest first");
            ASSERT_EQ(ids[2], "old", "oldest last");

            ids = store.list_recent(2, std::nullopt);
            ASSERT_EQ(ids.size(), 2u, "limit applied");

            ids = store.list_recent(10, std::string("2024-02-01T00:00:00Z"));
            ASSERT_EQ(ids.size(), 2u, "lower bound applied");
            ASSERT_EQ(ids[1], "mid", "bound keeps later records");
        }
        PASS();
    }
    {
        TEST(update_merges_patch);
        TempDir tmp("mediaxfer-db");
        const fs::path dir = tmp.path();
        {
            SqliteMetadataStore store(dir / "meta.db");
            store.upsert(good_record("ep1", "2024-05-01T00:00:00Z"));

            RecordPatch patch;
            patch.duration_ms = 1000;
            patch.additional_data = nlohmann::json{{"thumbnail", "s3://media/t.jpg"},
                                                   {"videoLocation", nullptr}};
            ASSERT_TRUE(store.update("ep1", patch), "update applied");

            auto back = store.get_by_id("ep1");
            ASSERT_TRUE(back->duration_ms == 1000, "scalar patched");
            ASSERT_EQ(back->title, "Episode ep1", "untouched field kept");
            ASSERT_TRUE(back->additional_data.contains("thumbnail"), "key added");
            ASSERT_TRUE(!back->additional_data.contains("videoLocation"), "null removes key");
            ASSERT_TRUE(back->additional_data.contains("master_m3u8"), "other keys kept");
            ASSERT_TRUE(!store.update("missing", patch), "unknown id");
        }
        PASS();
    }
    {
        TEST(unopenable_database_throws);
        bool threw = false;
        try {
            SqliteMetadataStore store("/nonexistent-mediaxfer-dir/sub/meta.db");
        } catch (const MetadataStoreUnavailable&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "MetadataStoreUnavailable");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 5. IntegrityScanner
// ---------------------------------------------------------------------------

static void test_scanner() {
    std::cout << "\n=== IntegrityScanner ===" << std::endl;

    {
        TEST(scan_records_only);
        TempDir tmp("mediaxfer-scan");
        const fs::path dir = tmp.path();
        {
            SqliteMetadataStore store(dir / "meta.db");
            store.upsert(good_record("ep1", "2024-05-01T00:00:00Z"));
            auto broken = good_record("ep2", "2024-05-02T00:00:00Z");
            broken.title = "";
            broken.duration_ms = 0;
            store.upsert(broken);

            ConcurrencyGovernor governor(small_limits(), 1);
            RecordingSink metrics;
            IntegrityScanner scanner(store, governor, nullptr, &metrics, "test");
            ScanOptions options;
            options.required_keys = {"videoLocation", "master_m3u8"};
            auto summary = scanner.scan(options);

            ASSERT_EQ(summary.scanned, 2u, "two scanned");
            ASSERT_EQ(summary.errors, 1u, "one error");
            ASSERT_EQ(summary.warnings, 1u, "one warning");
            ASSERT_EQ(summary.ok, 0u, "2 scanned - 2 distinct pairs");
            ASSERT_EQ(count_code(summary.issues, "MISSING_CORE"), 1u, "core issue");
            ASSERT_EQ(count_code(summary.issues, "DURATION_ZERO"), 1u, "duration issue");
            ASSERT_EQ(governor.stats(ResourceClass::MetadataQuery).admitted, 3u,
                      "list plus one read per record");

            ASSERT_TRUE(metrics.values["IntegrityScanTotal"] == 2, "total emitted");
            ASSERT_TRUE(metrics.values["IntegrityScanErrors"] == 1, "errors emitted");
            ASSERT_TRUE(metrics.values["IntegrityScanWarnings"] == 1, "warnings emitted");
            ASSERT_EQ(metrics.last_dimensions["Environment"], "test", "environment dimension");
            ASSERT_EQ(metrics.last_dimensions["Stage"], "integrity_scan", "stage dimension");

            auto j = summary.to_json();
            ASSERT_EQ(j["scanned"].get<size_t>(), 2u, "json scanned");
            ASSERT_EQ(j["issues"][0]["episodeId"].get<std::string>(), "ep2", "json episode id");
            ASSERT_TRUE(j["issues"][0].contains("severity"), "json severity");
            ASSERT_TRUE(j.contains("startedAt") && j.contains("finishedAt") && j.contains("durationMs"),
                        "timing fields");
        }
        PASS();
    }
    {
        TEST(scan_verifies_objects);
        TempDir tmp("mediaxfer-scan");
        const fs::path dir = tmp.path();
        {
            SqliteMetadataStore store(dir / "meta.db");
            store.upsert(good_record("ep1", "2024-05-01T00:00:00Z"));
            auto r = good_record("ep2", "2024-05-02T00:00:00Z");
            r.transcript_uri = "https://example.com";
            store.upsert(r);

            FakeObjectStore objects;
            publish(objects, "ep1");
            publish(objects, "ep2");
            objects.remove(ObjectRef{"media", "ep2/episode.mp4"});

            ConcurrencyGovernor governor(small_limits(), 1);
            TransferEngine engine(objects, governor, fast_retry());
            IntegrityScanner scanner(store, governor, &engine);
            ScanOptions options;
            options.required_keys = {"videoLocation", "master_m3u8"};
            options.verify_objects = true;
            auto summary = scanner.scan(options);

            ASSERT_EQ(summary.scanned, 2u, "two scanned");
            ASSERT_EQ(count_code(summary.issues, "S3_MISSING"), 1u, "missing object once");
            ASSERT_EQ(count_code(summary.issues, "S3_URL_UNPARSEABLE"), 1u, "bucketless url warned");
            auto it = std::find_if(summary.issues.begin(), summary.issues.end(),
                                   [](const IntegrityIssue& i) { return i.code == "S3_MISSING"; });
            ASSERT_EQ(it->episode_id, "ep2", "right episode");
            ASSERT_EQ(it->message, "Referenced S3 object missing: s3://media/ep2/episode.mp4", "message");
            ASSERT_EQ(summary.errors, 1u, "one error");
            ASSERT_EQ(summary.warnings, 1u, "one warning");
            ASSERT_EQ(summary.ok, 0u, "each distinct (episode, code) pair is subtracted");
        }
        PASS();
    }
    {
        TEST(scan_reconciles_manifest_duration);
        TempDir tmp("mediaxfer-scan");
        const fs::path dir = tmp.path();
        {
            SqliteMetadataStore store(dir / "meta.db");
            store.upsert(good_record("ep1", "2024-05-01T00:00:00Z"));
            store.upsert(good_record("ep2", "2024-05-02T00:00:00Z"));

            FakeObjectStore objects;
            publish(objects, "ep1");
            publish(objects, "ep2", 50);  // 500s against a 600s record

            ConcurrencyGovernor governor(small_limits(), 1);
            TransferEngine engine(objects, governor, fast_retry());
            IntegrityScanner scanner(store, governor, &engine);
            ScanOptions options;
            options.required_keys = {"videoLocation", "master_m3u8"};
            options.duration_tolerance_seconds = 2.0;
            auto summary = scanner.scan(options);

            ASSERT_EQ(count_code(summary.issues, "DURATION_MISMATCH"), 1u, "one mismatch");
            ASSERT_EQ(summary.issues[0].episode_id, "ep2", "mismatching episode");
            ASSERT_EQ((*summary.issues[0].details)["diffSeconds"].get<int64_t>(), -100, "diff");
            ASSERT_EQ(summary.errors, 1u, "counted as error");
        }
        PASS();
    }
    {
        TEST(deep_checks_skipped_without_engine);
        TempDir tmp("mediaxfer-scan");
        const fs::path dir = tmp.path();
        {
            SqliteMetadataStore store(dir / "meta.db");
            store.upsert(good_record("ep1", "2024-05-01T00:00:00Z"));
            ConcurrencyGovernor governor(small_limits(), 1);
            IntegrityScanner scanner(store, governor);
            ScanOptions options;
            options.required_keys = {"videoLocation", "master_m3u8"};
            options.verify_objects = true;
            auto summary = scanner.scan(options);
            ASSERT_EQ(summary.scanned, 1u, "scanned");
            ASSERT_TRUE(summary.issues.empty(), "no object issues");
        }
        PASS();
    }
    {
        TEST(store_failure_aborts_scan);
        UnavailableStore store;
        ConcurrencyGovernor governor(small_limits(), 1);
        RecordingSink metrics;
        IntegrityScanner scanner(store, governor, nullptr, &metrics, "test");
        bool threw = false;
        try {
            scanner.scan(ScanOptions{});
        } catch (const MetadataStoreUnavailable&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "failure propagates");
        ASSERT_TRUE(metrics.values.count("IntegrityScanFailed") == 1, "failure metric emitted");
        ASSERT_EQ(governor.stats(ResourceClass::MetadataQuery).in_flight, 0u, "permit returned");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 6. PostProcessValidator
// ---------------------------------------------------------------------------

static void test_post_process_validator() {
    std::cout << "\n=== PostProcessValidator ===" << std::endl;

    {
        TEST(published_episode_passes);
        TempDir tmp("mediaxfer-post");
        const fs::path dir = tmp.path();
        {
            SqliteMetadataStore store(dir / "meta.db");
            store.upsert(good_record("ep1", "2024-05-01T00:00:00Z"));
            FakeObjectStore objects;
            publish(objects, "ep1");
            ConcurrencyGovernor governor(small_limits(), 1);
            TransferEngine engine(objects, governor, fast_retry());
            PostProcessValidator validator(&store, governor, &engine);

            PostProcessRequest request;
            request.episode_id = "ep1";
            request.expect_additional_data = {"videoLocation", "master_m3u8"};
            request.urls = {"s3://media/ep1/episode.mp4", "s3://media/ep1/hls/master.m3u8"};
            request.validate_stream = true;
            request.require_processing_done = true;
            request.require_video_content = true;
            request.duration_tolerance_seconds = 2.0;

            auto result = validator.validate_after_processing(request);
            ASSERT_TRUE(result.ok, "ok");
            ASSERT_TRUE(result.errors.empty(), "no errors");
            ASSERT_EQ(result.details["hlsVariantCount"].get<size_t>(), 3u, "variant count");
            ASSERT_EQ(result.details["manifestSeconds"].get<int64_t>(), 600, "manifest seconds");
        }
        PASS();
    }
    {
        TEST(every_problem_reported);
        TempDir tmp("mediaxfer-post");
        const fs::path dir = tmp.path();
        {
            SqliteMetadataStore store(dir / "meta.db");
            auto r = good_record("ep1", "2024-05-01T00:00:00Z");
            r.processing_done = false;
            r.content_type = "audio";
            r.additional_data.erase("videoLocation");
            store.upsert(r);
            FakeObjectStore objects;
            objects.add(ObjectRef{"media", "ep1/hls/master.m3u8"}, "#EXTM3U\n");
            ConcurrencyGovernor governor(small_limits(), 1);
            TransferEngine engine(objects, governor, fast_retry());
            PostProcessValidator validator(&store, governor, &engine);

            PostProcessRequest request;
            request.episode_id = "ep1";
            request.expect_additional_data = {"videoLocation", "master_m3u8"};
            request.urls = {"s3://media/ep1/episode.mp4", "s3://media/ep1/hls/master.m3u8", "junk"};
            request.validate_stream = true;
            request.require_processing_done = true;
            request.require_video_content = true;

            auto result = validator.validate_after_processing(request);
            ASSERT_TRUE(!result.ok, "not ok");
            auto has = [&](const std::string& text) {
                return std::find(result.errors.begin(), result.errors.end(), text) != result.errors.end();
            };
            ASSERT_TRUE(has("metadata: missing/empty additionalData.videoLocation"), "missing key");
            ASSERT_TRUE(has("metadata: processingDone not true"), "processing flag");
            ASSERT_TRUE(has("metadata: contentType not video (got 'audio')"), "content type");
            ASSERT_TRUE(has("S3: object missing s3://media/ep1/episode.mp4"), "missing object");
            ASSERT_TRUE(has("S3: cannot parse URL junk"), "unparseable url");
            ASSERT_TRUE(std::any_of(result.errors.begin(), result.errors.end(),
                                    [](const std::string& e) { return e.rfind("HLS: ", 0) == 0; }),
                        "stream problem");
            ASSERT_EQ(result.errors.size(), 6u, "six problems");
        }
        PASS();
    }
    {
        TEST(unknown_episode);
        TempDir tmp("mediaxfer-post");
        const fs::path dir = tmp.path();
        {
            SqliteMetadataStore store(dir / "meta.db");
            ConcurrencyGovernor governor(small_limits(), 1);
            PostProcessValidator validator(&store, governor, nullptr);
            PostProcessRequest request;
            request.episode_id = "ghost";
            auto result = validator.validate_after_processing(request);
            ASSERT_TRUE(!result.ok, "not ok");
            ASSERT_EQ(result.errors.size(), 1u, "one error");
            ASSERT_EQ(result.errors[0], "metadata: episode not found: ghost", "message");
        }
        PASS();
    }
    {
        TEST(store_error_becomes_message);
        UnavailableStore store;
        ConcurrencyGovernor governor(small_limits(), 1);
        PostProcessValidator validator(&store, governor, nullptr);
        PostProcessRequest request;
        request.episode_id = "ep1";
        auto result = validator.validate_after_processing(request);
        ASSERT_TRUE(!result.ok, "not ok");
        ASSERT_TRUE(result.errors[0].rfind("metadata: error fetching episode ep1", 0) == 0,
                    "prefixed: " + result.errors[0]);
        PASS();
    }
}

int main() {
    std::cout << "mediaxfer integrity test suite" << std::endl;
    std::cout << "==============================" << std::endl;

    test_hls_parsing();
    test_manifest_validator();
    test_record_rules();
    test_sqlite_store();
    test_scanner();
    test_post_process_validator();

    std::cout << "\n==============================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
