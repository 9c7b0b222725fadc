#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

struct sqlite3;
struct sqlite3_stmt;

namespace mediaxfer {

/// One published episode as recorded by the pipeline.
struct EpisodeRecord {
    std::string id;
    std::string title;
    std::string channel_id;
    std::optional<int64_t> duration_ms;
    nlohmann::json additional_data = nlohmann::json::object();
    bool processing_done = false;
    std::string content_type;

    // URL-bearing columns
    std::string episode_uri;
    std::string transcript_uri;
    std::string processed_transcript_uri;
    std::string summary_audio_uri;
    std::string summary_transcript_uri;
    std::vector<std::string> episode_images;

    std::string created_at;                 // ISO-8601 UTC
    std::optional<std::string> deleted_at;  // soft-delete marker
};

/// Partial update; only engaged fields are written. additional_data is
/// applied as a JSON merge patch (RFC 7386) to the stored map.
struct RecordPatch {
    std::optional<std::string> title;
    std::optional<std::string> channel_id;
    std::optional<int64_t> duration_ms;
    std::optional<nlohmann::json> additional_data;
    std::optional<bool> processing_done;
    std::optional<std::string> content_type;
    std::optional<std::string> episode_uri;
    std::optional<std::string> transcript_uri;
    std::optional<std::string> processed_transcript_uri;
    std::optional<std::string> summary_audio_uri;
    std::optional<std::string> summary_transcript_uri;
    std::optional<std::vector<std::string>> episode_images;
    std::optional<std::string> deleted_at;
};

/// Record store consumed by the integrity checks. Implementations throw
/// MetadataStoreUnavailable when the backing store cannot be queried.
class MetadataStore {
public:
    virtual ~MetadataStore() = default;

    virtual std::optional<EpisodeRecord> get_by_id(const std::string& id) = 0;

    /// Ids of records that are not soft-deleted, newest created_at first.
    virtual std::vector<std::string> list_recent(size_t limit,
                                                 const std::optional<std::string>& created_after) = 0;

    /// Returns false if no record has this id.
    virtual bool update(const std::string& id, const RecordPatch& patch) = 0;
};

/// MetadataStore backed by a SQLite database (WAL mode).
///
/// additional_data and episode_images are stored as JSON text. All access
/// is serialized on one connection.
class SqliteMetadataStore : public MetadataStore {
public:
    /// Opens or creates the database. Throws MetadataStoreUnavailable.
    explicit SqliteMetadataStore(const std::filesystem::path& db_path);
    ~SqliteMetadataStore() override;

    SqliteMetadataStore(const SqliteMetadataStore&) = delete;
    SqliteMetadataStore& operator=(const SqliteMetadataStore&) = delete;

    std::optional<EpisodeRecord> get_by_id(const std::string& id) override;
    std::vector<std::string> list_recent(size_t limit,
                                         const std::optional<std::string>& created_after) override;
    bool update(const std::string& id, const RecordPatch& patch) override;

    /// Insert or replace a whole record.
    void upsert(const EpisodeRecord& record);

private:
    std::optional<EpisodeRecord> read_locked(const std::string& id);
    void write_locked(const EpisodeRecord& record);
    void rollback();
    [[noreturn]] void fail(const std::string& what, int rc);

    std::filesystem::path db_path_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_upsert_ = nullptr;
    sqlite3_stmt* stmt_get_ = nullptr;
    sqlite3_stmt* stmt_list_recent_ = nullptr;
    sqlite3_stmt* stmt_list_recent_after_ = nullptr;
    std::mutex db_mutex_;
};

} // namespace mediaxfer
