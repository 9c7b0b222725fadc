#include "mediaxfer/integrity/metadata_store.hpp"
#include "mediaxfer/core/errors.hpp"
#include "mediaxfer/core/log.hpp"

#include <sqlite3.h>

#include <chrono>
#include <thread>

namespace mediaxfer {

namespace {

constexpr const char* EPISODES_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS episodes (
    id TEXT PRIMARY KEY,
    title TEXT,
    channel_id TEXT,
    duration_ms INTEGER,
    additional_data TEXT NOT NULL DEFAULT '{}',
    processing_done INTEGER NOT NULL DEFAULT 0,
    content_type TEXT,
    episode_uri TEXT,
    transcript_uri TEXT,
    processed_transcript_uri TEXT,
    summary_audio_uri TEXT,
    summary_transcript_uri TEXT,
    episode_images TEXT NOT NULL DEFAULT '[]',
    created_at TEXT NOT NULL,
    deleted_at TEXT
) WITHOUT ROWID;

CREATE INDEX IF NOT EXISTS idx_recent
    ON episodes(created_at) WHERE deleted_at IS NULL;
)";

constexpr const char* EPISODE_COLUMNS =
    "id, title, channel_id, duration_ms, additional_data, processing_done, content_type, "
    "episode_uri, transcript_uri, processed_transcript_uri, summary_audio_uri, "
    "summary_transcript_uri, episode_images, created_at, deleted_at";

// Execute a SQL statement with retry on SQLITE_BUSY
int sql_exec(sqlite3* db, const char* sql) {
    int rc = SQLITE_BUSY;
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return rc;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return rc;
    }
    log_error("SQL timed out after retries");
    return rc;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

void bind_text_or_null(sqlite3_stmt* stmt, int idx, const std::string& value) {
    if (value.empty()) {
        sqlite3_bind_null(stmt, idx);
    } else {
        sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
    }
}

// Stored JSON is parsed without exceptions; a damaged column reads as empty
nlohmann::json parse_json_column(const std::string& text, const std::string& id,
                                 const char* column, nlohmann::json fallback) {
    if (text.empty()) return fallback;
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        log_warn("episode %s: unparseable %s column", id.c_str(), column);
        return fallback;
    }
    return parsed;
}

EpisodeRecord read_row(sqlite3_stmt* stmt) {
    EpisodeRecord r;
    r.id = column_text(stmt, 0);
    r.title = column_text(stmt, 1);
    r.channel_id = column_text(stmt, 2);
    if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
        r.duration_ms = sqlite3_column_int64(stmt, 3);
    }
    r.additional_data = parse_json_column(column_text(stmt, 4), r.id, "additional_data",
                                          nlohmann::json::object());
    r.processing_done = sqlite3_column_int(stmt, 5) != 0;
    r.content_type = column_text(stmt, 6);
    r.episode_uri = column_text(stmt, 7);
    r.transcript_uri = column_text(stmt, 8);
    r.processed_transcript_uri = column_text(stmt, 9);
    r.summary_audio_uri = column_text(stmt, 10);
    r.summary_transcript_uri = column_text(stmt, 11);

    auto images = parse_json_column(column_text(stmt, 12), r.id, "episode_images",
                                    nlohmann::json::array());
    if (images.is_array()) {
        for (const auto& img : images) {
            if (img.is_string()) r.episode_images.push_back(img.get<std::string>());
        }
    }

    r.created_at = column_text(stmt, 13);
    if (sqlite3_column_type(stmt, 14) != SQLITE_NULL) {
        r.deleted_at = column_text(stmt, 14);
    }
    return r;
}

} // namespace

SqliteMetadataStore::SqliteMetadataStore(const std::filesystem::path& db_path)
    : db_path_(db_path) {
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw MetadataStoreUnavailable("Cannot open metadata store " + db_path.string() + ": " + msg);
    }

    // WAL mode for concurrent readers
    for (const char* pragma : {"PRAGMA journal_mode=WAL", "PRAGMA synchronous=NORMAL",
                               "PRAGMA busy_timeout=5000"}) {
        if (sql_exec(db_, pragma) != SQLITE_OK) {
            log_warn("%s: '%s' failed, continuing with defaults", db_path.c_str(), pragma);
        }
    }
    if ((rc = sql_exec(db_, EPISODES_SCHEMA)) != SQLITE_OK) {
        fail("schema setup", rc);
    }

    // Prepare statements
    std::string upsert = std::string("INSERT OR REPLACE INTO episodes (") + EPISODE_COLUMNS +
        ") VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15)";
    std::string get = std::string("SELECT ") + EPISODE_COLUMNS + " FROM episodes WHERE id = ?1";

    struct { const std::string sql; sqlite3_stmt** stmt; } statements[] = {
        {upsert, &stmt_upsert_},
        {get, &stmt_get_},
        {"SELECT id FROM episodes WHERE deleted_at IS NULL "
         "ORDER BY created_at DESC LIMIT ?1", &stmt_list_recent_},
        {"SELECT id FROM episodes WHERE deleted_at IS NULL AND created_at >= ?2 "
         "ORDER BY created_at DESC LIMIT ?1", &stmt_list_recent_after_},
    };
    for (auto& s : statements) {
        rc = sqlite3_prepare_v2(db_, s.sql.c_str(), -1, s.stmt, nullptr);
        if (rc != SQLITE_OK) {
            fail("prepare", rc);
        }
    }
}

SqliteMetadataStore::~SqliteMetadataStore() {
    // Finalize prepared statements
    if (stmt_upsert_) sqlite3_finalize(stmt_upsert_);
    if (stmt_get_) sqlite3_finalize(stmt_get_);
    if (stmt_list_recent_) sqlite3_finalize(stmt_list_recent_);
    if (stmt_list_recent_after_) sqlite3_finalize(stmt_list_recent_after_);

    if (db_) {
        if (sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr) != SQLITE_OK) {
            log_debug("%s: final checkpoint failed", db_path_.c_str());
        }
        sqlite3_close(db_);
    }
}

void SqliteMetadataStore::fail(const std::string& what, int rc) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    std::string full = "Metadata store " + db_path_.string() + ": " + what + " failed: " + msg;
    // Only called during construction, so the destructor will not run
    for (sqlite3_stmt** stmt : {&stmt_upsert_, &stmt_get_, &stmt_list_recent_, &stmt_list_recent_after_}) {
        if (*stmt) {
            sqlite3_finalize(*stmt);
            *stmt = nullptr;
        }
    }
    sqlite3_close(db_);
    db_ = nullptr;
    throw MetadataStoreUnavailable(full);
}

std::optional<EpisodeRecord> SqliteMetadataStore::read_locked(const std::string& id) {
    sqlite3_reset(stmt_get_);
    sqlite3_bind_text(stmt_get_, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sql_step_retry(stmt_get_);
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        std::string msg = sqlite3_errmsg(db_);
        sqlite3_reset(stmt_get_);
        throw MetadataStoreUnavailable("get_by_id(" + id + ") failed: " + msg);
    }
    EpisodeRecord record = read_row(stmt_get_);
    sqlite3_reset(stmt_get_);
    return record;
}

void SqliteMetadataStore::write_locked(const EpisodeRecord& r) {
    std::string additional = r.additional_data.dump();
    std::string images = nlohmann::json(r.episode_images).dump();

    sqlite3_reset(stmt_upsert_);
    sqlite3_clear_bindings(stmt_upsert_);
    sqlite3_bind_text(stmt_upsert_, 1, r.id.c_str(), -1, SQLITE_TRANSIENT);
    bind_text_or_null(stmt_upsert_, 2, r.title);
    bind_text_or_null(stmt_upsert_, 3, r.channel_id);
    if (r.duration_ms) {
        sqlite3_bind_int64(stmt_upsert_, 4, *r.duration_ms);
    } else {
        sqlite3_bind_null(stmt_upsert_, 4);
    }
    sqlite3_bind_text(stmt_upsert_, 5, additional.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt_upsert_, 6, r.processing_done ? 1 : 0);
    bind_text_or_null(stmt_upsert_, 7, r.content_type);
    bind_text_or_null(stmt_upsert_, 8, r.episode_uri);
    bind_text_or_null(stmt_upsert_, 9, r.transcript_uri);
    bind_text_or_null(stmt_upsert_, 10, r.processed_transcript_uri);
    bind_text_or_null(stmt_upsert_, 11, r.summary_audio_uri);
    bind_text_or_null(stmt_upsert_, 12, r.summary_transcript_uri);
    sqlite3_bind_text(stmt_upsert_, 13, images.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_, 14, r.created_at.c_str(), -1, SQLITE_TRANSIENT);
    if (r.deleted_at) {
        sqlite3_bind_text(stmt_upsert_, 15, r.deleted_at->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt_upsert_, 15);
    }

    int rc = sql_step_retry(stmt_upsert_);
    sqlite3_reset(stmt_upsert_);
    if (rc != SQLITE_DONE) {
        throw MetadataStoreUnavailable("write of episode " + r.id + " failed: " + sqlite3_errmsg(db_));
    }
}

std::optional<EpisodeRecord> SqliteMetadataStore::get_by_id(const std::string& id) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    return read_locked(id);
}

std::vector<std::string> SqliteMetadataStore::list_recent(size_t limit,
                                                          const std::optional<std::string>& created_after) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    sqlite3_stmt* stmt = created_after ? stmt_list_recent_after_ : stmt_list_recent_;
    sqlite3_reset(stmt);
    sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(limit));
    if (created_after) {
        sqlite3_bind_text(stmt, 2, created_after->c_str(), -1, SQLITE_TRANSIENT);
    }

    std::vector<std::string> ids;
    int rc;
    while ((rc = sql_step_retry(stmt)) == SQLITE_ROW) {
        ids.push_back(column_text(stmt, 0));
    }
    sqlite3_reset(stmt);
    if (rc != SQLITE_DONE) {
        throw MetadataStoreUnavailable(std::string("list_recent failed: ") + sqlite3_errmsg(db_));
    }
    return ids;
}

bool SqliteMetadataStore::update(const std::string& id, const RecordPatch& patch) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);

    if (sql_exec(db_, "BEGIN IMMEDIATE") != SQLITE_OK) {
        throw MetadataStoreUnavailable("update of episode " + id + ": cannot begin transaction");
    }

    try {
        auto record = read_locked(id);
        if (!record) {
            rollback();
            return false;
        }

        EpisodeRecord& r = *record;
        if (patch.title) r.title = *patch.title;
        if (patch.channel_id) r.channel_id = *patch.channel_id;
        if (patch.duration_ms) r.duration_ms = *patch.duration_ms;
        if (patch.additional_data) {
            if (!r.additional_data.is_object()) r.additional_data = nlohmann::json::object();
            r.additional_data.merge_patch(*patch.additional_data);
        }
        if (patch.processing_done) r.processing_done = *patch.processing_done;
        if (patch.content_type) r.content_type = *patch.content_type;
        if (patch.episode_uri) r.episode_uri = *patch.episode_uri;
        if (patch.transcript_uri) r.transcript_uri = *patch.transcript_uri;
        if (patch.processed_transcript_uri) r.processed_transcript_uri = *patch.processed_transcript_uri;
        if (patch.summary_audio_uri) r.summary_audio_uri = *patch.summary_audio_uri;
        if (patch.summary_transcript_uri) r.summary_transcript_uri = *patch.summary_transcript_uri;
        if (patch.episode_images) r.episode_images = *patch.episode_images;
        if (patch.deleted_at) r.deleted_at = *patch.deleted_at;

        write_locked(r);
    } catch (const MetadataStoreUnavailable&) {
        rollback();
        throw;
    }

    if (sql_exec(db_, "COMMIT") != SQLITE_OK) {
        rollback();
        throw MetadataStoreUnavailable("update of episode " + id + ": commit failed");
    }
    return true;
}

void SqliteMetadataStore::rollback() {
    if (sql_exec(db_, "ROLLBACK") != SQLITE_OK) {
        log_warn("%s: rollback failed", db_path_.c_str());
    }
}

void SqliteMetadataStore::upsert(const EpisodeRecord& record) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    write_locked(record);
}

} // namespace mediaxfer
