/**
 * @file sqlite_durable_tier.cpp
 */
#include "sluice/cache/sqlite_durable_tier.hpp"

#include <spdlog/spdlog.h>

#include "sluice/cache/payload_codec.hpp"
#include "sluice/version.hpp"

namespace sluice::cache {

namespace {

int64_t to_ms(TimePoint t) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

TimePoint from_ms(int64_t ms) noexcept {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

/// Finalizes a prepared statement on scope exit.
struct Stmt {
    sqlite3_stmt* s{nullptr};
    ~Stmt() { if (s) sqlite3_finalize(s); }
};

} // namespace

std::string_view to_string(StoreError::Code c) noexcept {
    switch (c) {
        case StoreError::Code::OpenFailed:   return "open_failed";
        case StoreError::Code::SchemaFailed: return "schema_failed";
        case StoreError::Code::QueryFailed:  return "query_failed";
        case StoreError::Code::CorruptRow:   return "corrupt_row";
    }
    return "unknown";
}

sluice_detail::expected<std::unique_ptr<SqliteDurableTier>, StoreError>
SqliteDurableTier::open(const std::string& path) {
    sqlite3* db = nullptr;
    const int rc = sqlite3_open(path.c_str(), &db);
    if (rc != SQLITE_OK) {
        StoreError err{StoreError::Code::OpenFailed,
                       "failed to open " + path + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc))};
        if (db) sqlite3_close(db);
        return sluice_detail::unexpected(std::move(err));
    }

    std::unique_ptr<SqliteDurableTier> tier(new SqliteDurableTier(db, path));
    if (auto s = tier->ensure_schema(); !s.has_value()) return sluice_detail::unexpected(s.error());
    SPDLOG_INFO("durable cache tier opened path={}", path);
    return tier;
}

SqliteDurableTier::~SqliteDurableTier() {
    if (db_) sqlite3_close(db_);
}

StoreError SqliteDurableTier::error(StoreError::Code code, const char* what) const {
    return StoreError{code, std::string(what) + ": " + sqlite3_errmsg(db_)};
}

sluice_detail::expected<void, StoreError> SqliteDurableTier::exec_sql(const char* sql, StoreError::Code code) {
    char* msg = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &msg) != SQLITE_OK) {
        StoreError err{code, msg ? msg : "unknown error"};
        if (msg) sqlite3_free(msg);
        return sluice_detail::unexpected(std::move(err));
    }
    return {};
}

sluice_detail::expected<void, StoreError> SqliteDurableTier::ensure_schema() {
    std::lock_guard lk(mu_);
    // in-memory databases refuse WAL and keep their journal mode
    if (auto r = exec_sql("PRAGMA journal_mode=WAL;", StoreError::Code::SchemaFailed); !r.has_value())
        SPDLOG_DEBUG("durable cache: WAL not enabled path={}: {}", path_, r.error().message);
    if (auto r = exec_sql("PRAGMA synchronous=NORMAL;", StoreError::Code::SchemaFailed); !r.has_value()) return r;
    if (auto r = exec_sql("PRAGMA busy_timeout=5000;", StoreError::Code::SchemaFailed); !r.has_value()) return r;

    int on_disk = 0;
    {
        Stmt st;
        if (sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &st.s, nullptr) != SQLITE_OK) {
            return sluice_detail::unexpected(error(StoreError::Code::SchemaFailed, "prepare user_version"));
        }
        if (sqlite3_step(st.s) == SQLITE_ROW) on_disk = sqlite3_column_int(st.s, 0);
    }
    if (on_disk != 0 && on_disk != durable_schema_version) {
        // cached rows are disposable; a layout change starts over
        SPDLOG_WARN("durable cache schema {} != {}, dropping table path={}", on_disk, durable_schema_version, path_);
        if (auto r = exec_sql("DROP TABLE IF EXISTS cache_entries;", StoreError::Code::SchemaFailed); !r.has_value())
            return r;
    }

    if (auto r = exec_sql(R"SQL(
        CREATE TABLE IF NOT EXISTS cache_entries(
          key               TEXT PRIMARY KEY,
          body              BLOB NOT NULL,
          compressed        INTEGER NOT NULL,
          fields            TEXT NOT NULL,
          source_id         TEXT NOT NULL,
          fetched_at_ms     INTEGER NOT NULL,
          ttl_s             INTEGER NOT NULL,
          expires_at_ms     INTEGER NOT NULL,
          quality           REAL NOT NULL,
          refresh_threshold REAL NOT NULL
        );
      )SQL", StoreError::Code::SchemaFailed); !r.has_value()) return r;

    if (auto r = exec_sql("CREATE INDEX IF NOT EXISTS idx_cache_expiry ON cache_entries(expires_at_ms);",
                          StoreError::Code::SchemaFailed); !r.has_value()) return r;

    const std::string version = "PRAGMA user_version=" + std::to_string(durable_schema_version) + ";";
    return exec_sql(version.c_str(), StoreError::Code::SchemaFailed);
}

sluice_detail::expected<std::optional<StoredRecord>, StoreError>
SqliteDurableTier::load(std::string_view key) {
    std::lock_guard lk(mu_);
    Stmt st;
    const char* sql = R"SQL(
        SELECT body, compressed, fields, source_id, fetched_at_ms, ttl_s, quality, refresh_threshold
        FROM cache_entries WHERE key = ?;
      )SQL";
    if (sqlite3_prepare_v2(db_, sql, -1, &st.s, nullptr) != SQLITE_OK) {
        return sluice_detail::unexpected(error(StoreError::Code::QueryFailed, "prepare load"));
    }
    sqlite3_bind_text(st.s, 1, key.data(), static_cast<int>(key.size()), SQLITE_TRANSIENT);

    const int rc = sqlite3_step(st.s);
    if (rc == SQLITE_DONE) return std::optional<StoredRecord>{};
    if (rc != SQLITE_ROW) return sluice_detail::unexpected(error(StoreError::Code::QueryFailed, "step load"));

    StoredRecord r;
    r.key = std::string(key);
    const auto* blob = static_cast<const char*>(sqlite3_column_blob(st.s, 0));
    const int blob_len = sqlite3_column_bytes(st.s, 0);
    if (blob && blob_len > 0) r.body.assign(blob, static_cast<std::size_t>(blob_len));
    r.compressed = sqlite3_column_int(st.s, 1) != 0;

    const auto* fields = reinterpret_cast<const char*>(sqlite3_column_text(st.s, 2));
    auto parsed = fields_from_json(fields ? std::string_view(fields) : std::string_view{});
    if (!parsed.has_value()) {
        return sluice_detail::unexpected(StoreError{StoreError::Code::CorruptRow,
                                                    "bad fields column for key " + r.key});
    }
    r.fields = std::move(*parsed);

    const auto* src = reinterpret_cast<const char*>(sqlite3_column_text(st.s, 3));
    r.source_id         = src ? src : "";
    r.fetched_at        = from_ms(sqlite3_column_int64(st.s, 4));
    r.ttl               = std::chrono::seconds(sqlite3_column_int64(st.s, 5));
    r.quality           = sqlite3_column_double(st.s, 6);
    r.refresh_threshold = sqlite3_column_double(st.s, 7);
    return std::optional<StoredRecord>{std::move(r)};
}

sluice_detail::expected<void, StoreError> SqliteDurableTier::store(const StoredRecord& rec) {
    std::lock_guard lk(mu_);
    Stmt st;
    const char* sql = R"SQL(
        INSERT INTO cache_entries(key, body, compressed, fields, source_id, fetched_at_ms, ttl_s,
                                  expires_at_ms, quality, refresh_threshold)
        VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(key) DO UPDATE SET
          body=excluded.body, compressed=excluded.compressed, fields=excluded.fields,
          source_id=excluded.source_id, fetched_at_ms=excluded.fetched_at_ms, ttl_s=excluded.ttl_s,
          expires_at_ms=excluded.expires_at_ms, quality=excluded.quality,
          refresh_threshold=excluded.refresh_threshold;
      )SQL";
    if (sqlite3_prepare_v2(db_, sql, -1, &st.s, nullptr) != SQLITE_OK) {
        return sluice_detail::unexpected(error(StoreError::Code::QueryFailed, "prepare store"));
    }
    const std::string fields = fields_to_json(rec.fields);
    sqlite3_bind_text(st.s, 1, rec.key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(st.s, 2, rec.body.data(), static_cast<int>(rec.body.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int(st.s, 3, rec.compressed ? 1 : 0);
    sqlite3_bind_text(st.s, 4, fields.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.s, 5, rec.source_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(st.s, 6, to_ms(rec.fetched_at));
    sqlite3_bind_int64(st.s, 7, rec.ttl.count());
    sqlite3_bind_int64(st.s, 8, to_ms(rec.expires_at()));
    sqlite3_bind_double(st.s, 9, rec.quality);
    sqlite3_bind_double(st.s, 10, rec.refresh_threshold);

    if (sqlite3_step(st.s) != SQLITE_DONE) {
        return sluice_detail::unexpected(error(StoreError::Code::QueryFailed, "store"));
    }
    return {};
}

sluice_detail::expected<bool, StoreError> SqliteDurableTier::erase(std::string_view key) {
    std::lock_guard lk(mu_);
    Stmt st;
    if (sqlite3_prepare_v2(db_, "DELETE FROM cache_entries WHERE key = ?;", -1, &st.s, nullptr) != SQLITE_OK) {
        return sluice_detail::unexpected(error(StoreError::Code::QueryFailed, "prepare erase"));
    }
    sqlite3_bind_text(st.s, 1, key.data(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
    if (sqlite3_step(st.s) != SQLITE_DONE) {
        return sluice_detail::unexpected(error(StoreError::Code::QueryFailed, "erase"));
    }
    return sqlite3_changes(db_) > 0;
}

sluice_detail::expected<std::size_t, StoreError> SqliteDurableTier::sweep(TimePoint cutoff) {
    std::lock_guard lk(mu_);
    Stmt st;
    if (sqlite3_prepare_v2(db_, "DELETE FROM cache_entries WHERE expires_at_ms < ?;", -1, &st.s, nullptr) != SQLITE_OK) {
        return sluice_detail::unexpected(error(StoreError::Code::QueryFailed, "prepare sweep"));
    }
    sqlite3_bind_int64(st.s, 1, to_ms(cutoff));
    if (sqlite3_step(st.s) != SQLITE_DONE) {
        return sluice_detail::unexpected(error(StoreError::Code::QueryFailed, "sweep"));
    }
    return static_cast<std::size_t>(sqlite3_changes(db_));
}

sluice_detail::expected<std::size_t, StoreError> SqliteDurableTier::count() {
    std::lock_guard lk(mu_);
    Stmt st;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM cache_entries;", -1, &st.s, nullptr) != SQLITE_OK) {
        return sluice_detail::unexpected(error(StoreError::Code::QueryFailed, "prepare count"));
    }
    if (sqlite3_step(st.s) != SQLITE_ROW) {
        return sluice_detail::unexpected(error(StoreError::Code::QueryFailed, "count"));
    }
    return static_cast<std::size_t>(sqlite3_column_int64(st.s, 0));
}

} // namespace sluice::cache
