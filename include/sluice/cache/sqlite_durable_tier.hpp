#pragma once
/**
 * @file sqlite_durable_tier.hpp
 * @brief SQLite-backed durable tier (WAL journal, one row per key).
 * @details Use ":memory:" for a private in-memory database. All statements run under
 *          one connection mutex; multi-process sharing relies on SQLite file locking.
 */

#include <memory>
#include <mutex>
#include <string>

#include <sqlite3.h>

#include "sluice/cache/durable_tier.hpp"

namespace sluice::cache {

class SqliteDurableTier final : public DurableTier {
public:
    /// Open (creating if needed) the database and ensure the schema.
    static sluice_detail::expected<std::unique_ptr<SqliteDurableTier>, StoreError>
    open(const std::string& path);

    ~SqliteDurableTier() override;

    SqliteDurableTier(const SqliteDurableTier&) = delete;
    SqliteDurableTier& operator=(const SqliteDurableTier&) = delete;

    sluice_detail::expected<std::optional<StoredRecord>, StoreError> load(std::string_view key) override;
    sluice_detail::expected<void, StoreError> store(const StoredRecord& rec) override;
    sluice_detail::expected<bool, StoreError> erase(std::string_view key) override;
    sluice_detail::expected<std::size_t, StoreError> sweep(TimePoint cutoff) override;
    sluice_detail::expected<std::size_t, StoreError> count() override;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    SqliteDurableTier(sqlite3* db, std::string path) noexcept : db_(db), path_(std::move(path)) {}

    sluice_detail::expected<void, StoreError> ensure_schema();
    sluice_detail::expected<void, StoreError> exec_sql(const char* sql, StoreError::Code code);
    StoreError error(StoreError::Code code, const char* what) const;

    std::mutex  mu_;
    sqlite3*    db_{nullptr};
    std::string path_;
};

} // namespace sluice::cache
