#pragma once
/**
 * @file fast_tier.hpp
 * @brief Bounded in-process tier: lock-striped map with least-recently-used eviction.
 *
 * Concurrency model:
 *   - Keys hash to one of N shards; each shard has a shared_mutex.
 *   - Reads take the shard lock shared and bump an atomic access tick (no list splice),
 *     so concurrent readers of a shard never serialize.
 *   - Writes take the shard lock exclusive. Eviction picks the slot with the oldest tick.
 *   - Records are immutable shared_ptrs: a reader keeps its copy alive across replacement.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "sluice/cache/cache_entry.hpp"
#include "sluice/core/string_key.hpp"

namespace sluice::cache {

class FastTier {
public:
    /**
     * @param capacity Total entry budget across shards (>= 1).
     * @param shards Number of lock stripes (>= 1, clamped to capacity).
     */
    FastTier(std::size_t capacity, std::size_t shards);

    FastTier(const FastTier&) = delete;
    FastTier& operator=(const FastTier&) = delete;

    [[nodiscard]] std::shared_ptr<const StoredRecord> get(std::string_view key) const;

    /// Insert or replace. Returns the number of entries evicted to make room (0 or 1).
    std::size_t put(std::shared_ptr<const StoredRecord> rec);

    /**
     * @brief Insert a record read back from the durable tier unless a newer one is already held.
     * @param evicted Incremented when room had to be made.
     * @return The record the tier holds for the key afterwards.
     */
    std::shared_ptr<const StoredRecord> promote(std::shared_ptr<const StoredRecord> rec, std::size_t& evicted);

    bool erase(std::string_view key);

    /// Drop entries whose expiry is older than @p cutoff. Returns how many were dropped.
    std::size_t erase_expired_before(TimePoint cutoff);

    void clear();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return per_shard_ * shards_.size(); }

private:
    struct Slot {
        std::shared_ptr<const StoredRecord> rec;
        mutable std::atomic<uint64_t>       touched{0};
    };

    struct Shard {
        mutable std::shared_mutex mu;
        std::unordered_map<std::string, Slot, core::StringKeyHash, core::StringKeyEq> map;
    };

    Shard& shard_for(std::string_view key) const noexcept;
    std::size_t insert_locked(Shard& s, std::shared_ptr<const StoredRecord> rec);
    uint64_t tick() const noexcept { return clock_.fetch_add(1, std::memory_order_relaxed) + 1; }

    std::size_t                         per_shard_;
    std::vector<std::unique_ptr<Shard>> shards_;
    mutable std::atomic<uint64_t>       clock_{0};
};

} // namespace sluice::cache
