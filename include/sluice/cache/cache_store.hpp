#pragma once
/**
 * @file cache_store.hpp
 * @brief Two-tier cache with freshness, quality and refresh-ahead.
 *
 * Tiers:
 *   - FastTier: bounded in-process LRU, holds encoded records.
 *   - DurableTier (optional): survives restarts, keeps expired rows until the retention
 *     ceiling so degraded reads have something to return.
 *
 * Routine conditions (miss, expired, durable I/O error) are results, never exceptions.
 * Durable errors are logged and counted; the fast tier keeps serving.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

#include "sluice/cache/anomaly_detector.hpp"
#include "sluice/cache/cache_entry.hpp"
#include "sluice/cache/durable_tier.hpp"
#include "sluice/cache/fast_tier.hpp"
#include "sluice/cache/ttl_policy.hpp"
#include "sluice/config/constants.hpp"
#include "sluice/core/clock.hpp"
#include "sluice/core/string_key.hpp"
#include "sluice/exec/worker_pool.hpp"

namespace sluice::cache {

/** @struct CacheConfig
 *  @brief Cache sizing and policy.
 */
struct CacheConfig {
    std::size_t          fast_capacity{sluice::config::constants::CACHE_FAST_CAPACITY};
    std::size_t          fast_shards{sluice::config::constants::CACHE_FAST_SHARDS};
    std::size_t          compression_threshold{sluice::config::constants::CACHE_COMPRESSION_THRESHOLD_BYTES};
    std::chrono::seconds retention_ceiling{sluice::config::constants::CACHE_RETENTION_CEILING_S};
    std::string          durable_path{sluice::config::constants::CACHE_DURABLE_PATH}; ///< Empty = no durable tier
    AnomalyConfig        anomaly{};
    TtlPolicy            ttl{};
};

/** @struct CacheStats
 *  @brief Cumulative counters for health snapshots.
 */
struct CacheStats {
    uint64_t    hits{0};          ///< Fresh entries returned by get()
    uint64_t    misses{0};        ///< Absent or expired on get()
    uint64_t    fast_hits{0};
    uint64_t    durable_hits{0};  ///< Found only in the durable tier (then promoted)
    uint64_t    stale_served{0};  ///< Degraded reads that returned an expired entry
    uint64_t    writes{0};
    uint64_t    evictions{0};
    uint64_t    compressed_writes{0};
    uint64_t    anomalies{0};
    uint64_t    refreshes_scheduled{0};
    uint64_t    refreshes_deduplicated{0};
    uint64_t    refreshes_rejected{0};
    uint64_t    durable_errors{0};
    uint64_t    codec_errors{0};
    std::size_t fast_size{0};

    [[nodiscard]] double hit_rate() const noexcept {
        const auto total = hits + misses;
        return total ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }
};

class CacheStore {
public:
    /**
     * @param cfg Policy. cfg.durable_path is informational here; the tier is passed in.
     * @param durable Optional durable tier (nullptr = fast tier only).
     * @param pool Optional pool for background refresh (nullptr = refresh-ahead disabled).
     * @param clock Time source.
     */
    CacheStore(CacheConfig cfg,
               std::unique_ptr<DurableTier> durable,
               std::shared_ptr<exec::WorkerPool> pool,
               std::shared_ptr<const core::Clock> clock = core::system_clock());

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    /// Entry if present in either tier, fresh or not. `stale` tells which.
    [[nodiscard]] std::optional<CacheEntry> get(std::string_view key);

    /// Degraded-mode read: same lookup, counted as a stale serve when expired.
    [[nodiscard]] std::optional<CacheEntry> get_degraded(std::string_view key);

    /**
     * @brief Store a value in both tiers.
     * @param refresh_threshold Fraction of TTL that triggers refresh-ahead (nullopt = TTL table default 0.8).
     * @return Quality actually stored (after the anomaly downgrade).
     */
    double set(std::string_view key, core::Payload value, std::string source_id,
               std::chrono::seconds ttl, double quality,
               std::optional<double> refresh_threshold = std::nullopt);

    /// Remove from both tiers. Returns true if the key existed in either.
    bool invalidate(std::string_view key);

    /**
     * @brief Enqueue @p refresh_fn at most once per key while one is in flight.
     * @return true if a new task was enqueued; false if one is already pending,
     *         the pool is full/stopped, or no pool is configured.
     */
    bool schedule_background_refresh(std::string_view key, std::function<void()> refresh_fn);

    [[nodiscard]] bool refresh_in_flight(std::string_view key) const;

    /// Drop fast entries past expiry and durable rows past expiry + retention ceiling.
    std::size_t sweep_expired();

    [[nodiscard]] CacheStats stats() const;
    [[nodiscard]] const TtlRule& rule_for(core::DataType t) const noexcept { return cfg_.ttl.rule_for(t); }
    [[nodiscard]] const CacheConfig& config() const noexcept { return cfg_; }
    [[nodiscard]] bool has_durable_tier() const noexcept { return durable_ != nullptr; }

private:
    /// Keys with a refresh task queued or running; outlives the store if tasks do.
    struct RefreshSet {
        std::mutex mu;
        std::unordered_set<std::string, core::StringKeyHash, core::StringKeyEq> keys;
    };
    struct RefreshRelease;

    std::optional<CacheEntry> lookup(std::string_view key);

    struct Counters {
        std::atomic<uint64_t> hits{0}, misses{0}, fast_hits{0}, durable_hits{0}, stale_served{0},
            writes{0}, evictions{0}, compressed_writes{0}, anomalies{0}, refreshes_scheduled{0},
            refreshes_deduplicated{0}, refreshes_rejected{0}, durable_errors{0}, codec_errors{0};
    };

    CacheConfig                        cfg_;
    FastTier                           fast_;
    std::unique_ptr<DurableTier>       durable_;
    std::shared_ptr<exec::WorkerPool>  pool_;
    std::shared_ptr<const core::Clock> clock_;
    AnomalyDetector                    anomaly_;
    std::shared_ptr<RefreshSet>        refreshing_{std::make_shared<RefreshSet>()};
    mutable Counters                   ctr_;
};

} // namespace sluice::cache
