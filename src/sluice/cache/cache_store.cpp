/**
 * @file cache_store.cpp
 * @brief Two-tier lookup, write path with anomaly downgrade, refresh-ahead dedup.
 */
#include "sluice/cache/cache_store.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "sluice/cache/payload_codec.hpp"

namespace sluice::cache {

namespace {

constexpr auto kRelaxed = std::memory_order_relaxed;

} // namespace

/// Erases the key from the in-flight set when the last copy of its task goes away.
struct CacheStore::RefreshRelease {
    RefreshRelease(std::shared_ptr<RefreshSet> s, std::string k) : set(std::move(s)), key(std::move(k)) {}
    ~RefreshRelease() {
        std::lock_guard lk(set->mu);
        set->keys.erase(key);
    }
    std::shared_ptr<RefreshSet> set;
    std::string                 key;
};

CacheStore::CacheStore(CacheConfig cfg,
                       std::unique_ptr<DurableTier> durable,
                       std::shared_ptr<exec::WorkerPool> pool,
                       std::shared_ptr<const core::Clock> clock)
    : cfg_(std::move(cfg)),
      fast_(std::max<std::size_t>(cfg_.fast_capacity, 1), std::max<std::size_t>(cfg_.fast_shards, 1)),
      durable_(std::move(durable)),
      pool_(std::move(pool)),
      clock_(clock ? std::move(clock) : core::system_clock()),
      anomaly_(cfg_.anomaly) {}

std::optional<CacheEntry> CacheStore::lookup(std::string_view key) {
    std::shared_ptr<const StoredRecord> rec = fast_.get(key);
    bool from_durable = false;

    if (!rec && durable_) {
        auto loaded = durable_->load(key);
        if (!loaded.has_value()) {
            ctr_.durable_errors.fetch_add(1, kRelaxed);
            SPDLOG_ERROR("durable load failed key={} code={} err={}", key,
                         to_string(loaded.error().code), loaded.error().message);
        } else if (loaded->has_value()) {
            rec = std::make_shared<const StoredRecord>(std::move(**loaded));
            from_durable = true;
        }
    }
    if (!rec) return std::nullopt;

    if (from_durable) {
        std::size_t evicted = 0;
        rec = fast_.promote(std::move(rec), evicted);
        ctr_.durable_hits.fetch_add(1, kRelaxed);
        ctr_.evictions.fetch_add(evicted, kRelaxed);
    } else {
        ctr_.fast_hits.fetch_add(1, kRelaxed);
    }

    auto decoded = decode_record(*rec);
    if (!decoded.has_value()) {
        ctr_.codec_errors.fetch_add(1, kRelaxed);
        SPDLOG_ERROR("dropping undecodable cache entry key={} err={}", key, to_string(decoded.error()));
        invalidate(key);
        return std::nullopt;
    }
    decoded->stale = !decoded->is_fresh(clock_->now());
    return std::optional<CacheEntry>(std::move(*decoded));
}

std::optional<CacheEntry> CacheStore::get(std::string_view key) {
    auto e = lookup(key);
    if (e && !e->stale) ctr_.hits.fetch_add(1, kRelaxed);
    else ctr_.misses.fetch_add(1, kRelaxed);
    return e;
}

std::optional<CacheEntry> CacheStore::get_degraded(std::string_view key) {
    auto e = lookup(key);
    if (e && e->stale) {
        ctr_.stale_served.fetch_add(1, kRelaxed);
        SPDLOG_WARN("serving stale entry key={} source={} age_s={}", key, e->source_id,
                    std::chrono::duration_cast<std::chrono::seconds>(e->age(clock_->now())).count());
    }
    return e;
}

double CacheStore::set(std::string_view key, core::Payload value, std::string source_id,
                       std::chrono::seconds ttl, double quality,
                       std::optional<double> refresh_threshold) {
    const auto verdict = anomaly_.assess(key, value.fields);
    double q = std::clamp(quality, 0.0, 1.0);
    if (verdict.anomalous) {
        ctr_.anomalies.fetch_add(1, kRelaxed);
        q = std::clamp(q * verdict.quality_factor, 0.0, 1.0);
        SPDLOG_WARN("anomalous write key={} source={} fields={} quality={:.3f}", key, source_id,
                    verdict.fields.size(), q);
    }

    CacheEntry e;
    e.key = std::string(key);
    e.value = std::move(value);
    e.source_id = std::move(source_id);
    e.fetched_at = clock_->now();
    e.ttl = ttl;
    e.quality = q;
    e.refresh_threshold = refresh_threshold.value_or(sluice::config::constants::CACHE_REFRESH_THRESHOLD);

    auto encoded = encode_entry(e, cfg_.compression_threshold);
    if (!encoded.has_value()) {
        // Keep serving the previous value rather than caching something unreadable
        ctr_.codec_errors.fetch_add(1, kRelaxed);
        SPDLOG_ERROR("cache encode failed key={} err={}", key, to_string(encoded.error()));
        return q;
    }
    if (encoded->compressed) ctr_.compressed_writes.fetch_add(1, kRelaxed);

    auto rec = std::make_shared<const StoredRecord>(std::move(*encoded));
    if (durable_) {
        if (auto s = durable_->store(*rec); !s.has_value()) {
            ctr_.durable_errors.fetch_add(1, kRelaxed);
            SPDLOG_ERROR("durable store failed key={} code={} err={}", key,
                         to_string(s.error().code), s.error().message);
        }
    }
    ctr_.evictions.fetch_add(fast_.put(std::move(rec)), kRelaxed);
    ctr_.writes.fetch_add(1, kRelaxed);
    return q;
}

bool CacheStore::invalidate(std::string_view key) {
    bool existed = fast_.erase(key);
    if (durable_) {
        auto r = durable_->erase(key);
        if (!r.has_value()) {
            ctr_.durable_errors.fetch_add(1, kRelaxed);
            SPDLOG_ERROR("durable erase failed key={} err={}", key, r.error().message);
        } else {
            existed = existed || *r;
        }
    }
    anomaly_.forget(key);
    return existed;
}

bool CacheStore::schedule_background_refresh(std::string_view key, std::function<void()> refresh_fn) {
    if (!pool_ || !refresh_fn) {
        ctr_.refreshes_rejected.fetch_add(1, kRelaxed);
        return false;
    }
    {
        std::lock_guard lk(refreshing_->mu);
        if (!refreshing_->keys.emplace(key).second) {
            ctr_.refreshes_deduplicated.fetch_add(1, kRelaxed);
            return false;
        }
    }

    // The guard travels with the task: it releases the key once the task has run,
    // or when the pool drops it (queue full, stopped, discarded at shutdown).
    auto guard = std::make_shared<RefreshRelease>(refreshing_, std::string(key));
    auto task = [guard, fn = std::move(refresh_fn)] { fn(); };

    const auto rc = pool_->submit(std::move(task));
    if (rc != exec::SubmitErr::Ok) {
        ctr_.refreshes_rejected.fetch_add(1, kRelaxed);
        SPDLOG_WARN("background refresh rejected key={} reason={}", key,
                    rc == exec::SubmitErr::Full ? "queue_full" : "stopped");
        return false;
    }
    ctr_.refreshes_scheduled.fetch_add(1, kRelaxed);
    SPDLOG_DEBUG("background refresh scheduled key={}", key);
    return true;
}

bool CacheStore::refresh_in_flight(std::string_view key) const {
    std::lock_guard lk(refreshing_->mu);
    return refreshing_->keys.find(key) != refreshing_->keys.end();
}

std::size_t CacheStore::sweep_expired() {
    const auto now = clock_->now();
    std::size_t dropped = fast_.erase_expired_before(now);
    if (durable_) {
        auto r = durable_->sweep(now - cfg_.retention_ceiling);
        if (!r.has_value()) {
            ctr_.durable_errors.fetch_add(1, kRelaxed);
            SPDLOG_ERROR("durable sweep failed err={}", r.error().message);
        } else {
            dropped += *r;
        }
    }
    if (dropped) SPDLOG_INFO("cache sweep dropped={}", dropped);
    return dropped;
}

CacheStats CacheStore::stats() const {
    CacheStats s;
    s.hits = ctr_.hits.load(kRelaxed);
    s.misses = ctr_.misses.load(kRelaxed);
    s.fast_hits = ctr_.fast_hits.load(kRelaxed);
    s.durable_hits = ctr_.durable_hits.load(kRelaxed);
    s.stale_served = ctr_.stale_served.load(kRelaxed);
    s.writes = ctr_.writes.load(kRelaxed);
    s.evictions = ctr_.evictions.load(kRelaxed);
    s.compressed_writes = ctr_.compressed_writes.load(kRelaxed);
    s.anomalies = ctr_.anomalies.load(kRelaxed);
    s.refreshes_scheduled = ctr_.refreshes_scheduled.load(kRelaxed);
    s.refreshes_deduplicated = ctr_.refreshes_deduplicated.load(kRelaxed);
    s.refreshes_rejected = ctr_.refreshes_rejected.load(kRelaxed);
    s.durable_errors = ctr_.durable_errors.load(kRelaxed);
    s.codec_errors = ctr_.codec_errors.load(kRelaxed);
    s.fast_size = fast_.size();
    return s;
}

} // namespace sluice::cache
