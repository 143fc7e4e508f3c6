#pragma once
/**
 * @file cache_entry.hpp
 * @brief Cached value with freshness and quality metadata, plus its stored (encoded) form.
 */

#include <chrono>
#include <map>
#include <string>

#include "sluice/config/constants.hpp"
#include "sluice/core/types.hpp"

namespace sluice::cache {

using core::TimePoint;

/** @struct CacheEntry
 *  @brief Decoded cache entry as handed to callers.
 */
struct CacheEntry {
    std::string          key;
    core::Payload        value;
    std::string          source_id;
    TimePoint            fetched_at{};
    std::chrono::seconds ttl{0};
    double               quality{1.0};   ///< 0..1, after anomaly downgrade
    double               refresh_threshold{sluice::config::constants::CACHE_REFRESH_THRESHOLD};
    bool                 compressed{false}; ///< Body is stored deflated
    bool                 stale{false};      ///< Set on degraded reads of an expired entry

    [[nodiscard]] std::chrono::nanoseconds age(TimePoint now) const noexcept { return now - fetched_at; }
    [[nodiscard]] TimePoint expires_at() const noexcept { return fetched_at + ttl; }

    /// age < ttl
    [[nodiscard]] bool is_fresh(TimePoint now) const noexcept { return age(now) < ttl; }

    /// age < min(ttl, max_staleness); a zero max_staleness leaves the TTL alone.
    [[nodiscard]] bool is_fresh(TimePoint now, std::chrono::seconds max_staleness) const noexcept {
        const auto bound = (max_staleness.count() > 0 && max_staleness < ttl) ? max_staleness : ttl;
        return age(now) < bound;
    }

    /// age > ttl * refresh_threshold
    [[nodiscard]] bool needs_background_refresh(TimePoint now) const noexcept {
        return std::chrono::duration<double>(age(now)).count() >
               static_cast<double>(ttl.count()) * refresh_threshold;
    }
};

/** @struct StoredRecord
 *  @brief Encoded entry as held by the fast and durable tiers.
 */
struct StoredRecord {
    std::string                   key;
    std::string                   body;        ///< Deflated when `compressed`
    bool                          compressed{false};
    std::map<std::string, double> fields;
    std::string                   source_id;
    TimePoint                     fetched_at{};
    std::chrono::seconds          ttl{0};
    double                        quality{1.0};
    double                        refresh_threshold{sluice::config::constants::CACHE_REFRESH_THRESHOLD};

    [[nodiscard]] TimePoint expires_at() const noexcept { return fetched_at + ttl; }
};

} // namespace sluice::cache
