#pragma once
/**
 * @file cache_key.hpp
 * @brief Deterministic cache key: "<dataType>:<granularity>:<16 hex digits>".
 * @details Entity keys are upper-cased, sorted and de-duplicated before hashing, so
 *          ["msft","AAPL"] and ["AAPL","MSFT","AAPL"] share a key. Sector and date range
 *          are hashed too, so distinct filters never collide on one entry.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include "sluice/core/types.hpp"

namespace sluice::cache {

[[nodiscard]] std::string make_cache_key(const core::FilterCriteria& criteria);

/// FNV-1a 64 followed by an avalanche finalizer.
[[nodiscard]] uint64_t hash_bytes(std::string_view bytes, uint64_t seed) noexcept;

} // namespace sluice::cache
