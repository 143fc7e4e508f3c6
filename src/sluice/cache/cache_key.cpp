/**
 * @file cache_key.cpp
 */
#include "sluice/cache/cache_key.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sluice/config/constants.hpp"

namespace sluice::cache {

uint64_t hash_bytes(std::string_view bytes, uint64_t seed) noexcept {
    constexpr uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
    constexpr uint64_t FNV_PRIME  = 0x100000001b3ULL;
    // splitmix64/wyhash-style avalanching
    constexpr uint64_t PHI = 0x9e3779b97f4a7c15ULL;
    constexpr uint64_t M1  = 0xff51afd7ed558ccdULL;
    constexpr uint64_t M2  = 0xc4ceb9fe1a85ec53ULL;

    uint64_t x = FNV_OFFSET;
    for (unsigned char c : bytes) { x ^= c; x *= FNV_PRIME; }

    x ^= seed + PHI + (x << 6) + (x >> 2);
    x ^= (x >> 33); x *= M1;
    x ^= (x >> 33); x *= M2;
    x ^= (x >> 33);
    return x;
}

namespace {

void append_field(std::string& out, std::string_view v) {
    out += std::to_string(v.size());
    out += ':';
    out += v;
}

/// Absent and empty are different inputs.
void append_optional(std::string& out, const std::optional<std::string>& v) {
    if (!v) { out += '~'; return; }
    append_field(out, std::string_view(*v));
}

std::optional<std::string> day_of(const std::optional<core::TimePoint>& t) {
    if (!t) return std::nullopt;
    return std::to_string(std::chrono::floor<std::chrono::days>(*t).time_since_epoch().count());
}

} // namespace

std::string make_cache_key(const core::FilterCriteria& c) {
    std::vector<std::string> keys;
    keys.reserve(c.entity_keys.size());
    for (const auto& k : c.entity_keys) {
        std::string up(k);
        std::transform(up.begin(), up.end(), up.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
        keys.push_back(std::move(up));
    }
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

    // every component is length-prefixed so no key text can imitate a separator
    std::string canon;
    canon += std::to_string(keys.size());
    canon += '#';
    for (const auto& k : keys) append_field(canon, k);
    append_optional(canon, c.sector);
    append_optional(canon, day_of(c.from));
    append_optional(canon, day_of(c.to));

    char hex[17];
    std::snprintf(hex, sizeof(hex), "%016llx",
                  static_cast<unsigned long long>(hash_bytes(canon, sluice::config::constants::CACHE_KEY_SEED)));

    std::string key;
    key.reserve(48);
    key.append(core::to_string(c.data_type));
    key.push_back(':');
    key.append(core::to_string(c.granularity));
    key.push_back(':');
    key.append(hex, 16);
    return key;
}

} // namespace sluice::cache
