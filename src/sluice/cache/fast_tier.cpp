/**
 * @file fast_tier.cpp
 */
#include "sluice/cache/fast_tier.hpp"

#include <algorithm>
#include <mutex>

namespace sluice::cache {

FastTier::FastTier(std::size_t capacity, std::size_t shards) {
    capacity = std::max<std::size_t>(1, capacity);
    shards   = std::clamp<std::size_t>(shards, 1, capacity);
    per_shard_ = (capacity + shards - 1) / shards;
    shards_.reserve(shards);
    for (std::size_t i = 0; i < shards; ++i) shards_.push_back(std::make_unique<Shard>());
}

FastTier::Shard& FastTier::shard_for(std::string_view key) const noexcept {
    const auto h = core::StringKeyHash{}(key);
    return *shards_[h % shards_.size()];
}

std::shared_ptr<const StoredRecord> FastTier::get(std::string_view key) const {
    Shard& s = shard_for(key);
    std::shared_lock lk(s.mu);
    auto it = s.map.find(key);
    if (it == s.map.end()) return nullptr;
    it->second.touched.store(tick(), std::memory_order_relaxed);
    return it->second.rec;
}

std::size_t FastTier::put(std::shared_ptr<const StoredRecord> rec) {
    if (!rec) return 0;
    Shard& s = shard_for(rec->key);
    std::unique_lock lk(s.mu);

    auto it = s.map.find(rec->key);
    if (it != s.map.end()) {
        it->second.rec = std::move(rec);
        it->second.touched.store(tick(), std::memory_order_relaxed);
        return 0;
    }
    return insert_locked(s, std::move(rec));
}

std::shared_ptr<const StoredRecord> FastTier::promote(std::shared_ptr<const StoredRecord> rec,
                                                      std::size_t& evicted) {
    if (!rec) return nullptr;
    Shard& s = shard_for(rec->key);
    std::unique_lock lk(s.mu);

    auto it = s.map.find(rec->key);
    if (it != s.map.end()) {
        it->second.touched.store(tick(), std::memory_order_relaxed);
        // a write that landed after the durable read wins
        if (it->second.rec->fetched_at >= rec->fetched_at) return it->second.rec;
        it->second.rec = std::move(rec);
        return it->second.rec;
    }
    auto kept = rec;
    evicted += insert_locked(s, std::move(rec));
    return kept;
}

std::size_t FastTier::insert_locked(Shard& s, std::shared_ptr<const StoredRecord> rec) {
    std::size_t evicted = 0;
    if (s.map.size() >= per_shard_) {
        auto victim = std::min_element(s.map.begin(), s.map.end(), [](const auto& a, const auto& b) {
            return a.second.touched.load(std::memory_order_relaxed) <
                   b.second.touched.load(std::memory_order_relaxed);
        });
        if (victim != s.map.end()) {
            s.map.erase(victim);
            evicted = 1;
        }
    }
    auto [slot, inserted] = s.map.try_emplace(rec->key);
    slot->second.rec = std::move(rec);
    slot->second.touched.store(tick(), std::memory_order_relaxed);
    return evicted;
}

bool FastTier::erase(std::string_view key) {
    Shard& s = shard_for(key);
    std::unique_lock lk(s.mu);
    auto it = s.map.find(key);
    if (it == s.map.end()) return false;
    s.map.erase(it);
    return true;
}

std::size_t FastTier::erase_expired_before(TimePoint cutoff) {
    std::size_t n = 0;
    for (auto& sp : shards_) {
        std::unique_lock lk(sp->mu);
        n += std::erase_if(sp->map, [&](const auto& kv) { return kv.second.rec->expires_at() < cutoff; });
    }
    return n;
}

void FastTier::clear() {
    for (auto& sp : shards_) {
        std::unique_lock lk(sp->mu);
        sp->map.clear();
    }
}

std::size_t FastTier::size() const {
    std::size_t n = 0;
    for (const auto& sp : shards_) {
        std::shared_lock lk(sp->mu);
        n += sp->map.size();
    }
    return n;
}

} // namespace sluice::cache
