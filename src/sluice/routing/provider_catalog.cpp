// ProviderCatalog: RCU with shared_ptr snapshots.
//   • Readers: atomic_load (ACQUIRE), non-blocking, consistent view.
//   • Writers: copy current map, mutate, atomic_store (RELEASE).

#include "sluice/routing/provider_catalog.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "sluice/config/constants.hpp"

namespace sluice::routing {

namespace cst = sluice::config::constants;

//------------------------------- Validation -----------------------------------

bool ProviderCatalog::validate_id(std::string_view id) noexcept {
    // [A-Za-z0-9_.-], 2..CATALOG_MAX_ID_LEN
    if (id.size() < 2 || id.size() > cst::CATALOG_MAX_ID_LEN) return false;
    for (char c : id) {
        const bool ok = (c == '_' || c == '-' || c == '.' ||
                         (c >= '0' && c <= '9') ||
                         (c >= 'A' && c <= 'Z') ||
                         (c >= 'a' && c <= 'z'));
        if (!ok) return false;
    }
    return true;
}

bool ProviderCatalog::validate(const ProviderDescriptor& d) noexcept {
    const auto& s = d.spec();
    if (!validate_id(s.id)) return false;
    if (!std::isfinite(s.cost_per_request) || s.cost_per_request < 0.0) return false;
    if (s.timeout.count() <= 0) return false;
    if (!(s.initial_reliability >= 0.0 && s.initial_reliability <= 1.0)) return false;

    const auto& rl = s.rate_limit;
    if (rl.requests > 0 && rl.window.count() <= 0) return false;
    if (rl.requests > 0 && rl.burst > rl.requests) return false;
    if (rl.burst_window.count() < 0 || (rl.burst_window.count() > 0 && rl.burst == 0)) return false;
    if (rl.daily_reset_hour_utc > 23) return false;

    const auto& act = s.activation;
    if (act.max_entities && act.min_entities > *act.max_entities) return false;
    return true;
}

std::string_view to_string(CatalogErr e) noexcept {
    switch (e) {
        case CatalogErr::Ok:       return "ok";
        case CatalogErr::Exists:   return "exists";
        case CatalogErr::NotFound: return "not_found";
        case CatalogErr::Invalid:  return "invalid";
        case CatalogErr::Capacity: return "capacity";
    }
    return "unknown";
}

//------------------------------- Reads ----------------------------------------

std::shared_ptr<const ProviderCatalog::Map> ProviderCatalog::snapshot() const noexcept {
    // RCU read: pairs with the RELEASE store in publish()
    return std::atomic_load_explicit(&map_, std::memory_order_acquire);
}

ProviderCatalog::DescriptorPtr ProviderCatalog::find(std::string_view id) const noexcept {
    auto snap = snapshot();
    auto it = snap->find(id);
    return it == snap->end() ? nullptr : it->second;
}

bool ProviderCatalog::contains(std::string_view id) const noexcept {
    auto snap = snapshot();
    return snap->find(id) != snap->end();
}

std::size_t ProviderCatalog::size() const noexcept {
    return snapshot()->size();
}

std::vector<ProviderCatalog::DescriptorPtr> ProviderCatalog::list() const {
    auto snap = snapshot();
    std::vector<DescriptorPtr> out;
    out.reserve(snap->size());
    for (const auto& kv : *snap) out.push_back(kv.second);
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a->id() < b->id(); });
    return out;
}

ProviderCatalog::Stats ProviderCatalog::stats() const noexcept {
    Stats s;
    s.adds = adds_.load(std::memory_order_relaxed);
    s.replaces = replaces_.load(std::memory_order_relaxed);
    s.upserts = upserts_.load(std::memory_order_relaxed);
    s.removes = removes_.load(std::memory_order_relaxed);
    s.reloads = reloads_.load(std::memory_order_relaxed);
    s.failures = failures_.load(std::memory_order_relaxed);
    return s;
}

//------------------------------- Mutations ------------------------------------

void ProviderCatalog::publish(std::shared_ptr<Map> next) noexcept {
    std::shared_ptr<const Map> cnext = std::move(next);
    std::atomic_store_explicit(&map_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

CatalogErr ProviderCatalog::add(DescriptorPtr d)     { return mutate(Mode::Add, std::move(d)); }
CatalogErr ProviderCatalog::replace(DescriptorPtr d) { return mutate(Mode::Replace, std::move(d)); }
CatalogErr ProviderCatalog::upsert(DescriptorPtr d)  { return mutate(Mode::Upsert, std::move(d)); }

bool ProviderCatalog::remove(std::string_view id) noexcept {
    std::lock_guard lk(write_mu_);
    auto snap = snapshot();
    if (snap->find(id) == snap->end()) return false;

    auto next = std::make_shared<Map>(*snap);
    next->erase(next->find(id));
    publish(std::move(next));
    removes_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void ProviderCatalog::clear() noexcept {
    std::lock_guard lk(write_mu_);
    publish(std::make_shared<Map>());
}

CatalogErr ProviderCatalog::mutate(Mode mode, DescriptorPtr d) {
    if (!d || !validate(*d)) return fail(CatalogErr::Invalid);

    std::lock_guard lk(write_mu_);
    auto snap = snapshot();
    auto next = std::make_shared<Map>(*snap); // copy-on-write
    auto it = next->find(d->id());
    const bool exists = (it != next->end());

    switch (mode) {
        case Mode::Add:
            if (exists) return fail(CatalogErr::Exists);
            break;
        case Mode::Replace:
            if (!exists) return fail(CatalogErr::NotFound);
            break;
        case Mode::Upsert:
            break;
    }
    if (!exists && next->size() >= cst::CATALOG_MAX_PROVIDERS) return fail(CatalogErr::Capacity);

    if (exists) {
        if (it->second != d) d->seed_reliability(it->second->reliability(), it->second->observations());
        it->second = std::move(d);
    } else {
        const std::string id = d->id();
        next->emplace(id, std::move(d));
    }
    publish(std::move(next));

    switch (mode) {
        case Mode::Add:     adds_.fetch_add(1, std::memory_order_relaxed); break;
        case Mode::Replace: replaces_.fetch_add(1, std::memory_order_relaxed); break;
        case Mode::Upsert:  upserts_.fetch_add(1, std::memory_order_relaxed); break;
    }
    return CatalogErr::Ok;
}

CatalogErr ProviderCatalog::reload(std::vector<DescriptorPtr> descriptors) {
    if (descriptors.size() > cst::CATALOG_MAX_PROVIDERS) return fail(CatalogErr::Capacity);

    std::unordered_set<std::string_view> seen;
    for (const auto& d : descriptors) {
        if (!d || !validate(*d)) return fail(CatalogErr::Invalid);
        if (!seen.insert(d->id()).second) return fail(CatalogErr::Exists);
    }

    std::lock_guard lk(write_mu_);
    auto snap = snapshot();
    auto next = std::make_shared<Map>();
    next->reserve(descriptors.size());
    std::size_t carried = 0;
    for (auto& d : descriptors) {
        if (auto it = snap->find(d->id()); it != snap->end() && it->second != d) {
            d->seed_reliability(it->second->reliability(), it->second->observations());
            ++carried;
        }
        const std::string id = d->id();
        next->emplace(id, std::move(d));
    }
    const auto count = next->size();
    publish(std::move(next));
    reloads_.fetch_add(1, std::memory_order_relaxed);
    SPDLOG_INFO("provider catalog reloaded providers={} reliability_carried={} version={}",
                count, carried, version());
    return CatalogErr::Ok;
}

} // namespace sluice::routing
