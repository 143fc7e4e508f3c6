/**
 * @file health.cpp
 */
#include "sluice/obs/health.hpp"

#include <nlohmann/json.hpp>

namespace sluice::obs {

namespace {

std::string str(std::string_view s) { return std::string(s); }

} // namespace

HealthSnapshot collect(const HealthSources& src) {
    HealthSnapshot h;
    if (src.limiter) h.limiters = src.limiter->status_all();
    if (src.cache) h.cache = src.cache->stats();
    if (src.catalog) {
        h.catalog_version = src.catalog->version();
        for (const auto& d : src.catalog->list()) {
            ProviderHealth p{d->id(), d->reliability(), d->observations(), routing::CircuitState::Closed};
            if (src.breakers) p.circuit = src.breakers->state(d->id());
            h.providers.push_back(std::move(p));
        }
    }
    if (src.breakers) h.breakers = src.breakers->status_all();
    if (src.budget) h.budget = src.budget->status();
    if (src.observer) h.requests = src.observer->snapshot();
    return h;
}

void to_json(nlohmann::json& j, const HealthSnapshot& h) {
    j = nlohmann::json::object();

    auto& limiters = j["rate_limits"] = nlohmann::json::array();
    for (const auto& l : h.limiters) {
        nlohmann::json gates = nlohmann::json::array();
        for (const auto& g : l.gates) {
            gates.push_back({{"kind", str(ratelimit::to_string(g.kind))},
                             {"available", g.available},
                             {"capacity", g.capacity},
                             {"window_ms", g.window.count()},
                             {"reset_in_ms", g.reset_in.count()}});
        }
        limiters.push_back({{"provider", l.provider_id}, {"granted", l.granted}, {"denied", l.denied},
                            {"gates", std::move(gates)}});
    }

    if (h.cache) {
        const auto& c = *h.cache;
        j["cache"] = {{"hits", c.hits}, {"misses", c.misses}, {"hit_rate", c.hit_rate()},
                      {"fast_hits", c.fast_hits}, {"durable_hits", c.durable_hits},
                      {"stale_served", c.stale_served}, {"writes", c.writes}, {"evictions", c.evictions},
                      {"compressed_writes", c.compressed_writes}, {"anomalies", c.anomalies},
                      {"refreshes_scheduled", c.refreshes_scheduled},
                      {"refreshes_deduplicated", c.refreshes_deduplicated},
                      {"refreshes_rejected", c.refreshes_rejected},
                      {"durable_errors", c.durable_errors}, {"codec_errors", c.codec_errors},
                      {"fast_size", c.fast_size}};
    }

    auto& providers = j["providers"] = nlohmann::json::array();
    for (const auto& p : h.providers) {
        providers.push_back({{"id", p.id}, {"reliability", p.reliability}, {"observations", p.observations},
                             {"circuit", str(routing::to_string(p.circuit))}});
    }
    j["catalog_version"] = h.catalog_version;

    auto& breakers = j["breakers"] = nlohmann::json::array();
    for (const auto& b : h.breakers) {
        breakers.push_back({{"provider", b.provider_id}, {"state", str(routing::to_string(b.state))},
                            {"consecutive_failures", b.consecutive_failures}, {"trips", b.trips},
                            {"retry_in_ms", b.retry_in.count()}});
    }

    if (h.budget) {
        const auto& b = *h.budget;
        j["budget"] = {{"daily_spent", b.daily_spent}, {"monthly_spent", b.monthly_spent},
                       {"daily_limit", b.daily_limit}, {"monthly_limit", b.monthly_limit},
                       {"level", str(ratelimit::to_string(b.level))},
                       {"monthly_by_provider", b.monthly_by_provider}};
    }

    if (h.requests) {
        const auto& r = *h.requests;
        j["requests"] = {{"total", r.requests}, {"fresh_hits", r.fresh_hits}, {"refreshed", r.refreshed},
                         {"stale_served", r.stale_served}, {"unroutable", r.unroutable},
                         {"unavailable", r.unavailable}, {"timeouts", r.timeouts},
                         {"failovers", r.failovers}, {"conflicts", r.conflicts},
                         {"flagged_for_review", r.flagged_for_review}};
    }
}

} // namespace sluice::obs
