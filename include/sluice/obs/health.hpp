#pragma once
/**
 * @file health.hpp
 * @brief Read-only health snapshot across the core components, renderable as JSON.
 */

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "sluice/cache/cache_store.hpp"
#include "sluice/obs/observability.hpp"
#include "sluice/ratelimit/budget_tracker.hpp"
#include "sluice/ratelimit/rate_limiter.hpp"
#include "sluice/routing/circuit_breaker.hpp"
#include "sluice/routing/provider_catalog.hpp"

namespace sluice::obs {

/** @struct ProviderHealth
 *  @brief Reliability and breaker view of one catalog entry.
 */
struct ProviderHealth {
    std::string           id;
    double                reliability{0.0};
    uint64_t              observations{0};
    routing::CircuitState circuit{routing::CircuitState::Closed};
};

struct HealthSnapshot {
    std::vector<ratelimit::LimiterStatus>  limiters;
    std::optional<cache::CacheStats>       cache;
    std::vector<ProviderHealth>            providers;
    std::vector<routing::BreakerStatus>    breakers;
    std::optional<ratelimit::BudgetStatus> budget;
    std::optional<Counters>                requests;
    uint64_t                               catalog_version{0};
};

/// Any source may be null; its section is then left empty.
struct HealthSources {
    const ratelimit::RateLimiter*        limiter{nullptr};
    const cache::CacheStore*             cache{nullptr};
    const routing::ProviderCatalog*      catalog{nullptr};
    const routing::CircuitBreakerBank*   breakers{nullptr};
    const ratelimit::BudgetTracker*      budget{nullptr};
    const Observer*                      observer{nullptr};
};

[[nodiscard]] HealthSnapshot collect(const HealthSources& src);

void to_json(nlohmann::json& j, const HealthSnapshot& h);

} // namespace sluice::obs
