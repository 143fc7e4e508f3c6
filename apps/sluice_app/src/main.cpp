/**
 * @file main.cpp
 * @brief sluice_app: wires the data-acquisition core end to end against simulated providers.
 *
 * **Bootstrap**
 * - Load config (argv[1]) or the built-in demo catalog; init logging.
 * - Construct limiter, durable + fast cache, worker pool, catalog, breakers, budget, resolver.
 *
 * **Request path**
 * - Issue a few requests: cold fetch, fresh hit, cross-validated quote, failover, degraded return.
 *
 * **Observability & lifecycle**
 * - Print the health snapshot as JSON; drain the worker pool before exit.
 */

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "sluice/cache/sqlite_durable_tier.hpp"
#include "sluice/config/config_loader.hpp"
#include "sluice/exec/failover_executor.hpp"
#include "sluice/obs/health.hpp"
#include "sluice/obs/logging.hpp"
#include "sluice/provider/simulated_provider.hpp"
#include "sluice/version.hpp"

namespace {

using namespace sluice;

constexpr const char* kDemoConfig = R"({
  "logging": { "level": "info" },
  "cache": { "durable_path": "" },
  "executor": { "cross_validate": { "quote": 2 } },
  "budget": { "monthly_limit": 50, "daily_limit": 5 },
  "providers": [
    { "id": "exchange-feed", "tier": "commercial", "scope": "individual",
      "rate_limit": { "requests": 5, "window_ms": 60000, "burst": 2, "burst_window_ms": 10000 },
      "cost_per_request": 0.01, "reliability": 0.95,
      "activation": { "data_types": ["quote", "ohlcv"], "min_entities": 1, "max_entities": 20 },
      "priority": { "base": 60, "single_entity_bonus": 10, "real_time_bonus": 20 } },
    { "id": "market-aggregator", "tier": "commercial", "scope": "individual",
      "rate_limit": { "requests": 30, "window_ms": 60000, "daily_cap": 500 },
      "cost_per_request": 0.002, "reliability": 0.85,
      "activation": { "data_types": ["quote", "ohlcv", "fundamentals"], "min_entities": 1, "max_entities": 100 },
      "priority": { "base": 50, "data_type_bonus": { "fundamentals": 15 } } },
    { "id": "sector-screener", "tier": "tool_server", "scope": "bulk",
      "rate_limit": { "requests": 10, "window_ms": 60000 },
      "activation": { "max_entities": 0, "requires_sector": true },
      "priority": { "base": 40, "sector_bonus": 30 } },
    { "id": "stats-bureau", "tier": "government", "scope": "bulk",
      "rate_limit": { "requests": 120, "window_ms": 60000, "daily_cap": 1000 },
      "activation": { "data_types": ["economic_series"], "max_entities": 5 },
      "priority": { "base": 70 } }
  ]
})";

core::DataRequest make_request(std::string id, core::DataType type, std::vector<std::string> keys,
                               std::optional<std::string> sector = std::nullopt) {
    core::DataRequest r;
    r.request_id = std::move(id);
    r.criteria.data_type = type;
    r.criteria.entity_keys = std::move(keys);
    r.criteria.sector = std::move(sector);
    return r;
}

void report(const core::DataRequest& req, const core::RequestResult& r) {
    if (r) {
        std::cout << req.request_id << ": source=" << r->meta.source_id
                  << " state=" << core::to_string(r->meta.cache_state)
                  << " confidence=" << r->meta.confidence
                  << (r->meta.review_flag ? " review" : "")
                  << " fields=" << nlohmann::json(r->value.fields).dump() << '\n';
    } else {
        std::cout << req.request_id << ": error=" << core::to_string(r.error().kind)
                  << " (" << r.error().message << ")\n";
        for (const auto& a : r.error().attempts) {
            std::cout << "    " << a.provider_id << " -> " << core::to_string(a.outcome) << ' ' << a.detail << '\n';
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    auto loaded = (argc > 1) ? config::Loader::load_from_file(argv[1]) : config::Loader::parse(kDemoConfig);
    if (!loaded) {
        std::cerr << "config error [" << config::to_string(loaded.error().code) << "] "
                  << loaded.error().where << ": " << loaded.error().message << '\n';
        return EXIT_FAILURE;
    }
    config::SluiceConfig cfg = std::move(*loaded);

    if (auto lg = obs::init_logging(cfg.logging); !lg) {
        std::cerr << "logging setup failed: " << obs::to_string(lg.error()) << '\n';
        return EXIT_FAILURE;
    }
    SPDLOG_INFO("sluice_app {} starting providers={}", sluice::version_string, cfg.providers.size());

    // ----- shared state -----
    auto clock = core::system_clock();
    auto pool = exec::WorkerPool::create(cfg.workers);
    if (!pool) {
        SPDLOG_ERROR("worker pool: {}", exec::to_string(pool.error()));
        return EXIT_FAILURE;
    }
    std::shared_ptr<exec::WorkerPool> workers = std::move(*pool);

    std::unique_ptr<cache::DurableTier> durable;
    if (!cfg.cache.durable_path.empty()) {
        auto opened = cache::SqliteDurableTier::open(cfg.cache.durable_path);
        if (opened) durable = std::move(*opened);
        else SPDLOG_ERROR("durable tier disabled: {}", opened.error().message);
    }
    auto store = std::make_shared<cache::CacheStore>(cfg.cache, std::move(durable), workers, clock);

    auto catalog = std::make_shared<routing::ProviderCatalog>();
    if (auto rc = catalog->reload(config::make_descriptors(cfg)); rc != routing::CatalogErr::Ok) {
        SPDLOG_ERROR("catalog rejected: {}", routing::to_string(rc));
        return EXIT_FAILURE;
    }

    auto limiter = std::make_shared<ratelimit::RateLimiter>(clock);
    auto adapters = std::make_shared<provider::AdapterSet>();
    uint64_t seed = 7;
    for (const auto& spec : cfg.providers) {
        limiter->configure(spec.id, spec.rate_limit);
        adapters->bind(std::make_shared<provider::SimulatedProvider>(
            provider::SimProviderConfig{.id = spec.id, .jitter_pct = 0.02, .seed = seed++}));
    }

    auto breakers = std::make_shared<routing::CircuitBreakerBank>(cfg.breaker, clock);
    auto budget = std::make_shared<ratelimit::BudgetTracker>(cfg.budget, clock);
    auto observer = obs::make_logging_observer();

    exec::ExecutorDeps deps;
    deps.router = std::make_shared<routing::CollectorRouter>(catalog, clock);
    deps.limiter = limiter;
    deps.cache = store;
    deps.adapters = adapters;
    deps.resolver = std::make_shared<reconcile::ConflictResolver>(cfg.reconcile);
    deps.breakers = breakers;
    deps.budget = budget;
    deps.observer = observer;
    deps.clock = clock;

    auto created = exec::FailoverExecutor::create(deps, cfg.executor);
    if (!created) {
        SPDLOG_ERROR("executor: {}", exec::to_string(created.error()));
        return EXIT_FAILURE;
    }
    auto executor = std::move(*created);

    // ----- demo traffic -----
    const std::vector<core::DataRequest> requests = {
        make_request("cold-quote", core::DataType::Quote, {"AAPL"}),
        make_request("fresh-quote", core::DataType::Quote, {"AAPL"}),
        make_request("fundamentals", core::DataType::Fundamentals, {"MSFT", "NVDA"}),
        make_request("sector-screen", core::DataType::Fundamentals, {}, "semiconductors"),
        make_request("gdp", core::DataType::EconomicSeries, {"GDP"}),
        make_request("news-unroutable", core::DataType::News, {"AAPL"}),
    };
    for (const auto& req : requests) report(req, executor->execute(req));

    // Knock out every quote source: the next call for a cached key degrades to stale data
    for (const auto& id : {"exchange-feed", "market-aggregator"}) {
        if (auto sim = std::dynamic_pointer_cast<provider::SimulatedProvider>(adapters->find(id)))
            sim->fail_always(core::ProviderErrorKind::Unavailable);
    }
    auto strict = make_request("outage-quote", core::DataType::Quote, {"AAPL"});
    strict.max_staleness = std::chrono::seconds(1);
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    report(strict, executor->execute(strict));

    // ----- health -----
    obs::HealthSources src;
    src.limiter = limiter.get();
    src.cache = store.get();
    src.catalog = catalog.get();
    src.breakers = breakers.get();
    src.budget = budget.get();
    src.observer = observer.get();
    nlohmann::json health;
    obs::to_json(health, obs::collect(src));
    std::cout << health.dump(2) << std::endl;

    workers->shutdown(exec::ShutdownMode::Drain);
    SPDLOG_INFO("sluice_app finished");
    return EXIT_SUCCESS;
}
