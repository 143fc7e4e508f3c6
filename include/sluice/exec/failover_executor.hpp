#pragma once
/**
 * @file failover_executor.hpp
 * @brief Per-request state machine: route, serve from cache, walk the failover chain, reconcile, store.
 *
 * States:
 *   ROUTING -> CACHE_CHECK -> RATE_CHECK -> FETCHING -> RECONCILING -> DONE
 *   FETCHING loops back to RATE_CHECK for the next candidate; any state may go to
 *   DEGRADED (stale cache return) or FAILED (terminal).
 *
 * Guarantees:
 *   - A provider is called only after its breaker, budget and rate limiter all admit it.
 *   - Concurrent requests for one cold key share a single failover chain (single-flight).
 *   - Provider errors never escape: callers get a value (maybe stale) or
 *     Unroutable | Unavailable | Timeout with the attempt history.
 *   - A caller deadline stops the chain and goes straight to DEGRADED.
 */

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sluice/cache/cache_store.hpp"
#include "sluice/compat/expected.hpp"
#include "sluice/config/constants.hpp"
#include "sluice/core/clock.hpp"
#include "sluice/core/result.hpp"
#include "sluice/exec/single_flight.hpp"
#include "sluice/obs/observability.hpp"
#include "sluice/provider/provider_adapter.hpp"
#include "sluice/ratelimit/budget_tracker.hpp"
#include "sluice/ratelimit/rate_limiter.hpp"
#include "sluice/reconcile/conflict_resolver.hpp"
#include "sluice/routing/circuit_breaker.hpp"
#include "sluice/routing/collector_router.hpp"

namespace sluice::exec {

/** @struct ExecutorConfig
 *  @brief Request-path policy.
 */
struct ExecutorConfig {
    std::chrono::seconds reconcile_window{sluice::config::constants::RECONCILE_WINDOW_S}; ///< Max age of a cached rival
    std::array<uint32_t, core::kDataTypeCount> cross_validate{}; ///< Sources to collect per type (0/1 = first success)
    bool background_refresh{true};

    bool operator==(const ExecutorConfig&) const = default;
};

/** @struct ExecutorDeps
 *  @brief Collaborators. router, limiter, cache, adapters and resolver are required.
 */
struct ExecutorDeps {
    std::shared_ptr<routing::CollectorRouter>     router;
    std::shared_ptr<ratelimit::RateLimiter>       limiter;
    std::shared_ptr<cache::CacheStore>            cache;
    std::shared_ptr<provider::AdapterSet>         adapters;
    std::shared_ptr<reconcile::ConflictResolver>  resolver;
    std::shared_ptr<routing::CircuitBreakerBank>  breakers; ///< Optional
    std::shared_ptr<ratelimit::BudgetTracker>     budget;   ///< Optional
    std::shared_ptr<obs::Observer>                observer; ///< Optional
    std::shared_ptr<const core::Clock>            clock{core::system_clock()};
};

enum class ExecError : uint8_t { MissingDependency = 1 };

class FailoverExecutor : public std::enable_shared_from_this<FailoverExecutor> {
public:
    /// Validate the wiring. Shared ownership lets refresh tasks hold a weak reference.
    static sluice_detail::expected<std::shared_ptr<FailoverExecutor>, ExecError>
    create(ExecutorDeps deps, ExecutorConfig cfg = {});

    FailoverExecutor(const FailoverExecutor&) = delete;
    FailoverExecutor& operator=(const FailoverExecutor&) = delete;

    /// Synchronous request boundary.
    [[nodiscard]] core::RequestResult execute(const core::DataRequest& request);

    /**
     * @brief Re-fetch a key outside any caller's critical path (used by refresh-ahead).
     * @return true if a provider answered and the cache was updated.
     */
    bool refresh(const core::DataRequest& request);

    [[nodiscard]] const ExecutorConfig& config() const noexcept { return cfg_; }
    [[nodiscard]] std::size_t in_flight() const { return flights_.in_flight(); }

private:
    /// Result of one failover chain, shared by every caller that joined it.
    struct Flight {
        std::optional<core::DataResponse> response;
        std::vector<core::Attempt>        attempts;
        std::vector<core::ExecState>      trace;
        bool                              deadline_hit{false};
    };

    FailoverExecutor(ExecutorDeps deps, ExecutorConfig cfg) noexcept : deps_(std::move(deps)), cfg_(cfg) {}

    Flight fetch_chain(const core::DataRequest& request, const std::string& key,
                       const routing::RoutingDecision& decision,
                       const std::optional<cache::CacheEntry>& prior);

    /// Fresh cache hit as a finished flight.
    Flight from_cache(cache::CacheEntry e) const;

    core::RequestResult degrade(const core::DataRequest& request, const std::string& key, Flight flight);

    void schedule_refresh(const core::DataRequest& request, const std::string& key);

    std::size_t sources_wanted(core::DataType t) const noexcept;

    void observe(const core::DataRequest& request, const std::string& key, const core::RequestResult& r,
                 std::chrono::steady_clock::time_point started) const;

    ExecutorDeps         deps_;
    ExecutorConfig       cfg_;
    SingleFlight<Flight> flights_;
};

std::string_view to_string(ExecError e) noexcept;

} // namespace sluice::exec
