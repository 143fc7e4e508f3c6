#pragma once
/**
 * @file collector_router.hpp
 * @brief Ranks the providers competent for a request; validates filters before a fetch.
 *
 * Routing:
 *   1) Keep providers whose activation predicate accepts the request's FilterCriteria.
 *   2) Score each with its priority function.
 *   3) Sort: priority desc, reliability desc, cost asc, id asc.
 * An empty decision is a value here; the executor turns it into Unroutable.
 * Routing decisions are recomputed per request and never cached.
 */

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "sluice/core/clock.hpp"
#include "sluice/core/types.hpp"
#include "sluice/routing/provider_catalog.hpp"

namespace sluice::routing {

/** @struct RankedProvider
 *  @brief One entry of a routing decision.
 */
struct RankedProvider {
    std::shared_ptr<ProviderDescriptor> provider;
    int                                 priority{0};
    double                              reliability{0.0}; ///< Score used for ordering (read once)
};

/** @struct RoutingDecision
 *  @brief Ordered candidate list for one request.
 */
struct RoutingDecision {
    std::vector<RankedProvider> candidates;

    [[nodiscard]] bool empty() const noexcept { return candidates.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return candidates.size(); }
    [[nodiscard]] std::vector<std::string> ids() const;
};

/// Shape of a request, used for validation messages and logs.
enum class RequestType : uint8_t { RealTime, SingleEntity, EntityComparison, LargeEntityList, SectorScreen, Macro };

/** @struct FilterSuggestion
 *  @brief A concrete alternative filter the caller may adopt.
 */
struct FilterSuggestion {
    enum class Kind : uint8_t { SplitEntityList, UseSectorFilter, DefaultDateRange, UseFundamentalAnalysis };
    Kind                 kind{Kind::SplitEntityList};
    std::string          message;
    core::FilterCriteria proposed;
};

/** @struct ValidationReport
 *  @brief Pre-fetch feedback. Producing it has no side effects.
 */
struct ValidationReport {
    bool                          valid{true};
    std::vector<std::string>      warnings;
    std::vector<FilterSuggestion> suggestions;
    RequestType                   request_type{RequestType::Macro};
    std::vector<std::string>      eligible; ///< Provider ids in routing order
};

class CollectorRouter {
public:
    explicit CollectorRouter(std::shared_ptr<const ProviderCatalog> catalog,
                             std::shared_ptr<const core::Clock> clock = core::system_clock());

    /// Route against the current catalog snapshot.
    [[nodiscard]] RoutingDecision route(const core::DataRequest& request) const;

    /// Route against an explicit catalog.
    [[nodiscard]] static RoutingDecision route(const core::DataRequest& request, const ProviderCatalog::Map& catalog);
    [[nodiscard]] static RoutingDecision route(const core::DataRequest& request,
                                               std::span<const std::shared_ptr<ProviderDescriptor>> catalog);

    [[nodiscard]] ValidationReport validate(const core::DataRequest& request) const;

    [[nodiscard]] static RequestType classify(const core::FilterCriteria& f) noexcept;

private:
    std::shared_ptr<const ProviderCatalog> catalog_;
    std::shared_ptr<const core::Clock>     clock_;
};

std::string_view to_string(RequestType t) noexcept;
std::string_view to_string(FilterSuggestion::Kind k) noexcept;

} // namespace sluice::routing
