/**
 * @file collector_router.cpp
 * @brief Candidate ranking, request classification and filter validation.
 */
#include "sluice/routing/collector_router.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include <spdlog/spdlog.h>

#include "sluice/config/constants.hpp"

namespace sluice::routing {

namespace cst = sluice::config::constants;

namespace {

void rank(std::vector<RankedProvider>& out) {
    std::sort(out.begin(), out.end(), [](const RankedProvider& a, const RankedProvider& b) {
        if (a.priority != b.priority) return a.priority > b.priority;
        if (a.reliability != b.reliability) return a.reliability > b.reliability;
        const double ca = a.provider->cost_per_request();
        const double cb = b.provider->cost_per_request();
        if (ca != cb) return ca < cb;
        return a.provider->id() < b.provider->id();
    });
}

template <class Range, class Get>
RoutingDecision route_over(const core::DataRequest& req, const Range& range, Get get) {
    RoutingDecision d;
    for (const auto& item : range) {
        const auto& p = get(item);
        if (!p || !p->activates_for(req.criteria)) continue;
        d.candidates.push_back(RankedProvider{p, p->priority_for(req.criteria), p->reliability()});
    }
    rank(d.candidates);
    return d;
}

bool daily_or_coarser(core::Granularity g) noexcept {
    return g >= core::Granularity::Day;
}

} // namespace

std::vector<std::string> RoutingDecision::ids() const {
    std::vector<std::string> out;
    out.reserve(candidates.size());
    for (const auto& c : candidates) out.push_back(c.provider->id());
    return out;
}

std::string_view to_string(RequestType t) noexcept {
    switch (t) {
        case RequestType::RealTime:         return "real_time";
        case RequestType::SingleEntity:     return "single_entity";
        case RequestType::EntityComparison: return "entity_comparison";
        case RequestType::LargeEntityList:  return "large_entity_list";
        case RequestType::SectorScreen:     return "sector_screen";
        case RequestType::Macro:            return "macro";
    }
    return "unknown";
}

std::string_view to_string(FilterSuggestion::Kind k) noexcept {
    switch (k) {
        case FilterSuggestion::Kind::SplitEntityList:        return "split_entity_list";
        case FilterSuggestion::Kind::UseSectorFilter:        return "use_sector_filter";
        case FilterSuggestion::Kind::DefaultDateRange:       return "default_date_range";
        case FilterSuggestion::Kind::UseFundamentalAnalysis: return "use_fundamental_analysis";
    }
    return "unknown";
}

CollectorRouter::CollectorRouter(std::shared_ptr<const ProviderCatalog> catalog,
                                 std::shared_ptr<const core::Clock> clock)
    : catalog_(std::move(catalog)), clock_(clock ? std::move(clock) : core::system_clock()) {}

RoutingDecision CollectorRouter::route(const core::DataRequest& request, const ProviderCatalog::Map& catalog) {
    return route_over(request, catalog, [](const auto& kv) -> const auto& { return kv.second; });
}

RoutingDecision CollectorRouter::route(const core::DataRequest& request,
                                       std::span<const std::shared_ptr<ProviderDescriptor>> catalog) {
    return route_over(request, catalog, [](const auto& p) -> const auto& { return p; });
}

RoutingDecision CollectorRouter::route(const core::DataRequest& request) const {
    if (!catalog_) return {};
    auto snap = catalog_->snapshot();
    auto d = route(request, *snap);
    SPDLOG_DEBUG("routed request_id={} type={} candidates={}", request.request_id,
                 to_string(classify(request.criteria)), d.size());
    return d;
}

RequestType CollectorRouter::classify(const core::FilterCriteria& f) noexcept {
    const auto n = f.entity_keys.size();
    if (f.real_time) return RequestType::RealTime;
    if (n == 1) return RequestType::SingleEntity;
    if (n >= 2 && n <= cst::ROUTER_COMPARISON_MAX) return RequestType::EntityComparison;
    if (n > cst::ROUTER_COMPARISON_MAX) return RequestType::LargeEntityList;
    if (f.sector) return RequestType::SectorScreen;
    return RequestType::Macro;
}

ValidationReport CollectorRouter::validate(const core::DataRequest& request) const {
    const auto& f = request.criteria;
    ValidationReport r;
    r.request_type = classify(f);

    std::vector<std::shared_ptr<ProviderDescriptor>> all;
    if (catalog_) all = catalog_->list();
    r.eligible = route(request, std::span<const std::shared_ptr<ProviderDescriptor>>(all)).ids();

    // ----- hard errors -----
    if (f.from && f.to && *f.from > *f.to) {
        r.valid = false;
        r.warnings.emplace_back("date range is inverted: 'from' is after 'to'");
    }

    // ----- entity list vs individual-provider capacity -----
    std::size_t individual_cap = 0;
    bool sector_capable = false;
    for (const auto& p : all) {
        const auto& act = p->spec().activation;
        const bool type_ok = act.data_types.empty() ||
            std::find(act.data_types.begin(), act.data_types.end(), f.data_type) != act.data_types.end();
        if (!type_ok) continue;
        if (p->scope() == core::ProviderScope::IndividualEntity && act.max_entities)
            individual_cap = std::max(individual_cap, *act.max_entities);
        if (act.min_entities == 0) sector_capable = true;
    }

    const auto n = f.entity_keys.size();
    if (individual_cap > 0 && n > individual_cap) {
        r.warnings.push_back("entity list of " + std::to_string(n) +
                             " exceeds the largest individual-analysis capacity (" +
                             std::to_string(individual_cap) + ")");
        FilterSuggestion split{FilterSuggestion::Kind::SplitEntityList,
                               "split the list into batches of at most " + std::to_string(individual_cap), f};
        split.proposed.entity_keys.resize(individual_cap);
        r.suggestions.push_back(std::move(split));

        if (sector_capable) {
            FilterSuggestion sector{FilterSuggestion::Kind::UseSectorFilter,
                                    "consider a sector filter instead of an explicit entity list", f};
            sector.proposed.entity_keys.clear();
            r.suggestions.push_back(std::move(sector));
        }
    }

    // ----- defaults worth proposing -----
    if (f.data_type == core::DataType::Ohlcv && !f.from && !f.to) {
        const auto now = clock_->now();
        FilterSuggestion range{FilterSuggestion::Kind::DefaultDateRange,
                               "no date range given; defaulting to the last " +
                                   std::to_string(cst::VALIDATE_DEFAULT_LOOKBACK_D / 365) + " years",
                               f};
        range.proposed.from = now - std::chrono::days(cst::VALIDATE_DEFAULT_LOOKBACK_D);
        range.proposed.to = now;
        r.suggestions.push_back(std::move(range));
    }
    if (n > 0 && f.analysis == core::AnalysisType::Any) {
        FilterSuggestion fa{FilterSuggestion::Kind::UseFundamentalAnalysis,
                            "entities given without an analysis type; fundamental analysis assumed", f};
        fa.proposed.analysis = core::AnalysisType::Fundamental;
        r.suggestions.push_back(std::move(fa));
    }

    // ----- soft warnings -----
    if (f.real_time && daily_or_coarser(f.granularity)) {
        r.warnings.push_back("real-time requested at " + std::string(core::to_string(f.granularity)) +
                             " granularity");
    }
    if (r.eligible.empty()) {
        r.valid = false;
        r.warnings.emplace_back("no provider is competent for this request");
    }
    return r;
}

} // namespace sluice::routing
