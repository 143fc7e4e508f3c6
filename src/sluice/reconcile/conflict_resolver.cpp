/**
 * @file conflict_resolver.cpp
 * @brief Strategy dispatch and the tolerance check guarding averages.
 */
#include "sluice/reconcile/conflict_resolver.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace sluice::reconcile {

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

const Candidate& best_by_quality(std::span<const Candidate> cs) {
    return *std::max_element(cs.begin(), cs.end(), [](const Candidate& a, const Candidate& b) {
        if (a.quality != b.quality) return a.quality < b.quality;
        return a.source_id > b.source_id; // lower id wins ties
    });
}

double max_quality(std::span<const Candidate> cs) noexcept {
    double q = 0.0;
    for (const auto& c : cs) q = std::max(q, c.quality);
    return q;
}

bool all_agree(std::span<const Candidate> cs) {
    if (cs.size() < 2) return false;
    const auto& first = cs.front().value;
    return std::all_of(cs.begin() + 1, cs.end(), [&](const Candidate& c) {
        return first.fields.empty() ? c.value.body == first.body : c.value.fields == first.fields;
    });
}

Resolution pick(const Candidate& winner, StrategyKind kind) {
    Resolution r;
    r.value = winner.value;
    r.source_id = winner.source_id;
    r.confidence = winner.quality;
    r.strategy = kind;
    return r;
}

Resolution flag(std::span<const Candidate> cs, double cap) {
    auto r = pick(best_by_quality(cs), StrategyKind::FlagForReview);
    r.confidence = std::min(r.confidence, cap);
    r.review_flag = true;
    return r;
}

Resolution average(std::span<const Candidate> cs, const strategy::UseAverage& s,
                   const std::map<std::string, double>& variance) {
    if (cs.size() < 2 || variance.empty()) return flag(cs, sluice::config::constants::REVIEW_CONFIDENCE_CAP);

    for (const auto& [field, v] : variance) {
        if (v > s.tolerance_for(field)) return flag(cs, sluice::config::constants::REVIEW_CONFIDENCE_CAP);
    }

    Resolution r;
    r.strategy = StrategyKind::UseAverage;
    // fields only some sources report come from the best candidate; shared ones are averaged
    r.value = best_by_quality(cs).value;
    for (const auto& kv : variance) {
        double sum = 0.0;
        for (const auto& c : cs) sum += c.value.fields.at(kv.first);
        r.value.fields[kv.first] = sum / static_cast<double>(cs.size());
    }

    std::vector<std::string> ids;
    ids.reserve(cs.size());
    double qsum = 0.0;
    for (const auto& c : cs) {
        ids.push_back(c.source_id);
        qsum += c.quality;
    }
    std::sort(ids.begin(), ids.end());
    r.source_id = std::accumulate(std::next(ids.begin()), ids.end(), ids.front(),
                                  [](std::string a, const std::string& b) { return std::move(a) + "+" + b; });
    r.confidence = qsum / static_cast<double>(cs.size());
    return r;
}

} // namespace

double strategy::UseAverage::tolerance_for(std::string_view field) const {
    if (auto it = field_tolerance_pct.find(field); it != field_tolerance_pct.end()) return it->second;
    if (auto dot = field.rfind('.'); dot != std::string_view::npos) {
        if (auto it = field_tolerance_pct.find(field.substr(dot + 1)); it != field_tolerance_pct.end())
            return it->second;
    }
    return tolerance_pct;
}

StrategyKind kind_of(const Strategy& s) noexcept {
    return static_cast<StrategyKind>(s.index());
}

std::string_view to_string(StrategyKind k) noexcept {
    switch (k) {
        case StrategyKind::UsePrimary:        return "use_primary";
        case StrategyKind::UseHighestQuality: return "use_highest_quality";
        case StrategyKind::UseAverage:        return "use_average";
        case StrategyKind::UseMostRecent:     return "use_most_recent";
        case StrategyKind::FlagForReview:     return "flag_for_review";
    }
    return "unknown";
}

std::string_view to_string(ResolveErr e) noexcept {
    switch (e) {
        case ResolveErr::NoCandidates: return "no_candidates";
    }
    return "unknown";
}

ConflictResolver::ConflictResolver() {
    using core::DataType;
    policy_.fill(strategy::UseHighestQuality{});
    policy_[core::index_of(DataType::Quote)] = strategy::UseAverage{};
    policy_[core::index_of(DataType::Ohlcv)] = strategy::UseAverage{};
    strategy::UseAverage sentiment;
    sentiment.tolerance_pct = sluice::config::constants::SENTIMENT_TOLERANCE_PCT;
    policy_[core::index_of(DataType::Sentiment)] = sentiment;
    policy_[core::index_of(DataType::Options)] = strategy::UseMostRecent{};
    policy_[core::index_of(DataType::News)] = strategy::UseMostRecent{};
    policy_[core::index_of(DataType::EconomicSeries)] = strategy::UsePrimary{};
    policy_[core::index_of(DataType::Filings)] = strategy::UsePrimary{};
    policy_[core::index_of(DataType::Reference)] = strategy::UsePrimary{};
}

void ConflictResolver::set_strategy(core::DataType t, Strategy s) {
    policy_[core::index_of(t)] = std::move(s);
}

std::map<std::string, double> ConflictResolver::variance_pct(std::span<const Candidate> cs) {
    std::map<std::string, double> out;
    if (cs.empty()) return out;
    for (const auto& [field, first] : cs.front().value.fields) {
        double lo = first, hi = first, sum = 0.0;
        bool shared = true;
        for (const auto& c : cs) {
            auto it = c.value.fields.find(field);
            if (it == c.value.fields.end() || !std::isfinite(it->second)) { shared = false; break; }
            lo = std::min(lo, it->second);
            hi = std::max(hi, it->second);
            sum += it->second;
        }
        if (!shared) continue;
        const double mean = sum / static_cast<double>(cs.size());
        if (mean == 0.0) out[field] = (hi == lo) ? 0.0 : std::numeric_limits<double>::infinity();
        else out[field] = (hi - lo) / std::fabs(mean) * 100.0;
    }
    return out;
}

sluice_detail::expected<Resolution, ResolveErr>
ConflictResolver::resolve(core::DataType t, std::span<const Candidate> candidates) const {
    return resolve(candidates, strategy_for(t));
}

sluice_detail::expected<Resolution, ResolveErr>
ConflictResolver::resolve(std::span<const Candidate> cs, const Strategy& s) {
    if (cs.empty()) return sluice_detail::unexpected(ResolveErr::NoCandidates);
    if (cs.size() == 1) return pick(cs.front(), kind_of(s));

    const auto variance = variance_pct(cs);

    Resolution r = std::visit(Overloaded{
        [&](const strategy::UsePrimary&) {
            const auto& w = *std::max_element(cs.begin(), cs.end(), [](const Candidate& a, const Candidate& b) {
                if (a.reliability != b.reliability) return a.reliability < b.reliability;
                if (a.quality != b.quality) return a.quality < b.quality;
                return a.source_id > b.source_id;
            });
            return pick(w, StrategyKind::UsePrimary);
        },
        [&](const strategy::UseHighestQuality&) {
            return pick(best_by_quality(cs), StrategyKind::UseHighestQuality);
        },
        [&](const strategy::UseAverage& a) {
            return average(cs, a, variance);
        },
        [&](const strategy::UseMostRecent&) {
            const auto& w = *std::max_element(cs.begin(), cs.end(), [](const Candidate& a, const Candidate& b) {
                if (a.fetched_at != b.fetched_at) return a.fetched_at < b.fetched_at;
                return a.quality < b.quality;
            });
            return pick(w, StrategyKind::UseMostRecent);
        },
        [&](const strategy::FlagForReview& f) {
            return flag(cs, f.confidence_cap);
        },
    }, s);

    r.variance_pct = variance;
    r.exact_agreement = all_agree(cs);
    if (r.exact_agreement && !std::holds_alternative<strategy::FlagForReview>(s)) {
        r.review_flag = false;
        r.confidence = 1.0;
    } else {
        r.confidence = std::min(r.confidence, max_quality(cs));
    }
    return r;
}

} // namespace sluice::reconcile
