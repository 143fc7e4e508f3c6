/**
 * @file activation.cpp
 * @brief Rule compilation and predicate combinators.
 */
#include "sluice/routing/activation.hpp"

#include <algorithm>
#include <utility>

namespace sluice::routing {

namespace {

template <class T>
bool listed_or_empty(const std::vector<T>& allowed, T v) noexcept {
    return allowed.empty() || std::find(allowed.begin(), allowed.end(), v) != allowed.end();
}

} // namespace

ActivationPredicate make_activation(ActivationRule rule) {
    return [r = std::move(rule)](const core::FilterCriteria& f) {
        const auto n = f.entity_keys.size();
        if (!listed_or_empty(r.data_types, f.data_type)) return false;
        if (n < r.min_entities) return false;
        if (r.max_entities && n > *r.max_entities) return false;
        if (r.requires_sector && !f.sector) return false;
        if (!listed_or_empty(r.analysis_types, f.analysis)) return false;
        if (!listed_or_empty(r.granularities, f.granularity)) return false;
        if (r.real_time && *r.real_time != f.real_time) return false;
        return true;
    };
}

PriorityFn make_priority(PriorityRule rule) {
    return [r = std::move(rule)](const core::FilterCriteria& f) {
        int score = r.base;
        if (auto it = r.data_type_bonus.find(f.data_type); it != r.data_type_bonus.end()) score += it->second;
        if (auto it = r.analysis_bonus.find(f.analysis); it != r.analysis_bonus.end()) score += it->second;
        if (f.entity_keys.size() == 1) score += r.single_entity_bonus;
        if (f.entity_keys.empty() && f.sector) score += r.sector_bonus;
        if (f.real_time) score += r.real_time_bonus;
        return score;
    };
}

PriorityFn constant_priority(int value) {
    return [value](const core::FilterCriteria&) { return value; };
}

namespace predicates {

ActivationPredicate always() {
    return [](const core::FilterCriteria&) { return true; };
}

ActivationPredicate data_type_is(core::DataType t) {
    return [t](const core::FilterCriteria& f) { return f.data_type == t; };
}

ActivationPredicate entity_count_between(std::size_t lo, std::size_t hi) {
    return [lo, hi](const core::FilterCriteria& f) {
        return f.entity_keys.size() >= lo && f.entity_keys.size() <= hi;
    };
}

ActivationPredicate no_entities() {
    return [](const core::FilterCriteria& f) { return f.entity_keys.empty(); };
}

ActivationPredicate has_sector() {
    return [](const core::FilterCriteria& f) { return f.sector.has_value(); };
}

ActivationPredicate all_of(std::vector<ActivationPredicate> ps) {
    return [ps = std::move(ps)](const core::FilterCriteria& f) {
        return std::all_of(ps.begin(), ps.end(), [&](const auto& p) { return p(f); });
    };
}

ActivationPredicate any_of(std::vector<ActivationPredicate> ps) {
    return [ps = std::move(ps)](const core::FilterCriteria& f) {
        return std::any_of(ps.begin(), ps.end(), [&](const auto& p) { return p(f); });
    };
}

ActivationPredicate negate(ActivationPredicate p) {
    return [p = std::move(p)](const core::FilterCriteria& f) { return !p(f); };
}

} // namespace predicates

} // namespace sluice::routing
