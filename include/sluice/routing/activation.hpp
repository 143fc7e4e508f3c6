#pragma once
/**
 * @file activation.hpp
 * @brief Typed activation predicates and priority functions over FilterCriteria.
 *
 * Competence boundaries are declared as rules (from the catalog) and compiled once into
 * std::function objects; nothing is string-matched at request time.
 */

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <vector>

#include "sluice/core/types.hpp"

namespace sluice::routing {

using ActivationPredicate = std::function<bool(const core::FilterCriteria&)>;
using PriorityFn          = std::function<int(const core::FilterCriteria&)>;

/** @struct ActivationRule
 *  @brief Declarative competence boundary. Empty lists mean "any".
 */
struct ActivationRule {
    std::vector<core::DataType>     data_types;
    std::size_t                     min_entities{0};
    std::optional<std::size_t>      max_entities;      ///< nullopt = unbounded; 0 = sector/macro only
    bool                            requires_sector{false};
    std::vector<core::AnalysisType> analysis_types;
    std::vector<core::Granularity>  granularities;
    std::optional<bool>             real_time;         ///< nullopt = both live and end-of-day

    bool operator==(const ActivationRule&) const = default;
};

/** @struct PriorityRule
 *  @brief Additive priority score.
 */
struct PriorityRule {
    int                               base{50};
    std::map<core::DataType, int>     data_type_bonus;
    std::map<core::AnalysisType, int> analysis_bonus;
    int                               single_entity_bonus{0}; ///< Exactly one entity key
    int                               sector_bonus{0};        ///< Sector set and no entity keys
    int                               real_time_bonus{0};

    bool operator==(const PriorityRule&) const = default;
};

[[nodiscard]] ActivationPredicate make_activation(ActivationRule rule);
[[nodiscard]] PriorityFn make_priority(PriorityRule rule);

/// Building blocks for hand-written predicates (tests, adapters with unusual boundaries).
namespace predicates {

[[nodiscard]] ActivationPredicate always();
[[nodiscard]] ActivationPredicate data_type_is(core::DataType t);
[[nodiscard]] ActivationPredicate entity_count_between(std::size_t lo, std::size_t hi);
[[nodiscard]] ActivationPredicate no_entities();
[[nodiscard]] ActivationPredicate has_sector();
[[nodiscard]] ActivationPredicate all_of(std::vector<ActivationPredicate> ps);
[[nodiscard]] ActivationPredicate any_of(std::vector<ActivationPredicate> ps);
[[nodiscard]] ActivationPredicate negate(ActivationPredicate p);

} // namespace predicates

[[nodiscard]] PriorityFn constant_priority(int value);

} // namespace sluice::routing
