#pragma once
/**
 * @file ttl_policy.hpp
 * @brief Externally configured TTL table, one rule per data type.
 */

#include <array>
#include <chrono>

#include "sluice/config/constants.hpp"
#include "sluice/core/types.hpp"

namespace sluice::cache {

/** @struct TtlRule
 *  @brief Freshness window and refresh-ahead point of one data type.
 */
struct TtlRule {
    std::chrono::seconds ttl{sluice::config::constants::TTL_DEFAULT_S};
    double               refresh_threshold{sluice::config::constants::CACHE_REFRESH_THRESHOLD};

    bool operator==(const TtlRule&) const = default;
};

/** @class TtlPolicy
 *  @brief Dense lookup table indexed by DataType.
 */
class TtlPolicy {
public:
    /// Table filled with the named defaults.
    TtlPolicy() noexcept;

    [[nodiscard]] const TtlRule& rule_for(core::DataType t) const noexcept { return rules_[core::index_of(t)]; }
    void set_rule(core::DataType t, TtlRule r) noexcept { rules_[core::index_of(t)] = r; }

    bool operator==(const TtlPolicy&) const = default;

private:
    std::array<TtlRule, core::kDataTypeCount> rules_{};
};

} // namespace sluice::cache
