#pragma once
/**
 * @file conflict_resolver.hpp
 * @brief Reconciles values for one key coming from several sources.
 *
 * Strategies are a tagged variant dispatched with std::visit; the policy is chosen per
 * data type, never inferred from the values.
 *
 * Guarantees:
 *   - confidence <= max(candidate quality), except exact agreement of >= 2 candidates (1.0).
 *   - UseAverage never averages values that diverge beyond tolerance: it falls back to
 *     FlagForReview instead.
 */

#include <array>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "sluice/compat/expected.hpp"
#include "sluice/config/constants.hpp"
#include "sluice/core/types.hpp"

namespace sluice::reconcile {

/** @struct Candidate
 *  @brief One sourced value.
 */
struct Candidate {
    core::Payload   value;
    std::string     source_id;
    double          quality{1.0};
    double          reliability{0.0}; ///< Source reliability at resolution time
    core::TimePoint fetched_at{};
};

namespace strategy {

/// Most reliable source wins outright.
struct UsePrimary {
    bool operator==(const UsePrimary&) const = default;
};

struct UseHighestQuality {
    bool operator==(const UseHighestQuality&) const = default;
};

/// Mean of the numeric fields shared by all candidates, when they agree within tolerance.
struct UseAverage {
    double tolerance_pct{sluice::config::constants::RECONCILE_DEFAULT_TOLERANCE_PCT};
    std::map<std::string, double, std::less<>> field_tolerance_pct{
        {"price",      sluice::config::constants::RECONCILE_PRICE_TOLERANCE_PCT},
        {"open",       sluice::config::constants::RECONCILE_PRICE_TOLERANCE_PCT},
        {"high",       sluice::config::constants::RECONCILE_PRICE_TOLERANCE_PCT},
        {"low",        sluice::config::constants::RECONCILE_PRICE_TOLERANCE_PCT},
        {"close",      sluice::config::constants::RECONCILE_PRICE_TOLERANCE_PCT},
        {"volume",     sluice::config::constants::RECONCILE_VOLUME_TOLERANCE_PCT},
        {"market_cap", sluice::config::constants::RECONCILE_MCAP_TOLERANCE_PCT},
    };

    /// Tolerance for a field; "AAPL.price" is looked up as "price".
    [[nodiscard]] double tolerance_for(std::string_view field) const;

    bool operator==(const UseAverage&) const = default;
};

/// Newest fetch wins.
struct UseMostRecent {
    bool operator==(const UseMostRecent&) const = default;
};

/// No automatic resolution: best candidate, capped confidence, review flag set.
struct FlagForReview {
    double confidence_cap{sluice::config::constants::REVIEW_CONFIDENCE_CAP};

    bool operator==(const FlagForReview&) const = default;
};

} // namespace strategy

using Strategy = std::variant<strategy::UsePrimary, strategy::UseHighestQuality, strategy::UseAverage,
                              strategy::UseMostRecent, strategy::FlagForReview>;

enum class StrategyKind : uint8_t { UsePrimary, UseHighestQuality, UseAverage, UseMostRecent, FlagForReview };

[[nodiscard]] StrategyKind kind_of(const Strategy& s) noexcept;

enum class ResolveErr : uint8_t { NoCandidates = 1 };

/** @struct Resolution
 *  @brief Reconciled value.
 */
struct Resolution {
    core::Payload                 value;
    std::string                   source_id;    ///< Winner, or "a+b" for an average
    double                        confidence{0.0};
    StrategyKind                  strategy{StrategyKind::UseHighestQuality}; ///< Strategy actually applied
    bool                          review_flag{false};
    bool                          exact_agreement{false};
    std::map<std::string, double> variance_pct; ///< Per shared numeric field
};

/** @struct ConflictRecord
 *  @brief Audit record of one reconciliation (logged, not persisted).
 */
struct ConflictRecord {
    std::string            key;
    std::vector<Candidate> candidates;
    StrategyKind           requested{StrategyKind::UseHighestQuality};
    Resolution             resolution;
};

class ConflictResolver {
public:
    /// Per-type defaults (averaging for prices, primary for official series).
    ConflictResolver();

    void set_strategy(core::DataType t, Strategy s);
    [[nodiscard]] const Strategy& strategy_for(core::DataType t) const noexcept { return policy_[core::index_of(t)]; }

    [[nodiscard]] sluice_detail::expected<Resolution, ResolveErr>
    resolve(core::DataType t, std::span<const Candidate> candidates) const;

    [[nodiscard]] static sluice_detail::expected<Resolution, ResolveErr>
    resolve(std::span<const Candidate> candidates, const Strategy& s);

    /// (max - min) / |mean| * 100 per numeric field present in every candidate.
    [[nodiscard]] static std::map<std::string, double> variance_pct(std::span<const Candidate> candidates);

private:
    std::array<Strategy, core::kDataTypeCount> policy_;
};

std::string_view to_string(StrategyKind k) noexcept;
std::string_view to_string(ResolveErr e) noexcept;

} // namespace sluice::reconcile
