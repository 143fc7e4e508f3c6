#pragma once
/**
 * @file budget_tracker.hpp
 * @brief Spending guard for commercial providers: daily and monthly limits with alert thresholds.
 * @details Periods are UTC calendar days and months. A limit of zero forbids any paid call.
 */

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "sluice/config/constants.hpp"
#include "sluice/core/clock.hpp"

namespace sluice::ratelimit {

/** @struct BudgetConfig
 *  @brief Spending limits (currency units) and alert thresholds (percent).
 */
struct BudgetConfig {
    double              monthly_limit{sluice::config::constants::BUDGET_MONTHLY_LIMIT};
    double              daily_limit{sluice::config::constants::BUDGET_DAILY_LIMIT};
    bool                auto_stop{true}; ///< Refuse calls that would exceed a limit
    std::vector<double> alert_pcts{sluice::config::constants::BUDGET_ALERT_PCTS.begin(),
                                   sluice::config::constants::BUDGET_ALERT_PCTS.end()};
};

enum class BudgetLevel : uint8_t { WithinBudget, HighUsage, ApproachingLimit, Exceeded };

/** @struct BudgetStatus
 *  @brief Spending in the current day and month.
 */
struct BudgetStatus {
    double                        daily_spent{0.0};
    double                        monthly_spent{0.0};
    double                        daily_limit{0.0};
    double                        monthly_limit{0.0};
    BudgetLevel                   level{BudgetLevel::WithinBudget};
    std::map<std::string, double> monthly_by_provider;
};

/** @class BudgetTracker
 *  @brief Thread-safe spend accounting.
 */
class BudgetTracker {
public:
    explicit BudgetTracker(BudgetConfig cfg = {},
                           std::shared_ptr<const core::Clock> clock = core::system_clock());

    /// True if spending @p cost now keeps both periods within their limits (always true without auto_stop).
    [[nodiscard]] bool can_spend(double cost) const;

    /// Account a completed paid call.
    void record(std::string_view provider_id, double cost);

    [[nodiscard]] BudgetStatus status() const;

    void update_config(BudgetConfig cfg);

private:
    struct Period {
        long   index{-1};     ///< Day or month ordinal
        double spent{0.0};
        std::size_t alerts_fired{0};
    };

    static long day_index(core::TimePoint t) noexcept;
    static long month_index(core::TimePoint t) noexcept;
    static double spent_in(const Period& p, long current) noexcept { return p.index == current ? p.spent : 0.0; }
    static BudgetLevel level_of(double pct) noexcept;
    void alert(const char* period, Period& p, double limit);

    std::shared_ptr<const core::Clock> clock_;
    mutable std::mutex                 mu_;
    BudgetConfig                       cfg_;
    Period                             day_;
    Period                             month_;
    std::map<std::string, double>      by_provider_;
};

std::string_view to_string(BudgetLevel l) noexcept;

} // namespace sluice::ratelimit
