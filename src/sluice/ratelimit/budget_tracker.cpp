/**
 * @file budget_tracker.cpp
 */
#include "sluice/ratelimit/budget_tracker.hpp"

#include <algorithm>
#include <chrono>

#include <spdlog/spdlog.h>

namespace sluice::ratelimit {

using namespace sluice::config::constants;

BudgetTracker::BudgetTracker(BudgetConfig cfg, std::shared_ptr<const core::Clock> clock)
    : clock_(clock ? std::move(clock) : core::system_clock()), cfg_(std::move(cfg)) {
    std::sort(cfg_.alert_pcts.begin(), cfg_.alert_pcts.end());
}

long BudgetTracker::day_index(core::TimePoint t) noexcept {
    return static_cast<long>(std::chrono::floor<std::chrono::days>(t).time_since_epoch().count());
}

long BudgetTracker::month_index(core::TimePoint t) noexcept {
    const std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(t)};
    return static_cast<long>(static_cast<int>(ymd.year())) * 12 +
           static_cast<long>(static_cast<unsigned>(ymd.month())) - 1;
}

BudgetLevel BudgetTracker::level_of(double pct) noexcept {
    if (pct >= 100.0)                  return BudgetLevel::Exceeded;
    if (pct >= BUDGET_APPROACHING_PCT) return BudgetLevel::ApproachingLimit;
    if (pct >= BUDGET_HIGH_USAGE_PCT)  return BudgetLevel::HighUsage;
    return BudgetLevel::WithinBudget;
}

bool BudgetTracker::can_spend(double cost) const {
    if (cost <= 0.0) return true;
    const auto now = clock_->now();
    std::lock_guard lk(mu_);
    if (!cfg_.auto_stop) return true;
    const double day   = spent_in(day_,   day_index(now))   + cost;
    const double month = spent_in(month_, month_index(now)) + cost;
    return day <= cfg_.daily_limit && month <= cfg_.monthly_limit;
}

void BudgetTracker::alert(const char* period, Period& p, double limit) {
    if (limit <= 0.0) return;
    const double pct = p.spent / limit * 100.0;
    while (p.alerts_fired < cfg_.alert_pcts.size() && pct >= cfg_.alert_pcts[p.alerts_fired]) {
        SPDLOG_WARN("budget alert: {} spending {:.2f} of {:.2f} reached {:.0f}%",
                    period, p.spent, limit, cfg_.alert_pcts[p.alerts_fired]);
        ++p.alerts_fired;
    }
}

void BudgetTracker::record(std::string_view provider_id, double cost) {
    if (cost <= 0.0) return;
    const auto now = clock_->now();
    std::lock_guard lk(mu_);

    const long d = day_index(now);
    const long m = month_index(now);
    if (day_.index != d)   day_ = Period{.index = d};
    if (month_.index != m) {
        month_ = Period{.index = m};
        by_provider_.clear();
    }
    day_.spent   += cost;
    month_.spent += cost;
    by_provider_[std::string(provider_id)] += cost;

    alert("daily",   day_,   cfg_.daily_limit);
    alert("monthly", month_, cfg_.monthly_limit);
}

BudgetStatus BudgetTracker::status() const {
    const auto now = clock_->now();
    std::lock_guard lk(mu_);
    BudgetStatus st;
    st.daily_limit   = cfg_.daily_limit;
    st.monthly_limit = cfg_.monthly_limit;
    st.daily_spent   = spent_in(day_,   day_index(now));
    st.monthly_spent = spent_in(month_, month_index(now));
    if (month_.index == month_index(now)) st.monthly_by_provider = by_provider_;

    const auto pct = [](double spent, double limit) {
        if (limit <= 0.0) return spent > 0.0 ? 100.0 : 0.0;
        return spent / limit * 100.0;
    };
    st.level = level_of(std::max(pct(st.daily_spent, st.daily_limit),
                                 pct(st.monthly_spent, st.monthly_limit)));
    return st;
}

void BudgetTracker::update_config(BudgetConfig cfg) {
    std::sort(cfg.alert_pcts.begin(), cfg.alert_pcts.end());
    std::lock_guard lk(mu_);
    cfg_ = std::move(cfg);
}

std::string_view to_string(BudgetLevel l) noexcept {
    switch (l) {
        case BudgetLevel::WithinBudget:     return "within_budget";
        case BudgetLevel::HighUsage:        return "high_usage";
        case BudgetLevel::ApproachingLimit: return "approaching_limit";
        case BudgetLevel::Exceeded:         return "budget_exceeded";
    }
    return "unknown";
}

} // namespace sluice::ratelimit
