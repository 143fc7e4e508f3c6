/**
 * @file rate_limiter.cpp
 * @brief RateLimiter: gate construction, two-phase admission, blocking acquire.
 */
#include "sluice/ratelimit/rate_limiter.hpp"

#include <algorithm>
#include <thread>

#include <spdlog/spdlog.h>

#include "sluice/ratelimit/daily_quota.hpp"
#include "sluice/ratelimit/sliding_window.hpp"
#include "sluice/ratelimit/token_bucket.hpp"

namespace sluice::ratelimit {

using namespace sluice::config::constants;

RateLimiter::RateLimiter(std::shared_ptr<const core::Clock> clock)
    : clock_(clock ? std::move(clock) : core::system_clock()) {}

std::vector<std::unique_ptr<AdmissionGate>>
RateLimiter::build_gates(const RateLimitSpec& spec, core::TimePoint now) {
    std::vector<std::unique_ptr<AdmissionGate>> gates;
    if (spec.requests > 0 && spec.window.count() > 0) {
        const double per_sec  = spec.requests / std::chrono::duration<double>(spec.window).count();
        const double capacity = spec.burst > 0 ? spec.burst : spec.requests;
        gates.push_back(std::make_unique<TokenBucket>(capacity, per_sec, now));
        // the bucket alone can admit capacity + refill within one window
        gates.push_back(std::make_unique<SlidingWindow>(spec.requests, spec.window));
    }
    if (spec.burst > 0 && spec.burst_window.count() > 0) {
        gates.push_back(std::make_unique<SlidingWindow>(spec.burst, spec.burst_window));
    }
    if (spec.daily_cap > 0) {
        gates.push_back(std::make_unique<DailyQuota>(spec.daily_cap, spec.daily_reset_hour_utc, now));
    }
    return gates;
}

void RateLimiter::configure(std::string_view provider_id, const RateLimitSpec& spec) {
    std::unique_lock lk(map_mu_);
    auto it = limiters_.find(provider_id);
    if (it != limiters_.end() && it->second->spec == spec) return;

    auto pl = std::make_shared<ProviderLimiter>();
    pl->spec  = spec;
    pl->gates = build_gates(spec, clock_->now());
    if (it != limiters_.end()) {
        it->second = std::move(pl);
    } else {
        limiters_.emplace(std::string(provider_id), std::move(pl));
    }
    SPDLOG_DEBUG("rate limiter configured provider={} requests={} window_ms={} burst={} daily_cap={}",
                 provider_id, spec.requests, spec.window.count(), spec.burst, spec.daily_cap);
}

bool RateLimiter::remove(std::string_view provider_id) {
    std::unique_lock lk(map_mu_);
    auto it = limiters_.find(provider_id);
    if (it == limiters_.end()) return false;
    limiters_.erase(it);
    return true;
}

std::shared_ptr<RateLimiter::ProviderLimiter> RateLimiter::find(std::string_view provider_id) const {
    std::shared_lock lk(map_mu_);
    auto it = limiters_.find(provider_id);
    return it == limiters_.end() ? nullptr : it->second;
}

AdmissionResult RateLimiter::try_acquire(std::string_view provider_id) {
    return try_acquire(provider_id, clock_->now());
}

AdmissionResult RateLimiter::try_acquire(std::string_view provider_id, core::TimePoint now) {
    auto pl = find(provider_id);
    if (!pl) return AdmissionResult{.granted = true, .retry_after = std::chrono::milliseconds{0}};

    std::lock_guard lk(pl->mu);
    std::chrono::nanoseconds wait{0};
    for (auto& g : pl->gates) wait = std::max(wait, g->wait_time(now));

    if (wait.count() > 0) {
        ++pl->denied;
        const auto retry = std::max(std::chrono::milliseconds{RATE_MIN_RETRY_MS},
                                    std::chrono::ceil<std::chrono::milliseconds>(wait));
        return AdmissionResult{.granted = false, .retry_after = retry};
    }
    for (auto& g : pl->gates) g->commit(now);
    ++pl->granted;
    return AdmissionResult{.granted = true, .retry_after = std::chrono::milliseconds{0}};
}

AdmissionResult RateLimiter::acquire(std::string_view provider_id, std::chrono::milliseconds timeout) {
    // the timeout runs on the monotonic clock, admission on the injected one
    const auto give_up = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        auto res = try_acquire(provider_id);
        if (res.granted) return res;

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            give_up - std::chrono::steady_clock::now());
        if (remaining < res.retry_after) return res;

        const auto step = std::min({res.retry_after, remaining,
                                    std::chrono::milliseconds{RATE_ACQUIRE_MAX_SLEEP_MS}});
        std::this_thread::sleep_for(step);
    }
}

LimiterStatus RateLimiter::snapshot_of(const std::string& id, ProviderLimiter& pl, core::TimePoint now) {
    std::lock_guard lk(pl.mu);
    LimiterStatus st;
    st.provider_id = id;
    st.granted = pl.granted;
    st.denied  = pl.denied;
    st.gates.reserve(pl.gates.size());
    for (auto& g : pl.gates) st.gates.push_back(g->status(now));
    return st;
}

std::optional<LimiterStatus> RateLimiter::status(std::string_view provider_id) const {
    auto pl = find(provider_id);
    if (!pl) return std::nullopt;
    return snapshot_of(std::string(provider_id), *pl, clock_->now());
}

std::vector<LimiterStatus> RateLimiter::status_all() const {
    std::vector<std::pair<std::string, std::shared_ptr<ProviderLimiter>>> copy;
    {
        std::shared_lock lk(map_mu_);
        copy.reserve(limiters_.size());
        for (const auto& [id, pl] : limiters_) copy.emplace_back(id, pl);
    }
    const auto now = clock_->now();
    std::vector<LimiterStatus> out;
    out.reserve(copy.size());
    for (auto& [id, pl] : copy) out.push_back(snapshot_of(id, *pl, now));
    std::sort(out.begin(), out.end(),
              [](const LimiterStatus& a, const LimiterStatus& b) { return a.provider_id < b.provider_id; });
    return out;
}

bool RateLimiter::reset(std::string_view provider_id) {
    auto pl = find(provider_id);
    if (!pl) return false;
    const auto now = clock_->now();
    std::lock_guard lk(pl->mu);
    for (auto& g : pl->gates) g->reset(now);
    return true;
}

bool RateLimiter::has(std::string_view provider_id) const {
    return find(provider_id) != nullptr;
}

} // namespace sluice::ratelimit
