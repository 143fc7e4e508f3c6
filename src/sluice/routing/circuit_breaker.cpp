/**
 * @file circuit_breaker.cpp
 */
#include "sluice/routing/circuit_breaker.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace sluice::routing {

std::string_view to_string(CircuitState s) noexcept {
    switch (s) {
        case CircuitState::Closed:   return "closed";
        case CircuitState::Open:     return "open";
        case CircuitState::HalfOpen: return "half_open";
    }
    return "unknown";
}

CircuitBreakerBank::CircuitBreakerBank(BreakerConfig cfg, std::shared_ptr<const core::Clock> clock)
    : cfg_(cfg), clock_(clock ? std::move(clock) : core::system_clock()) {
    if (cfg_.failure_threshold == 0) cfg_.failure_threshold = 1;
}

bool CircuitBreakerBank::counts_as_failure(core::ProviderErrorKind kind) noexcept {
    return kind != core::ProviderErrorKind::RateLimited && kind != core::ProviderErrorKind::NotFound;
}

CircuitBreakerBank::Entry& CircuitBreakerBank::entry(std::string_view id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) it = entries_.emplace(std::string(id), Entry{}).first;
    return it->second;
}

void CircuitBreakerBank::trip(std::string_view id, Entry& e, core::TimePoint now) {
    e.state = CircuitState::Open;
    e.opened_at = now;
    e.trial_in_flight = false;
    ++e.trips;
    SPDLOG_WARN("circuit opened provider={} consecutive_failures={} open_for_ms={}", id, e.failures,
                cfg_.open_for.count());
}

bool CircuitBreakerBank::allow(std::string_view provider_id) {
    std::lock_guard lk(mu_);
    auto& e = entry(provider_id);
    switch (e.state) {
        case CircuitState::Closed:
            return true;
        case CircuitState::Open:
            if (clock_->now() - e.opened_at < cfg_.open_for) return false;
            e.state = CircuitState::HalfOpen;
            e.trial_in_flight = true;
            SPDLOG_INFO("circuit half-open provider={} probing", provider_id);
            return true;
        case CircuitState::HalfOpen:
            if (e.trial_in_flight) return false;
            e.trial_in_flight = true;
            return true;
    }
    return false;
}

void CircuitBreakerBank::on_success(std::string_view provider_id) {
    std::lock_guard lk(mu_);
    auto& e = entry(provider_id);
    if (e.state != CircuitState::Closed) SPDLOG_INFO("circuit closed provider={}", provider_id);
    e.state = CircuitState::Closed;
    e.failures = 0;
    e.trial_in_flight = false;
}

void CircuitBreakerBank::on_failure(std::string_view provider_id, core::ProviderErrorKind kind) {
    std::lock_guard lk(mu_);
    auto& e = entry(provider_id);
    if (!counts_as_failure(kind)) {
        e.trial_in_flight = false;
        return;
    }
    ++e.failures;
    const auto now = clock_->now();
    if (e.state == CircuitState::HalfOpen) trip(provider_id, e, now);
    else if (e.state == CircuitState::Closed && e.failures >= cfg_.failure_threshold) trip(provider_id, e, now);
}

void CircuitBreakerBank::release(std::string_view provider_id) {
    std::lock_guard lk(mu_);
    if (auto it = entries_.find(provider_id); it != entries_.end()) it->second.trial_in_flight = false;
}

CircuitState CircuitBreakerBank::state(std::string_view provider_id) const {
    std::lock_guard lk(mu_);
    auto it = entries_.find(provider_id);
    return it == entries_.end() ? CircuitState::Closed : it->second.state;
}

std::vector<BreakerStatus> CircuitBreakerBank::status_all() const {
    std::lock_guard lk(mu_);
    const auto now = clock_->now();
    std::vector<BreakerStatus> out;
    out.reserve(entries_.size());
    for (const auto& [id, e] : entries_) {
        BreakerStatus s{id, e.state, e.failures, e.trips, std::chrono::milliseconds{0}};
        if (e.state == CircuitState::Open) {
            const auto left = cfg_.open_for - std::chrono::duration_cast<std::chrono::milliseconds>(now - e.opened_at);
            s.retry_in = std::max(left, std::chrono::milliseconds{0});
        }
        out.push_back(std::move(s));
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.provider_id < b.provider_id; });
    return out;
}

void CircuitBreakerBank::reset(std::string_view provider_id) {
    std::lock_guard lk(mu_);
    if (auto it = entries_.find(provider_id); it != entries_.end()) it->second = Entry{};
}

} // namespace sluice::routing
