/**
 * @file provider_descriptor.cpp
 */
#include "sluice/routing/provider_descriptor.hpp"

#include <algorithm>
#include <utility>

namespace sluice::routing {

namespace cst = sluice::config::constants;

double reliability_signal(std::optional<core::ProviderErrorKind> error) noexcept {
    if (!error) return cst::RELIABILITY_SIGNAL_SUCCESS;
    switch (*error) {
        case core::ProviderErrorKind::NotFound:        return cst::RELIABILITY_SIGNAL_NOT_FOUND;
        case core::ProviderErrorKind::RateLimited:     return cst::RELIABILITY_SIGNAL_RATE_LIMITED;
        case core::ProviderErrorKind::Timeout:         return cst::RELIABILITY_SIGNAL_TIMEOUT;
        case core::ProviderErrorKind::Unavailable:     return cst::RELIABILITY_SIGNAL_UNAVAILABLE;
        case core::ProviderErrorKind::InvalidResponse: return cst::RELIABILITY_SIGNAL_INVALID;
    }
    return cst::RELIABILITY_SIGNAL_UNAVAILABLE;
}

ProviderDescriptor::ProviderDescriptor(ProviderSpec spec, double ema_alpha)
    : ProviderDescriptor(spec, make_activation(spec.activation), make_priority(spec.priority), ema_alpha) {}

ProviderDescriptor::ProviderDescriptor(ProviderSpec spec, ActivationPredicate activation, PriorityFn priority,
                                       double ema_alpha)
    : spec_(std::move(spec)),
      activation_(activation ? std::move(activation) : predicates::always()),
      priority_(priority ? std::move(priority) : constant_priority(0)),
      alpha_(std::clamp(ema_alpha, 0.0, 1.0)),
      reliability_(std::clamp(spec_.initial_reliability, 0.0, 1.0)) {}

double ProviderDescriptor::record_outcome(std::optional<core::ProviderErrorKind> error) {
    const double signal = reliability_signal(error);
    std::lock_guard lk(mu_);
    const double prev = reliability_.load(std::memory_order_relaxed);
    const double next = std::clamp(prev + alpha_ * (signal - prev), 0.0, 1.0);
    reliability_.store(next, std::memory_order_relaxed);
    observations_.fetch_add(1, std::memory_order_relaxed);
    return next;
}

void ProviderDescriptor::seed_reliability(double score, uint64_t observations) {
    std::lock_guard lk(mu_);
    reliability_.store(std::clamp(score, 0.0, 1.0), std::memory_order_relaxed);
    observations_.store(observations, std::memory_order_relaxed);
}

} // namespace sluice::routing
