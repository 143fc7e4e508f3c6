#pragma once
/**
 * @file provider_descriptor.hpp
 * @brief Static description of one external provider plus its observed reliability.
 *
 * Everything except the reliability score is immutable after construction.
 * Reliability is an exponential moving average updated through record_outcome() only:
 *   - writers serialize on a per-descriptor mutex;
 *   - readers load an atomic without locking (routing sorts on it).
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "sluice/config/constants.hpp"
#include "sluice/core/result.hpp"
#include "sluice/core/types.hpp"
#include "sluice/ratelimit/rate_limiter.hpp"
#include "sluice/routing/activation.hpp"

namespace sluice::routing {

/** @struct ProviderSpec
 *  @brief Catalog entry as configured.
 */
struct ProviderSpec {
    std::string               id;
    core::ProviderTier        tier{core::ProviderTier::Commercial};
    core::ProviderScope       scope{core::ProviderScope::IndividualEntity};
    ratelimit::RateLimitSpec  rate_limit{};
    double                    cost_per_request{0.0};
    std::chrono::milliseconds timeout{sluice::config::constants::EXEC_PROVIDER_TIMEOUT_MS};
    double                    initial_reliability{sluice::config::constants::RELIABILITY_INITIAL};
    ActivationRule            activation{};
    PriorityRule              priority{};

    bool operator==(const ProviderSpec&) const = default;
};

/// EMA input for an outcome: 1.0 for success, lower for worse failures.
[[nodiscard]] double reliability_signal(std::optional<core::ProviderErrorKind> error) noexcept;

class ProviderDescriptor {
public:
    /// Predicates compiled from spec.activation / spec.priority.
    explicit ProviderDescriptor(ProviderSpec spec,
                                double ema_alpha = sluice::config::constants::RELIABILITY_EMA_ALPHA);

    /// Hand-written predicates; spec.activation / spec.priority are kept only as metadata.
    ProviderDescriptor(ProviderSpec spec, ActivationPredicate activation, PriorityFn priority,
                       double ema_alpha = sluice::config::constants::RELIABILITY_EMA_ALPHA);

    ProviderDescriptor(const ProviderDescriptor&) = delete;
    ProviderDescriptor& operator=(const ProviderDescriptor&) = delete;

    [[nodiscard]] const ProviderSpec& spec() const noexcept { return spec_; }
    [[nodiscard]] const std::string& id() const noexcept { return spec_.id; }
    [[nodiscard]] core::ProviderTier tier() const noexcept { return spec_.tier; }
    [[nodiscard]] core::ProviderScope scope() const noexcept { return spec_.scope; }
    [[nodiscard]] const ratelimit::RateLimitSpec& rate_limit() const noexcept { return spec_.rate_limit; }
    [[nodiscard]] double cost_per_request() const noexcept { return spec_.cost_per_request; }
    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return spec_.timeout; }

    [[nodiscard]] bool activates_for(const core::FilterCriteria& f) const { return activation_(f); }
    [[nodiscard]] int priority_for(const core::FilterCriteria& f) const { return priority_(f); }

    [[nodiscard]] double reliability() const noexcept { return reliability_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t observations() const noexcept { return observations_.load(std::memory_order_relaxed); }

    /**
     * @brief Fold one call outcome into the reliability score.
     * @param error nullopt for success, otherwise the adapter's classification.
     * @return The updated score.
     */
    double record_outcome(std::optional<core::ProviderErrorKind> error);

    /// Overwrite the score (catalog reload carries scores over to the new descriptor).
    void seed_reliability(double score, uint64_t observations);

private:
    ProviderSpec          spec_;
    ActivationPredicate   activation_;
    PriorityFn            priority_;
    double                alpha_;
    std::mutex            mu_;
    std::atomic<double>   reliability_;
    std::atomic<uint64_t> observations_{0};
};

} // namespace sluice::routing
