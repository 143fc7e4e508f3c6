#pragma once
/**
 * @file token_bucket.hpp
 * @brief Continuous-refill token bucket. No background timer: refill is computed on access.
 */

#include "sluice/ratelimit/admission_gate.hpp"

namespace sluice::ratelimit {

/** @class TokenBucket
 *  @brief tokens = min(capacity, tokens + elapsed * refill_rate); admit while tokens >= 1.
 *  @details A clock that moves backwards resets the refill origin without crediting tokens.
 */
class TokenBucket final : public AdmissionGate {
public:
    /**
     * @param capacity Burst capacity (maximum tokens), >= 1.
     * @param refill_per_sec Tokens added per second, > 0.
     * @param now Initial refill origin. The bucket starts full.
     */
    TokenBucket(double capacity, double refill_per_sec, TimePoint now) noexcept;

    std::chrono::nanoseconds wait_time(TimePoint now) noexcept override;
    void commit(TimePoint now) noexcept override;
    GateStatus status(TimePoint now) noexcept override;
    void reset(TimePoint now) noexcept override;

    [[nodiscard]] double tokens() const noexcept { return tokens_; }
    [[nodiscard]] double capacity() const noexcept { return capacity_; }

private:
    void refill(TimePoint now) noexcept;

    double    capacity_;
    double    rate_;        ///< tokens per second
    double    tokens_;
    TimePoint last_refill_;
};

} // namespace sluice::ratelimit
