#pragma once
/**
 * @file daily_quota.hpp
 * @brief Fixed daily budget that resets at a wall-clock instant (UTC hour), not by refill.
 */

#include <cstdint>

#include "sluice/ratelimit/admission_gate.hpp"

namespace sluice::ratelimit {

/** @class DailyQuota
 *  @brief Counter of admissions since the last reset boundary.
 *  @details Boundary = midnight UTC shifted by reset_hour_utc. A denied request is told to
 *           wait until the next boundary, however far away.
 */
class DailyQuota final : public AdmissionGate {
public:
    DailyQuota(uint32_t limit, uint32_t reset_hour_utc, TimePoint now) noexcept;

    std::chrono::nanoseconds wait_time(TimePoint now) noexcept override;
    void commit(TimePoint now) noexcept override;
    GateStatus status(TimePoint now) noexcept override;
    void reset(TimePoint now) noexcept override;

    /// Start of the quota period containing @p now.
    [[nodiscard]] TimePoint period_start(TimePoint now) const noexcept;
    [[nodiscard]] uint32_t used() const noexcept { return used_; }

private:
    void roll(TimePoint now) noexcept;

    uint32_t             limit_;
    std::chrono::hours   offset_;
    uint32_t             used_{0};
    TimePoint            period_{};
};

} // namespace sluice::ratelimit
