#pragma once
/**
 * @file sliding_window.hpp
 * @brief Exact sliding-window log: at most N admissions in any half-open window of length W.
 */

#include <cstdint>
#include <deque>

#include "sluice/ratelimit/admission_gate.hpp"

namespace sluice::ratelimit {

/** @class SlidingWindow
 *  @brief Keeps the timestamps of the last N admissions.
 *  @details Memory is bounded by the limit. Used as the hard guard behind the token bucket
 *           and for the secondary short (burst) window.
 */
class SlidingWindow final : public AdmissionGate {
public:
    SlidingWindow(uint32_t limit, std::chrono::milliseconds window) noexcept;

    std::chrono::nanoseconds wait_time(TimePoint now) noexcept override;
    void commit(TimePoint now) noexcept override;
    GateStatus status(TimePoint now) noexcept override;
    void reset(TimePoint now) noexcept override;

    [[nodiscard]] std::size_t in_window() const noexcept { return grants_.size(); }

private:
    void evict(TimePoint now) noexcept;

    uint32_t                  limit_;
    std::chrono::milliseconds window_;
    std::deque<TimePoint>     grants_;
};

} // namespace sluice::ratelimit
