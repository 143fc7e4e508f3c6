#pragma once
/**
 * @file admission_gate.hpp
 * @brief Common interface of the bucket kinds a provider limiter chains in series.
 * @details Admission is two-phase: every gate is asked for its wait time, and only when
 *          all report zero is commit() applied to each. Callers hold the provider lock
 *          across both phases, so gates need no synchronization of their own.
 */

#include <chrono>
#include <cstdint>
#include <string_view>

#include "sluice/core/types.hpp"

namespace sluice::ratelimit {

using core::TimePoint;

/// Bucket kinds. Daily caps are a distinct kind, never approximated by a refill rate.
enum class GateKind : uint8_t { TokenBucket, SlidingWindow, DailyQuota };

/** @struct GateStatus
 *  @brief Read-only view of one gate for health snapshots.
 */
struct GateStatus {
    GateKind                  kind{GateKind::TokenBucket};
    double                    available{0.0};  ///< Tokens or remaining admissions
    double                    capacity{0.0};
    std::chrono::milliseconds window{0};       ///< Refill window, sliding window or day
    std::chrono::milliseconds reset_in{0};     ///< Time until the gate is full again (or resets)
};

/** @class AdmissionGate
 *  @brief One admission constraint on a provider.
 */
class AdmissionGate {
public:
    virtual ~AdmissionGate() = default;

    /// Zero if one request may pass at @p now, otherwise the time until it could.
    virtual std::chrono::nanoseconds wait_time(TimePoint now) noexcept = 0;

    /// Consume one admission. Only called after wait_time(now) returned zero.
    virtual void commit(TimePoint now) noexcept = 0;

    virtual GateStatus status(TimePoint now) noexcept = 0;

    /// Return to the initial (full) state.
    virtual void reset(TimePoint now) noexcept = 0;
};

std::string_view to_string(GateKind k) noexcept;

} // namespace sluice::ratelimit
