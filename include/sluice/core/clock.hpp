#pragma once
/**
 * @file clock.hpp
 * @brief Injectable wall clock so time-dependent policy can be driven from tests.
 */

#include <memory>

#include "sluice/core/types.hpp"

namespace sluice::core {

/** @class Clock
 *  @brief Source of "now" for rate limiting, freshness and deadlines.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const noexcept = 0;
};

/** @class SystemClock
 *  @brief std::chrono::system_clock backed implementation.
 */
class SystemClock final : public Clock {
public:
    TimePoint now() const noexcept override { return std::chrono::system_clock::now(); }
};

/// Process-wide SystemClock instance.
std::shared_ptr<const Clock> system_clock();

} // namespace sluice::core
