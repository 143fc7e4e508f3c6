/**
 * @file clock.cpp
 */
#include "sluice/core/clock.hpp"

namespace sluice::core {

std::shared_ptr<const Clock> system_clock() {
    static const auto clk = std::make_shared<const SystemClock>();
    return clk;
}

} // namespace sluice::core
