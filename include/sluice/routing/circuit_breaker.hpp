#pragma once
/**
 * @file circuit_breaker.hpp
 * @brief Per-provider circuit breakers (CLOSED / OPEN / HALF_OPEN).
 *
 * State machine per provider:
 *   CLOSED    --N consecutive failures-->  OPEN
 *   OPEN      --open_for elapsed------->   HALF_OPEN (one trial call admitted)
 *   HALF_OPEN --trial succeeds-------->    CLOSED
 *   HALF_OPEN --trial fails----------->    OPEN (timer restarts)
 *
 * RateLimited and NotFound are answers, not outages: they neither count nor reset.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "sluice/config/constants.hpp"
#include "sluice/core/clock.hpp"
#include "sluice/core/result.hpp"
#include "sluice/core/string_key.hpp"

namespace sluice::routing {

enum class CircuitState : uint8_t { Closed, Open, HalfOpen };

struct BreakerConfig {
    uint32_t                  failure_threshold{sluice::config::constants::BREAKER_FAILURE_THRESHOLD};
    std::chrono::milliseconds open_for{sluice::config::constants::BREAKER_OPEN_MS};

    bool operator==(const BreakerConfig&) const = default;
};

struct BreakerStatus {
    std::string               provider_id;
    CircuitState              state{CircuitState::Closed};
    uint32_t                  consecutive_failures{0};
    uint64_t                  trips{0};
    std::chrono::milliseconds retry_in{0}; ///< Time until a half-open trial call (Open only)
};

class CircuitBreakerBank {
public:
    explicit CircuitBreakerBank(BreakerConfig cfg = {},
                                std::shared_ptr<const core::Clock> clock = core::system_clock());

    /**
     * @brief May a call go to this provider now?
     * @details In HALF_OPEN exactly one caller gets true until the trial call reports back
     *          (on_success / on_failure / release).
     */
    [[nodiscard]] bool allow(std::string_view provider_id);

    void on_success(std::string_view provider_id);
    void on_failure(std::string_view provider_id, core::ProviderErrorKind kind);

    /// Give back an admission that never turned into a call (rate or budget denial).
    void release(std::string_view provider_id);

    [[nodiscard]] CircuitState state(std::string_view provider_id) const;
    [[nodiscard]] std::vector<BreakerStatus> status_all() const;
    void reset(std::string_view provider_id);

    [[nodiscard]] static bool counts_as_failure(core::ProviderErrorKind kind) noexcept;

private:
    struct Entry {
        CircuitState    state{CircuitState::Closed};
        uint32_t        failures{0};
        uint64_t        trips{0};
        core::TimePoint opened_at{};
        bool            trial_in_flight{false};
    };

    Entry& entry(std::string_view id);
    void trip(std::string_view id, Entry& e, core::TimePoint now);

    BreakerConfig                      cfg_;
    std::shared_ptr<const core::Clock> clock_;
    mutable std::mutex                 mu_;
    std::unordered_map<std::string, Entry, core::StringKeyHash, core::StringKeyEq> entries_;
};

std::string_view to_string(CircuitState s) noexcept;

} // namespace sluice::routing
