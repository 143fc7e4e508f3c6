#pragma once
/**
 * @file rate_limiter.hpp
 * @brief Per-provider admission control built from token-bucket, sliding-window and daily-quota gates.
 * @details Denial is not an error: AdmissionResult is always returned.
 *
 * Locking model:
 *   - The provider map is guarded by a shared_mutex (exclusive only on configure/remove).
 *   - Each provider owns its own mutex; unrelated providers never contend.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "sluice/config/constants.hpp"
#include "sluice/core/clock.hpp"
#include "sluice/core/string_key.hpp"
#include "sluice/ratelimit/admission_gate.hpp"

namespace sluice::ratelimit {

/** @struct RateLimitSpec
 *  @brief Declared budget of one provider.
 */
struct RateLimitSpec {
    uint32_t                  requests{0};  ///< Per window; 0 = unlimited
    std::chrono::milliseconds window{sluice::config::constants::RATE_DEFAULT_WINDOW_MS};
    uint32_t                  burst{0};     ///< Token-bucket capacity; 0 = requests
    std::chrono::milliseconds burst_window{0}; ///< Secondary short window holding at most `burst`; 0 = off
    uint32_t                  daily_cap{0};    ///< Hard daily total; 0 = none
    uint32_t                  daily_reset_hour_utc{0};

    bool operator==(const RateLimitSpec&) const = default;
};

/** @struct AdmissionResult
 *  @brief Outcome of an admission attempt. retry_after is zero when granted, > 0 otherwise.
 */
struct AdmissionResult {
    bool                      granted{false};
    std::chrono::milliseconds retry_after{0};
};

/** @struct LimiterStatus
 *  @brief Health view of one provider limiter.
 */
struct LimiterStatus {
    std::string             provider_id;
    std::vector<GateStatus> gates;
    uint64_t                granted{0};
    uint64_t                denied{0};
};

/** @class RateLimiter
 *  @brief Thread-safe registry of provider limiters.
 *
 * A provider with no configured spec (or requests == 0 and no daily cap) is unlimited.
 */
class RateLimiter {
public:
    explicit RateLimiter(std::shared_ptr<const core::Clock> clock = core::system_clock());

    /// Install or replace the spec for a provider. Re-configuring an identical spec keeps state.
    void configure(std::string_view provider_id, const RateLimitSpec& spec);

    /// Forget a provider. Returns false if it was unknown.
    bool remove(std::string_view provider_id);

    /// Non-blocking admission at the clock's current time.
    [[nodiscard]] AdmissionResult try_acquire(std::string_view provider_id);

    /// Non-blocking admission at an explicit time.
    [[nodiscard]] AdmissionResult try_acquire(std::string_view provider_id, core::TimePoint now);

    /**
     * @brief Blocking admission: retries until granted or @p timeout elapses.
     * @details Sleeps min(retry_after, remaining, RATE_ACQUIRE_MAX_SLEEP_MS) between attempts.
     *          Returns the last denial if the wait would exceed the timeout.
     */
    AdmissionResult acquire(std::string_view provider_id, std::chrono::milliseconds timeout);

    [[nodiscard]] std::optional<LimiterStatus> status(std::string_view provider_id) const;
    [[nodiscard]] std::vector<LimiterStatus> status_all() const;

    /// Refill every gate of a provider. Returns false if it was unknown.
    bool reset(std::string_view provider_id);

    [[nodiscard]] bool has(std::string_view provider_id) const;

private:
    struct ProviderLimiter {
        RateLimitSpec                               spec;
        mutable std::mutex                          mu;
        std::vector<std::unique_ptr<AdmissionGate>> gates;
        uint64_t                                    granted{0};
        uint64_t                                    denied{0};
    };

    static std::vector<std::unique_ptr<AdmissionGate>> build_gates(const RateLimitSpec& spec, core::TimePoint now);
    std::shared_ptr<ProviderLimiter> find(std::string_view provider_id) const;
    static LimiterStatus snapshot_of(const std::string& id, ProviderLimiter& pl, core::TimePoint now);

    std::shared_ptr<const core::Clock> clock_;
    mutable std::shared_mutex          map_mu_;
    std::unordered_map<std::string, std::shared_ptr<ProviderLimiter>,
                       core::StringKeyHash, core::StringKeyEq> limiters_;
};

} // namespace sluice::ratelimit
