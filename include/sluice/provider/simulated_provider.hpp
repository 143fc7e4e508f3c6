#pragma once
/**
 * @file simulated_provider.hpp
 * @brief Deterministic in-process provider for the demo app, benchmarks and tests.
 * @details Values derive from the entity key (stable across runs) unless pinned with set_value().
 *          Failures can be scripted per call; a hold latch makes a fetch block until released.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "sluice/provider/provider_adapter.hpp"

namespace sluice::provider {

/** @struct SimProviderConfig
 *  @brief Simulator knobs.
 */
struct SimProviderConfig {
    std::string               id;
    double                    base_value{100.0};
    double                    jitter_pct{0.0};   ///< Uniform +/- noise on every value
    uint64_t                  seed{42};
    std::chrono::milliseconds latency{0};
    double                    quality{1.0};
    std::size_t               body_padding{0};   ///< Extra body bytes (exercises compression)
};

class SimulatedProvider final : public ProviderAdapter {
public:
    explicit SimulatedProvider(SimProviderConfig cfg);

    [[nodiscard]] std::string_view id() const noexcept override { return cfg_.id; }

    FetchResult fetch(const FetchContext& ctx, const core::DataRequest& request) override;

    // ----- scripting -----
    /// The next @p times calls fail with @p kind.
    void fail_next(core::ProviderErrorKind kind, std::size_t times = 1);
    /// Every call fails with @p kind until cleared with std::nullopt.
    void fail_always(std::optional<core::ProviderErrorKind> kind);
    /// Pin the primary value of an entity.
    void set_value(const std::string& entity, double value);
    void set_latency(std::chrono::milliseconds latency);
    void set_quality(double q);

    /// Block subsequent fetches until release().
    void hold();
    void release();

    [[nodiscard]] uint64_t calls() const noexcept { return calls_.load(std::memory_order_relaxed); }
    /// Calls currently parked on the hold latch.
    [[nodiscard]] std::size_t waiting() const;

private:
    double value_for(const std::string& entity);
    core::Payload make_payload(const core::DataRequest& request);

    SimProviderConfig                   cfg_;
    mutable std::mutex                  mu_;
    std::condition_variable             cv_;
    std::deque<core::ProviderErrorKind> scripted_;
    std::optional<core::ProviderErrorKind> always_;
    std::map<std::string, double>       pinned_;
    std::mt19937_64                     rng_;
    bool                                held_{false};
    std::size_t                         waiting_{0};
    std::atomic<uint64_t>               calls_{0};
};

} // namespace sluice::provider
