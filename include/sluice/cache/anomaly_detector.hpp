#pragma once
/**
 * @file anomaly_detector.hpp
 * @brief Cheap statistical check on cache writes: flag numeric fields far from their history.
 * @details A field is anomalous when |x - mean| > sigma * stddev over the last `history`
 *          samples for the same key and field, once `min_samples` are available. The caller
 *          downgrades quality; writes are never rejected.
 */

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "sluice/config/constants.hpp"
#include "sluice/core/string_key.hpp"

namespace sluice::cache {

/** @struct AnomalyConfig
 *  @brief Detector tuning.
 */
struct AnomalyConfig {
    double      sigma{sluice::config::constants::ANOMALY_SIGMA};
    std::size_t history{sluice::config::constants::ANOMALY_HISTORY};
    std::size_t min_samples{sluice::config::constants::ANOMALY_MIN_SAMPLES};
    double      quality_penalty{sluice::config::constants::ANOMALY_QUALITY_PENALTY};
    std::size_t max_keys{sluice::config::constants::ANOMALY_MAX_KEYS};
};

/** @struct AnomalyVerdict
 *  @brief Result of assessing one write.
 */
struct AnomalyVerdict {
    bool                     anomalous{false};
    double                   quality_factor{1.0}; ///< Multiply the caller's quality by this
    std::vector<std::string> fields;              ///< Offending field names
};

class AnomalyDetector {
public:
    explicit AnomalyDetector(AnomalyConfig cfg = {}) noexcept : cfg_(cfg) {}

    /// Judge @p fields against history, then append them to it.
    AnomalyVerdict assess(std::string_view key, const std::map<std::string, double>& fields);

    /// Forget the history of a key (after invalidation).
    void forget(std::string_view key);

    [[nodiscard]] std::size_t tracked_keys() const;
    [[nodiscard]] const AnomalyConfig& config() const noexcept { return cfg_; }

private:
    using Series = std::deque<double>;
    using FieldHistory = std::map<std::string, Series, std::less<>>;

    AnomalyConfig cfg_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, FieldHistory, core::StringKeyHash, core::StringKeyEq> history_;
    std::deque<std::string> insertion_order_; ///< Oldest tracked key first, for the max_keys bound
};

} // namespace sluice::cache
