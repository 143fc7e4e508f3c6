/**
 * @file anomaly_detector.cpp
 */
#include "sluice/cache/anomaly_detector.hpp"

#include <algorithm>
#include <cmath>

namespace sluice::cache {

namespace {

struct Moments { double mean; double stddev; };

Moments moments_of(const std::deque<double>& v) noexcept {
    // Welford
    double mean = 0.0, m2 = 0.0;
    std::size_t n = 0;
    for (double x : v) {
        ++n;
        const double d = x - mean;
        mean += d / static_cast<double>(n);
        m2 += d * (x - mean);
    }
    const double var = n > 1 ? m2 / static_cast<double>(n - 1) : 0.0;
    return {mean, std::sqrt(var)};
}

} // namespace

AnomalyVerdict AnomalyDetector::assess(std::string_view key, const std::map<std::string, double>& fields) {
    AnomalyVerdict verdict;
    if (fields.empty()) return verdict;

    std::lock_guard lk(mu_);
    auto it = history_.find(key);
    if (it == history_.end()) {
        if (history_.size() >= cfg_.max_keys && !insertion_order_.empty()) {
            history_.erase(insertion_order_.front());
            insertion_order_.pop_front();
        }
        it = history_.emplace(std::string(key), FieldHistory{}).first;
        insertion_order_.emplace_back(key);
    }

    for (const auto& [name, value] : fields) {
        if (!std::isfinite(value)) {
            verdict.anomalous = true;
            verdict.fields.push_back(name);
            continue;
        }
        Series& s = it->second[name];
        if (s.size() >= cfg_.min_samples) {
            const auto m = moments_of(s);
            // floor at 0.1% of the mean so a flat history does not flag every tick
            const double sd = std::max(m.stddev, 1e-3 * std::fabs(m.mean));
            if (sd > 0.0 && std::fabs(value - m.mean) > cfg_.sigma * sd) {
                verdict.anomalous = true;
                verdict.fields.push_back(name);
            }
        }
        s.push_back(value);
        while (s.size() > cfg_.history) s.pop_front();
    }

    if (verdict.anomalous) verdict.quality_factor = cfg_.quality_penalty;
    return verdict;
}

void AnomalyDetector::forget(std::string_view key) {
    std::lock_guard lk(mu_);
    auto it = history_.find(key);
    if (it == history_.end()) return;
    history_.erase(it);
    std::erase(insertion_order_, key);
}

std::size_t AnomalyDetector::tracked_keys() const {
    std::lock_guard lk(mu_);
    return history_.size();
}

} // namespace sluice::cache
