/**
 * @file observability.cpp
 * @brief spdlog-backed Observer emitting structured JSON lines.
 */
#include "sluice/obs/observability.hpp"

#include <mutex>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace sluice::obs {

namespace {

std::string str(std::string_view s) { return std::string(s); }

class LoggingObserver final : public Observer {
public:
    void record(const RequestEvent& e) override {
        {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.requests++;
            if (e.cache_state) {
                switch (*e.cache_state) {
                    case core::CacheState::Fresh:     ctr_.fresh_hits++; break;
                    case core::CacheState::Refreshed: ctr_.refreshed++; break;
                    case core::CacheState::Stale:     ctr_.stale_served++; break;
                }
            }
            if (e.error) {
                switch (*e.error) {
                    case core::RequestErrorKind::Unroutable:  ctr_.unroutable++; break;
                    case core::RequestErrorKind::Unavailable: ctr_.unavailable++; break;
                    case core::RequestErrorKind::Timeout:     ctr_.timeouts++; break;
                }
            }
            for (const auto& a : e.attempts) {
                if (a.outcome != core::AttemptOutcome::Succeeded) ctr_.failovers++;
            }
            if (e.review_flag) ctr_.flagged_for_review++;
        }
        if (e.error || e.cache_state == core::CacheState::Stale) SPDLOG_WARN("{}", to_json_line(e));
        else SPDLOG_INFO("{}", to_json_line(e));
    }

    void record(const reconcile::ConflictRecord& c) override {
        {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.conflicts++;
        }
        SPDLOG_INFO("{}", to_json_line(c));
    }

    Counters snapshot() const override {
        std::lock_guard<std::mutex> lk(mu_);
        return ctr_;
    }

private:
    mutable std::mutex mu_;
    Counters ctr_;
};

} // namespace

std::string to_json_line(const RequestEvent& e) {
    nlohmann::json j;
    j["event"] = "request";
    j["request_id"] = e.request_id;
    j["key"] = e.cache_key;
    j["data_type"] = str(core::to_string(e.data_type));
    if (e.cache_state) j["cache_state"] = str(core::to_string(*e.cache_state));
    if (e.error) j["error"] = str(core::to_string(*e.error));
    if (!e.source_id.empty()) j["source"] = e.source_id;
    j["confidence"] = e.confidence;
    if (e.review_flag) j["review"] = true;
    auto& attempts = j["attempts"] = nlohmann::json::array();
    for (const auto& a : e.attempts) {
        attempts.push_back({{"provider", a.provider_id}, {"outcome", str(core::to_string(a.outcome))},
                            {"detail", a.detail}});
    }
    auto& trace = j["trace"] = nlohmann::json::array();
    for (auto s : e.trace) trace.push_back(str(core::to_string(s)));
    j["elapsed_us"] = e.elapsed.count();
    return j.dump();
}

std::string to_json_line(const reconcile::ConflictRecord& c) {
    nlohmann::json j;
    j["event"] = "conflict";
    j["key"] = c.key;
    j["requested"] = str(reconcile::to_string(c.requested));
    j["applied"] = str(reconcile::to_string(c.resolution.strategy));
    j["source"] = c.resolution.source_id;
    j["confidence"] = c.resolution.confidence;
    j["review"] = c.resolution.review_flag;
    j["exact_agreement"] = c.resolution.exact_agreement;
    j["variance_pct"] = c.resolution.variance_pct;
    auto& cands = j["candidates"] = nlohmann::json::array();
    for (const auto& cand : c.candidates) {
        cands.push_back({{"source", cand.source_id}, {"quality", cand.quality}, {"fields", cand.value.fields}});
    }
    return j.dump();
}

std::shared_ptr<Observer> make_logging_observer() {
    return std::make_shared<LoggingObserver>();
}

} // namespace sluice::obs
