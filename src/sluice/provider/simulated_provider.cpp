/**
 * @file simulated_provider.cpp
 * @brief Simulated adapter: stable per-entity values, scripted failures, deadline-aware latency.
 */
#include "sluice/provider/simulated_provider.hpp"

#include <algorithm>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "sluice/cache/cache_key.hpp"

namespace sluice::provider {

namespace {

/// Field names produced for each data type.
std::vector<std::string_view> fields_for(core::DataType t) {
    switch (t) {
        case core::DataType::Quote:        return {"price", "volume"};
        case core::DataType::Ohlcv:        return {"open", "high", "low", "close", "volume"};
        case core::DataType::Fundamentals: return {"market_cap", "pe_ratio"};
        case core::DataType::Options:      return {"implied_vol", "open_interest"};
        case core::DataType::Sentiment:    return {"score"};
        default:                           return {"value"};
    }
}

/// Scale of each field relative to the entity's base value.
double scale_of(std::string_view field) noexcept {
    if (field == "volume" || field == "open_interest") return 1e4;
    if (field == "market_cap") return 1e7;
    if (field == "high") return 1.01;
    if (field == "low") return 0.99;
    if (field == "pe_ratio" || field == "implied_vol" || field == "score") return 0.01;
    return 1.0;
}

} // namespace

SimulatedProvider::SimulatedProvider(SimProviderConfig cfg) : cfg_(std::move(cfg)), rng_(cfg_.seed) {}

void SimulatedProvider::fail_next(core::ProviderErrorKind kind, std::size_t times) {
    std::lock_guard lk(mu_);
    for (std::size_t i = 0; i < times; ++i) scripted_.push_back(kind);
}

void SimulatedProvider::fail_always(std::optional<core::ProviderErrorKind> kind) {
    std::lock_guard lk(mu_);
    always_ = kind;
}

void SimulatedProvider::set_value(const std::string& entity, double value) {
    std::lock_guard lk(mu_);
    pinned_[entity] = value;
}

void SimulatedProvider::set_latency(std::chrono::milliseconds latency) {
    std::lock_guard lk(mu_);
    cfg_.latency = latency;
}

void SimulatedProvider::set_quality(double q) {
    std::lock_guard lk(mu_);
    cfg_.quality = std::clamp(q, 0.0, 1.0);
}

void SimulatedProvider::hold() {
    std::lock_guard lk(mu_);
    held_ = true;
}

void SimulatedProvider::release() {
    {
        std::lock_guard lk(mu_);
        held_ = false;
    }
    cv_.notify_all();
}

std::size_t SimulatedProvider::waiting() const {
    std::lock_guard lk(mu_);
    return waiting_;
}

double SimulatedProvider::value_for(const std::string& entity) {
    if (auto it = pinned_.find(entity); it != pinned_.end()) return it->second;
    // Stable pseudo-price in [base, 2*base)
    const auto h = cache::hash_bytes(entity, 0);
    return cfg_.base_value * (1.0 + static_cast<double>(h % 1000) / 1000.0);
}

core::Payload SimulatedProvider::make_payload(const core::DataRequest& request) {
    const auto& keys = request.entity_keys();
    std::vector<std::string> subjects = keys.empty()
        ? std::vector<std::string>{request.criteria.sector.value_or(std::string(core::to_string(request.data_type())))}
        : keys;

    std::uniform_real_distribution<double> noise(-cfg_.jitter_pct / 100.0, cfg_.jitter_pct / 100.0);
    core::Payload p;
    for (const auto& s : subjects) {
        const double v = value_for(s);
        for (auto f : fields_for(request.data_type())) {
            double x = v * scale_of(f);
            if (cfg_.jitter_pct > 0.0) x *= 1.0 + noise(rng_);
            const std::string name = subjects.size() == 1 ? std::string(f) : s + "." + std::string(f);
            p.fields[name] = x;
        }
    }

    nlohmann::json body;
    body["provider"] = cfg_.id;
    body["data_type"] = std::string(core::to_string(request.data_type()));
    body["subjects"] = subjects;
    body["fields"] = p.fields;
    if (cfg_.body_padding > 0) body["padding"] = std::string(cfg_.body_padding, 'x');
    p.body = body.dump();
    return p;
}

FetchResult SimulatedProvider::fetch(const FetchContext& ctx, const core::DataRequest& request) {
    calls_.fetch_add(1, std::memory_order_relaxed);

    std::chrono::milliseconds latency;
    std::optional<core::ProviderErrorKind> failure;
    {
        std::unique_lock lk(mu_);
        if (held_) {
            ++waiting_;
            cv_.wait(lk, [&] { return !held_; });
            --waiting_;
        }
        latency = cfg_.latency;
        if (!scripted_.empty()) {
            failure = scripted_.front();
            scripted_.pop_front();
        } else {
            failure = always_;
        }
    }

    if (latency.count() > 0) {
        const auto budget = ctx.remaining();
        if (budget < latency) {
            std::this_thread::sleep_for(budget);
            return sluice_detail::unexpected(core::ProviderError{
                core::ProviderErrorKind::Timeout, cfg_.id + ": no answer before the deadline"});
        }
        std::this_thread::sleep_for(latency);
    }

    if (failure) {
        SPDLOG_DEBUG("simulated provider {} scripted failure {}", cfg_.id, core::to_string(*failure));
        return sluice_detail::unexpected(core::ProviderError{*failure, cfg_.id + ": simulated " +
                                                             std::string(core::to_string(*failure))});
    }

    std::lock_guard lk(mu_);
    return ProviderResponse{make_payload(request), cfg_.quality};
}

} // namespace sluice::provider
