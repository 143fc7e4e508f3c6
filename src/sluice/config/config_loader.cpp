/**
 * @file config_loader.cpp
 * @brief nlohmann::json parser for SluiceConfig; json exceptions stop at this boundary.
 */
#include "sluice/config/config_loader.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "sluice/config/constants.hpp"
#include "sluice/routing/provider_catalog.hpp"

namespace sluice::config {

using json = nlohmann::json;
using namespace sluice::config::constants;

namespace {

using Err = std::optional<ConfigError>;

ConfigError bad(std::string where, std::string msg) {
    return ConfigError{ConfigError::Code::BadValue, std::move(where), std::move(msg)};
}

std::string at(const std::string& where, std::string_view name) {
    return where.empty() ? std::string(name) : where + "." + std::string(name);
}

const json* member(const json& obj, const char* name) {
    auto it = obj.find(name);
    return (it == obj.end() || it->is_null()) ? nullptr : &*it;
}

// ----- scalar readers: absent keeps the default -----

Err read_bool(const json& obj, const char* name, bool& out, const std::string& where) {
    const json* v = member(obj, name);
    if (!v) return std::nullopt;
    if (!v->is_boolean()) return bad(at(where, name), "expected a boolean");
    out = v->get<bool>();
    return std::nullopt;
}

Err read_string(const json& obj, const char* name, std::string& out, const std::string& where) {
    const json* v = member(obj, name);
    if (!v) return std::nullopt;
    if (!v->is_string()) return bad(at(where, name), "expected a string");
    out = v->get<std::string>();
    return std::nullopt;
}

Err read_double(const json& obj, const char* name, double& out, const std::string& where,
                double lo = 0.0, double hi = std::numeric_limits<double>::max()) {
    const json* v = member(obj, name);
    if (!v) return std::nullopt;
    if (!v->is_number()) return bad(at(where, name), "expected a number");
    const double d = v->get<double>();
    if (!std::isfinite(d) || d < lo || d > hi) return bad(at(where, name), "out of range");
    out = d;
    return std::nullopt;
}

template <class U>
Err read_uint(const json& obj, const char* name, U& out, const std::string& where,
              uint64_t hi = std::numeric_limits<U>::max()) {
    const json* v = member(obj, name);
    if (!v) return std::nullopt;
    if (!v->is_number_integer() || (v->is_number_integer() && !v->is_number_unsigned() && v->get<int64_t>() < 0))
        return bad(at(where, name), "expected a non-negative integer");
    const auto n = v->get<uint64_t>();
    if (n > hi) return bad(at(where, name), "out of range");
    out = static_cast<U>(n);
    return std::nullopt;
}

template <class Duration>
Err read_duration(const json& obj, const char* name, Duration& out, const std::string& where) {
    uint64_t n = static_cast<uint64_t>(out.count());
    if (auto e = read_uint(obj, name, n, where, static_cast<uint64_t>(std::numeric_limits<int32_t>::max())))
        return e;
    out = Duration(static_cast<typename Duration::rep>(n));
    return std::nullopt;
}

template <class T, class ParseFn>
Err read_enum_list(const json& obj, const char* name, std::vector<T>& out, const std::string& where, ParseFn parse) {
    const json* v = member(obj, name);
    if (!v) return std::nullopt;
    if (!v->is_array()) return bad(at(where, name), "expected an array of names");
    out.clear();
    for (std::size_t i = 0; i < v->size(); ++i) {
        const auto& item = (*v)[i];
        const auto loc = at(where, name) + "[" + std::to_string(i) + "]";
        if (!item.is_string()) return bad(loc, "expected a string");
        auto parsed = parse(item.template get<std::string>());
        if (!parsed) return bad(loc, "unknown name '" + item.template get<std::string>() + "'");
        out.push_back(*parsed);
    }
    return std::nullopt;
}

/// {"quote": 10, ...} keyed by an enum name.
template <class K, class ParseFn>
Err read_int_map(const json& obj, const char* name, std::map<K, int>& out, const std::string& where, ParseFn parse) {
    const json* v = member(obj, name);
    if (!v) return std::nullopt;
    if (!v->is_object()) return bad(at(where, name), "expected an object");
    out.clear();
    for (auto it = v->begin(); it != v->end(); ++it) {
        const auto loc = at(at(where, name), it.key());
        auto k = parse(it.key());
        if (!k) return bad(loc, "unknown name");
        if (!it->is_number_integer()) return bad(loc, "expected an integer");
        out[*k] = it->template get<int>();
    }
    return std::nullopt;
}

// ----- sections -----

Err parse_logging(const json& j, obs::LoggingConfig& out) {
    const std::string w = "logging";
    if (auto e = read_string(j, "level", out.level, w)) return e;
    if (auto e = read_string(j, "pattern", out.pattern, w)) return e;
    if (auto e = read_string(j, "file", out.file, w)) return e;
    if (auto e = read_uint(j, "rotate_bytes", out.rotate_bytes, w)) return e;
    if (auto e = read_uint(j, "rotate_files", out.rotate_files, w)) return e;
    static const std::set<std::string> levels{"trace", "debug", "info", "warn", "error", "critical", "off"};
    if (!levels.count(out.level)) return bad("logging.level", "unknown level '" + out.level + "'");
    return std::nullopt;
}

Err parse_cache(const json& j, cache::CacheConfig& out) {
    const std::string w = "cache";
    if (auto e = read_uint(j, "fast_capacity", out.fast_capacity, w)) return e;
    if (auto e = read_uint(j, "fast_shards", out.fast_shards, w)) return e;
    if (auto e = read_uint(j, "compression_threshold", out.compression_threshold, w)) return e;
    if (auto e = read_string(j, "durable_path", out.durable_path, w)) return e;
    if (auto e = read_duration(j, "retention_ceiling_s", out.retention_ceiling, w)) return e;
    if (out.fast_capacity == 0) return bad("cache.fast_capacity", "must be at least 1");
    if (out.fast_shards == 0) return bad("cache.fast_shards", "must be at least 1");

    if (const json* a = member(j, "anomaly")) {
        const std::string wa = "cache.anomaly";
        if (!a->is_object()) return bad(wa, "expected an object");
        if (auto e = read_double(*a, "sigma", out.anomaly.sigma, wa, 0.1)) return e;
        if (auto e = read_uint(*a, "history", out.anomaly.history, wa)) return e;
        if (auto e = read_uint(*a, "min_samples", out.anomaly.min_samples, wa)) return e;
        if (auto e = read_double(*a, "quality_penalty", out.anomaly.quality_penalty, wa, 0.0, 1.0)) return e;
        if (auto e = read_uint(*a, "max_keys", out.anomaly.max_keys, wa)) return e;
        if (out.anomaly.min_samples < 2) return bad("cache.anomaly.min_samples", "must be at least 2");
        if (out.anomaly.history < out.anomaly.min_samples)
            return bad("cache.anomaly.history", "must be >= min_samples");
    }

    if (const json* t = member(j, "ttl")) {
        if (!t->is_object()) return bad("cache.ttl", "expected an object keyed by data type");
        for (auto it = t->begin(); it != t->end(); ++it) {
            const auto wt = "cache.ttl." + it.key();
            auto type = core::parse_data_type(it.key());
            if (!type) return bad(wt, "unknown data type");
            if (!it->is_object()) return bad(wt, "expected an object");
            auto rule = out.ttl.rule_for(*type);
            if (auto e = read_duration(*it, "ttl_s", rule.ttl, wt)) return e;
            if (auto e = read_double(*it, "refresh_threshold", rule.refresh_threshold, wt, 0.0, 1.0)) return e;
            if (rule.ttl.count() == 0) return bad(wt + ".ttl_s", "must be positive");
            out.ttl.set_rule(*type, rule);
        }
    }
    return std::nullopt;
}

Err parse_executor(const json& j, SluiceConfig& out) {
    const std::string w = "executor";
    if (auto e = read_duration(j, "default_timeout_ms", out.default_provider_timeout, w)) return e;
    if (auto e = read_double(j, "reliability_alpha", out.reliability_alpha, w, 0.0, 1.0)) return e;
    if (auto e = read_duration(j, "reconcile_window_s", out.executor.reconcile_window, w)) return e;
    if (auto e = read_bool(j, "background_refresh", out.executor.background_refresh, w)) return e;
    if (out.default_provider_timeout.count() == 0) return bad("executor.default_timeout_ms", "must be positive");

    if (const json* cv = member(j, "cross_validate")) {
        if (!cv->is_object()) return bad("executor.cross_validate", "expected an object keyed by data type");
        for (auto it = cv->begin(); it != cv->end(); ++it) {
            auto type = core::parse_data_type(it.key());
            if (!type) return bad("executor.cross_validate." + it.key(), "unknown data type");
            uint32_t n = 1;
            if (auto e = read_uint(*cv, it.key().c_str(), n, "executor.cross_validate", CROSS_VALIDATE_MAX)) return e;
            out.executor.cross_validate[core::index_of(*type)] = n;
        }
    }
    return std::nullopt;
}

Err parse_workers(const json& j, exec::PoolConfig& out) {
    const std::string w = "workers";
    if (auto e = read_uint(j, "threads", out.threads, w, 256)) return e;
    if (auto e = read_uint(j, "queue_capacity", out.queue_capacity, w)) return e;
    std::string mode = out.on_destroy == exec::ShutdownMode::Drain ? "drain" : "discard";
    if (auto e = read_string(j, "shutdown", mode, w)) return e;
    if (mode == "drain") out.on_destroy = exec::ShutdownMode::Drain;
    else if (mode == "discard") out.on_destroy = exec::ShutdownMode::Discard;
    else return bad("workers.shutdown", "expected 'drain' or 'discard'");
    return std::nullopt;
}

Err parse_breaker(const json& j, routing::BreakerConfig& out) {
    const std::string w = "breaker";
    if (auto e = read_uint(j, "failure_threshold", out.failure_threshold, w)) return e;
    if (auto e = read_duration(j, "open_ms", out.open_for, w)) return e;
    if (out.failure_threshold == 0) return bad("breaker.failure_threshold", "must be at least 1");
    return std::nullopt;
}

Err parse_budget(const json& j, ratelimit::BudgetConfig& out) {
    const std::string w = "budget";
    if (auto e = read_double(j, "monthly_limit", out.monthly_limit, w)) return e;
    if (auto e = read_double(j, "daily_limit", out.daily_limit, w)) return e;
    if (auto e = read_bool(j, "auto_stop", out.auto_stop, w)) return e;
    if (const json* a = member(j, "alert_pcts")) {
        if (!a->is_array()) return bad("budget.alert_pcts", "expected an array of percentages");
        out.alert_pcts.clear();
        for (const auto& p : *a) {
            if (!p.is_number() || p.get<double>() <= 0.0) return bad("budget.alert_pcts", "expected positive numbers");
            out.alert_pcts.push_back(p.get<double>());
        }
    }
    return std::nullopt;
}

std::optional<reconcile::Strategy> strategy_named(std::string_view name) {
    if (name == "use_primary") return reconcile::strategy::UsePrimary{};
    if (name == "use_highest_quality") return reconcile::strategy::UseHighestQuality{};
    if (name == "use_average") return reconcile::strategy::UseAverage{};
    if (name == "use_most_recent") return reconcile::strategy::UseMostRecent{};
    if (name == "flag_for_review") return reconcile::strategy::FlagForReview{};
    return std::nullopt;
}

Err parse_reconcile(const json& j, reconcile::ConflictResolver& out) {
    const std::string w = "reconcile";
    std::optional<double> default_tol;
    std::map<std::string, double, std::less<>> field_tol;

    if (member(j, "default_tolerance_pct")) {
        double d = 0.0;
        if (auto e = read_double(j, "default_tolerance_pct", d, w)) return e;
        default_tol = d;
    }
    if (const json* f = member(j, "field_tolerance_pct")) {
        if (!f->is_object()) return bad("reconcile.field_tolerance_pct", "expected an object");
        for (auto it = f->begin(); it != f->end(); ++it) {
            double d = 0.0;
            if (auto e = read_double(*f, it.key().c_str(), d, "reconcile.field_tolerance_pct")) return e;
            field_tol[it.key()] = d;
        }
    }

    // Tolerances apply to every averaging strategy, default or configured below
    auto tune = [&](reconcile::Strategy& s) {
        if (auto* avg = std::get_if<reconcile::strategy::UseAverage>(&s)) {
            if (default_tol) avg->tolerance_pct = *default_tol;
            for (const auto& [k, v] : field_tol) avg->field_tolerance_pct[k] = v;
        }
    };
    for (std::size_t i = 0; i < core::kDataTypeCount; ++i) {
        const auto t = static_cast<core::DataType>(i);
        auto s = out.strategy_for(t);
        if (t == core::DataType::Sentiment && !default_tol) {
            // keep the wider sentiment band unless a global default is configured
            if (auto* avg = std::get_if<reconcile::strategy::UseAverage>(&s))
                for (const auto& [k, v] : field_tol) avg->field_tolerance_pct[k] = v;
        } else {
            tune(s);
        }
        out.set_strategy(t, std::move(s));
    }

    if (const json* st = member(j, "strategies")) {
        if (!st->is_object()) return bad("reconcile.strategies", "expected an object keyed by data type");
        for (auto it = st->begin(); it != st->end(); ++it) {
            const auto ws = "reconcile.strategies." + it.key();
            auto type = core::parse_data_type(it.key());
            if (!type) return bad(ws, "unknown data type");

            std::string name;
            const json* opts = nullptr;
            if (it->is_string()) {
                name = it->get<std::string>();
            } else if (it->is_object()) {
                if (auto e = read_string(*it, "strategy", name, ws)) return e;
                opts = &*it;
            } else {
                return bad(ws, "expected a strategy name or object");
            }
            auto s = strategy_named(name);
            if (!s) return bad(ws, "unknown strategy '" + name + "'");
            tune(*s);
            if (opts) {
                if (auto* avg = std::get_if<reconcile::strategy::UseAverage>(&*s)) {
                    if (auto e = read_double(*opts, "tolerance_pct", avg->tolerance_pct, ws)) return e;
                }
                if (auto* fr = std::get_if<reconcile::strategy::FlagForReview>(&*s)) {
                    if (auto e = read_double(*opts, "confidence_cap", fr->confidence_cap, ws, 0.0, 1.0)) return e;
                }
            }
            out.set_strategy(*type, std::move(*s));
        }
    }
    return std::nullopt;
}

Err parse_provider(const json& j, const std::string& w, std::chrono::milliseconds default_timeout,
                   routing::ProviderSpec& p) {
    if (!j.is_object()) return bad(w, "expected an object");
    p.timeout = default_timeout;
    if (auto e = read_string(j, "id", p.id, w)) return e;
    if (p.id.empty()) return bad(at(w, "id"), "required");

    std::string tier(core::to_string(p.tier)), scope(core::to_string(p.scope));
    if (auto e = read_string(j, "tier", tier, w)) return e;
    if (auto e = read_string(j, "scope", scope, w)) return e;
    auto t = core::parse_provider_tier(tier);
    if (!t) return bad(at(w, "tier"), "unknown tier '" + tier + "'");
    auto s = core::parse_provider_scope(scope);
    if (!s) return bad(at(w, "scope"), "unknown scope '" + scope + "'");
    p.tier = *t;
    p.scope = *s;

    if (auto e = read_double(j, "cost_per_request", p.cost_per_request, w)) return e;
    if (auto e = read_duration(j, "timeout_ms", p.timeout, w)) return e;
    if (auto e = read_double(j, "reliability", p.initial_reliability, w, 0.0, 1.0)) return e;
    if (p.timeout.count() == 0) return bad(at(w, "timeout_ms"), "must be positive");

    if (const json* rl = member(j, "rate_limit")) {
        const auto wr = at(w, "rate_limit");
        if (!rl->is_object()) return bad(wr, "expected an object");
        auto& r = p.rate_limit;
        if (auto e = read_uint(*rl, "requests", r.requests, wr)) return e;
        if (auto e = read_duration(*rl, "window_ms", r.window, wr)) return e;
        if (auto e = read_uint(*rl, "burst", r.burst, wr)) return e;
        if (auto e = read_duration(*rl, "burst_window_ms", r.burst_window, wr)) return e;
        if (auto e = read_uint(*rl, "daily_cap", r.daily_cap, wr)) return e;
        if (auto e = read_uint(*rl, "daily_reset_hour_utc", r.daily_reset_hour_utc, wr, 23)) return e;
        if (r.requests > 0 && r.window.count() == 0) return bad(at(wr, "window_ms"), "must be positive");
        if (r.requests > 0 && r.burst > r.requests) return bad(at(wr, "burst"), "must not exceed requests");
        if (r.burst_window.count() > 0 && r.burst == 0) return bad(at(wr, "burst"), "required with burst_window_ms");
    }

    if (const json* a = member(j, "activation")) {
        const auto wa = at(w, "activation");
        if (!a->is_object()) return bad(wa, "expected an object");
        auto& act = p.activation;
        if (auto e = read_enum_list(*a, "data_types", act.data_types, wa, core::parse_data_type)) return e;
        if (auto e = read_uint(*a, "min_entities", act.min_entities, wa)) return e;
        if (member(*a, "max_entities")) {
            std::size_t mx = 0;
            if (auto e = read_uint(*a, "max_entities", mx, wa)) return e;
            act.max_entities = mx;
        }
        if (auto e = read_bool(*a, "requires_sector", act.requires_sector, wa)) return e;
        if (auto e = read_enum_list(*a, "analysis_types", act.analysis_types, wa, core::parse_analysis_type)) return e;
        if (auto e = read_enum_list(*a, "granularities", act.granularities, wa, core::parse_granularity)) return e;
        if (member(*a, "real_time")) {
            bool rt = false;
            if (auto e = read_bool(*a, "real_time", rt, wa)) return e;
            act.real_time = rt;
        }
        if (act.max_entities && act.min_entities > *act.max_entities)
            return bad(at(wa, "min_entities"), "greater than max_entities");
    }

    if (const json* pr = member(j, "priority")) {
        const auto wp = at(w, "priority");
        if (!pr->is_object()) return bad(wp, "expected an object");
        auto& rule = p.priority;
        if (const json* b = member(*pr, "base")) {
            if (!b->is_number_integer()) return bad(at(wp, "base"), "expected an integer");
            rule.base = b->get<int>();
        }
        if (auto e = read_int_map(*pr, "data_type_bonus", rule.data_type_bonus, wp, core::parse_data_type)) return e;
        if (auto e = read_int_map(*pr, "analysis_bonus", rule.analysis_bonus, wp, core::parse_analysis_type)) return e;
        for (auto [name, field] : {std::pair{"single_entity_bonus", &rule.single_entity_bonus},
                                   std::pair{"sector_bonus", &rule.sector_bonus},
                                   std::pair{"real_time_bonus", &rule.real_time_bonus}}) {
            if (const json* v = member(*pr, name)) {
                if (!v->is_number_integer()) return bad(at(wp, name), "expected an integer");
                *field = v->get<int>();
            }
        }
    }
    return std::nullopt;
}

Err parse_providers(const json& j, SluiceConfig& out) {
    if (!j.is_array()) return bad("providers", "expected an array");
    if (j.size() > CATALOG_MAX_PROVIDERS) return bad("providers", "too many providers");
    std::set<std::string> seen;
    out.providers.clear();
    for (std::size_t i = 0; i < j.size(); ++i) {
        const auto w = "providers[" + std::to_string(i) + "]";
        routing::ProviderSpec p;
        if (auto e = parse_provider(j[i], w, out.default_provider_timeout, p)) return e;
        if (!routing::ProviderCatalog::validate_id(p.id)) return bad(at(w, "id"), "invalid id '" + p.id + "'");
        if (!seen.insert(p.id).second)
            return ConfigError{ConfigError::Code::DuplicateProvider, at(w, "id"), "duplicate id '" + p.id + "'"};
        out.providers.push_back(std::move(p));
    }
    return std::nullopt;
}

template <class Fn>
Err section(const json& root, const char* name, Fn&& fn) {
    const json* s = member(root, name);
    if (!s) return std::nullopt;
    if (std::string_view(name) != "providers" && !s->is_object()) return bad(name, "expected an object");
    return fn(*s);
}

} // namespace

std::string_view to_string(ConfigError::Code c) noexcept {
    switch (c) {
        case ConfigError::Code::FileNotFound:      return "file_not_found";
        case ConfigError::Code::ParseError:        return "parse_error";
        case ConfigError::Code::BadValue:          return "bad_value";
        case ConfigError::Code::DuplicateProvider: return "duplicate_provider";
    }
    return "unknown";
}

SluiceConfig Loader::defaults() {
    return SluiceConfig{};
}

sluice_detail::expected<SluiceConfig, ConfigError> Loader::from_json(const json& j) {
    if (!j.is_object()) return sluice_detail::unexpected(bad("", "top level must be an object"));
    SluiceConfig cfg = defaults();
    try {
        Err e;
        if (!e) e = section(j, "logging", [&](const json& s) { return parse_logging(s, cfg.logging); });
        if (!e) e = section(j, "cache", [&](const json& s) { return parse_cache(s, cfg.cache); });
        if (!e) e = section(j, "executor", [&](const json& s) { return parse_executor(s, cfg); });
        if (!e) e = section(j, "workers", [&](const json& s) { return parse_workers(s, cfg.workers); });
        if (!e) e = section(j, "breaker", [&](const json& s) { return parse_breaker(s, cfg.breaker); });
        if (!e) e = section(j, "budget", [&](const json& s) { return parse_budget(s, cfg.budget); });
        if (!e) e = section(j, "reconcile", [&](const json& s) { return parse_reconcile(s, cfg.reconcile); });
        if (!e) e = section(j, "providers", [&](const json& s) { return parse_providers(s, cfg); });
        if (e) return sluice_detail::unexpected(std::move(*e));
    } catch (const json::exception& ex) {
        return sluice_detail::unexpected(bad("", ex.what()));
    }
    return cfg;
}

sluice_detail::expected<SluiceConfig, ConfigError> Loader::parse(std::string_view text) {
    json j;
    try {
        j = json::parse(std::string(text));
    } catch (const json::parse_error& ex) {
        return sluice_detail::unexpected(ConfigError{ConfigError::Code::ParseError, "", ex.what()});
    }
    return from_json(j);
}

sluice_detail::expected<SluiceConfig, ConfigError> Loader::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return sluice_detail::unexpected(ConfigError{ConfigError::Code::FileNotFound, path, "cannot open file"});
    }
    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& ex) {
        return sluice_detail::unexpected(ConfigError{ConfigError::Code::ParseError, path, ex.what()});
    }
    auto cfg = from_json(j);
    if (cfg) SPDLOG_INFO("configuration loaded path={} providers={}", path, cfg->providers.size());
    return cfg;
}

std::vector<std::shared_ptr<routing::ProviderDescriptor>> make_descriptors(const SluiceConfig& cfg) {
    std::vector<std::shared_ptr<routing::ProviderDescriptor>> out;
    out.reserve(cfg.providers.size());
    for (const auto& spec : cfg.providers) {
        out.push_back(std::make_shared<routing::ProviderDescriptor>(spec, cfg.reliability_alpha));
    }
    return out;
}

} // namespace sluice::config
