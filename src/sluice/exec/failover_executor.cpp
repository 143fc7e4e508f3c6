/**
 * @file failover_executor.cpp
 * @brief Request state machine with admission checks, deadline handling and reconciliation.
 */
#include "sluice/exec/failover_executor.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

#include "sluice/cache/cache_key.hpp"

namespace sluice::exec {

namespace cst = sluice::config::constants;
using core::AttemptOutcome;
using core::ExecState;

namespace {

std::string retry_detail(std::chrono::milliseconds retry_after) {
    return "retry_after_ms=" + std::to_string(retry_after.count());
}

core::RequestError request_error(core::RequestErrorKind kind, std::string message,
                                 std::vector<core::Attempt> attempts) {
    return core::RequestError{kind, std::move(message), std::move(attempts)};
}

} // namespace

std::string_view to_string(ExecError e) noexcept {
    switch (e) {
        case ExecError::MissingDependency: return "missing_dependency";
    }
    return "unknown";
}

sluice_detail::expected<std::shared_ptr<FailoverExecutor>, ExecError>
FailoverExecutor::create(ExecutorDeps deps, ExecutorConfig cfg) {
    if (!deps.router || !deps.limiter || !deps.cache || !deps.adapters || !deps.resolver) {
        return sluice_detail::unexpected(ExecError::MissingDependency);
    }
    if (!deps.clock) deps.clock = core::system_clock();
    return std::shared_ptr<FailoverExecutor>(new FailoverExecutor(std::move(deps), cfg));
}

std::size_t FailoverExecutor::sources_wanted(core::DataType t) const noexcept {
    const auto n = cfg_.cross_validate[core::index_of(t)];
    return std::clamp<std::size_t>(n, 1, cst::CROSS_VALIDATE_MAX);
}

// ----- request boundary -----

core::RequestResult FailoverExecutor::execute(const core::DataRequest& request) {
    const auto started = std::chrono::steady_clock::now();
    const auto key = cache::make_cache_key(request.criteria);
    std::vector<ExecState> trace{ExecState::Routing};

    auto decision = deps_.router->route(request);
    if (decision.empty()) {
        trace.push_back(ExecState::Failed);
        core::RequestResult r = sluice_detail::unexpected(request_error(
            core::RequestErrorKind::Unroutable, "no provider is competent for this request", {}));
        SPDLOG_DEBUG("request_id={} key={} unroutable", request.request_id, key);
        observe(request, key, r, started);
        return r;
    }

    trace.push_back(ExecState::CacheCheck);
    auto cached = deps_.cache->get(key);
    const auto now = deps_.clock->now();
    if (cached && cached->is_fresh(now, request.max_staleness)) {
        if (cfg_.background_refresh && cached->needs_background_refresh(now)) schedule_refresh(request, key);
        Flight f = from_cache(std::move(*cached));
        trace.insert(trace.end(), f.trace.begin(), f.trace.end());
        f.response->meta.trace = std::move(trace);
        core::RequestResult r = std::move(*f.response);
        observe(request, key, r, started);
        return r;
    }

    auto leader = [&] {
        // a flight that finished between our miss and this point already filled the cache
        if (auto again = deps_.cache->get(key); again && again->is_fresh(deps_.clock->now(), request.max_staleness)) {
            return from_cache(std::move(*again));
        }
        return fetch_chain(request, key, decision, cached);
    };

    std::optional<SingleFlight<Flight>::Outcome> flight;
    if (request.deadline) {
        const auto deadline = *request.deadline;
        flight = flights_.run(key, leader, [&] { return deps_.clock->now() >= deadline; },
                              std::chrono::milliseconds(cst::EXEC_JOIN_POLL_MS));
    } else {
        flight = flights_.run(key, leader);
    }

    Flight f;
    if (!flight) {
        f.deadline_hit = true;
        SPDLOG_DEBUG("request_id={} key={} deadline passed while waiting on in-flight fetch",
                     request.request_id, key);
    } else {
        if (flight->shared) SPDLOG_DEBUG("request_id={} key={} joined in-flight fetch", request.request_id, key);
        f = std::move(flight->value);
    }
    f.trace.insert(f.trace.begin(), trace.begin(), trace.end());

    core::RequestResult r;
    if (f.response) {
        f.response->meta.attempts = std::move(f.attempts);
        f.response->meta.trace = std::move(f.trace);
        r = std::move(*f.response);
    } else {
        r = degrade(request, key, std::move(f));
    }
    observe(request, key, r, started);
    return r;
}

FailoverExecutor::Flight FailoverExecutor::from_cache(cache::CacheEntry e) const {
    Flight f;
    f.trace.push_back(ExecState::Done);
    core::DataResponse resp;
    resp.value = std::move(e.value);
    resp.meta.source_id = std::move(e.source_id);
    resp.meta.cache_state = core::CacheState::Fresh;
    resp.meta.confidence = e.quality;
    f.response = std::move(resp);
    return f;
}

// ----- RATE_CHECK / FETCHING / RECONCILING -----

FailoverExecutor::Flight FailoverExecutor::fetch_chain(const core::DataRequest& request, const std::string& key,
                                                       const routing::RoutingDecision& decision,
                                                       const std::optional<cache::CacheEntry>& prior) {
    Flight f;
    const auto wanted = sources_wanted(request.data_type());
    std::vector<reconcile::Candidate> got;

    for (const auto& cand : decision.candidates) {
        const auto& p = cand.provider;
        const auto& id = p->id();
        const auto now = deps_.clock->now();

        if (request.deadline && now >= *request.deadline) {
            f.deadline_hit = true;
            f.attempts.push_back({id, AttemptOutcome::DeadlineExceeded, "caller deadline passed"});
            SPDLOG_DEBUG("request_id={} deadline passed before {}", request.request_id, id);
            break;
        }

        f.trace.push_back(ExecState::RateCheck);
        auto adapter = deps_.adapters->find(id);
        if (!adapter) {
            f.attempts.push_back({id, AttemptOutcome::NoAdapter, "no adapter bound"});
            continue;
        }
        if (deps_.breakers && !deps_.breakers->allow(id)) {
            f.attempts.push_back({id, AttemptOutcome::CircuitOpen, "circuit open"});
            continue;
        }
        const double cost = p->cost_per_request();
        if (deps_.budget && cost > 0.0 && !deps_.budget->can_spend(cost)) {
            if (deps_.breakers) deps_.breakers->release(id);
            f.attempts.push_back({id, AttemptOutcome::OverBudget, "cost would exceed budget"});
            continue;
        }
        const auto adm = deps_.limiter->try_acquire(id, now);
        if (!adm.granted) {
            if (deps_.breakers) deps_.breakers->release(id);
            f.attempts.push_back({id, AttemptOutcome::RateDenied, retry_detail(adm.retry_after)});
            SPDLOG_DEBUG("request_id={} provider={} rate denied {}", request.request_id, id,
                         retry_detail(adm.retry_after));
            continue;
        }

        f.trace.push_back(ExecState::Fetching);
        provider::FetchContext ctx;
        ctx.deadline = now + p->timeout();
        if (request.deadline && *request.deadline < ctx.deadline) ctx.deadline = *request.deadline;
        ctx.request_id = request.request_id;
        ctx.clock = deps_.clock;

        provider::FetchResult res = sluice_detail::unexpected(
            core::ProviderError{core::ProviderErrorKind::Unavailable, "adapter did not answer"});
        try {
            res = adapter->fetch(ctx, request);
        } catch (const std::exception& e) {
            res = sluice_detail::unexpected(core::ProviderError{core::ProviderErrorKind::Unavailable,
                                                                std::string("adapter threw: ") + e.what()});
        }
        if (deps_.budget && cost > 0.0) deps_.budget->record(id, cost);

        // An answer after the deadline is a timeout, whatever it says
        if (res.has_value() && deps_.clock->now() > ctx.deadline) {
            res = sluice_detail::unexpected(core::ProviderError{core::ProviderErrorKind::Timeout,
                                                                "answer arrived after the deadline"});
        }

        if (!res.has_value()) {
            const auto& err = res.error();
            const double score = p->record_outcome(err.kind);
            if (deps_.breakers) deps_.breakers->on_failure(id, err.kind);
            f.attempts.push_back({id, core::outcome_of(err.kind), err.message});
            SPDLOG_DEBUG("request_id={} provider={} failed kind={} reliability={:.3f}", request.request_id, id,
                         core::to_string(err.kind), score);
            continue;
        }

        p->record_outcome(std::nullopt);
        if (deps_.breakers) deps_.breakers->on_success(id);
        f.attempts.push_back({id, AttemptOutcome::Succeeded, {}});
        got.push_back(reconcile::Candidate{std::move(res->payload), id, std::clamp(res->quality, 0.0, 1.0),
                                           p->reliability(), deps_.clock->now()});
        if (got.size() >= wanted) break;
    }

    if (got.empty()) return f;

    // ----- RECONCILING -----
    f.trace.push_back(ExecState::Reconciling);
    const auto now = deps_.clock->now();
    if (prior && prior->age(now) <= cfg_.reconcile_window &&
        std::none_of(got.begin(), got.end(), [&](const auto& c) { return c.source_id == prior->source_id; })) {
        double rel = 0.0;
        for (const auto& c : decision.candidates) {
            if (c.provider->id() == prior->source_id) rel = c.provider->reliability();
        }
        got.push_back(reconcile::Candidate{prior->value, prior->source_id, prior->quality, rel, prior->fetched_at});
    }

    core::DataResponse resp;
    if (got.size() == 1) {
        resp.value = got.front().value;
        resp.meta.source_id = got.front().source_id;
        resp.meta.confidence = got.front().quality;
    } else {
        auto res = deps_.resolver->resolve(request.data_type(), got);
        if (!res.has_value()) {
            // unreachable with a non-empty list; keep the first answer
            SPDLOG_ERROR("reconcile failed key={} err={}", key, reconcile::to_string(res.error()));
            resp.value = got.front().value;
            resp.meta.source_id = got.front().source_id;
            resp.meta.confidence = got.front().quality;
        } else {
            if (deps_.observer) {
                reconcile::ConflictRecord rec{key, got, reconcile::kind_of(deps_.resolver->strategy_for(request.data_type())),
                                              *res};
                deps_.observer->record(rec);
            }
            resp.value = std::move(res->value);
            resp.meta.source_id = std::move(res->source_id);
            resp.meta.confidence = res->confidence;
            resp.meta.review_flag = res->review_flag;
        }
    }

    const auto& rule = deps_.cache->rule_for(request.data_type());
    resp.meta.confidence = deps_.cache->set(key, resp.value, resp.meta.source_id, rule.ttl,
                                            resp.meta.confidence, rule.refresh_threshold);
    resp.meta.cache_state = core::CacheState::Refreshed;
    f.trace.push_back(ExecState::Done);
    f.response = std::move(resp);
    return f;
}

// ----- DEGRADED -----

core::RequestResult FailoverExecutor::degrade(const core::DataRequest& request, const std::string& key,
                                              Flight f) {
    f.trace.push_back(ExecState::Degraded);
    if (auto e = deps_.cache->get_degraded(key)) {
        f.trace.push_back(ExecState::Done);
        core::DataResponse resp;
        resp.value = std::move(e->value);
        resp.meta.source_id = e->source_id;
        // another flight may have refreshed the key while this one was failing
        const bool stale = e->stale || !e->is_fresh(deps_.clock->now(), request.max_staleness);
        resp.meta.cache_state = stale ? core::CacheState::Stale : core::CacheState::Fresh;
        resp.meta.confidence = e->quality;
        resp.meta.attempts = std::move(f.attempts);
        resp.meta.trace = std::move(f.trace);
        if (stale) {
            SPDLOG_WARN("request_id={} key={} degraded to cached value from {}", request.request_id, key,
                        resp.meta.source_id);
        }
        return resp;
    }

    f.trace.push_back(ExecState::Failed);
    const bool timed_out = f.deadline_hit ||
        (request.deadline && deps_.clock->now() >= *request.deadline);
    const auto kind = timed_out ? core::RequestErrorKind::Timeout : core::RequestErrorKind::Unavailable;
    std::string msg = timed_out ? "deadline expired with no cached value"
                                : "all " + std::to_string(f.attempts.size()) + " candidate(s) failed and no cached value";
    SPDLOG_WARN("request_id={} key={} failed kind={} attempts={}", request.request_id, key,
                core::to_string(kind), f.attempts.size());
    return sluice_detail::unexpected(request_error(kind, std::move(msg), std::move(f.attempts)));
}

// ----- refresh-ahead -----

void FailoverExecutor::schedule_refresh(const core::DataRequest& request, const std::string& key) {
    core::DataRequest copy = request;
    copy.deadline.reset();
    copy.max_staleness = std::chrono::seconds{0};
    copy.request_id = request.request_id + "/refresh";

    std::weak_ptr<FailoverExecutor> weak = weak_from_this();
    const bool queued = deps_.cache->schedule_background_refresh(key, [weak, copy = std::move(copy)] {
        if (auto self = weak.lock()) self->refresh(copy);
    });
    if (queued) SPDLOG_DEBUG("request_id={} key={} refresh-ahead queued", request.request_id, key);
}

bool FailoverExecutor::refresh(const core::DataRequest& request) {
    const auto key = cache::make_cache_key(request.criteria);
    auto decision = deps_.router->route(request);
    if (decision.empty()) return false;

    auto prior = deps_.cache->get(key);
    auto flight = flights_.run(key, [&] { return fetch_chain(request, key, decision, prior); });
    const bool ok = flight.value.response.has_value();
    if (!ok) {
        SPDLOG_WARN("background refresh found no provider answer key={} attempts={}", key,
                    flight.value.attempts.size());
    }
    return ok;
}

// ----- observability -----

void FailoverExecutor::observe(const core::DataRequest& request, const std::string& key,
                               const core::RequestResult& r, std::chrono::steady_clock::time_point started) const {
    if (!deps_.observer) return;
    obs::RequestEvent e;
    e.request_id = request.request_id;
    e.cache_key = key;
    e.data_type = request.data_type();
    if (r.has_value()) {
        e.cache_state = r->meta.cache_state;
        e.source_id = r->meta.source_id;
        e.confidence = r->meta.confidence;
        e.review_flag = r->meta.review_flag;
        e.attempts = r->meta.attempts;
        e.trace = r->meta.trace;
    } else {
        e.error = r.error().kind;
        e.attempts = r.error().attempts;
    }
    e.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
    deps_.observer->record(e);
}

} // namespace sluice::exec
