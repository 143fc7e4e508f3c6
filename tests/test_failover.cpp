/**
 * @file test_failover.cpp
 * @brief End-to-end tests of the FailoverExecutor against simulated providers.
 *
 * Validates:
 *  - Unroutable requests fail before any cache or provider access
 *  - Fresh cache hits skip providers; refresh-ahead re-fetches in the background
 *  - Failover order, breaker / budget / limiter skips and the attempt history
 *  - Degraded stale returns versus Unavailable and Timeout
 *  - Concurrent cold requests for one key reach a provider once
 *  - Callers waiting on another caller's fetch still honour their own deadline
 *  - Cross-validation reconciles several sources
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <thread>
#include <vector>

#include "sluice/cache/cache_key.hpp"
#include "sluice/exec/failover_executor.hpp"
#include "sluice/exec/worker_pool.hpp"
#include "sluice/provider/simulated_provider.hpp"
#include "support/manual_clock.hpp"

using namespace std::chrono_literals;
using sluice::core::AttemptOutcome;
using sluice::core::CacheState;
using sluice::core::DataRequest;
using sluice::core::DataType;
using sluice::core::ExecState;
using sluice::core::ProviderErrorKind;
using sluice::core::RequestErrorKind;
using sluice::exec::ExecutorConfig;
using sluice::exec::ExecutorDeps;
using sluice::exec::FailoverExecutor;
using sluice::provider::SimulatedProvider;
using sluice::routing::ProviderSpec;

///
/// Harness: catalog + limiter + cache + simulated adapters wired into one executor.
///
struct Harness {
  std::shared_ptr<const sluice::core::Clock>          clock;
  std::shared_ptr<sluice::exec::WorkerPool>            pool;
  std::shared_ptr<sluice::routing::ProviderCatalog>    catalog = std::make_shared<sluice::routing::ProviderCatalog>();
  std::shared_ptr<sluice::ratelimit::RateLimiter>      limiter;
  std::shared_ptr<sluice::cache::CacheStore>           cache;
  std::shared_ptr<sluice::provider::AdapterSet>        adapters = std::make_shared<sluice::provider::AdapterSet>();
  std::shared_ptr<sluice::routing::CircuitBreakerBank> breakers;
  std::shared_ptr<sluice::ratelimit::BudgetTracker>    budget;
  std::shared_ptr<sluice::obs::Observer>               observer = sluice::obs::make_logging_observer();
  std::map<std::string, std::shared_ptr<SimulatedProvider>> sims;

  explicit Harness(std::shared_ptr<const sluice::core::Clock> clk) : clock(std::move(clk)) {
    auto p = sluice::exec::WorkerPool::create({.threads = 1, .queue_capacity = 16});
    EXPECT_TRUE(p.has_value());
    pool = std::move(*p);
    limiter = std::make_shared<sluice::ratelimit::RateLimiter>(clock);
    sluice::cache::CacheConfig cc;
    cc.durable_path.clear();
    cache = std::make_shared<sluice::cache::CacheStore>(cc, nullptr, pool, clock);
  }

  /// Register a provider competent for every request, ranked by @p base.
  std::shared_ptr<SimulatedProvider> add(std::string id, int base, double cost = 0.0,
                                         sluice::ratelimit::RateLimitSpec rl = {}) {
    ProviderSpec s;
    s.id = id;
    s.priority.base = base;
    s.cost_per_request = cost;
    s.rate_limit = rl;
    s.activation.data_types = {DataType::Quote, DataType::Fundamentals};
    EXPECT_EQ(catalog->add(std::make_shared<sluice::routing::ProviderDescriptor>(s)),
              sluice::routing::CatalogErr::Ok);
    limiter->configure(id, rl);
    auto sim = std::make_shared<SimulatedProvider>(sluice::provider::SimProviderConfig{.id = id});
    adapters->bind(sim);
    sims[id] = sim;
    return sim;
  }

  /// @param exec_clock Clock seen by the executor alone; the harness clock when null.
  std::shared_ptr<FailoverExecutor> build(ExecutorConfig cfg = {},
                                          std::shared_ptr<const sluice::core::Clock> exec_clock = nullptr) {
    ExecutorDeps d;
    d.router = std::make_shared<sluice::routing::CollectorRouter>(catalog, clock);
    d.limiter = limiter;
    d.cache = cache;
    d.adapters = adapters;
    d.resolver = std::make_shared<sluice::reconcile::ConflictResolver>();
    d.breakers = breakers;
    d.budget = budget;
    d.observer = observer;
    d.clock = exec_clock ? std::move(exec_clock) : clock;
    auto ex = FailoverExecutor::create(std::move(d), cfg);
    EXPECT_TRUE(ex.has_value());
    return *ex;
  }
};

static DataRequest quote(std::string symbol, std::string id = "req") {
  DataRequest r;
  r.request_id = std::move(id);
  r.criteria.data_type = DataType::Quote;
  r.criteria.entity_keys = {std::move(symbol)};
  return r;
}

static std::vector<AttemptOutcome> outcomes(const std::vector<sluice::core::Attempt>& as) {
  std::vector<AttemptOutcome> out;
  for (const auto& a : as) out.push_back(a.outcome);
  return out;
}

/// Clock that, once armed, stops the next caller of now() until released.
class ParkingClock final : public sluice::core::Clock {
public:
  explicit ParkingClock(std::shared_ptr<const sluice::core::Clock> inner) : inner_(std::move(inner)) {}

  void arm() { armed_ = true; }
  std::future<void> parked() { return parked_.get_future(); }
  void release() { release_.set_value(); }

  sluice::core::TimePoint now() const noexcept override {
    if (armed_.exchange(false)) {
      parked_.set_value();
      gate_.wait();
    }
    return inner_->now();
  }

private:
  std::shared_ptr<const sluice::core::Clock> inner_;
  mutable std::atomic<bool>                  armed_{false};
  mutable std::promise<void>                 parked_;
  std::promise<void>                         release_;
  std::shared_future<void>                   gate_{release_.get_future().share()};
};

/// Adapter that writes a fresh value under @p key itself, then reports failure.
class WritesThenFails final : public sluice::provider::ProviderAdapter {
public:
  WritesThenFails(std::string id, std::shared_ptr<sluice::cache::CacheStore> cache, std::string key)
      : id_(std::move(id)), cache_(std::move(cache)), key_(std::move(key)) {}

  std::string_view id() const noexcept override { return id_; }

  sluice::provider::FetchResult fetch(const sluice::provider::FetchContext&, const DataRequest&) override {
    cache_->set(key_, sluice::core::Payload{.body = "{\"price\":42}", .fields = {{"price", 42.0}}}, "elsewhere",
                60s, 1.0);
    return sluice_detail::unexpected(
        sluice::core::ProviderError{ProviderErrorKind::Unavailable, id_ + ": down after writing"});
  }

private:
  std::string                               id_;
  std::shared_ptr<sluice::cache::CacheStore> cache_;
  std::string                               key_;
};

// --------------------------- Wiring -----------------------------------------

/**
 * @test Executor_Create_Requires_Core_Dependencies
 * @brief A missing router, limiter, cache, adapter set or resolver is refused at construction.
 */
TEST(FailoverExecutor, Create_Requires_Core_Dependencies) {
  ExecutorDeps d;
  auto ex = FailoverExecutor::create(d);
  ASSERT_FALSE(ex.has_value());
  EXPECT_EQ(ex.error(), sluice::exec::ExecError::MissingDependency);
}

// --------------------------- Happy paths ------------------------------------

/**
 * @test Executor_Unroutable
 * @brief No competent provider: Unroutable with an empty attempt list, nothing cached.
 */
TEST(FailoverExecutor, Unroutable) {
  Harness h(std::make_shared<sluice::testing::ManualClock>());
  auto a = h.add("alpha", 50);
  auto ex = h.build();

  DataRequest news = quote("AAPL");
  news.criteria.data_type = DataType::News;
  auto r = ex->execute(news);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, RequestErrorKind::Unroutable);
  EXPECT_TRUE(r.error().attempts.empty());
  EXPECT_EQ(a->calls(), 0u);
  EXPECT_EQ(h.observer->snapshot().unroutable, 1u);
}

/**
 * @test Executor_Fetch_Then_Fresh_Hit
 * @brief First call fetches and caches; second is a fresh hit with no provider call.
 */
TEST(FailoverExecutor, Fetch_Then_Fresh_Hit) {
  auto clk = std::make_shared<sluice::testing::ManualClock>();
  Harness h(clk);
  auto a = h.add("alpha", 50);
  a->set_value("AAPL", 187.25);
  auto ex = h.build();

  auto first = ex->execute(quote("AAPL"));
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->meta.cache_state, CacheState::Refreshed);
  EXPECT_EQ(first->meta.source_id, "alpha");
  EXPECT_DOUBLE_EQ(first->value.fields.at("price"), 187.25);
  EXPECT_EQ(first->meta.trace, (std::vector<ExecState>{ExecState::Routing, ExecState::CacheCheck,
                                                        ExecState::RateCheck, ExecState::Fetching,
                                                        ExecState::Reconciling, ExecState::Done}));

  clk->advance(5s);
  auto second = ex->execute(quote("aapl"));
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->meta.cache_state, CacheState::Fresh);
  EXPECT_EQ(second->value, first->value);
  EXPECT_EQ(a->calls(), 1u);

  auto c = h.observer->snapshot();
  EXPECT_EQ(c.requests, 2u);
  EXPECT_EQ(c.fresh_hits, 1u);
  EXPECT_EQ(c.refreshed, 1u);
}

/**
 * @test Executor_Refresh_Ahead
 * @brief A hit past ttl * threshold returns the cached value and re-fetches in the background.
 */
TEST(FailoverExecutor, Refresh_Ahead) {
  auto clk = std::make_shared<sluice::testing::ManualClock>();
  Harness h(clk);
  auto a = h.add("alpha", 50);
  auto ex = h.build();

  ASSERT_TRUE(ex->execute(quote("MSFT")).has_value());
  const auto ttl = h.cache->rule_for(DataType::Quote).ttl;
  clk->advance(std::chrono::duration_cast<std::chrono::seconds>(ttl * 0.9));

  auto hit = ex->execute(quote("MSFT"));
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->meta.cache_state, CacheState::Fresh);
  h.pool->wait_idle();

  EXPECT_EQ(a->calls(), 2u);
  EXPECT_EQ(h.cache->stats().refreshes_scheduled, 1u);

  // the background fetch restarted the entry's age
  clk->advance(std::chrono::duration_cast<std::chrono::seconds>(ttl * 0.5));
  auto again = ex->execute(quote("MSFT"));
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->meta.cache_state, CacheState::Fresh);
  h.pool->wait_idle();
  EXPECT_EQ(a->calls(), 2u);
}

// --------------------------- Failover ---------------------------------------

/**
 * @test Executor_Fails_Over_In_Rank_Order
 * @brief The top provider fails; the next answers; the history lists both.
 */
TEST(FailoverExecutor, Fails_Over_In_Rank_Order) {
  Harness h(std::make_shared<sluice::testing::ManualClock>());
  auto top = h.add("top", 90);
  auto next = h.add("next", 50);
  top->fail_next(ProviderErrorKind::Unavailable);
  auto ex = h.build();

  auto r = ex->execute(quote("IBM"));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->meta.source_id, "next");
  EXPECT_EQ(outcomes(r->meta.attempts),
            (std::vector<AttemptOutcome>{AttemptOutcome::Unavailable, AttemptOutcome::Succeeded}));
  EXPECT_EQ(r->meta.attempts[0].provider_id, "top");
  EXPECT_EQ(h.observer->snapshot().failovers, 1u);
}

/**
 * @test Executor_Failure_Lowers_Reliability
 * @brief Failures pull the EMA down, successes pull it back toward one.
 */
TEST(FailoverExecutor, Failure_Lowers_Reliability) {
  Harness h(std::make_shared<sluice::testing::ManualClock>());
  auto flaky = h.add("flaky", 90);
  h.add("steady", 50);
  flaky->fail_next(ProviderErrorKind::Timeout);
  auto ex = h.build();

  const double before = h.catalog->find("flaky")->reliability();
  ASSERT_TRUE(ex->execute(quote("A")).has_value());
  const double after = h.catalog->find("flaky")->reliability();
  EXPECT_LT(after, before);
  EXPECT_NEAR(after, before * 0.9 + 0.1 * 0.3, 1e-9);
  EXPECT_GT(h.catalog->find("steady")->reliability(), before);
}

/**
 * @test Executor_Skips_Open_Breaker_Budget_And_Limiter
 * @brief Providers refused by breaker, budget or limiter are skipped without being called.
 */
TEST(FailoverExecutor, Skips_Open_Breaker_Budget_And_Limiter) {
  auto clk = std::make_shared<sluice::testing::ManualClock>();
  Harness h(clk);
  h.breakers = std::make_shared<sluice::routing::CircuitBreakerBank>(
      sluice::routing::BreakerConfig{.failure_threshold = 1, .open_for = 60s}, clk);
  sluice::ratelimit::BudgetConfig bc;
  bc.daily_limit = 1.5;
  h.budget = std::make_shared<sluice::ratelimit::BudgetTracker>(bc, clk);

  sluice::ratelimit::RateLimitSpec one_per_minute;
  one_per_minute.requests = 1;
  one_per_minute.window = 60s;

  auto broken = h.add("broken", 90);
  auto paid = h.add("paid", 80, 1.0);
  auto limited = h.add("limited", 70, 0.0, one_per_minute);
  auto fallback = h.add("fallback", 10);
  broken->fail_always(ProviderErrorKind::Unavailable);
  auto ex = h.build();

  auto r1 = ex->execute(quote("K1"));
  ASSERT_TRUE(r1.has_value());
  EXPECT_EQ(r1->meta.source_id, "paid");
  EXPECT_EQ(h.breakers->state("broken"), sluice::routing::CircuitState::Open);

  // paid now exceeds the daily budget; limited answers once
  auto r2 = ex->execute(quote("K2"));
  ASSERT_TRUE(r2.has_value());
  EXPECT_EQ(r2->meta.source_id, "limited");
  EXPECT_EQ(outcomes(r2->meta.attempts),
            (std::vector<AttemptOutcome>{AttemptOutcome::CircuitOpen, AttemptOutcome::OverBudget,
                                         AttemptOutcome::Succeeded}));

  auto r3 = ex->execute(quote("K3"));
  ASSERT_TRUE(r3.has_value());
  EXPECT_EQ(r3->meta.source_id, "fallback");
  EXPECT_EQ(r3->meta.attempts[2].outcome, AttemptOutcome::RateDenied);

  EXPECT_EQ(broken->calls(), 1u);
  EXPECT_EQ(paid->calls(), 1u);
  EXPECT_EQ(limited->calls(), 1u);
  EXPECT_EQ(fallback->calls(), 1u);
  EXPECT_NEAR(h.budget->status().daily_spent, 1.0, 1e-9);
}

// --------------------------- Degradation ------------------------------------

/**
 * @test Executor_Degrades_To_Stale
 * @brief With every provider down, an expired cached value is returned and marked stale.
 */
TEST(FailoverExecutor, Degrades_To_Stale) {
  auto clk = std::make_shared<sluice::testing::ManualClock>();
  Harness h(clk);
  auto a = h.add("alpha", 50);
  auto ex = h.build();

  auto fresh = ex->execute(quote("TSLA"));
  ASSERT_TRUE(fresh.has_value());

  clk->advance(1h);
  a->fail_always(ProviderErrorKind::Unavailable);
  auto r = ex->execute(quote("TSLA"));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->meta.cache_state, CacheState::Stale);
  EXPECT_EQ(r->value, fresh->value);
  EXPECT_EQ(r->meta.source_id, "alpha");
  EXPECT_EQ(r->meta.trace.back(), ExecState::Done);
  EXPECT_NE(std::find(r->meta.trace.begin(), r->meta.trace.end(), ExecState::Degraded), r->meta.trace.end());
  EXPECT_EQ(h.observer->snapshot().stale_served, 1u);
}

/**
 * @test Executor_Degrade_Labels_Fresh_Entry_Fresh
 * @brief When the chain fails but the key was written fresh meanwhile, the answer is labelled Fresh.
 */
TEST(FailoverExecutor, Degrade_Labels_Fresh_Entry_Fresh) {
  Harness h(std::make_shared<sluice::testing::ManualClock>());
  h.add("writer", 50);
  const auto req = quote("INTC");
  h.adapters->bind(std::make_shared<WritesThenFails>("writer", h.cache, sluice::cache::make_cache_key(req.criteria)));
  auto ex = h.build();

  auto r = ex->execute(req);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->meta.cache_state, CacheState::Fresh);
  EXPECT_EQ(r->meta.source_id, "elsewhere");
  EXPECT_DOUBLE_EQ(r->value.fields.at("price"), 42.0);
  EXPECT_EQ(h.observer->snapshot().stale_served, 0u);
}

/**
 * @test Executor_MaxStaleness_Forces_Fetch
 * @brief A tighter staleness bound than the TTL makes a cached value unusable as fresh.
 */
TEST(FailoverExecutor, MaxStaleness_Forces_Fetch) {
  auto clk = std::make_shared<sluice::testing::ManualClock>();
  Harness h(clk);
  auto a = h.add("alpha", 50);
  auto ex = h.build();

  ASSERT_TRUE(ex->execute(quote("NVDA")).has_value());
  clk->advance(10s);
  auto strict = quote("NVDA");
  strict.max_staleness = 5s;
  auto r = ex->execute(strict);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->meta.cache_state, CacheState::Refreshed);
  EXPECT_EQ(a->calls(), 2u);
}

/**
 * @test Executor_Unavailable_Without_Cache
 * @brief All candidates fail on a cold key: Unavailable listing every attempt.
 */
TEST(FailoverExecutor, Unavailable_Without_Cache) {
  Harness h(std::make_shared<sluice::testing::ManualClock>());
  h.add("a1", 60)->fail_always(ProviderErrorKind::Unavailable);
  h.add("a2", 50)->fail_always(ProviderErrorKind::InvalidResponse);
  auto ex = h.build();

  auto r = ex->execute(quote("GME"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, RequestErrorKind::Unavailable);
  EXPECT_EQ(outcomes(r.error().attempts),
            (std::vector<AttemptOutcome>{AttemptOutcome::Unavailable, AttemptOutcome::InvalidResponse}));
  EXPECT_EQ(h.observer->snapshot().unavailable, 1u);
}

/**
 * @test Executor_Timeout_At_Caller_Deadline
 * @brief A slow provider and a short caller deadline end in Timeout when nothing is cached.
 */
TEST(FailoverExecutor, Timeout_At_Caller_Deadline) {
  auto clk = sluice::core::system_clock();
  Harness h(clk);
  h.add("slow", 60)->set_latency(500ms);
  h.add("never-reached", 50);
  auto ex = h.build();

  auto req = quote("AMD");
  req.deadline = clk->now() + 40ms;
  const auto t0 = std::chrono::steady_clock::now();
  auto r = ex->execute(req);
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 400ms);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, RequestErrorKind::Timeout);
  ASSERT_FALSE(r.error().attempts.empty());
  EXPECT_EQ(r.error().attempts[0].outcome, AttemptOutcome::Timeout);
  EXPECT_EQ(h.sims["never-reached"]->calls(), 0u);
}

// --------------------------- Concurrency ------------------------------------

/**
 * @test Executor_Single_Flight_Per_Key
 * @brief Many callers on one cold key: one provider call, identical answers.
 */
TEST(FailoverExecutor, Single_Flight_Per_Key) {
  Harness h(std::make_shared<sluice::testing::ManualClock>());
  auto a = h.add("alpha", 50);
  a->hold();
  auto ex = h.build();

  constexpr int kCallers = 8;
  std::vector<sluice::core::RequestResult> results(kCallers);
  std::vector<std::thread> ts;
  for (int i = 0; i < kCallers; ++i) {
    ts.emplace_back([&, i] { results[i] = ex->execute(quote("AAPL", "caller-" + std::to_string(i))); });
  }

  while (a->waiting() == 0) std::this_thread::sleep_for(1ms);
  std::this_thread::sleep_for(50ms); // let the other callers join the flight
  EXPECT_EQ(ex->in_flight(), 1u);
  a->release();
  for (auto& t : ts) t.join();

  EXPECT_EQ(a->calls(), 1u);
  for (const auto& r : results) {
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->value, results[0]->value);
  }
  EXPECT_EQ(ex->in_flight(), 0u);
}

/**
 * @test Executor_Late_Miss_Uses_Finished_Flight
 * @brief A caller that missed the cache just before another caller's fetch finished reuses that value.
 */
TEST(FailoverExecutor, Late_Miss_Uses_Finished_Flight) {
  auto clk = std::make_shared<sluice::testing::ManualClock>();
  Harness h(clk);
  auto a = h.add("alpha", 50);
  auto parking = std::make_shared<ParkingClock>(clk);
  auto ex = h.build({}, parking);

  // the late caller stops right after its cache miss
  parking->arm();
  auto parked = parking->parked();
  auto late = std::async(std::launch::async, [&] { return ex->execute(quote("AAPL", "late")); });
  ASSERT_EQ(parked.wait_for(5s), std::future_status::ready);

  auto first = ex->execute(quote("AAPL", "first"));
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->meta.cache_state, CacheState::Refreshed);
  parking->release();

  auto r = late.get();
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->meta.cache_state, CacheState::Fresh);
  EXPECT_EQ(r->value, first->value);
  EXPECT_EQ(a->calls(), 1u);
}

/**
 * @test Executor_Joiner_Honours_Own_Deadline
 * @brief A caller waiting on another caller's held fetch returns Timeout once its own deadline passes.
 */
TEST(FailoverExecutor, Joiner_Honours_Own_Deadline) {
  auto clk = std::make_shared<sluice::testing::ManualClock>();
  Harness h(clk);
  auto a = h.add("alpha", 50);
  a->hold();
  auto ex = h.build();

  auto leader = std::async(std::launch::async, [&] { return ex->execute(quote("AAPL", "leader")); });
  while (a->waiting() == 0) std::this_thread::sleep_for(1ms);

  auto req = quote("AAPL", "joiner");
  req.deadline = clk->now() + 100ms;
  auto joiner = std::async(std::launch::async, [&] { return ex->execute(req); });
  std::this_thread::sleep_for(20ms);
  clk->advance(2s);

  const bool returned = joiner.wait_for(5s) == std::future_status::ready;
  a->release();
  ASSERT_TRUE(returned);
  auto r = joiner.get();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, RequestErrorKind::Timeout);

  EXPECT_TRUE(leader.get().has_value());
  EXPECT_EQ(a->calls(), 1u);
}

// --------------------------- Reconciliation ---------------------------------

/**
 * @test Executor_Cross_Validates_Sources
 * @brief With two sources wanted for quotes, both are called and reconciled.
 */
TEST(FailoverExecutor, Cross_Validates_Sources) {
  Harness h(std::make_shared<sluice::testing::ManualClock>());
  h.add("exch", 60)->set_value("AAPL", 100.0);
  h.add("aggr", 50)->set_value("AAPL", 100.0);
  ExecutorConfig cfg;
  cfg.cross_validate[sluice::core::index_of(DataType::Quote)] = 2;
  auto ex = h.build(cfg);

  auto agree = ex->execute(quote("AAPL"));
  ASSERT_TRUE(agree.has_value());
  EXPECT_EQ(agree->meta.source_id, "aggr+exch");
  EXPECT_DOUBLE_EQ(agree->meta.confidence, 1.0);
  EXPECT_FALSE(agree->meta.review_flag);

  h.sims["aggr"]->set_value("MSFT", 300.0);
  h.sims["exch"]->set_value("MSFT", 330.0);
  auto split = ex->execute(quote("MSFT"));
  ASSERT_TRUE(split.has_value());
  EXPECT_TRUE(split->meta.review_flag);
  EXPECT_LE(split->meta.confidence, 0.3);

  auto c = h.observer->snapshot();
  EXPECT_EQ(c.conflicts, 2u);
  EXPECT_EQ(c.flagged_for_review, 1u);
}

/**
 * @test Executor_Reconciles_Recent_Cached_Rival
 * @brief A recent cached value from another source joins the reconciliation of a forced re-fetch.
 */
TEST(FailoverExecutor, Reconciles_Recent_Cached_Rival) {
  auto clk = std::make_shared<sluice::testing::ManualClock>();
  Harness h(clk);
  auto first = h.add("first", 60);
  auto second = h.add("second", 50);
  first->set_value("ORCL", 120.0);
  second->set_value("ORCL", 120.0);
  auto ex = h.build();

  ASSERT_TRUE(ex->execute(quote("ORCL")).has_value());
  first->fail_always(ProviderErrorKind::Unavailable);

  clk->advance(10s);
  auto strict = quote("ORCL");
  strict.max_staleness = 5s;
  auto r = ex->execute(strict);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->meta.source_id, "first+second");
  EXPECT_DOUBLE_EQ(r->meta.confidence, 1.0);
}
