/**
 * @file test_routing.cpp
 * @brief Tests for the ProviderCatalog, CollectorRouter, activation rules and circuit breakers.
 *
 * Validates:
 *  - Snapshot publication via atomic_load/store on shared_ptr (RCU pattern)
 *  - add / upsert / replace / remove / reload behavior, reliability carried across replacement
 *  - Routing contains exactly the providers whose predicate holds, in rank order
 *  - Request classification and pre-fetch validation suggestions
 *  - Breaker trips, half-open probing and recovery
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <string_view>
#include <thread>
#include <vector>

#include "sluice/routing/circuit_breaker.hpp"
#include "sluice/routing/collector_router.hpp"
#include "sluice/routing/provider_catalog.hpp"
#include "support/manual_clock.hpp"

using namespace std::chrono_literals;
using sluice::core::DataRequest;
using sluice::core::DataType;
using sluice::core::FilterCriteria;
using sluice::core::ProviderErrorKind;
using sluice::core::ProviderScope;
using sluice::routing::ActivationRule;
using sluice::routing::CatalogErr;
using sluice::routing::CircuitBreakerBank;
using sluice::routing::CircuitState;
using sluice::routing::CollectorRouter;
using sluice::routing::FilterSuggestion;
using sluice::routing::ProviderCatalog;
using sluice::routing::ProviderDescriptor;
using sluice::routing::ProviderSpec;
using sluice::routing::RequestType;
namespace predicates = sluice::routing::predicates;

///
/// Helpers: compact descriptor construction.
///
static std::shared_ptr<ProviderDescriptor> provider(std::string id, int base = 50, double reliability = 0.9,
                                                    double cost = 0.0, ActivationRule act = {}) {
  ProviderSpec s;
  s.id = std::move(id);
  s.initial_reliability = reliability;
  s.cost_per_request = cost;
  s.priority.base = base;
  s.activation = std::move(act);
  return std::make_shared<ProviderDescriptor>(std::move(s));
}

static DataRequest request_for(std::vector<std::string> keys, DataType t = DataType::Quote) {
  DataRequest r;
  r.criteria.entity_keys = std::move(keys);
  r.criteria.data_type = t;
  return r;
}

// --------------------------- Catalog: basics --------------------------------

/**
 * @test Catalog_Construct_Empty
 * @brief Fresh catalog publishes a valid empty snapshot.
 */
TEST(ProviderCatalog, Catalog_Construct_Empty) {
  ProviderCatalog cat;
  auto snap = cat.snapshot();
  ASSERT_TRUE(snap);
  EXPECT_TRUE(snap->empty());
  EXPECT_EQ(cat.version(), 0u);
}

/**
 * @test Catalog_Add_And_Find
 * @brief Added descriptors are visible through heterogeneous lookup; a second add is refused.
 */
TEST(ProviderCatalog, Catalog_Add_And_Find) {
  ProviderCatalog cat;
  ASSERT_EQ(cat.add(provider("fred")), CatalogErr::Ok);
  ASSERT_EQ(cat.add(provider("polygon")), CatalogErr::Ok);
  EXPECT_EQ(cat.add(provider("fred")), CatalogErr::Exists);

  auto snap = cat.snapshot();
  auto it = snap->find(std::string_view{"fred"});
  ASSERT_NE(it, snap->end());
  EXPECT_EQ(it->second->id(), "fred");
  EXPECT_TRUE(cat.contains("polygon"));

  auto all = cat.list();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0]->id(), "fred");
  EXPECT_EQ(all[1]->id(), "polygon");
  EXPECT_EQ(cat.stats().failures, 1u);
}

/**
 * @test Catalog_Replace_Carries_Reliability
 * @brief Replacing a descriptor keeps the learned reliability of the old one.
 */
TEST(ProviderCatalog, Catalog_Replace_Carries_Reliability) {
  ProviderCatalog cat;
  EXPECT_EQ(cat.replace(provider("alpha")), CatalogErr::NotFound);

  auto v1 = provider("alpha", 50, 0.9);
  ASSERT_EQ(cat.add(v1), CatalogErr::Ok);
  for (int i = 0; i < 10; ++i) v1->record_outcome(ProviderErrorKind::Unavailable);
  const double learned = v1->reliability();
  ASSERT_LT(learned, 0.9);

  auto v2 = provider("alpha", 70, 0.9);
  ASSERT_EQ(cat.replace(v2), CatalogErr::Ok);
  auto now = cat.find("alpha");
  ASSERT_EQ(now, v2);
  EXPECT_DOUBLE_EQ(now->reliability(), learned);
  EXPECT_EQ(now->observations(), 10u);
  EXPECT_EQ(now->priority_for(FilterCriteria{}), 70);
}

/**
 * @test Catalog_Upsert_Same_Pointer_Idempotent
 * @brief Upserting the descriptor already published leaves its state untouched.
 */
TEST(ProviderCatalog, Catalog_Upsert_Same_Pointer_Idempotent) {
  ProviderCatalog cat;
  auto d = provider("svc");
  ASSERT_EQ(cat.upsert(d), CatalogErr::Ok);
  d->record_outcome(std::nullopt);
  ASSERT_EQ(cat.upsert(d), CatalogErr::Ok);
  EXPECT_EQ(cat.find("svc"), d);
  EXPECT_EQ(d->observations(), 1u);
  EXPECT_EQ(cat.version(), 2u);
}

/**
 * @test Catalog_Remove_And_Clear
 * @brief Remove erases one entry; removing a missing one publishes nothing; clear empties.
 */
TEST(ProviderCatalog, Catalog_Remove_And_Clear) {
  ProviderCatalog cat;
  ASSERT_EQ(cat.add(provider("aa")), CatalogErr::Ok);
  ASSERT_EQ(cat.add(provider("bb")), CatalogErr::Ok);

  EXPECT_TRUE(cat.remove("aa"));
  const auto v = cat.version();
  EXPECT_FALSE(cat.remove("aa"));
  EXPECT_EQ(cat.version(), v);
  EXPECT_FALSE(cat.contains("aa"));

  cat.clear();
  EXPECT_EQ(cat.size(), 0u);
}

/**
 * @test Catalog_Reload_All_Or_Nothing
 * @brief A reload with one invalid or duplicate descriptor publishes nothing.
 */
TEST(ProviderCatalog, Catalog_Reload_All_Or_Nothing) {
  ProviderCatalog cat;
  ASSERT_EQ(cat.reload({provider("one"), provider("two")}), CatalogErr::Ok);
  const auto v = cat.version();

  EXPECT_EQ(cat.reload({provider("three"), provider("bad id!")}), CatalogErr::Invalid);
  EXPECT_EQ(cat.reload({provider("three"), provider("three")}), CatalogErr::Exists);
  EXPECT_EQ(cat.version(), v);
  EXPECT_TRUE(cat.contains("one"));
  EXPECT_FALSE(cat.contains("three"));

  ASSERT_EQ(cat.reload({provider("three")}), CatalogErr::Ok);
  EXPECT_EQ(cat.size(), 1u);
}

// --------------------------- Catalog: validation ----------------------------

/**
 * @test Catalog_Validation_Rejections_DoNotPublish
 * @brief Invalid descriptors are rejected without publishing a new snapshot.
 */
TEST(ProviderCatalog, Catalog_Validation_Rejections_DoNotPublish) {
  ProviderCatalog cat;

  EXPECT_FALSE(ProviderCatalog::validate_id("x"));
  EXPECT_FALSE(ProviderCatalog::validate_id("has space"));
  EXPECT_TRUE(ProviderCatalog::validate_id("sec.edgar-v2_1"));

  EXPECT_EQ(cat.add(provider("neg-cost", 50, 0.9, -1.0)), CatalogErr::Invalid);

  ActivationRule inverted;
  inverted.min_entities = 5;
  inverted.max_entities = 2;
  EXPECT_EQ(cat.add(provider("inverted", 50, 0.9, 0.0, inverted)), CatalogErr::Invalid);

  ProviderSpec burst_over;
  burst_over.id = "burst";
  burst_over.rate_limit.requests = 2;
  burst_over.rate_limit.burst = 5;
  EXPECT_EQ(cat.add(std::make_shared<ProviderDescriptor>(burst_over)), CatalogErr::Invalid);

  EXPECT_EQ(cat.add(nullptr), CatalogErr::Invalid);
  EXPECT_TRUE(cat.snapshot()->empty());
  EXPECT_EQ(cat.version(), 0u);
}

// --------------------------- Concurrency sanity ----------------------------

/**
 * @test Catalog_Concurrency_1W_MR
 * @brief One writer toggles between two catalogs; readers only observe complete states.
 *
 * This is a lightweight sanity test (not a full linearizability proof).
 */
TEST(ProviderCatalog, Catalog_Concurrency_1W_MR) {
  ProviderCatalog cat;
  std::atomic<bool> running{true};
  std::atomic<int>  ok_reads{0};

  std::thread writer([&] {
    for (int i = 0; i < 2000; ++i) {
      if ((i & 1) == 0) (void)cat.reload({provider("a1"), provider("a2")});
      else              (void)cat.reload({provider("b1")});
      if ((i % 32) == 0) std::this_thread::yield();
    }
    running.store(false, std::memory_order_relaxed);
  });

  auto reader_fn = [&] {
    while (running.load(std::memory_order_relaxed)) {
      auto s = cat.snapshot();
      const bool a = s->size() == 2 && s->contains("a1") && s->contains("a2");
      const bool b = s->size() == 1 && s->contains("b1");
      if (a || b || s->empty()) {
        ok_reads.fetch_add(1, std::memory_order_relaxed);
      } else {
        ADD_FAILURE() << "Observed torn catalog of size " << s->size();
        break;
      }
      std::this_thread::yield();
    }
  };

  std::thread r1(reader_fn), r2(reader_fn), r3(reader_fn);
  writer.join();
  r1.join(); r2.join(); r3.join();
  EXPECT_GT(ok_reads.load(), 0);
}

// --------------------------- Router ----------------------------------------

/**
 * @test Router_Single_Entity_Excludes_Sector_Only
 * @brief ['AAPL'] routes to the 1..20 entity provider, never to the sector-only one.
 */
TEST(CollectorRouter, Router_Single_Entity_Excludes_Sector_Only) {
  ActivationRule individual;
  individual.min_entities = 1;
  individual.max_entities = 20;
  ActivationRule sector_only;
  sector_only.max_entities = 0;

  auto cat = std::make_shared<ProviderCatalog>();
  ASSERT_EQ(cat->add(provider("single", 50, 0.9, 0.0, individual)), CatalogErr::Ok);
  ASSERT_EQ(cat->add(provider("sector", 90, 0.9, 0.0, sector_only)), CatalogErr::Ok);
  CollectorRouter router(cat);

  auto d = router.route(request_for({"AAPL"}));
  ASSERT_EQ(d.size(), 1u);
  EXPECT_EQ(d.ids(), std::vector<std::string>{"single"});

  auto screen = request_for({}, DataType::Fundamentals);
  screen.criteria.sector = "energy";
  EXPECT_EQ(router.route(screen).ids(), std::vector<std::string>{"sector"});
}

/**
 * @test Router_Contains_Exactly_Activated
 * @brief For a spread of filters, the decision holds exactly the providers whose predicate is true.
 */
TEST(CollectorRouter, Router_Contains_Exactly_Activated) {
  std::vector<std::shared_ptr<ProviderDescriptor>> all;
  ProviderSpec s;
  s.id = "quotes";
  all.push_back(std::make_shared<ProviderDescriptor>(s, predicates::data_type_is(DataType::Quote),
                                                     sluice::routing::constant_priority(10)));
  s.id = "bulk";
  all.push_back(std::make_shared<ProviderDescriptor>(
      s, predicates::all_of({predicates::no_entities(), predicates::has_sector()}),
      sluice::routing::constant_priority(20)));
  s.id = "small";
  all.push_back(std::make_shared<ProviderDescriptor>(s, predicates::entity_count_between(1, 3),
                                                     sluice::routing::constant_priority(30)));
  s.id = "not-news";
  all.push_back(std::make_shared<ProviderDescriptor>(s, predicates::negate(predicates::data_type_is(DataType::News)),
                                                     sluice::routing::constant_priority(5)));

  const std::vector<std::vector<std::string>> key_sets = {{}, {"A"}, {"A", "B", "C"}, {"A", "B", "C", "D"}};
  for (auto t : {DataType::Quote, DataType::News, DataType::Fundamentals}) {
    for (const auto& keys : key_sets) {
      for (bool sector : {false, true}) {
        auto req = request_for(keys, t);
        if (sector) req.criteria.sector = "tech";
        auto ids = CollectorRouter::route(req, std::span<const std::shared_ptr<ProviderDescriptor>>(all)).ids();

        std::vector<std::string> expected;
        for (const auto& p : all) if (p->activates_for(req.criteria)) expected.push_back(p->id());
        std::sort(ids.begin(), ids.end());
        std::sort(expected.begin(), expected.end());
        EXPECT_EQ(ids, expected);
      }
    }
  }
}

/**
 * @test Router_Rank_Tie_Breaks
 * @brief Priority desc, then reliability desc, then cost asc, then id asc.
 */
TEST(CollectorRouter, Router_Rank_Tie_Breaks) {
  std::vector<std::shared_ptr<ProviderDescriptor>> all{
      provider("d-cheap", 50, 0.8, 0.001),
      provider("c-dear", 50, 0.8, 0.01),
      provider("b-reliable", 50, 0.95, 0.05),
      provider("a-top", 60, 0.1, 1.0),
      provider("e-same", 50, 0.8, 0.001),
  };
  auto d = CollectorRouter::route(request_for({"X"}), std::span<const std::shared_ptr<ProviderDescriptor>>(all));
  EXPECT_EQ(d.ids(), (std::vector<std::string>{"a-top", "b-reliable", "d-cheap", "e-same", "c-dear"}));
  EXPECT_EQ(d.candidates.front().priority, 60);
}

/**
 * @test Router_Priority_Rule_Bonuses
 * @brief Bonuses stack on the base according to the filter shape.
 */
TEST(CollectorRouter, Router_Priority_Rule_Bonuses) {
  sluice::routing::PriorityRule rule;
  rule.base = 40;
  rule.data_type_bonus[DataType::Fundamentals] = 15;
  rule.single_entity_bonus = 10;
  rule.sector_bonus = 30;
  rule.real_time_bonus = 5;
  auto prio = sluice::routing::make_priority(rule);

  FilterCriteria f;
  f.entity_keys = {"AAPL"};
  f.data_type = DataType::Fundamentals;
  EXPECT_EQ(prio(f), 65);
  f.real_time = true;
  EXPECT_EQ(prio(f), 70);

  FilterCriteria screen;
  screen.sector = "banks";
  EXPECT_EQ(prio(screen), 70);
}

/**
 * @test Router_Classify
 * @brief Request shapes map onto the routing classes.
 */
TEST(CollectorRouter, Router_Classify) {
  FilterCriteria f;
  EXPECT_EQ(CollectorRouter::classify(f), RequestType::Macro);
  f.sector = "energy";
  EXPECT_EQ(CollectorRouter::classify(f), RequestType::SectorScreen);
  f.entity_keys = {"XOM"};
  EXPECT_EQ(CollectorRouter::classify(f), RequestType::SingleEntity);
  f.entity_keys.assign(5, "K");
  EXPECT_EQ(CollectorRouter::classify(f), RequestType::EntityComparison);
  f.entity_keys.assign(50, "K");
  EXPECT_EQ(CollectorRouter::classify(f), RequestType::LargeEntityList);
  f.real_time = true;
  EXPECT_EQ(CollectorRouter::classify(f), RequestType::RealTime);
}

/**
 * @test Router_Validate_Suggestions
 * @brief Oversized lists get split and sector suggestions; OHLCV without dates gets a default range.
 */
TEST(CollectorRouter, Router_Validate_Suggestions) {
  ActivationRule individual;
  individual.min_entities = 1;
  individual.max_entities = 10;
  ActivationRule screener;
  screener.max_entities = 0;

  auto cat = std::make_shared<ProviderCatalog>();
  ProviderSpec s;
  s.id = "single";
  s.scope = ProviderScope::IndividualEntity;
  s.activation = individual;
  ASSERT_EQ(cat->add(std::make_shared<ProviderDescriptor>(s)), CatalogErr::Ok);
  s.id = "screener";
  s.scope = ProviderScope::Bulk;
  s.activation = screener;
  ASSERT_EQ(cat->add(std::make_shared<ProviderDescriptor>(s)), CatalogErr::Ok);

  auto clk = std::make_shared<sluice::testing::ManualClock>();
  CollectorRouter router(cat, clk);

  std::vector<std::string> many(25, "K");
  auto big = request_for(many, DataType::Ohlcv);
  big.criteria.analysis = sluice::core::AnalysisType::Technical;
  auto report = router.validate(big);
  EXPECT_FALSE(report.valid); // nobody takes 25 entities
  EXPECT_EQ(report.request_type, RequestType::LargeEntityList);

  std::vector<FilterSuggestion::Kind> kinds;
  for (const auto& sg : report.suggestions) kinds.push_back(sg.kind);
  ASSERT_EQ(kinds.size(), 3u);
  EXPECT_EQ(kinds[0], FilterSuggestion::Kind::SplitEntityList);
  EXPECT_EQ(report.suggestions[0].proposed.entity_keys.size(), 10u);
  EXPECT_EQ(kinds[1], FilterSuggestion::Kind::UseSectorFilter);
  EXPECT_TRUE(report.suggestions[1].proposed.entity_keys.empty());
  EXPECT_EQ(kinds[2], FilterSuggestion::Kind::DefaultDateRange);
  ASSERT_TRUE(report.suggestions[2].proposed.to);
  EXPECT_EQ(*report.suggestions[2].proposed.to, clk->now());

  auto ok = request_for({"AAPL"});
  auto r2 = router.validate(ok);
  EXPECT_TRUE(r2.valid);
  EXPECT_EQ(r2.eligible, std::vector<std::string>{"single"});
  ASSERT_EQ(r2.suggestions.size(), 1u);
  EXPECT_EQ(r2.suggestions[0].kind, FilterSuggestion::Kind::UseFundamentalAnalysis);
}

/**
 * @test Router_Validate_Inverted_Range_And_RealTime
 * @brief Inverted dates invalidate the request; real-time with daily bars only warns.
 */
TEST(CollectorRouter, Router_Validate_Inverted_Range_And_RealTime) {
  auto cat = std::make_shared<ProviderCatalog>();
  ASSERT_EQ(cat->add(provider("any")), CatalogErr::Ok);
  CollectorRouter router(cat);

  auto req = request_for({}, DataType::EconomicSeries);
  req.criteria.from = sluice::core::TimePoint{std::chrono::hours(48)};
  req.criteria.to = sluice::core::TimePoint{std::chrono::hours(24)};
  EXPECT_FALSE(router.validate(req).valid);

  auto rt = request_for({}, DataType::EconomicSeries);
  rt.criteria.real_time = true;
  rt.criteria.granularity = sluice::core::Granularity::Day;
  auto report = router.validate(rt);
  EXPECT_TRUE(report.valid);
  ASSERT_EQ(report.warnings.size(), 1u);
  EXPECT_NE(report.warnings[0].find("real-time"), std::string::npos);
}

// --------------------------- Circuit breaker --------------------------------

/**
 * @test Breaker_Trips_Trials_And_Recovers
 * @brief Threshold failures open the circuit; after open_for one trial call is let through.
 */
TEST(CircuitBreaker, Breaker_Trips_Trials_And_Recovers) {
  auto clk = std::make_shared<sluice::testing::ManualClock>();
  CircuitBreakerBank bank({.failure_threshold = 3, .open_for = 30s}, clk);

  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(bank.allow("p"));
    bank.on_failure("p", ProviderErrorKind::Unavailable);
  }
  EXPECT_EQ(bank.state("p"), CircuitState::Open);
  EXPECT_FALSE(bank.allow("p"));

  clk->advance(30s);
  EXPECT_TRUE(bank.allow("p"));
  EXPECT_EQ(bank.state("p"), CircuitState::HalfOpen);
  EXPECT_FALSE(bank.allow("p")); // one trial call at a time

  bank.on_failure("p", ProviderErrorKind::Timeout);
  EXPECT_EQ(bank.state("p"), CircuitState::Open);

  clk->advance(30s);
  ASSERT_TRUE(bank.allow("p"));
  bank.on_success("p");
  EXPECT_EQ(bank.state("p"), CircuitState::Closed);

  auto st = bank.status_all();
  ASSERT_EQ(st.size(), 1u);
  EXPECT_EQ(st[0].trips, 2u);
}

/**
 * @test Breaker_Ignores_Throttling_And_NotFound
 * @brief RateLimited and NotFound do not count toward opening; release frees a trial slot.
 */
TEST(CircuitBreaker, Breaker_Ignores_Throttling_And_NotFound) {
  auto clk = std::make_shared<sluice::testing::ManualClock>();
  CircuitBreakerBank bank({.failure_threshold = 1, .open_for = 10s}, clk);

  bank.on_failure("p", ProviderErrorKind::RateLimited);
  bank.on_failure("p", ProviderErrorKind::NotFound);
  EXPECT_EQ(bank.state("p"), CircuitState::Closed);

  bank.on_failure("p", ProviderErrorKind::InvalidResponse);
  EXPECT_EQ(bank.state("p"), CircuitState::Open);
  clk->advance(10s);
  ASSERT_TRUE(bank.allow("p"));
  bank.release("p");
  EXPECT_TRUE(bank.allow("p"));

  bank.reset("p");
  EXPECT_EQ(bank.state("p"), CircuitState::Closed);
}
