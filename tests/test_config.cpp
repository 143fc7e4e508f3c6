/**
 * @file test_config.cpp
 * @brief Tests for the JSON configuration loader.
 *
 * Validates:
 *  - Omitted sections keep the named defaults
 *  - Provider entries map onto ProviderSpec (rate limit, activation, priority)
 *  - Errors carry a code and the JSON location that caused them
 */

#include <gtest/gtest.h>
#include <string>
#include <variant>

#include "sluice/config/config_loader.hpp"
#include "sluice/config/constants.hpp"

using namespace std::chrono_literals;
using sluice::config::ConfigError;
using sluice::config::Loader;
using sluice::core::DataType;
namespace constants = sluice::config::constants;
namespace strategy = sluice::reconcile::strategy;

static constexpr const char* kTwoProviders = R"({
  "logging": { "level": "debug" },
  "cache": { "fast_capacity": 128, "ttl": { "quote": { "ttl_s": 15, "refresh_threshold": 0.5 } } },
  "executor": { "default_timeout_ms": 1500, "cross_validate": { "quote": 2 } },
  "workers": { "threads": 4, "shutdown": "drain" },
  "reconcile": { "strategies": { "fundamentals": { "strategy": "flag_for_review", "confidence_cap": 0.2 },
                                 "news": "use_primary" } },
  "providers": [
    { "id": "feed-a", "tier": "commercial", "scope": "individual",
      "rate_limit": { "requests": 5, "window_ms": 60000, "burst": 2, "burst_window_ms": 10000, "daily_cap": 100 },
      "cost_per_request": 0.01, "reliability": 0.95,
      "activation": { "data_types": ["quote", "ohlcv"], "min_entities": 1, "max_entities": 20, "real_time": true },
      "priority": { "base": 60, "single_entity_bonus": 10, "data_type_bonus": { "ohlcv": 5 } } },
    { "id": "bureau", "tier": "government", "scope": "bulk", "timeout_ms": 9000,
      "activation": { "data_types": ["economic_series"] } }
  ]
})";

static sluice::config::SluiceConfig parse_ok(const char* text) {
  auto r = Loader::parse(text);
  EXPECT_TRUE(r.has_value()) << (r ? "" : r.error().where + ": " + r.error().message);
  return r ? *r : Loader::defaults();
}

static ConfigError parse_err(const char* text) {
  auto r = Loader::parse(text);
  EXPECT_FALSE(r.has_value());
  return r ? ConfigError{} : r.error();
}

// ---------------------------- Defaults --------------------------------------

/**
 * @test Loader_Empty_Object_Is_Defaults
 * @brief "{}" yields the same configuration as defaults().
 */
TEST(Loader, Empty_Object_Is_Defaults) {
  auto cfg = parse_ok("{}");
  auto def = Loader::defaults();
  EXPECT_EQ(cfg.logging, def.logging);
  EXPECT_EQ(cfg.cache.fast_capacity, constants::CACHE_FAST_CAPACITY);
  EXPECT_EQ(cfg.cache.ttl, def.cache.ttl);
  EXPECT_EQ(cfg.default_provider_timeout, std::chrono::milliseconds(constants::EXEC_PROVIDER_TIMEOUT_MS));
  EXPECT_EQ(cfg.workers.threads, constants::WORKER_THREADS);
  EXPECT_TRUE(cfg.providers.empty());
  EXPECT_EQ(cfg.cache.ttl.rule_for(DataType::Quote).ttl, std::chrono::seconds(constants::TTL_QUOTE_S));
}

// ---------------------------- Sections --------------------------------------

/**
 * @test Loader_Parses_All_Sections
 * @brief Every configured field reaches its sub-config.
 */
TEST(Loader, Parses_All_Sections) {
  auto cfg = parse_ok(kTwoProviders);

  EXPECT_EQ(cfg.logging.level, "debug");
  EXPECT_EQ(cfg.cache.fast_capacity, 128u);
  EXPECT_EQ(cfg.cache.ttl.rule_for(DataType::Quote).ttl, 15s);
  EXPECT_DOUBLE_EQ(cfg.cache.ttl.rule_for(DataType::Quote).refresh_threshold, 0.5);
  EXPECT_EQ(cfg.default_provider_timeout, 1500ms);
  EXPECT_EQ(cfg.executor.cross_validate[sluice::core::index_of(DataType::Quote)], 2u);
  EXPECT_EQ(cfg.workers.threads, 4u);
  EXPECT_EQ(cfg.workers.on_destroy, sluice::exec::ShutdownMode::Drain);

  const auto& review = cfg.reconcile.strategy_for(DataType::Fundamentals);
  ASSERT_TRUE(std::holds_alternative<strategy::FlagForReview>(review));
  EXPECT_DOUBLE_EQ(std::get<strategy::FlagForReview>(review).confidence_cap, 0.2);
  EXPECT_TRUE(std::holds_alternative<strategy::UsePrimary>(cfg.reconcile.strategy_for(DataType::News)));
  EXPECT_TRUE(std::holds_alternative<strategy::UseAverage>(cfg.reconcile.strategy_for(DataType::Quote)));
}

/**
 * @test Loader_Provider_Spec
 * @brief Rate limit, activation and priority fields; the executor default timeout fills gaps.
 */
TEST(Loader, Provider_Spec) {
  auto cfg = parse_ok(kTwoProviders);
  ASSERT_EQ(cfg.providers.size(), 2u);

  const auto& a = cfg.providers[0];
  EXPECT_EQ(a.id, "feed-a");
  EXPECT_EQ(a.tier, sluice::core::ProviderTier::Commercial);
  EXPECT_EQ(a.scope, sluice::core::ProviderScope::IndividualEntity);
  EXPECT_EQ(a.rate_limit.requests, 5u);
  EXPECT_EQ(a.rate_limit.window, 60000ms);
  EXPECT_EQ(a.rate_limit.burst, 2u);
  EXPECT_EQ(a.rate_limit.burst_window, 10000ms);
  EXPECT_EQ(a.rate_limit.daily_cap, 100u);
  EXPECT_DOUBLE_EQ(a.cost_per_request, 0.01);
  EXPECT_DOUBLE_EQ(a.initial_reliability, 0.95);
  EXPECT_EQ(a.timeout, 1500ms);
  EXPECT_EQ(a.activation.data_types, (std::vector<DataType>{DataType::Quote, DataType::Ohlcv}));
  EXPECT_EQ(a.activation.min_entities, 1u);
  ASSERT_TRUE(a.activation.max_entities.has_value());
  EXPECT_EQ(*a.activation.max_entities, 20u);
  EXPECT_EQ(a.activation.real_time, std::optional<bool>(true));
  EXPECT_EQ(a.priority.base, 60);
  EXPECT_EQ(a.priority.single_entity_bonus, 10);
  EXPECT_EQ(a.priority.data_type_bonus.at(DataType::Ohlcv), 5);

  const auto& b = cfg.providers[1];
  EXPECT_EQ(b.tier, sluice::core::ProviderTier::Government);
  EXPECT_EQ(b.scope, sluice::core::ProviderScope::Bulk);
  EXPECT_EQ(b.timeout, 9000ms);
  EXPECT_EQ(b.rate_limit.requests, 0u);
  EXPECT_FALSE(b.activation.max_entities.has_value());
  EXPECT_DOUBLE_EQ(b.initial_reliability, constants::RELIABILITY_INITIAL);
}

/**
 * @test Loader_Make_Descriptors
 * @brief One descriptor per provider, seeded with the configured reliability.
 */
TEST(Loader, Make_Descriptors) {
  auto cfg = parse_ok(kTwoProviders);
  auto descs = sluice::config::make_descriptors(cfg);
  ASSERT_EQ(descs.size(), 2u);
  EXPECT_EQ(descs[0]->spec(), cfg.providers[0]);
  EXPECT_DOUBLE_EQ(descs[0]->reliability(), 0.95);
  EXPECT_EQ(descs[1]->spec().id, "bureau");
}

// ---------------------------- Errors ----------------------------------------

/**
 * @test Loader_Reports_Location
 * @brief Bad values name the offending path.
 */
TEST(Loader, Reports_Location) {
  auto e = parse_err(R"({"providers": [{"id": "xx", "rate_limit": {"requests": 2, "burst": 5}}]})");
  EXPECT_EQ(e.code, ConfigError::Code::BadValue);
  EXPECT_EQ(e.where, "providers[0].rate_limit.burst");

  e = parse_err(R"({"logging": {"level": "loud"}})");
  EXPECT_EQ(e.code, ConfigError::Code::BadValue);
  EXPECT_EQ(e.where, "logging.level");

  e = parse_err(R"({"providers": [{"id": "xx", "activation": {"data_types": ["quote", "weather"]}}]})");
  EXPECT_EQ(e.where, "providers[0].activation.data_types[1]");

  e = parse_err(R"({"providers": [{"id": "xx", "tier": "hobby"}]})");
  EXPECT_EQ(e.where, "providers[0].tier");

  e = parse_err(R"({"executor": {"cross_validate": {"quote": 50}}})");
  EXPECT_EQ(e.code, ConfigError::Code::BadValue);

  e = parse_err(R"({"reconcile": {"strategies": {"quote": "coin_flip"}}})");
  EXPECT_EQ(e.where, "reconcile.strategies.quote");

  e = parse_err(R"({"providers": [{"tier": "commercial"}]})");
  EXPECT_EQ(e.where, "providers[0].id");
}

/**
 * @test Loader_Duplicate_And_Syntax
 * @brief Duplicate ids, malformed JSON and a missing file each get their own code.
 */
TEST(Loader, Duplicate_And_Syntax) {
  auto e = parse_err(R"({"providers": [{"id": "xx"}, {"id": "xx"}]})");
  EXPECT_EQ(e.code, ConfigError::Code::DuplicateProvider);
  EXPECT_EQ(e.where, "providers[1].id");

  e = parse_err(R"({"providers": [)");
  EXPECT_EQ(e.code, ConfigError::Code::ParseError);

  e = parse_err("[1, 2]");
  EXPECT_EQ(e.code, ConfigError::Code::BadValue);

  auto f = Loader::load_from_file("/nonexistent/sluice-config.json");
  ASSERT_FALSE(f.has_value());
  EXPECT_EQ(f.error().code, ConfigError::Code::FileNotFound);
  EXPECT_EQ(sluice::config::to_string(f.error().code), "file_not_found");
}
