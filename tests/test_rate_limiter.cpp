/**
 * @file test_rate_limiter.cpp
 * @brief Tests for the provider RateLimiter, its admission gates and the BudgetTracker.
 *
 * Validates:
 *  - Token bucket capacity is the burst allowance; the primary window bounds total admissions
 *  - Secondary short window and daily quota are chained in series with the bucket
 *  - No more than `requests` grants inside any window of length `window`
 *  - Budget levels, auto-stop and per-provider accounting
 */

#include <gtest/gtest.h>
#include <chrono>
#include <deque>
#include <thread>
#include <vector>

#include "sluice/ratelimit/budget_tracker.hpp"
#include "sluice/ratelimit/daily_quota.hpp"
#include "sluice/ratelimit/rate_limiter.hpp"
#include "sluice/ratelimit/sliding_window.hpp"
#include "sluice/ratelimit/token_bucket.hpp"
#include "support/manual_clock.hpp"

using namespace std::chrono_literals;
using sluice::ratelimit::BudgetConfig;
using sluice::ratelimit::BudgetLevel;
using sluice::ratelimit::BudgetTracker;
using sluice::ratelimit::DailyQuota;
using sluice::ratelimit::GateKind;
using sluice::ratelimit::RateLimiter;
using sluice::ratelimit::RateLimitSpec;
using sluice::ratelimit::SlidingWindow;
using sluice::ratelimit::TokenBucket;
using sluice::testing::ManualClock;

static RateLimitSpec spec_of(uint32_t requests, std::chrono::milliseconds window, uint32_t burst = 0) {
  RateLimitSpec s;
  s.requests = requests;
  s.window = window;
  s.burst = burst;
  return s;
}

// --------------------------- Token bucket ----------------------------------

/**
 * @test TokenBucket_Refills_Continuously
 * @brief Drained bucket admits again after (1 - tokens) / rate seconds.
 */
TEST(TokenBucket, Refills_Continuously) {
  ManualClock clk;
  TokenBucket tb(2.0, 0.5, clk.now()); // one token every two seconds

  EXPECT_EQ(tb.wait_time(clk.now()).count(), 0);
  tb.commit(clk.now());
  tb.commit(clk.now());
  EXPECT_GT(tb.wait_time(clk.now()), 1900ms);

  clk.advance(2s);
  EXPECT_EQ(tb.wait_time(clk.now()).count(), 0);
  EXPECT_NEAR(tb.tokens(), 1.0, 1e-9);

  clk.advance(60s);
  auto st = tb.status(clk.now());
  EXPECT_EQ(st.kind, GateKind::TokenBucket);
  EXPECT_DOUBLE_EQ(st.available, 2.0); // never above capacity
}

/**
 * @test TokenBucket_Backwards_Clock_Credits_Nothing
 * @brief A clock stepping back neither adds tokens nor breaks later refills.
 */
TEST(TokenBucket, Backwards_Clock_Credits_Nothing) {
  ManualClock clk;
  TokenBucket tb(1.0, 1.0, clk.now());
  tb.commit(clk.now());

  clk.advance(-5s);
  EXPECT_GT(tb.wait_time(clk.now()).count(), 0);
  clk.advance(1s);
  EXPECT_EQ(tb.wait_time(clk.now()).count(), 0);
}

// --------------------------- Sliding window / daily quota ------------------

/**
 * @test SlidingWindow_Evicts_At_Window_Edge
 * @brief Grants leave the window exactly W after they were made.
 */
TEST(SlidingWindow, Evicts_At_Window_Edge) {
  ManualClock clk;
  SlidingWindow w(2, 10s);
  w.commit(clk.now());
  clk.advance(3s);
  w.commit(clk.now());

  EXPECT_EQ(w.wait_time(clk.now()), std::chrono::nanoseconds(7s));
  clk.advance(7s);
  EXPECT_EQ(w.wait_time(clk.now()).count(), 0);
  EXPECT_EQ(w.in_window(), 1u);
}

/**
 * @test DailyQuota_Resets_At_Boundary
 * @brief Quota is a counter reset at the configured UTC hour, not a refill.
 */
TEST(DailyQuota, Resets_At_Boundary) {
  ManualClock clk; // midnight UTC
  clk.advance(5h);
  DailyQuota q(3, 6, clk.now()); // resets at 06:00 UTC

  for (int i = 0; i < 3; ++i) q.commit(clk.now());
  auto wait = q.wait_time(clk.now());
  EXPECT_EQ(wait, std::chrono::nanoseconds(1h));

  clk.advance(59min);
  EXPECT_GT(q.wait_time(clk.now()).count(), 0);
  clk.advance(1min);
  EXPECT_EQ(q.wait_time(clk.now()).count(), 0);
  EXPECT_EQ(q.used(), 0u);
}

// --------------------------- RateLimiter ------------------------------------

/**
 * @test RateLimiter_Burst_Caps_Rapid_Calls
 * @brief requests=5/10s with burst=2: seven rapid calls grant two, deny five with retry hints.
 */
TEST(RateLimiter, Burst_Caps_Rapid_Calls) {
  auto clk = std::make_shared<ManualClock>();
  RateLimiter rl(clk);
  rl.configure("p", spec_of(5, 10s, 2));

  int granted = 0;
  for (int i = 0; i < 7; ++i) {
    auto r = rl.try_acquire("p");
    if (r.granted) {
      ++granted;
      EXPECT_EQ(r.retry_after.count(), 0);
    } else {
      EXPECT_GT(r.retry_after.count(), 0);
    }
  }
  EXPECT_EQ(granted, 2);

  auto st = rl.status("p");
  ASSERT_TRUE(st);
  EXPECT_EQ(st->granted, 2u);
  EXPECT_EQ(st->denied, 5u);
}

/**
 * @test RateLimiter_No_Burst_Grants_Full_Window
 * @brief Without a burst allowance the bucket holds `requests` tokens: five of seven pass.
 */
TEST(RateLimiter, No_Burst_Grants_Full_Window) {
  auto clk = std::make_shared<ManualClock>();
  RateLimiter rl(clk);
  rl.configure("p", spec_of(5, 10s));

  int granted = 0;
  std::chrono::milliseconds last_retry{0};
  for (int i = 0; i < 7; ++i) {
    auto r = rl.try_acquire("p");
    if (r.granted) ++granted;
    else last_retry = r.retry_after;
  }
  EXPECT_EQ(granted, 5);
  // the bucket refills a token in 2s, but the window still holds five grants until they age out
  EXPECT_EQ(last_retry, 10000ms);

  clk->advance(2s);
  EXPECT_FALSE(rl.try_acquire("p").granted);
  clk->advance(last_retry - 2s);
  EXPECT_TRUE(rl.try_acquire("p").granted);
}

/**
 * @test RateLimiter_Window_Invariant_Holds
 * @brief Over a long run at a steady call rate, no 10s window sees more than five grants
 *        and no 2s sub-window more than the burst.
 */
TEST(RateLimiter, Window_Invariant_Holds) {
  auto clk = std::make_shared<ManualClock>();
  RateLimiter rl(clk);
  auto s = spec_of(5, 10s, 2);
  s.burst_window = 2s;
  rl.configure("p", s);

  std::vector<sluice::core::TimePoint> grants;
  for (int step = 0; step < 2000; ++step) {
    if (rl.try_acquire("p").granted) grants.push_back(clk->now());
    clk->advance(137ms);
  }
  ASSERT_GT(grants.size(), 50u);

  std::deque<sluice::core::TimePoint> win, burst;
  for (auto t : grants) {
    win.push_back(t);
    burst.push_back(t);
    while (win.front() + 10s <= t) win.pop_front();
    while (burst.front() + 2s <= t) burst.pop_front();
    ASSERT_LE(win.size(), 5u);
    ASSERT_LE(burst.size(), 2u);
  }
}

/**
 * @test RateLimiter_Unknown_Provider_Unlimited
 * @brief Providers without a spec are admitted and have no status.
 */
TEST(RateLimiter, Unknown_Provider_Unlimited) {
  RateLimiter rl(std::make_shared<ManualClock>());
  for (int i = 0; i < 100; ++i) EXPECT_TRUE(rl.try_acquire("free").granted);
  EXPECT_FALSE(rl.status("free").has_value());
  EXPECT_FALSE(rl.has("free"));
}

/**
 * @test RateLimiter_Daily_Cap_Chained
 * @brief Daily cap is a separate gate: it denies even when the window has room.
 */
TEST(RateLimiter, Daily_Cap_Chained) {
  auto clk = std::make_shared<ManualClock>();
  RateLimiter rl(clk);
  auto s = spec_of(100, 1s);
  s.daily_cap = 3;
  rl.configure("gov", s);

  for (int i = 0; i < 3; ++i) {
    EXPECT_TRUE(rl.try_acquire("gov").granted);
    clk->advance(1s);
  }
  auto denied = rl.try_acquire("gov");
  EXPECT_FALSE(denied.granted);
  EXPECT_GT(denied.retry_after, 1h);

  auto st = rl.status("gov");
  ASSERT_TRUE(st);
  ASSERT_EQ(st->gates.size(), 3u);
  EXPECT_EQ(st->gates.back().kind, GateKind::DailyQuota);
  EXPECT_DOUBLE_EQ(st->gates.back().available, 0.0);

  clk->advance(24h);
  EXPECT_TRUE(rl.try_acquire("gov").granted);
}

/**
 * @test RateLimiter_Reconfigure_Identical_Keeps_State
 * @brief Re-applying the same spec does not refill; a different spec rebuilds the gates.
 */
TEST(RateLimiter, Reconfigure_Identical_Keeps_State) {
  auto clk = std::make_shared<ManualClock>();
  RateLimiter rl(clk);
  rl.configure("p", spec_of(1, 60s));
  EXPECT_TRUE(rl.try_acquire("p").granted);

  rl.configure("p", spec_of(1, 60s));
  EXPECT_FALSE(rl.try_acquire("p").granted);

  rl.configure("p", spec_of(2, 60s));
  EXPECT_TRUE(rl.try_acquire("p").granted);

  EXPECT_TRUE(rl.reset("p"));
  EXPECT_TRUE(rl.remove("p"));
  EXPECT_FALSE(rl.remove("p"));
}

/**
 * @test RateLimiter_Acquire_Blocks_Until_Granted
 * @brief Blocking acquire sleeps through a short retry and gives up when the wait exceeds the timeout.
 */
TEST(RateLimiter, Acquire_Blocks_Until_Granted) {
  RateLimiter rl; // system clock
  rl.configure("p", spec_of(20, 1s, 1)); // one token every 50ms
  ASSERT_TRUE(rl.try_acquire("p").granted);

  const auto t0 = std::chrono::steady_clock::now();
  auto r = rl.acquire("p", 500ms);
  EXPECT_TRUE(r.granted);
  EXPECT_GE(std::chrono::steady_clock::now() - t0, 30ms);

  auto slow = spec_of(1, 60s);
  rl.configure("slow", slow);
  ASSERT_TRUE(rl.try_acquire("slow").granted);
  auto gave_up = rl.acquire("slow", 20ms);
  EXPECT_FALSE(gave_up.granted);
  EXPECT_GT(gave_up.retry_after, 20ms);
}

/**
 * @test RateLimiter_Concurrent_Never_Overadmits
 * @brief Many threads racing on one provider never exceed the bucket capacity.
 */
TEST(RateLimiter, Concurrent_Never_Overadmits) {
  auto clk = std::make_shared<ManualClock>();
  RateLimiter rl(clk);
  rl.configure("p", spec_of(10, 60s));

  std::atomic<int> granted{0};
  std::vector<std::thread> ts;
  for (int t = 0; t < 8; ++t) {
    ts.emplace_back([&] {
      for (int i = 0; i < 50; ++i)
        if (rl.try_acquire("p").granted) granted.fetch_add(1);
    });
  }
  for (auto& th : ts) th.join();
  EXPECT_EQ(granted.load(), 10);
}

// --------------------------- Budget ----------------------------------------

/**
 * @test BudgetTracker_Levels_And_AutoStop
 * @brief Spend moves through the levels; auto-stop refuses a call that would cross the daily limit.
 */
TEST(BudgetTracker, Levels_And_AutoStop) {
  auto clk = std::make_shared<ManualClock>();
  BudgetConfig cfg;
  cfg.daily_limit = 10.0;
  cfg.monthly_limit = 100.0;
  BudgetTracker bt(cfg, clk);

  bt.record("a", 7.6);
  EXPECT_EQ(bt.status().level, BudgetLevel::HighUsage);
  bt.record("b", 1.5);
  EXPECT_EQ(bt.status().level, BudgetLevel::ApproachingLimit);

  EXPECT_TRUE(bt.can_spend(0.9));
  EXPECT_FALSE(bt.can_spend(1.0));
  EXPECT_TRUE(bt.can_spend(0.0)); // free calls always pass

  auto st = bt.status();
  EXPECT_NEAR(st.daily_spent, 9.1, 1e-9);
  EXPECT_NEAR(st.monthly_by_provider.at("a"), 7.6, 1e-9);

  clk->advance(24h);
  EXPECT_TRUE(bt.can_spend(5.0));
  EXPECT_NEAR(bt.status().daily_spent, 0.0, 1e-9);
}

/**
 * @test BudgetTracker_Without_AutoStop_Only_Reports
 * @brief With auto-stop off spending is never refused but the level still reaches Exceeded.
 */
TEST(BudgetTracker, Without_AutoStop_Only_Reports) {
  auto clk = std::make_shared<ManualClock>();
  BudgetConfig cfg;
  cfg.daily_limit = 1.0;
  cfg.auto_stop = false;
  BudgetTracker bt(cfg, clk);

  bt.record("a", 2.0);
  EXPECT_TRUE(bt.can_spend(5.0));
  EXPECT_EQ(bt.status().level, BudgetLevel::Exceeded);
}
