/**
 * @file gates.cpp
 * @brief TokenBucket, SlidingWindow and DailyQuota.
 */
#include "sluice/ratelimit/daily_quota.hpp"
#include "sluice/ratelimit/sliding_window.hpp"
#include "sluice/ratelimit/token_bucket.hpp"

#include <algorithm>
#include <cmath>

namespace sluice::ratelimit {

namespace {

using Seconds = std::chrono::duration<double>;

std::chrono::nanoseconds ceil_ns(Seconds s) noexcept {
    return std::chrono::ceil<std::chrono::nanoseconds>(s);
}

std::chrono::milliseconds ceil_ms(std::chrono::nanoseconds ns) noexcept {
    return ns.count() <= 0 ? std::chrono::milliseconds{0}
                           : std::chrono::ceil<std::chrono::milliseconds>(ns);
}

constexpr std::chrono::hours kDay{24};

} // namespace

std::string_view to_string(GateKind k) noexcept {
    switch (k) {
        case GateKind::TokenBucket:   return "token_bucket";
        case GateKind::SlidingWindow: return "sliding_window";
        case GateKind::DailyQuota:    return "daily_quota";
    }
    return "unknown";
}

//------------------------------- TokenBucket ----------------------------------

TokenBucket::TokenBucket(double capacity, double refill_per_sec, TimePoint now) noexcept
    : capacity_(std::max(1.0, capacity)),
      rate_(refill_per_sec > 0.0 ? refill_per_sec : 1.0),
      tokens_(capacity_),
      last_refill_(now) {}

void TokenBucket::refill(TimePoint now) noexcept {
    if (now <= last_refill_) {
        // clock stepped back (or no time passed): move origin, credit nothing
        last_refill_ = std::min(last_refill_, now);
        return;
    }
    const double elapsed = Seconds(now - last_refill_).count();
    tokens_ = std::min(capacity_, tokens_ + elapsed * rate_);
    last_refill_ = now;
}

std::chrono::nanoseconds TokenBucket::wait_time(TimePoint now) noexcept {
    refill(now);
    if (tokens_ >= 1.0) return std::chrono::nanoseconds{0};
    return std::max(std::chrono::nanoseconds{1}, ceil_ns(Seconds((1.0 - tokens_) / rate_)));
}

void TokenBucket::commit(TimePoint now) noexcept {
    refill(now);
    tokens_ = std::max(0.0, tokens_ - 1.0);
}

GateStatus TokenBucket::status(TimePoint now) noexcept {
    refill(now);
    const auto to_full = ceil_ns(Seconds((capacity_ - tokens_) / rate_));
    return GateStatus{
        .kind      = GateKind::TokenBucket,
        .available = tokens_,
        .capacity  = capacity_,
        .window    = std::chrono::duration_cast<std::chrono::milliseconds>(Seconds(capacity_ / rate_)),
        .reset_in  = ceil_ms(to_full),
    };
}

void TokenBucket::reset(TimePoint now) noexcept {
    tokens_ = capacity_;
    last_refill_ = now;
}

//------------------------------- SlidingWindow --------------------------------

SlidingWindow::SlidingWindow(uint32_t limit, std::chrono::milliseconds window) noexcept
    : limit_(std::max<uint32_t>(1, limit)),
      window_(window.count() > 0 ? window : std::chrono::milliseconds{1}) {}

void SlidingWindow::evict(TimePoint now) noexcept {
    // half-open window (now - W, now]
    while (!grants_.empty() && grants_.front() + window_ <= now) grants_.pop_front();
}

std::chrono::nanoseconds SlidingWindow::wait_time(TimePoint now) noexcept {
    evict(now);
    if (grants_.size() < limit_) return std::chrono::nanoseconds{0};
    const auto wait = grants_.front() + window_ - now;
    return std::max(std::chrono::nanoseconds{1},
                    std::chrono::duration_cast<std::chrono::nanoseconds>(wait));
}

void SlidingWindow::commit(TimePoint now) noexcept {
    // a backwards clock step must not reorder the log
    const TimePoint stamp = grants_.empty() ? now : std::max(now, grants_.back());
    grants_.push_back(stamp);
}

GateStatus SlidingWindow::status(TimePoint now) noexcept {
    evict(now);
    std::chrono::milliseconds reset_in{0};
    if (!grants_.empty()) {
        reset_in = ceil_ms(std::chrono::duration_cast<std::chrono::nanoseconds>(grants_.back() + window_ - now));
    }
    return GateStatus{
        .kind      = GateKind::SlidingWindow,
        .available = static_cast<double>(limit_ - std::min<std::size_t>(limit_, grants_.size())),
        .capacity  = static_cast<double>(limit_),
        .window    = window_,
        .reset_in  = reset_in,
    };
}

void SlidingWindow::reset(TimePoint) noexcept { grants_.clear(); }

//------------------------------- DailyQuota -----------------------------------

DailyQuota::DailyQuota(uint32_t limit, uint32_t reset_hour_utc, TimePoint now) noexcept
    : limit_(limit), offset_(std::chrono::hours{reset_hour_utc % 24}) {
    period_ = period_start(now);
}

TimePoint DailyQuota::period_start(TimePoint now) const noexcept {
    const auto shifted = now - offset_;
    return std::chrono::floor<std::chrono::days>(shifted) + offset_;
}

void DailyQuota::roll(TimePoint now) noexcept {
    const auto p = period_start(now);
    if (p > period_) {
        period_ = p;
        used_ = 0;
    }
}

std::chrono::nanoseconds DailyQuota::wait_time(TimePoint now) noexcept {
    roll(now);
    if (used_ < limit_) return std::chrono::nanoseconds{0};
    const auto next = period_ + kDay;
    return std::max(std::chrono::nanoseconds{1},
                    std::chrono::duration_cast<std::chrono::nanoseconds>(next - now));
}

void DailyQuota::commit(TimePoint now) noexcept {
    roll(now);
    ++used_;
}

GateStatus DailyQuota::status(TimePoint now) noexcept {
    roll(now);
    return GateStatus{
        .kind      = GateKind::DailyQuota,
        .available = static_cast<double>(limit_ - std::min(limit_, used_)),
        .capacity  = static_cast<double>(limit_),
        .window    = std::chrono::duration_cast<std::chrono::milliseconds>(kDay),
        .reset_in  = ceil_ms(std::chrono::duration_cast<std::chrono::nanoseconds>(period_ + kDay - now)),
    };
}

void DailyQuota::reset(TimePoint now) noexcept {
    period_ = period_start(now);
    used_ = 0;
}

} // namespace sluice::ratelimit
