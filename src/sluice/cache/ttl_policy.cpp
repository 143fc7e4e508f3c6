/**
 * @file ttl_policy.cpp
 */
#include "sluice/cache/ttl_policy.hpp"

namespace sluice::cache {

using namespace sluice::config::constants;
using core::DataType;

TtlPolicy::TtlPolicy() noexcept {
    const auto secs = [](uint32_t s) { return std::chrono::seconds{s}; };
    set_rule(DataType::Quote,          {secs(TTL_QUOTE_S),        CACHE_REFRESH_THRESHOLD});
    set_rule(DataType::Ohlcv,          {secs(TTL_OHLCV_S),        CACHE_REFRESH_THRESHOLD});
    set_rule(DataType::Fundamentals,   {secs(TTL_FUNDAMENTALS_S), CACHE_REFRESH_THRESHOLD});
    set_rule(DataType::Options,        {secs(TTL_OPTIONS_S),      CACHE_REFRESH_THRESHOLD});
    set_rule(DataType::News,           {secs(TTL_NEWS_S),         CACHE_REFRESH_THRESHOLD});
    set_rule(DataType::Sentiment,      {secs(TTL_SENTIMENT_S),    CACHE_REFRESH_THRESHOLD});
    set_rule(DataType::EconomicSeries, {secs(TTL_ECONOMIC_S),     CACHE_REFRESH_THRESHOLD});
    set_rule(DataType::Filings,        {secs(TTL_FILINGS_S),      CACHE_REFRESH_THRESHOLD});
    set_rule(DataType::Reference,      {secs(TTL_REFERENCE_S),    CACHE_REFRESH_THRESHOLD});
}

} // namespace sluice::cache
