#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the data-acquisition core.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (JSON) in production deployments.
 */

#include <array>
#include <cstddef>
#include <cstdint>

namespace sluice::config::constants {

// =====================
// Rate Limiting
// Units: milliseconds unless noted
// =====================
inline constexpr uint32_t RATE_DEFAULT_WINDOW_MS     = 1000; ///< Primary window if none is configured
inline constexpr uint32_t RATE_MIN_RETRY_MS          = 1;    ///< Smallest retry hint handed to callers
inline constexpr uint32_t RATE_ACQUIRE_MAX_SLEEP_MS  = 1000; ///< Blocking acquire sleeps at most this per step
inline constexpr uint32_t RATE_DAY_MS                = 86'400'000;

// =====================
// Cache Tiers
// =====================
inline constexpr std::size_t CACHE_FAST_CAPACITY               = 4096;  ///< Entries held in-process
inline constexpr std::size_t CACHE_FAST_SHARDS                 = 16;    ///< Lock stripes in the fast tier
inline constexpr std::size_t CACHE_COMPRESSION_THRESHOLD_BYTES = 8192;  ///< Bodies above this are deflated
inline constexpr int         CACHE_COMPRESSION_LEVEL           = 6;     ///< zlib level (1 fast .. 9 small)
inline constexpr double      CACHE_REFRESH_THRESHOLD           = 0.8;   ///< Fraction of TTL before refresh-ahead
inline constexpr uint32_t    CACHE_RETENTION_CEILING_S         = 7 * 24 * 3600; ///< Durable rows kept past expiry
inline constexpr const char* CACHE_DURABLE_PATH                = "sluice-cache.db";
inline constexpr uint64_t    CACHE_KEY_SEED                    = 0x5111CE5EEDULL; ///< Deterministic key hash salt

// =====================
// TTL Defaults per data type (seconds)
// =====================
inline constexpr uint32_t TTL_DEFAULT_S      = 600;
inline constexpr uint32_t TTL_QUOTE_S        = 30;
inline constexpr uint32_t TTL_OHLCV_S        = 300;
inline constexpr uint32_t TTL_FUNDAMENTALS_S = 3600;
inline constexpr uint32_t TTL_OPTIONS_S      = 60;
inline constexpr uint32_t TTL_NEWS_S         = 1800;
inline constexpr uint32_t TTL_SENTIMENT_S    = 1200;
inline constexpr uint32_t TTL_ECONOMIC_S     = 6 * 3600;
inline constexpr uint32_t TTL_FILINGS_S      = 24 * 3600;
inline constexpr uint32_t TTL_REFERENCE_S    = 7 * 24 * 3600;

// =====================
// Anomaly Check (cache writes)
// =====================
inline constexpr double      ANOMALY_SIGMA           = 3.0;   ///< Std-devs before a value is suspicious
inline constexpr std::size_t ANOMALY_HISTORY         = 20;    ///< Samples kept per key and field
inline constexpr std::size_t ANOMALY_MIN_SAMPLES     = 5;     ///< History needed before judging
inline constexpr double      ANOMALY_QUALITY_PENALTY = 0.5;   ///< Multiplier applied to quality on anomaly
inline constexpr std::size_t ANOMALY_MAX_KEYS        = 10000; ///< Bound on tracked keys

// =====================
// Provider Catalog / Routing
// =====================
inline constexpr std::size_t CATALOG_MAX_PROVIDERS        = 256;
inline constexpr std::size_t CATALOG_MAX_ID_LEN           = 48;
inline constexpr std::size_t ROUTER_COMPARISON_MAX        = 20;       ///< Upper bound of an entity comparison
inline constexpr uint32_t    VALIDATE_DEFAULT_LOOKBACK_D  = 5 * 365;  ///< Suggested OHLCV range when none given

// =====================
// Failover Executor
// =====================
inline constexpr uint32_t EXEC_PROVIDER_TIMEOUT_MS = 3000; ///< Per-provider deadline when none configured
inline constexpr uint32_t EXEC_JOIN_POLL_MS        = 5;    ///< How often a caller waiting on another fetch checks its deadline
inline constexpr double   RELIABILITY_INITIAL      = 0.9;
inline constexpr double   RELIABILITY_EMA_ALPHA    = 0.1;  ///< Weight of the newest outcome

/// EMA targets per call outcome. RateLimited is penalized lightly, InvalidResponse fully.
inline constexpr double RELIABILITY_SIGNAL_SUCCESS      = 1.0;
inline constexpr double RELIABILITY_SIGNAL_NOT_FOUND    = 0.9;
inline constexpr double RELIABILITY_SIGNAL_RATE_LIMITED = 0.8;
inline constexpr double RELIABILITY_SIGNAL_TIMEOUT      = 0.3;
inline constexpr double RELIABILITY_SIGNAL_UNAVAILABLE  = 0.2;
inline constexpr double RELIABILITY_SIGNAL_INVALID      = 0.0;

// =====================
// Circuit Breaker
// =====================
inline constexpr uint32_t BREAKER_FAILURE_THRESHOLD = 5;      ///< Consecutive failures before opening
inline constexpr uint32_t BREAKER_OPEN_MS           = 60000;  ///< Time before a half-open trial call

// =====================
// Budget (commercial providers, currency units)
// =====================
inline constexpr double BUDGET_MONTHLY_LIMIT        = 100.0;
inline constexpr double BUDGET_DAILY_LIMIT          = 10.0;
inline constexpr double BUDGET_HIGH_USAGE_PCT       = 75.0;
inline constexpr double BUDGET_APPROACHING_PCT      = 90.0;
inline constexpr std::array<double, 4> BUDGET_ALERT_PCTS{50.0, 75.0, 90.0, 100.0};

// =====================
// Background Workers
// =====================
inline constexpr std::size_t WORKER_THREADS        = 2;
inline constexpr std::size_t WORKER_QUEUE_CAPACITY = 256;

// =====================
// Reconciliation (tolerance in percent of the mean)
// =====================
inline constexpr double RECONCILE_DEFAULT_TOLERANCE_PCT = 2.0;
inline constexpr double RECONCILE_PRICE_TOLERANCE_PCT   = 0.1;
inline constexpr double RECONCILE_VOLUME_TOLERANCE_PCT  = 5.0;
inline constexpr double RECONCILE_MCAP_TOLERANCE_PCT    = 1.0;
inline constexpr double REVIEW_CONFIDENCE_CAP           = 0.3; ///< Ceiling for flagged resolutions
inline constexpr double SENTIMENT_TOLERANCE_PCT         = 10.0;
inline constexpr uint32_t RECONCILE_WINDOW_S            = 300; ///< Max age of a cached rival worth reconciling
inline constexpr uint32_t CROSS_VALIDATE_MAX            = 5;   ///< Upper bound for sources per request

// =====================
// Logging
// =====================
inline constexpr const char* LOG_LOGGER_NAME     = "sluice";
inline constexpr const char* LOG_DEFAULT_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v";
inline constexpr std::size_t LOG_ROTATE_BYTES    = 10 * 1024 * 1024;
inline constexpr std::size_t LOG_ROTATE_FILES    = 3;

} // namespace sluice::config::constants
