#pragma once
/**
 * @file types.hpp
 * @brief Vocabulary shared by every layer: data categories, filter criteria, requests, payloads.
 * @details Enumerations have string forms (used by the config loader and logs). Parsing returns
 *          std::nullopt on unknown names rather than throwing.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sluice::core {

/// Wall-clock time. Cache ages persist across restarts, so a steady clock is not enough.
using TimePoint = std::chrono::system_clock::time_point;

/** @enum DataType
 *  @brief Category of financial data a request asks for.
 */
enum class DataType : uint8_t {
    Quote,          ///< Latest price snapshot
    Ohlcv,          ///< Historical bars
    Fundamentals,   ///< Statements, ratios
    Options,        ///< Chains, greeks
    News,
    Sentiment,
    EconomicSeries, ///< Macro/statistical series (rates, CPI, employment)
    Filings,        ///< Regulatory filings
    Reference       ///< Static reference data (listings, identifiers)
};
inline constexpr std::size_t kDataTypeCount = 9;

/** @enum Granularity
 *  @brief Sampling interval of time-series data.
 */
enum class Granularity : uint8_t { None, Tick, Minute, Hour, Day, Week, Month, Quarter, Year };

/** @enum AnalysisType
 *  @brief What the caller intends to do with the data.
 */
enum class AnalysisType : uint8_t { Any, Fundamental, Technical, Sentiment, Economic, Screening };

/// Funding model of a provider.
enum class ProviderTier : uint8_t { Government, Commercial, ToolServer };

/// Shape of requests a provider is built for.
enum class ProviderScope : uint8_t { IndividualEntity, Bulk };

/** @struct FilterCriteria
 *  @brief Structured description of a request, the sole input of activation and priority rules.
 *  @details Entity keys and data type live here (not only on DataRequest) so that a
 *           predicate sees everything that defines provider competence.
 */
struct FilterCriteria {
    std::vector<std::string>   entity_keys;               ///< Symbols, CIKs, series ids
    DataType                   data_type{DataType::Quote};
    std::optional<std::string> sector;
    std::optional<TimePoint>   from;                      ///< Inclusive start of the date range
    std::optional<TimePoint>   to;                        ///< Inclusive end of the date range
    Granularity                granularity{Granularity::None};
    AnalysisType               analysis{AnalysisType::Any};
    bool                       real_time{false};          ///< Caller wants live rather than end-of-day data

    bool operator==(const FilterCriteria&) const = default;
};

/** @struct DataRequest
 *  @brief One semantic ask from the analysis engine. Immutable for the duration of a call.
 */
struct DataRequest {
    FilterCriteria             criteria;
    std::chrono::seconds       max_staleness{0}; ///< 0 = accept anything the TTL table calls fresh
    std::optional<TimePoint>   deadline;         ///< Overall caller deadline
    std::string                request_id;       ///< Caller-provided id for logs

    [[nodiscard]] const std::vector<std::string>& entity_keys() const noexcept { return criteria.entity_keys; }
    [[nodiscard]] DataType data_type() const noexcept { return criteria.data_type; }
};

/** @struct Payload
 *  @brief Provider answer: opaque body plus the numeric fields used for reconciliation.
 */
struct Payload {
    std::string                   body;   ///< Raw bytes as returned by the provider
    std::map<std::string, double> fields; ///< e.g. {"price": 187.2, "volume": 5.1e7}

    bool operator==(const Payload&) const = default;
};

// -----------------------------------------------------------------------------
// String forms
// -----------------------------------------------------------------------------
std::string_view to_string(DataType t) noexcept;
std::string_view to_string(Granularity g) noexcept;
std::string_view to_string(AnalysisType a) noexcept;
std::string_view to_string(ProviderTier t) noexcept;
std::string_view to_string(ProviderScope s) noexcept;

std::optional<DataType>      parse_data_type(std::string_view s) noexcept;
std::optional<Granularity>   parse_granularity(std::string_view s) noexcept;
std::optional<AnalysisType>  parse_analysis_type(std::string_view s) noexcept;
std::optional<ProviderTier>  parse_provider_tier(std::string_view s) noexcept;
std::optional<ProviderScope> parse_provider_scope(std::string_view s) noexcept;

/// Dense index for per-type tables.
constexpr std::size_t index_of(DataType t) noexcept { return static_cast<std::size_t>(t); }

} // namespace sluice::core
