/**
 * @file types.cpp
 * @brief String tables for core enumerations.
 */
#include "sluice/core/types.hpp"

#include <array>
#include <utility>

namespace sluice::core {

namespace {

template <class E, std::size_t N>
using NameTable = std::array<std::pair<E, std::string_view>, N>;

constexpr NameTable<DataType, kDataTypeCount> kDataTypes{{
    {DataType::Quote,          "quote"},
    {DataType::Ohlcv,          "ohlcv"},
    {DataType::Fundamentals,   "fundamentals"},
    {DataType::Options,        "options"},
    {DataType::News,           "news"},
    {DataType::Sentiment,      "sentiment"},
    {DataType::EconomicSeries, "economic_series"},
    {DataType::Filings,        "filings"},
    {DataType::Reference,      "reference"},
}};

constexpr NameTable<Granularity, 9> kGranularities{{
    {Granularity::None,    "none"},
    {Granularity::Tick,    "tick"},
    {Granularity::Minute,  "1m"},
    {Granularity::Hour,    "1h"},
    {Granularity::Day,     "1d"},
    {Granularity::Week,    "1w"},
    {Granularity::Month,   "1mo"},
    {Granularity::Quarter, "1q"},
    {Granularity::Year,    "1y"},
}};

constexpr NameTable<AnalysisType, 6> kAnalysis{{
    {AnalysisType::Any,         "any"},
    {AnalysisType::Fundamental, "fundamental"},
    {AnalysisType::Technical,   "technical"},
    {AnalysisType::Sentiment,   "sentiment"},
    {AnalysisType::Economic,    "economic"},
    {AnalysisType::Screening,   "screening"},
}};

constexpr NameTable<ProviderTier, 3> kTiers{{
    {ProviderTier::Government, "government"},
    {ProviderTier::Commercial, "commercial"},
    {ProviderTier::ToolServer, "tool_server"},
}};

constexpr NameTable<ProviderScope, 2> kScopes{{
    {ProviderScope::IndividualEntity, "individual"},
    {ProviderScope::Bulk,             "bulk"},
}};

template <class E, std::size_t N>
std::string_view name_of(const NameTable<E, N>& table, E value) noexcept {
    for (const auto& [e, name] : table) if (e == value) return name;
    return "unknown";
}

template <class E, std::size_t N>
std::optional<E> value_of(const NameTable<E, N>& table, std::string_view name) noexcept {
    for (const auto& [e, n] : table) if (n == name) return e;
    return std::nullopt;
}

} // namespace

std::string_view to_string(DataType t) noexcept      { return name_of(kDataTypes, t); }
std::string_view to_string(Granularity g) noexcept   { return name_of(kGranularities, g); }
std::string_view to_string(AnalysisType a) noexcept  { return name_of(kAnalysis, a); }
std::string_view to_string(ProviderTier t) noexcept  { return name_of(kTiers, t); }
std::string_view to_string(ProviderScope s) noexcept { return name_of(kScopes, s); }

std::optional<DataType>      parse_data_type(std::string_view s) noexcept      { return value_of(kDataTypes, s); }
std::optional<Granularity>   parse_granularity(std::string_view s) noexcept    { return value_of(kGranularities, s); }
std::optional<AnalysisType>  parse_analysis_type(std::string_view s) noexcept  { return value_of(kAnalysis, s); }
std::optional<ProviderTier>  parse_provider_tier(std::string_view s) noexcept  { return value_of(kTiers, s); }
std::optional<ProviderScope> parse_provider_scope(std::string_view s) noexcept { return value_of(kScopes, s); }

} // namespace sluice::core
