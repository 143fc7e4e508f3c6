#pragma once
/**
 * @file result.hpp
 * @brief Error taxonomy and the response shape handed back to the analysis engine.
 * @details Provider-level errors stay inside the core; callers only ever see
 *          RequestError (Unroutable | Unavailable | Timeout) with the attempt history.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "sluice/compat/expected.hpp"
#include "sluice/core/types.hpp"

namespace sluice::core {

/// Classification every ProviderAdapter must apply to its own failures.
enum class ProviderErrorKind : uint8_t { RateLimited, Timeout, NotFound, InvalidResponse, Unavailable };

/** @struct ProviderError
 *  @brief Failure reported by an adapter. Never escapes the executor.
 */
struct ProviderError {
    ProviderErrorKind kind{ProviderErrorKind::Unavailable};
    std::string       message;
};

/// Outcome of one candidate in a failover chain.
enum class AttemptOutcome : uint8_t {
    Succeeded,
    RateDenied,       ///< Local limiter refused admission
    CircuitOpen,      ///< Breaker refused admission
    OverBudget,       ///< Cost would exceed the budget
    NoAdapter,        ///< Catalog lists a provider with no adapter bound
    RateLimited,      ///< Provider itself answered "too many requests"
    Timeout,
    NotFound,
    InvalidResponse,
    Unavailable,
    DeadlineExceeded  ///< Caller deadline passed before this candidate was tried
};

/** @struct Attempt
 *  @brief One step of the failover chain, kept for logs and alerts.
 */
struct Attempt {
    std::string    provider_id;
    AttemptOutcome outcome{AttemptOutcome::Succeeded};
    std::string    detail;
};

/// Terminal error kinds visible to callers.
enum class RequestErrorKind : uint8_t { Unroutable, Unavailable, Timeout };

/** @struct RequestError
 *  @brief Terminal failure of a request with the providers tried and why each failed.
 */
struct RequestError {
    RequestErrorKind     kind{RequestErrorKind::Unavailable};
    std::string          message;
    std::vector<Attempt> attempts;
};

/// How the returned value was obtained.
enum class CacheState : uint8_t {
    Fresh,     ///< Served from cache within freshness bounds
    Stale,     ///< Degraded-mode return, explicitly stale
    Refreshed  ///< Fetched from a provider during this call
};

/// Per-request state machine positions.
enum class ExecState : uint8_t { Routing, CacheCheck, RateCheck, Fetching, Reconciling, Done, Degraded, Failed };

/** @struct ResponseMetadata
 *  @brief Provenance of a returned value.
 */
struct ResponseMetadata {
    std::string            source_id;
    CacheState             cache_state{CacheState::Fresh};
    double                 confidence{1.0};
    bool                   review_flag{false};  ///< Reconciliation could not settle automatically
    std::vector<Attempt>   attempts;
    std::vector<ExecState> trace;               ///< States visited, in order
};

/** @struct DataResponse
 *  @brief Successful answer to a DataRequest.
 */
struct DataResponse {
    Payload          value;
    ResponseMetadata meta;
};

using RequestResult = sluice_detail::expected<DataResponse, RequestError>;

/// Map an adapter error onto the attempt log.
AttemptOutcome outcome_of(ProviderErrorKind k) noexcept;

std::string_view to_string(ProviderErrorKind k) noexcept;
std::string_view to_string(AttemptOutcome o) noexcept;
std::string_view to_string(RequestErrorKind k) noexcept;
std::string_view to_string(CacheState s) noexcept;
std::string_view to_string(ExecState s) noexcept;

} // namespace sluice::core
