/**
 * @file result.cpp
 */
#include "sluice/core/result.hpp"

namespace sluice::core {

AttemptOutcome outcome_of(ProviderErrorKind k) noexcept {
    switch (k) {
        case ProviderErrorKind::RateLimited:     return AttemptOutcome::RateLimited;
        case ProviderErrorKind::Timeout:         return AttemptOutcome::Timeout;
        case ProviderErrorKind::NotFound:        return AttemptOutcome::NotFound;
        case ProviderErrorKind::InvalidResponse: return AttemptOutcome::InvalidResponse;
        case ProviderErrorKind::Unavailable:     return AttemptOutcome::Unavailable;
    }
    return AttemptOutcome::Unavailable;
}

std::string_view to_string(ProviderErrorKind k) noexcept {
    switch (k) {
        case ProviderErrorKind::RateLimited:     return "rate_limited";
        case ProviderErrorKind::Timeout:         return "timeout";
        case ProviderErrorKind::NotFound:        return "not_found";
        case ProviderErrorKind::InvalidResponse: return "invalid_response";
        case ProviderErrorKind::Unavailable:     return "unavailable";
    }
    return "unknown";
}

std::string_view to_string(AttemptOutcome o) noexcept {
    switch (o) {
        case AttemptOutcome::Succeeded:        return "succeeded";
        case AttemptOutcome::RateDenied:       return "rate_denied";
        case AttemptOutcome::CircuitOpen:      return "circuit_open";
        case AttemptOutcome::OverBudget:       return "over_budget";
        case AttemptOutcome::NoAdapter:        return "no_adapter";
        case AttemptOutcome::RateLimited:      return "rate_limited";
        case AttemptOutcome::Timeout:          return "timeout";
        case AttemptOutcome::NotFound:         return "not_found";
        case AttemptOutcome::InvalidResponse:  return "invalid_response";
        case AttemptOutcome::Unavailable:      return "unavailable";
        case AttemptOutcome::DeadlineExceeded: return "deadline_exceeded";
    }
    return "unknown";
}

std::string_view to_string(RequestErrorKind k) noexcept {
    switch (k) {
        case RequestErrorKind::Unroutable:  return "unroutable";
        case RequestErrorKind::Unavailable: return "unavailable";
        case RequestErrorKind::Timeout:     return "timeout";
    }
    return "unknown";
}

std::string_view to_string(CacheState s) noexcept {
    switch (s) {
        case CacheState::Fresh:     return "fresh";
        case CacheState::Stale:     return "stale";
        case CacheState::Refreshed: return "refreshed";
    }
    return "unknown";
}

std::string_view to_string(ExecState s) noexcept {
    switch (s) {
        case ExecState::Routing:     return "ROUTING";
        case ExecState::CacheCheck:  return "CACHE_CHECK";
        case ExecState::RateCheck:   return "RATE_CHECK";
        case ExecState::Fetching:    return "FETCHING";
        case ExecState::Reconciling: return "RECONCILING";
        case ExecState::Done:        return "DONE";
        case ExecState::Degraded:    return "DEGRADED";
        case ExecState::Failed:      return "FAILED";
    }
    return "UNKNOWN";
}

} // namespace sluice::core
