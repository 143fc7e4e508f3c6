#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: per-request events, reconciliation audit records, counters.
 * @details The default sink writes one JSON line per event through spdlog.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sluice/core/result.hpp"
#include "sluice/core/types.hpp"
#include "sluice/reconcile/conflict_resolver.hpp"

namespace sluice::obs {

/** @struct Counters
 *  @brief Process-level counters for the request path.
 */
struct Counters {
    uint64_t requests{0};           ///< Total requests recorded
    uint64_t fresh_hits{0};         ///< Answered from cache within freshness bounds
    uint64_t refreshed{0};          ///< Answered by a provider during the call
    uint64_t stale_served{0};       ///< Degraded returns
    uint64_t unroutable{0};
    uint64_t unavailable{0};
    uint64_t timeouts{0};
    uint64_t failovers{0};          ///< Candidates skipped or failed before the answer
    uint64_t conflicts{0};          ///< Reconciliations performed
    uint64_t flagged_for_review{0};
};

/** @struct RequestEvent
 *  @brief Payload describing one executed request.
 */
struct RequestEvent {
    std::string                           request_id;
    std::string                           cache_key;
    core::DataType                        data_type{core::DataType::Quote};
    std::optional<core::CacheState>       cache_state;  ///< Set on success
    std::optional<core::RequestErrorKind> error;        ///< Set on failure
    std::string                           source_id;
    double                                confidence{0.0};
    bool                                  review_flag{false};
    std::vector<core::Attempt>            attempts;
    std::vector<core::ExecState>          trace;
    std::chrono::microseconds             elapsed{0};
};

/** @class Observer
 *  @brief Observability sink interface.
 */
class Observer {
public:
    virtual ~Observer() = default;
    /// Record a finished request.
    virtual void record(const RequestEvent& e) = 0;
    /// Record a reconciliation for audit.
    virtual void record(const reconcile::ConflictRecord& c) = 0;
    /// Return a snapshot of counters.
    virtual Counters snapshot() const = 0;
};

/// Thread-safe observer that counts and logs each event as a JSON line.
std::shared_ptr<Observer> make_logging_observer();

/// JSON renderings used by the logging observer.
std::string to_json_line(const RequestEvent& e);
std::string to_json_line(const reconcile::ConflictRecord& c);

} // namespace sluice::obs
