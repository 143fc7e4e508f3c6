#pragma once
/**
 * @file config_loader.hpp
 * @brief JSON configuration: logging, cache, executor, workers, guards, reconciliation, catalog.
 * @details Every field is optional; omitted fields keep the named defaults from constants.hpp.
 *          Catalog rules compile into typed predicates once, at load time.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "sluice/cache/cache_store.hpp"
#include "sluice/compat/expected.hpp"
#include "sluice/exec/failover_executor.hpp"
#include "sluice/exec/worker_pool.hpp"
#include "sluice/obs/logging.hpp"
#include "sluice/ratelimit/budget_tracker.hpp"
#include "sluice/reconcile/conflict_resolver.hpp"
#include "sluice/routing/circuit_breaker.hpp"
#include "sluice/routing/provider_descriptor.hpp"

namespace sluice::config {

/** @struct SluiceConfig
 *  @brief Aggregate of every sub-config the wiring needs.
 */
struct SluiceConfig {
    obs::LoggingConfig                 logging;
    cache::CacheConfig                 cache;
    exec::ExecutorConfig               executor;
    std::chrono::milliseconds          default_provider_timeout{constants::EXEC_PROVIDER_TIMEOUT_MS};
    double                             reliability_alpha{constants::RELIABILITY_EMA_ALPHA};
    exec::PoolConfig                   workers;
    routing::BreakerConfig             breaker;
    ratelimit::BudgetConfig            budget;
    reconcile::ConflictResolver        reconcile; ///< Strategy per data type
    std::vector<routing::ProviderSpec> providers;
};

/** @struct ConfigError
 *  @brief Load failure with the JSON location that caused it.
 */
struct ConfigError {
    enum class Code : uint8_t { FileNotFound = 1, ParseError, BadValue, DuplicateProvider };
    Code        code{Code::BadValue};
    std::string where;   ///< e.g. "providers[2].rate_limit.burst"
    std::string message;
};

/** @class Loader
 *  @brief Source of configuration (defaults or parsed files).
 */
class Loader {
public:
    static sluice_detail::expected<SluiceConfig, ConfigError> load_from_file(const std::string& path);
    static sluice_detail::expected<SluiceConfig, ConfigError> parse(std::string_view text);
    static sluice_detail::expected<SluiceConfig, ConfigError> from_json(const nlohmann::json& j);
    static SluiceConfig defaults();
};

/// Descriptors for the configured catalog (EMA alpha taken from the config).
std::vector<std::shared_ptr<routing::ProviderDescriptor>> make_descriptors(const SluiceConfig& cfg);

std::string_view to_string(ConfigError::Code c) noexcept;

} // namespace sluice::config
