#pragma once
/**
 * @file provider_adapter.hpp
 * @brief Uniform interface every external data source implements, plus the adapter set.
 *
 * Contract:
 *   - fetch() must give up by ctx.deadline and report Timeout when it does.
 *   - Failures are classified into ProviderErrorKind; nothing provider-specific leaks out.
 *   - fetch() may be called concurrently for different requests.
 */

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "sluice/compat/expected.hpp"
#include "sluice/core/clock.hpp"
#include "sluice/core/result.hpp"
#include "sluice/core/string_key.hpp"
#include "sluice/core/types.hpp"

namespace sluice::provider {

/** @struct FetchContext
 *  @brief Per-call context: deadline and correlation id.
 */
struct FetchContext {
    core::TimePoint                    deadline{};  ///< min(provider timeout, caller deadline)
    std::string                        request_id;
    std::shared_ptr<const core::Clock> clock{core::system_clock()};

    [[nodiscard]] bool expired() const noexcept { return clock->now() >= deadline; }
    [[nodiscard]] std::chrono::nanoseconds remaining() const noexcept {
        const auto left = deadline - clock->now();
        return left.count() > 0 ? std::chrono::duration_cast<std::chrono::nanoseconds>(left)
                                : std::chrono::nanoseconds{0};
    }
};

/** @struct ProviderResponse
 *  @brief Successful answer with the adapter's own completeness score.
 */
struct ProviderResponse {
    core::Payload payload;
    double        quality{1.0}; ///< 0..1
};

using FetchResult = sluice_detail::expected<ProviderResponse, core::ProviderError>;

class ProviderAdapter {
public:
    virtual ~ProviderAdapter() = default;

    [[nodiscard]] virtual std::string_view id() const noexcept = 0;

    virtual FetchResult fetch(const FetchContext& ctx, const core::DataRequest& request) = 0;
};

/** @class AdapterSet
 *  @brief Thread-safe binding of provider ids to adapters.
 */
class AdapterSet {
public:
    /// Bind (or rebind) an adapter under its own id.
    void bind(std::shared_ptr<ProviderAdapter> adapter);
    bool unbind(std::string_view id);

    [[nodiscard]] std::shared_ptr<ProviderAdapter> find(std::string_view id) const;
    [[nodiscard]] std::vector<std::string> ids() const;
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<ProviderAdapter>, core::StringKeyHash, core::StringKeyEq> map_;
};

} // namespace sluice::provider
