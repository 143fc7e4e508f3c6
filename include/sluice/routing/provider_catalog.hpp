#pragma once
/**
 * @file provider_catalog.hpp
 * @brief Provider catalog with RCU snapshots: id -> ProviderDescriptor.
 *
 * Concurrency model:
 *   - Readers take a snapshot (shared_ptr copy) with ACQUIRE semantics and never block.
 *   - Writers serialize on a mutex, copy the map, mutate, and publish with RELEASE.
 *   - Old snapshots live until the last reader drops them (shared_ptr refcount is the grace period).
 *   - Descriptors are shared between snapshots, so reliability updates are visible everywhere.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "sluice/core/string_key.hpp"
#include "sluice/routing/provider_descriptor.hpp"

namespace sluice::routing {

// -----------------------------------------------------------------------------
// Result codes for catalog mutations. Never thrown.
// -----------------------------------------------------------------------------
enum class CatalogErr {
    Ok,
    Exists,   ///< Add failed: id already present
    NotFound, ///< Replace failed: id absent
    Invalid,  ///< Id, rate limit, cost or activation bounds rejected
    Capacity  ///< More than CATALOG_MAX_PROVIDERS
};

class ProviderCatalog final {
public:
    using DescriptorPtr = std::shared_ptr<ProviderDescriptor>;
    using Map = std::unordered_map<std::string, DescriptorPtr, core::StringKeyHash, core::StringKeyEq>;

    // --------------------------- RCU Snapshot API ----------------------------
    [[nodiscard]] std::shared_ptr<const Map> snapshot() const noexcept;

    [[nodiscard]] DescriptorPtr find(std::string_view id) const noexcept;
    [[nodiscard]] bool contains(std::string_view id) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

    /// Descriptors ordered by id.
    [[nodiscard]] std::vector<DescriptorPtr> list() const;

    /// Monotonic; bumps on every successful mutation.
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    // --------------------------- Mutations -----------------------------------
    CatalogErr add(DescriptorPtr d);

    /// Replace an existing descriptor; its reliability score carries over.
    CatalogErr replace(DescriptorPtr d);

    CatalogErr upsert(DescriptorPtr d);

    bool remove(std::string_view id) noexcept;

    void clear() noexcept;

    /**
     * @brief Swap in a whole new catalog in one publish.
     * @details All-or-nothing: any invalid or duplicate entry leaves the catalog untouched.
     *          Providers present before and after keep their reliability.
     */
    CatalogErr reload(std::vector<DescriptorPtr> descriptors);

    // --------------------------- Validation ----------------------------------
    [[nodiscard]] static bool validate_id(std::string_view id) noexcept;
    [[nodiscard]] static bool validate(const ProviderDescriptor& d) noexcept;

    // --------------------------- Observability -------------------------------
    struct Stats {
        uint64_t adds{0}, replaces{0}, upserts{0}, removes{0}, reloads{0}, failures{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    enum class Mode { Add, Replace, Upsert };

    CatalogErr mutate(Mode mode, DescriptorPtr d);
    void publish(std::shared_ptr<Map> next) noexcept;
    CatalogErr fail(CatalogErr e) noexcept {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return e;
    }

    std::shared_ptr<const Map> map_{std::make_shared<Map>()};
    std::mutex                 write_mu_;
    std::atomic<uint64_t>      version_{0};
    std::atomic<uint64_t>      adds_{0}, replaces_{0}, upserts_{0}, removes_{0}, reloads_{0}, failures_{0};
};

std::string_view to_string(CatalogErr e) noexcept;

} // namespace sluice::routing
