#pragma once
/**
 * @file durable_tier.hpp
 * @brief Pluggable durable tier: survives restarts and may be shared by several processes.
 * @details Lookups are by primary key. sweep() runs independently of reads.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "sluice/cache/cache_entry.hpp"
#include "sluice/compat/expected.hpp"

namespace sluice::cache {

/** @struct StoreError
 *  @brief Durable-tier failure with the backend's message.
 */
struct StoreError {
    enum class Code : uint8_t { OpenFailed = 1, SchemaFailed, QueryFailed, CorruptRow };
    Code        code{Code::QueryFailed};
    std::string message;
};

class DurableTier {
public:
    virtual ~DurableTier() = default;

    virtual sluice_detail::expected<std::optional<StoredRecord>, StoreError> load(std::string_view key) = 0;
    virtual sluice_detail::expected<void, StoreError> store(const StoredRecord& rec) = 0;
    virtual sluice_detail::expected<bool, StoreError> erase(std::string_view key) = 0;

    /// Delete records whose expiry is older than @p cutoff. Returns the number deleted.
    virtual sluice_detail::expected<std::size_t, StoreError> sweep(TimePoint cutoff) = 0;

    virtual sluice_detail::expected<std::size_t, StoreError> count() = 0;
};

std::string_view to_string(StoreError::Code c) noexcept;

} // namespace sluice::cache
