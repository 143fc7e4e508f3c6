#pragma once
/**
 * @file payload_codec.hpp
 * @brief Conversion between CacheEntry and StoredRecord, with zlib compression of large bodies.
 * @details Compressed layout: 8-byte little-endian original size, then the zlib stream.
 */

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#include "sluice/cache/cache_entry.hpp"
#include "sluice/compat/expected.hpp"

namespace sluice::cache {

/// Codec failures (corrupt rows, allocation failure).
enum class CodecError : uint8_t {
    CompressFailed = 1,
    TruncatedHeader,
    InflateFailed,
    SizeMismatch,
    BadFields
};

[[nodiscard]] sluice_detail::expected<std::string, CodecError> deflate_bytes(std::string_view raw, int level);
[[nodiscard]] sluice_detail::expected<std::string, CodecError> inflate_bytes(std::string_view packed);

/// Encode an entry; the body is deflated when larger than @p threshold bytes (0 disables).
[[nodiscard]] sluice_detail::expected<StoredRecord, CodecError>
encode_entry(const CacheEntry& e, std::size_t threshold);

[[nodiscard]] sluice_detail::expected<CacheEntry, CodecError>
decode_record(const StoredRecord& r);

/// Numeric fields as a JSON object (durable column).
[[nodiscard]] std::string fields_to_json(const std::map<std::string, double>& fields);
[[nodiscard]] sluice_detail::expected<std::map<std::string, double>, CodecError>
fields_from_json(std::string_view text);

std::string_view to_string(CodecError e) noexcept;

} // namespace sluice::cache
