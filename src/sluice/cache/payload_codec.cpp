/**
 * @file payload_codec.cpp
 * @brief zlib compress2/uncompress wrappers and nlohmann::json field encoding.
 */
#include "sluice/cache/payload_codec.hpp"

#include <cmath>
#include <new>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <zlib.h>

#include "sluice/config/constants.hpp"

namespace sluice::cache {

namespace {
constexpr std::size_t kHeader = 8;
} // namespace

sluice_detail::expected<std::string, CodecError> deflate_bytes(std::string_view raw, int level) {
    try {
        uLongf bound = compressBound(static_cast<uLong>(raw.size()));
        std::string out(kHeader + bound, '\0');
        uint64_t n = raw.size();
        for (std::size_t i = 0; i < kHeader; ++i) out[i] = static_cast<char>((n >> (8 * i)) & 0xFF);

        const int rc = compress2(reinterpret_cast<Bytef*>(out.data() + kHeader), &bound,
                                 reinterpret_cast<const Bytef*>(raw.data()),
                                 static_cast<uLong>(raw.size()), level);
        if (rc != Z_OK) return sluice_detail::unexpected(CodecError::CompressFailed);
        out.resize(kHeader + bound);
        return out;
    } catch (const std::bad_alloc&) {
        return sluice_detail::unexpected(CodecError::CompressFailed);
    }
}

sluice_detail::expected<std::string, CodecError> inflate_bytes(std::string_view packed) {
    if (packed.size() < kHeader) return sluice_detail::unexpected(CodecError::TruncatedHeader);
    uint64_t n = 0;
    for (std::size_t i = 0; i < kHeader; ++i) {
        n |= static_cast<uint64_t>(static_cast<unsigned char>(packed[i])) << (8 * i);
    }
    try {
        std::string out(n, '\0');
        uLongf len = static_cast<uLongf>(n);
        const int rc = uncompress(reinterpret_cast<Bytef*>(out.data()), &len,
                                  reinterpret_cast<const Bytef*>(packed.data() + kHeader),
                                  static_cast<uLong>(packed.size() - kHeader));
        if (rc != Z_OK) return sluice_detail::unexpected(CodecError::InflateFailed);
        if (len != n)   return sluice_detail::unexpected(CodecError::SizeMismatch);
        return out;
    } catch (const std::bad_alloc&) {
        // absurd size header from a corrupt row
        return sluice_detail::unexpected(CodecError::TruncatedHeader);
    } catch (const std::length_error&) {
        return sluice_detail::unexpected(CodecError::TruncatedHeader);
    }
}

sluice_detail::expected<StoredRecord, CodecError> encode_entry(const CacheEntry& e, std::size_t threshold) {
    StoredRecord r{
        .key               = e.key,
        .body              = {},
        .compressed        = false,
        .fields            = e.value.fields,
        .source_id         = e.source_id,
        .fetched_at        = e.fetched_at,
        .ttl               = e.ttl,
        .quality           = e.quality,
        .refresh_threshold = e.refresh_threshold,
    };
    if (threshold > 0 && e.value.body.size() > threshold) {
        auto packed = deflate_bytes(e.value.body, sluice::config::constants::CACHE_COMPRESSION_LEVEL);
        if (!packed.has_value()) return sluice_detail::unexpected(packed.error());
        r.body = std::move(*packed);
        r.compressed = true;
    } else {
        r.body = e.value.body;
    }
    return r;
}

sluice_detail::expected<CacheEntry, CodecError> decode_record(const StoredRecord& r) {
    CacheEntry e{
        .key               = r.key,
        .value             = core::Payload{.body = {}, .fields = r.fields},
        .source_id         = r.source_id,
        .fetched_at        = r.fetched_at,
        .ttl               = r.ttl,
        .quality           = r.quality,
        .refresh_threshold = r.refresh_threshold,
        .compressed        = r.compressed,
        .stale             = false,
    };
    if (r.compressed) {
        auto raw = inflate_bytes(r.body);
        if (!raw.has_value()) return sluice_detail::unexpected(raw.error());
        e.value.body = std::move(*raw);
    } else {
        e.value.body = r.body;
    }
    return e;
}

std::string fields_to_json(const std::map<std::string, double>& fields) {
    nlohmann::json j = nlohmann::json::object();
    // JSON has no NaN or infinity; nlohmann would write null and the read back would fail
    for (const auto& [k, v] : fields) {
        if (std::isfinite(v)) j[k] = v;
    }
    return j.dump();
}

sluice_detail::expected<std::map<std::string, double>, CodecError> fields_from_json(std::string_view text) {
    if (text.empty()) return std::map<std::string, double>{};
    try {
        const auto j = nlohmann::json::parse(text);
        if (!j.is_object()) return sluice_detail::unexpected(CodecError::BadFields);
        std::map<std::string, double> out;
        for (const auto& [k, v] : j.items()) {
            if (!v.is_number()) return sluice_detail::unexpected(CodecError::BadFields);
            out.emplace(k, v.get<double>());
        }
        return out;
    } catch (const nlohmann::json::exception&) {
        return sluice_detail::unexpected(CodecError::BadFields);
    }
}

std::string_view to_string(CodecError e) noexcept {
    switch (e) {
        case CodecError::CompressFailed:  return "compress_failed";
        case CodecError::TruncatedHeader: return "truncated_header";
        case CodecError::InflateFailed:   return "inflate_failed";
        case CodecError::SizeMismatch:    return "size_mismatch";
        case CodecError::BadFields:       return "bad_fields";
    }
    return "unknown";
}

} // namespace sluice::cache
