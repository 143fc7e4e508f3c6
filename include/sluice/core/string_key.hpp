#pragma once
/**
 * @file string_key.hpp
 * @brief Transparent hash/equal functors for string-keyed maps.
 * @details Enables heterogeneous lookup with std::string_view (no std::string
 *          temporaries on every query).
 */

#include <cstddef>
#include <functional>
#include <string_view>

namespace sluice::core {

struct StringKeyHash {
    using is_transparent = void;
    std::size_t operator()(std::string_view s) const noexcept {
        return std::hash<std::string_view>{}(s);
    }
};

struct StringKeyEq {
    using is_transparent = void;
    bool operator()(std::string_view a, std::string_view b) const noexcept {
        return a == b;
    }
};

} // namespace sluice::core
