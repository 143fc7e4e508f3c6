#pragma once
/**
 * @file logging.hpp
 * @brief spdlog setup: one named logger installed as the default, console or rotating file.
 */

#include <cstddef>
#include <string>

#include "sluice/compat/expected.hpp"
#include "sluice/config/constants.hpp"

namespace sluice::obs {

struct LoggingConfig {
    std::string level{"info"};   ///< trace|debug|info|warn|error|critical|off
    std::string pattern{sluice::config::constants::LOG_DEFAULT_PATTERN};
    std::string file;            ///< Empty = colored stdout
    std::size_t rotate_bytes{sluice::config::constants::LOG_ROTATE_BYTES};
    std::size_t rotate_files{sluice::config::constants::LOG_ROTATE_FILES};

    bool operator==(const LoggingConfig&) const = default;
};

enum class LoggingError : uint8_t { BadLevel = 1, SinkFailed };

/// Install the `sluice` logger as spdlog's default. Safe to call again to reconfigure.
sluice_detail::expected<void, LoggingError> init_logging(const LoggingConfig& cfg);

std::string_view to_string(LoggingError e) noexcept;

} // namespace sluice::obs
