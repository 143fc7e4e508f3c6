/**
 * @file logging.cpp
 */
#include "sluice/obs/logging.hpp"

#include <memory>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace sluice::obs {

std::string_view to_string(LoggingError e) noexcept {
    switch (e) {
        case LoggingError::BadLevel:   return "bad_level";
        case LoggingError::SinkFailed: return "sink_failed";
    }
    return "unknown";
}

sluice_detail::expected<void, LoggingError> init_logging(const LoggingConfig& cfg) {
    const auto level = spdlog::level::from_str(cfg.level);
    // from_str maps unknown names to off; only "off" itself may mean off
    if (level == spdlog::level::off && cfg.level != "off") {
        return sluice_detail::unexpected(LoggingError::BadLevel);
    }

    std::shared_ptr<spdlog::logger> logger;
    try {
        spdlog::drop(sluice::config::constants::LOG_LOGGER_NAME);
        if (cfg.file.empty()) {
            logger = spdlog::stdout_color_mt(sluice::config::constants::LOG_LOGGER_NAME);
        } else {
            logger = spdlog::rotating_logger_mt(sluice::config::constants::LOG_LOGGER_NAME, cfg.file,
                                                cfg.rotate_bytes, cfg.rotate_files);
        }
    } catch (const spdlog::spdlog_ex& e) {
        SPDLOG_ERROR("logging setup failed: {}", e.what());
        return sluice_detail::unexpected(LoggingError::SinkFailed);
    }

    logger->set_pattern(cfg.pattern);
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(std::move(logger));
    return {};
}

} // namespace sluice::obs
