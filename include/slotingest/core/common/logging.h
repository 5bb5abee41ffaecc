#ifndef SLOTINGEST_CORE_COMMON_LOGGING_H
#define SLOTINGEST_CORE_COMMON_LOGGING_H

#include <fmt/printf.h>
#include <spdlog/spdlog.h>

namespace slotingest::logging {

/**
 * @brief Configure the default spdlog logger for slotingest.
 *
 * Reads the level from SLOTINGEST_LOG_LEVEL (trace, debug, info, warn,
 * error, off). Unknown or missing values fall back to info. Safe to call
 * more than once; only the first call installs the pattern.
 */
void init_logger();

/**
 * @brief Override the active log level (e.g. from a --verbose flag).
 */
void set_level(spdlog::level::level_enum level);

}  // namespace slotingest::logging

#define SLOTINGEST_LOGGER_INIT() ::slotingest::logging::init_logger()

// printf-style front end over spdlog
#define SLOTINGEST_LOG_IMPL(lvl, fmt_str, ...)                       \
    do {                                                             \
        if (spdlog::should_log(lvl)) {                               \
            spdlog::log(lvl, ::fmt::sprintf(fmt_str, __VA_ARGS__));  \
        }                                                            \
    } while (0)

#define SLOTINGEST_LOG_TRACE(fmt_str, ...) \
    SLOTINGEST_LOG_IMPL(spdlog::level::trace, fmt_str, __VA_ARGS__)
#define SLOTINGEST_LOG_DEBUG(fmt_str, ...) \
    SLOTINGEST_LOG_IMPL(spdlog::level::debug, fmt_str, __VA_ARGS__)
#define SLOTINGEST_LOG_INFO(fmt_str, ...) \
    SLOTINGEST_LOG_IMPL(spdlog::level::info, fmt_str, __VA_ARGS__)
#define SLOTINGEST_LOG_WARN(fmt_str, ...) \
    SLOTINGEST_LOG_IMPL(spdlog::level::warn, fmt_str, __VA_ARGS__)
#define SLOTINGEST_LOG_ERROR(fmt_str, ...) \
    SLOTINGEST_LOG_IMPL(spdlog::level::err, fmt_str, __VA_ARGS__)

#endif  // SLOTINGEST_CORE_COMMON_LOGGING_H
