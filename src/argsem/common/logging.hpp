/**
 * @file logging.hpp
 * @brief Access to the library-wide spdlog logger.
 */
#pragma once
#include "argsem/common/common.hpp"

#include <spdlog/spdlog.h>

namespace argsem
{

/**
 * @brief Name under which the library logger is registered with spdlog.
 */
inline constexpr const char* k_logger_name = "argsem";

/**
 * @brief Get the library logger, creating it on first use.
 *
 * @details
 * The logger writes to stderr. Its level defaults to `warn`; hosts raise it
 * with `set_log_level()` or through the spdlog registry.
 *
 * @par Thread safety
 * Safe to call from any thread.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the level of the library logger.
 */
void set_log_level(spdlog::level::level_enum level);

} // namespace argsem
