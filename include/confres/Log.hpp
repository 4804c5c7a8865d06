/**
 * @file Log.hpp
 * @brief Diagnostic logger for configuration warnings
 *
 * Unknown keys, user/username mismatches and retired settings are reported
 * through a single named spdlog logger ("confres"). It writes to stderr
 * unless replaced with set_logger().
 */

#ifndef CONFRES_LOG_HPP
#define CONFRES_LOG_HPP

#include <spdlog/spdlog.h>
#include <memory>

namespace confres {

/**
 * @brief Get the diagnostic logger, creating the stderr logger on first use
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Replace the diagnostic logger
 * @param replacement New logger; nullptr restores the stderr logger
 */
void set_logger(std::shared_ptr<spdlog::logger> replacement);

} // namespace confres

#endif // CONFRES_LOG_HPP
