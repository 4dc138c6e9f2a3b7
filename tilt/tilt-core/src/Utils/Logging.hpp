// Ticket: 0007_card_controller

#ifndef TILT_CORE_UTILS_LOGGING_HPP
#define TILT_CORE_UTILS_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace tilt_core
{

/**
 * @brief Fetch a registered logger, creating a colored stdout one if needed
 * @param name Registry name, e.g. "card" or "preview"
 * @param level Level applied when the logger is created here
 *
 * Loggers already registered by the host (with their own sinks and level)
 * are returned unchanged.
 */
std::shared_ptr<spdlog::logger> makeLogger(
  const std::string& name,
  spdlog::level::level_enum level = spdlog::level::info);

}  // namespace tilt_core

#endif  // TILT_CORE_UTILS_LOGGING_HPP
