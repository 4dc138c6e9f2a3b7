// Ticket: 0007_card_controller

#include "tilt-core/src/Utils/Logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace tilt_core
{

std::shared_ptr<spdlog::logger> makeLogger(const std::string& name,
                                           spdlog::level::level_enum level)
{
  if (auto existing = spdlog::get(name))
  {
    return existing;
  }

  try
  {
    auto logger = spdlog::stdout_color_mt(name);
    logger->set_level(level);
    return logger;
  }
  catch (const spdlog::spdlog_ex&)
  {
    // Registered concurrently between get() and stdout_color_mt()
    if (auto existing = spdlog::get(name))
    {
      return existing;
    }
    throw;
  }
}

}  // namespace tilt_core
