// Ticket: 0011_preview_app

#include <cstdlib>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

#include "tilt-core/src/Config/ControllerConfig.hpp"
#include "tilt-core/src/Utils/Logging.hpp"
#include "tilt-gui/src/SDLApp.hpp"

namespace
{

// Usage: tilt_exe [free|tap|legacy|carousel] [--verbose]
tilt_core::ControllerConfig profileFor(std::string_view name)
{
  if (name == "tap")
  {
    return tilt_core::ControllerConfig::tapOnly();
  }
  if (name == "legacy")
  {
    return tilt_core::ControllerConfig::legacyFriction();
  }
  if (name == "carousel")
  {
    return tilt_core::ControllerConfig::carousel();
  }
  return tilt_core::ControllerConfig::freeRotation();
}

}  // namespace

int main(int argc, char* argv[])
{
  std::string_view profile = "free";
  auto level = spdlog::level::info;
  for (int i = 1; i < argc; ++i)
  {
    const std::string_view arg{argv[i]};
    if (arg == "--verbose")
    {
      level = spdlog::level::debug;
    }
    else
    {
      profile = arg;
    }
  }

  auto logger = tilt_core::makeLogger("tilt", level);
  logger->info("Starting preview with the '{}' profile", profile);

  try
  {
    tilt_gui::SDLApplication application{profileFor(profile), logger};
    return application.runApp();
  }
  catch (const std::exception& e)
  {
    logger->critical("Preview failed to start: {}", e.what());
    return EXIT_FAILURE;
  }
}
