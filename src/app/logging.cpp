#include <labscan/app/logging.hpp>
#include <labscan/core/alias_table.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace labscan::app {

bool configure_logging(std::string_view level) {
  auto logger = spdlog::get("labscan");
  if (!logger) {
    logger = spdlog::stderr_color_mt("labscan");
  }
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_default_logger(logger);

  const std::string name = labscan::core::to_lower(level);
  const auto parsed = spdlog::level::from_str(name);
  // from_str maps anything unrecognised to off; only accept that for "off" itself.
  const bool known = parsed != spdlog::level::off || name == "off";
  spdlog::set_level(known ? parsed : spdlog::level::info);
  if (!known) {
    spdlog::warn("unknown log level '{}', using info", level);
  }
  return known;
}

}  // namespace labscan::app
