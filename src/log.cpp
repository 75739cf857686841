#include "include/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view s) {
  if (s == "debug")
    return spdlog::level::debug;
  if (s == "info")
    return spdlog::level::info;
  if (s == "warn" || s == "warning")
    return spdlog::level::warn;
  if (s == "error")
    return spdlog::level::err;
  if (s == "off")
    return spdlog::level::off;
  return std::nullopt;
}

void init_logging(spdlog::level::level_enum level) {
  auto logger = spdlog::get("schemasniff");
  if (!logger)
    logger = spdlog::stderr_color_mt("schemasniff");
  logger->set_pattern("%^%l%$: %v");
  spdlog::set_default_logger(logger);
  spdlog::set_level(level);
}
