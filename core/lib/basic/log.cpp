// modgraph/basic/log.cpp - Named spdlog loggers
#include "modgraph/basic/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace modgraph::log
{

namespace
{

constexpr const char * k_pattern = "[%H:%M:%S.%e] [%^%l%$] [modgraph:%n] %v";

}  // namespace

void init_logging(spdlog::level::level_enum level)
{
  spdlog::set_pattern(k_pattern);
  spdlog::set_level(level);
}

std::shared_ptr<spdlog::logger> get(const std::string & name)
{
  if (auto logger = spdlog::get(name)) {
    return logger;
  }

  std::shared_ptr<spdlog::logger> logger;
  try {
    logger = spdlog::stderr_color_mt(name);
  } catch (const spdlog::spdlog_ex &) {
    // Registered by another thread in the meantime.
    return spdlog::get(name);
  }
  logger->set_pattern(k_pattern);
  return logger;
}

std::shared_ptr<spdlog::logger> graph()
{
  static std::shared_ptr<spdlog::logger> logger = get("graph");
  return logger;
}

std::shared_ptr<spdlog::logger> sfc()
{
  static std::shared_ptr<spdlog::logger> logger = get("sfc");
  return logger;
}

std::shared_ptr<spdlog::logger> cache()
{
  static std::shared_ptr<spdlog::logger> logger = get("cache");
  return logger;
}

}  // namespace modgraph::log
