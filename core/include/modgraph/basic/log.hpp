// modgraph/basic/log.hpp - Named spdlog loggers
//
// Debug timing and cache-hit tracing only. User-facing problems go through
// DiagnosticBag, never through these loggers.
//
#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace modgraph::log
{

/// Set pattern and level of every registered spdlog logger, existing and future.
void init_logging(spdlog::level::level_enum level = spdlog::level::warn);

/// Get the logger registered under `name`, creating a stderr logger if needed.
std::shared_ptr<spdlog::logger> get(const std::string & name);

/// Graph construction ("parse")
std::shared_ptr<spdlog::logger> graph();

/// Composite-component compilation
std::shared_ptr<spdlog::logger> sfc();

/// Content and artifact caches
std::shared_ptr<spdlog::logger> cache();

}  // namespace modgraph::log
