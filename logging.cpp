#include "logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

void init_logging(const char* name, Verbosity verbosity) {
  auto logger = spdlog::stderr_color_mt(name);
  logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
  spdlog::set_default_logger(logger);

  switch (verbosity) {
    case Verbosity::kQuiet:
      spdlog::set_level(spdlog::level::err);
      break;
    case Verbosity::kNormal:
      spdlog::set_level(spdlog::level::info);
      break;
    case Verbosity::kVerbose:
      spdlog::set_level(spdlog::level::debug);
      break;
  }
}
