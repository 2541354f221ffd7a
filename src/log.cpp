#include "patchwright/log.hpp"

#include "patchwright/errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>

namespace patchwright::log {

namespace {

std::shared_ptr<spdlog::logger> make_logger() {
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  sink->set_color_mode(spdlog::color_mode::automatic);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
  logger->set_pattern(kPattern);
  logger->flush_on(spdlog::level::warn);
  spdlog::register_logger(logger);
  return logger;
}

} // namespace

void init(spdlog::level::level_enum level) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger)
    logger = make_logger();
  logger->set_level(level);
}

std::shared_ptr<spdlog::logger> get() {
  if (auto logger = spdlog::get(kLoggerName))
    return logger;
  return make_logger();
}

spdlog::level::level_enum parse_level(std::string_view name) {
  if (name == "debug")
    return spdlog::level::debug;
  if (name == "info")
    return spdlog::level::info;
  if (name == "warn" || name == "warning")
    return spdlog::level::warn;
  if (name == "error")
    return spdlog::level::err;
  if (name == "off")
    return spdlog::level::off;
  throw ConfigError("unknown log level: " + std::string(name));
}

} // namespace patchwright::log
