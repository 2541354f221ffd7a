#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace patchwright::log {

inline constexpr const char *kLoggerName = "patchwright";
inline constexpr const char *kPattern = "[%H:%M:%S] [%^%l%$] %v";

// Create (or reconfigure) the process logger writing to stderr.
void init(spdlog::level::level_enum level = spdlog::level::info);

// The process logger; created with defaults on first use if init() was not called.
std::shared_ptr<spdlog::logger> get();

// "debug" | "info" | "warn" | "error" | "off"; throws ConfigError otherwise.
spdlog::level::level_enum parse_level(std::string_view name);

} // namespace patchwright::log
