#pragma once

// Internal header, not installed.
// Library logger on top of spdlog. Compile-time filtering is left to
// SPDLOG_ACTIVE_LEVEL (set to trace for this target); the runtime level
// is controlled through set_log_level().

#include <spdlog/spdlog.h>

namespace eventsource_cpp::detail {

auto logger() -> spdlog::logger&;

}  // namespace eventsource_cpp::detail

#define EVENTSOURCE_TRACE(...) SPDLOG_LOGGER_TRACE(&::eventsource_cpp::detail::logger(), __VA_ARGS__)
#define EVENTSOURCE_DEBUG(...) SPDLOG_LOGGER_DEBUG(&::eventsource_cpp::detail::logger(), __VA_ARGS__)
#define EVENTSOURCE_INFO(...)  SPDLOG_LOGGER_INFO(&::eventsource_cpp::detail::logger(), __VA_ARGS__)
#define EVENTSOURCE_WARN(...)  SPDLOG_LOGGER_WARN(&::eventsource_cpp::detail::logger(), __VA_ARGS__)
#define EVENTSOURCE_ERROR(...) SPDLOG_LOGGER_ERROR(&::eventsource_cpp::detail::logger(), __VA_ARGS__)
