/// @file logging.hpp
/// @brief Verbosity control for the library's diagnostic log.

#pragma once

#include <cstdint>
#include <string_view>

namespace eventsource_cpp {

/// Log verbosity, most to least verbose.
enum class LogLevel : std::uint8_t {
    trace,  ///< Every applied instruction.
    debug,  ///< Replay start/finish and tolerated no-op removals.
    info,
    warn,   ///< Failed replays. The default.
    error,
    off,
};

/// Convert a LogLevel to its string representation.
constexpr auto to_string_view(LogLevel level) noexcept -> std::string_view {
    switch (level) {
        case LogLevel::trace: return "trace";
        case LogLevel::debug: return "debug";
        case LogLevel::info:  return "info";
        case LogLevel::warn:  return "warn";
        case LogLevel::error: return "error";
        case LogLevel::off:   return "off";
    }
    return "unknown";
}

/// Set the verbosity of the library logger (named "eventsource", writing
/// to stderr). Global sinks and the default spdlog logger are untouched.
void set_log_level(LogLevel level);

/// Current verbosity of the library logger.
auto log_level() -> LogLevel;

}  // namespace eventsource_cpp
