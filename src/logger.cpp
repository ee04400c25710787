#include "logger.hpp"

#include <eventsource-cpp/logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <utility>

namespace eventsource_cpp {

namespace detail {

auto logger() -> spdlog::logger& {
    static auto instance = [] {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto result = std::make_shared<spdlog::logger>("eventsource", std::move(sink));
        result->set_level(spdlog::level::warn);
        return result;
    }();
    return *instance;
}

}  // namespace detail

void set_log_level(LogLevel level) {
    auto spd = spdlog::level::warn;
    switch (level) {
        case LogLevel::trace: spd = spdlog::level::trace; break;
        case LogLevel::debug: spd = spdlog::level::debug; break;
        case LogLevel::info:  spd = spdlog::level::info; break;
        case LogLevel::warn:  spd = spdlog::level::warn; break;
        case LogLevel::error: spd = spdlog::level::err; break;
        case LogLevel::off:   spd = spdlog::level::off; break;
    }
    detail::logger().set_level(spd);
}

auto log_level() -> LogLevel {
    switch (detail::logger().level()) {
        case spdlog::level::trace:    return LogLevel::trace;
        case spdlog::level::debug:    return LogLevel::debug;
        case spdlog::level::info:     return LogLevel::info;
        case spdlog::level::warn:     return LogLevel::warn;
        case spdlog::level::err:
        case spdlog::level::critical: return LogLevel::error;
        default:                      return LogLevel::off;
    }
}

}  // namespace eventsource_cpp
