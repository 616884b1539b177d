#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace cronspan {

class Logger {
public:
    /// Replace the process-wide logger. Safe while other threads log.
    static void init(std::string_view name = "cronspan", std::string_view level = "info");

    /// The current logger, created with defaults on first use.
    static auto get() -> std::shared_ptr<spdlog::logger>;

    static void set_level(std::string_view level);
    static void flush();
};

} // namespace cronspan

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::cronspan::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::cronspan::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::cronspan::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::cronspan::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::cronspan::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::cronspan::Logger::get(), __VA_ARGS__)
