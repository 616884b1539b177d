#include "cronspan/core/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace cronspan {

namespace {
    // Guards g_logger; batch workers read it while init() may replace it.
    std::mutex g_mutex;
    std::shared_ptr<spdlog::logger> g_logger;

    auto to_spdlog_level(std::string_view level) -> spdlog::level::level_enum {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "info") return spdlog::level::info;
        if (level == "warn") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        return spdlog::level::info;
    }

    // Caller holds g_mutex, which also serializes spdlog registration.
    auto make_logger(std::string_view name, std::string_view level)
        -> std::shared_ptr<spdlog::logger>
    {
        spdlog::drop(std::string(name));
        auto logger = spdlog::stdout_color_mt(std::string(name));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
        logger->set_level(to_spdlog_level(level));
        return logger;
    }
}

void Logger::init(std::string_view name, std::string_view level) {
    std::lock_guard lock(g_mutex);
    // Threads still holding the previous logger keep it alive until done.
    g_logger = make_logger(name, level);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger> {
    std::lock_guard lock(g_mutex);
    if (!g_logger) g_logger = make_logger("cronspan", "info");
    return g_logger;
}

void Logger::set_level(std::string_view level) {
    get()->set_level(to_spdlog_level(level));
}

void Logger::flush() {
    get()->flush();
}

} // namespace cronspan
