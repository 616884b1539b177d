#include "cronspan/core/config.hpp"
#include "cronspan/core/calendar.hpp"
#include "cronspan/core/logger.hpp"
#include "cronspan/cron/day_match.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <optional>

namespace cronspan {

namespace {

template <typename T>
auto parse_env_number(const char* name) -> std::optional<T> {
    auto* val = std::getenv(name);
    if (!val) return std::nullopt;

    std::string_view text(val);
    T number{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        LOG_WARN("Config: ignoring {}='{}', not a number", name, text);
        return std::nullopt;
    }
    return number;
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto val = parse_env_number<int>("CRONSPAN_MAX_DATE_RANGE")) {
        config.expander.max_date_range = *val;
    }
    if (auto* val = std::getenv("CRONSPAN_DAY_MATCH_MODE")) {
        config.expander.day_match_mode = val;
    }
    if (auto val = parse_env_number<std::size_t>("CRONSPAN_MAX_RESULTS")) {
        config.expander.max_results = *val;
    }
    if (auto val = parse_env_number<std::size_t>("CRONSPAN_WORKER_THREADS")) {
        config.expander.worker_threads = *val;
    }
    if (auto* val = std::getenv("CRONSPAN_LOG_LEVEL")) {
        config.log_level = val;
    }

    return config;
}

void apply_log_level(const Config& config) {
    Logger::set_level(config.log_level);
}

auto default_config() -> Config {
    return Config{};
}

auto validate_config(const ExpanderConfig& config) -> VoidResult {
    if (auto policy = cron::parse_day_match_policy(config.day_match_mode); !policy) {
        return std::unexpected(policy.error());
    }
    if (config.max_date_range <= 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfiguration,
            "max_date_range must be positive",
            std::to_string(config.max_date_range)));
    }
    if (config.max_date_range > calendar::kSupportedDays) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfiguration,
            "max_date_range exceeds the supported calendar",
            std::to_string(config.max_date_range) + " days (max " +
                std::to_string(calendar::kSupportedDays) + ")"));
    }
    if (config.max_results == 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfiguration,
            "max_results must be positive"));
    }
    return {};
}

} // namespace cronspan
