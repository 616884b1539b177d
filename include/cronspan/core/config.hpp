#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "cronspan/core/error.hpp"
#include "cronspan/core/types.hpp"

namespace cronspan {

/// Default upper bound on a window's span, in days (365 * 3).
inline constexpr int kDefaultMaxDateRange = 1095;

struct ExpanderConfig {
    int max_date_range = kDefaultMaxDateRange;
    std::string day_match_mode = "vixie";  // "vixie", "contains", "union", "intersect"
    std::size_t max_results = 2000000;     // per expression, eager expansion only
    std::size_t worker_threads = 1;        // 0 = hardware concurrency
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ExpanderConfig, max_date_range, day_match_mode, max_results, worker_threads)

struct Config {
    ExpanderConfig expander;
    std::string log_level = "info";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, expander, log_level)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;

/// Sets the logger's level from `config.log_level`.
void apply_log_level(const Config& config);

/// Checks an expander configuration before it is used.
/// Fails with InvalidConfiguration on an unknown day_match_mode or a
/// non-positive max_date_range / max_results, or a max_date_range longer
/// than the supported calendar.
auto validate_config(const ExpanderConfig& config) -> VoidResult;

} // namespace cronspan
