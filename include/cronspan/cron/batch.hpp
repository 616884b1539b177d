#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include <nlohmann/json.hpp>

#include "cronspan/core/config.hpp"
#include "cronspan/core/error.hpp"
#include "cronspan/core/types.hpp"
#include "cronspan/cron/expander.hpp"
#include "cronspan/cron/window.hpp"

namespace cronspan::cron {

/// One fired instant of one expression. `window_key` is set for
/// per-entry windows (see window_key()).
struct TriggerInstant {
    std::string cron;
    std::optional<std::string> window_key;
    Timestamp at;

    auto operator==(const TriggerInstant&) const -> bool = default;
    auto operator<(const TriggerInstant& other) const -> bool {
        return std::tie(window_key, cron, at) < std::tie(other.window_key, other.cron, other.at);
    }
};

void to_json(json& j, const TriggerInstant& t);

/// Outcome for a single batch entry: its instants, or the error that
/// stopped it. One bad entry never fails the rest of the batch.
struct EntryResult {
    std::optional<std::string> id;
    std::string cron;
    std::optional<std::string> window_key;
    Result<std::set<Timestamp>> triggers;
};

void to_json(json& j, const EntryResult& e);

struct BatchResult {
    std::vector<EntryResult> entries;

    /// Every successful entry's instants, flattened and deduplicated.
    [[nodiscard]] auto instants() const -> std::set<TriggerInstant>;

    /// Number of entries that failed.
    [[nodiscard]] auto failures() const -> std::size_t;
};

void to_json(json& j, const BatchResult& b);

/// Expand many expressions over one shared window. Duplicate cron strings
/// collapse to one entry. Fails as a whole only when the window itself is
/// invalid; per-expression errors land in the entry results.
auto expand_global_window(const TimestampExpander& expander,
                          const std::vector<std::string>& crons,
                          const GlobalWindow& window) -> Result<BatchResult>;

/// Expand each entry over its own window. Identical entries collapse to
/// one. Every failure is reported per entry.
auto expand_per_entry_window(const TimestampExpander& expander,
                             const std::vector<EntryWindow>& entries) -> BatchResult;

/// Library entry point for the global window strategy.
/// Fails with InvalidConfiguration on an unknown `day_match_mode`.
auto expand_global_window(const std::vector<std::string>& crons, CivilDate start_date,
                          int days_forward, std::string_view day_match_mode = "vixie",
                          ExpanderConfig config = {}) -> Result<BatchResult>;

/// Library entry point for the per-entry window strategy.
/// Fails with InvalidConfiguration on an unknown `day_match_mode` or a
/// non-positive `max_date_range`.
auto expand_per_entry_window(const std::vector<EntryWindow>& entries,
                             int max_date_range = kDefaultMaxDateRange,
                             std::string_view day_match_mode = "vixie",
                             ExpanderConfig config = {}) -> Result<BatchResult>;

} // namespace cronspan::cron
