#pragma once

#include <optional>
#include <string>

#include "cronspan/core/config.hpp"
#include "cronspan/core/error.hpp"
#include "cronspan/core/types.hpp"

namespace cronspan::cron {

/// One window shared by every expression: `days_forward` whole days
/// starting at midnight UTC of `start_date`.
struct GlobalWindow {
    CivilDate start_date;
    int days_forward = 0;
};

/// A window owned by a single expression. Both bounds are inclusive and
/// may carry sub-day precision.
struct EntryWindow {
    std::optional<std::string> id;
    std::string cron;
    Timestamp start_at;
    Timestamp end_at;

    auto operator==(const EntryWindow&) const -> bool = default;
};

/// The candidate dates of a window plus the instant bounds that constructed
/// timestamps must fall within (both inclusive).
struct DateRange {
    CivilDate first;
    int day_count = 0;
    Timestamp lower;
    Timestamp upper;
};

/// Fails with InvalidWindow on a negative `days_forward` or a window
/// reaching past the supported calendar, and with WindowTooLarge when
/// `days_forward` exceeds `max_date_range`.
auto resolve_window(const GlobalWindow& window, int max_date_range = kDefaultMaxDateRange)
    -> Result<DateRange>;

/// Fails with InvalidWindow unless `start_at < end_at` and both lie within
/// the supported calendar, and with
/// WindowTooLarge when the window touches more than `max_date_range`
/// calendar days.
auto resolve_window(Timestamp start_at, Timestamp end_at,
                    int max_date_range = kDefaultMaxDateRange) -> Result<DateRange>;

/// Caller-supplied id, or `<cron>-<start date>-<end date>` when absent.
auto window_key(const EntryWindow& entry) -> std::string;

} // namespace cronspan::cron
