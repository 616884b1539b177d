#pragma once

#include "cronspan/core/types.hpp"
#include "cronspan/cron/day_match.hpp"
#include "cronspan/cron/values.hpp"

namespace cronspan::cron {

/// Combine a date's day-of-month and day-of-week matches per `mode`.
/// Expects the month filter to have passed already.
[[nodiscard]] inline auto day_matches(int day_of_month, int day_of_week,
                                      const FieldValues& dom_values,
                                      const FieldValues& dow_values,
                                      DayMatchMode mode) noexcept -> bool {
    bool dom_ok = dom_values.contains(day_of_month);
    bool dow_ok = dow_values.contains(day_of_week);
    return mode == DayMatchMode::Union ? (dom_ok || dow_ok) : (dom_ok && dow_ok);
}

/// Same as above for a calendar date; computes its weekday.
auto day_matches(const CivilDate& date, const FieldValues& dom_values,
                 const FieldValues& dow_values, DayMatchMode mode) -> bool;

} // namespace cronspan::cron
