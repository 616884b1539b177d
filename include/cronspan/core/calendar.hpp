#pragma once

#include <ctime>

#include "cronspan/core/types.hpp"

namespace cronspan::calendar {

/// Bounds of the supported calendar. Windows reaching outside them are
/// rejected before any date math runs.
inline constexpr CivilDate kFirstSupportedDate{.year = 1, .month = 1, .day = 1};
inline constexpr CivilDate kLastSupportedDate{.year = 9999, .month = 12, .day = 31};

/// Whole days from kFirstSupportedDate through kLastSupportedDate.
inline constexpr int kSupportedDays = 3652059;

[[nodiscard]] constexpr auto is_leap_year(int year) noexcept -> bool {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

/// Number of days in `month` (1-12) of `year`; 0 for an invalid month.
[[nodiscard]] constexpr auto days_in_month(int year, int month) noexcept -> int {
    constexpr int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return days[month - 1];
}

[[nodiscard]] constexpr auto is_valid(const CivilDate& date) noexcept -> bool {
    return date.day >= 1 && date.day <= days_in_month(date.year, date.month);
}

[[nodiscard]] constexpr auto is_supported(const CivilDate& date) noexcept -> bool {
    return is_valid(date) && date >= kFirstSupportedDate && date <= kLastSupportedDate;
}

/// Convert a Timestamp to a std::tm in UTC.
auto to_tm(Timestamp ts) -> std::tm;

/// Midnight UTC of `date`, plus the given time of day.
auto to_timestamp(const CivilDate& date, int hour = 0, int minute = 0, int second = 0) -> Timestamp;

/// Calendar date (UTC) containing `ts`.
auto to_date(Timestamp ts) -> CivilDate;

/// First and last representable instants of the supported calendar.
auto first_supported_instant() -> Timestamp;
auto last_supported_instant() -> Timestamp;

/// Day of week of `date`, 0 = Sunday .. 6 = Saturday.
auto weekday(const CivilDate& date) -> int;

auto add_days(const CivilDate& date, int days) -> CivilDate;

/// Whole days from `from` to `to` (negative when `to` is earlier).
auto days_between(const CivilDate& from, const CivilDate& to) -> int;

} // namespace cronspan::calendar
