#include "cronspan/cron/day_filter.hpp"
#include "cronspan/core/calendar.hpp"

namespace cronspan::cron {

auto day_matches(const CivilDate& date, const FieldValues& dom_values,
                 const FieldValues& dow_values, DayMatchMode mode) -> bool {
    if (!calendar::is_valid(date)) return false;
    return day_matches(date.day, calendar::weekday(date), dom_values, dow_values, mode);
}

} // namespace cronspan::cron
