#include "cronspan/core/calendar.hpp"

#include <chrono>

namespace cronspan::calendar {

namespace {

auto to_sys_days(const CivilDate& date) -> std::chrono::sys_days {
    return std::chrono::sys_days{std::chrono::year{date.year} /
                                 std::chrono::month{static_cast<unsigned>(date.month)} /
                                 std::chrono::day{static_cast<unsigned>(date.day)}};
}

auto from_sys_days(std::chrono::sys_days days) -> CivilDate {
    std::chrono::year_month_day ymd{days};
    return CivilDate{
        .year = static_cast<int>(ymd.year()),
        .month = static_cast<int>(static_cast<unsigned>(ymd.month())),
        .day = static_cast<int>(static_cast<unsigned>(ymd.day())),
    };
}

} // anonymous namespace

auto to_tm(Timestamp ts) -> std::tm {
    auto time_t_val = static_cast<std::time_t>(ts.time_since_epoch().count());
    std::tm tm_val{};
#ifdef _WIN32
    gmtime_s(&tm_val, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm_val);
#endif
    return tm_val;
}

auto to_timestamp(const CivilDate& date, int hour, int minute, int second) -> Timestamp {
    return to_sys_days(date) + std::chrono::hours(hour) + std::chrono::minutes(minute) +
           std::chrono::seconds(second);
}

auto to_date(Timestamp ts) -> CivilDate {
    return from_sys_days(std::chrono::floor<std::chrono::days>(ts));
}

auto first_supported_instant() -> Timestamp {
    return to_timestamp(kFirstSupportedDate);
}

auto last_supported_instant() -> Timestamp {
    return to_timestamp(kLastSupportedDate, 23, 59, 59);
}

auto weekday(const CivilDate& date) -> int {
    return static_cast<int>(std::chrono::weekday{to_sys_days(date)}.c_encoding());
}

auto add_days(const CivilDate& date, int days) -> CivilDate {
    return from_sys_days(to_sys_days(date) + std::chrono::days(days));
}

auto days_between(const CivilDate& from, const CivilDate& to) -> int {
    return static_cast<int>((to_sys_days(to) - to_sys_days(from)).count());
}

} // namespace cronspan::calendar
