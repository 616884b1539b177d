#include "cronspan/cron/window.hpp"
#include "cronspan/core/calendar.hpp"
#include "cronspan/core/utils.hpp"

namespace cronspan::cron {

namespace {

auto too_large(int days, int max_date_range) -> Error {
    return make_error(
        ErrorCode::WindowTooLarge,
        "Window exceeds the maximum date range",
        std::to_string(days) + " days (max " + std::to_string(max_date_range) + ")");
}

auto outside_calendar(std::string detail) -> Error {
    return make_error(
        ErrorCode::InvalidWindow,
        "Window reaches outside 0001-01-01 .. 9999-12-31",
        std::move(detail));
}

} // anonymous namespace

auto resolve_window(const GlobalWindow& window, int max_date_range) -> Result<DateRange> {
    if (window.days_forward < 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidWindow,
            "days_forward must not be negative",
            std::to_string(window.days_forward)));
    }
    if (!calendar::is_valid(window.start_date)) {
        return std::unexpected(make_error(
            ErrorCode::InvalidWindow,
            "Invalid start date",
            utils::format_date(window.start_date)));
    }
    if (!calendar::is_supported(window.start_date)) {
        return std::unexpected(outside_calendar(utils::format_date(window.start_date)));
    }
    if (window.days_forward > max_date_range) {
        return std::unexpected(too_large(window.days_forward, max_date_range));
    }
    if (window.days_forward > calendar::days_between(window.start_date, calendar::kLastSupportedDate) + 1) {
        return std::unexpected(outside_calendar(
            utils::format_date(window.start_date) + " +" + std::to_string(window.days_forward) + "d"));
    }

    auto lower = calendar::to_timestamp(window.start_date);
    auto end = lower + std::chrono::days(window.days_forward);
    return DateRange{
        .first = window.start_date,
        .day_count = window.days_forward,
        .lower = lower,
        .upper = end - std::chrono::seconds(1),
    };
}

auto resolve_window(Timestamp start_at, Timestamp end_at, int max_date_range) -> Result<DateRange> {
    if (!(start_at < end_at)) {
        return std::unexpected(make_error(
            ErrorCode::InvalidWindow,
            "Window start must be before its end",
            utils::format_timestamp(start_at) + " >= " + utils::format_timestamp(end_at)));
    }

    if (start_at < calendar::first_supported_instant() || end_at > calendar::last_supported_instant()) {
        return std::unexpected(outside_calendar(
            std::to_string(start_at.time_since_epoch().count()) + "s .. " +
            std::to_string(end_at.time_since_epoch().count()) + "s since epoch"));
    }

    auto first = calendar::to_date(start_at);
    auto last = calendar::to_date(end_at);
    int day_count = calendar::days_between(first, last) + 1;
    if (day_count > max_date_range) {
        return std::unexpected(too_large(day_count, max_date_range));
    }

    return DateRange{
        .first = first,
        .day_count = day_count,
        .lower = start_at,
        .upper = end_at,
    };
}

auto window_key(const EntryWindow& entry) -> std::string {
    if (entry.id) return *entry.id;
    return entry.cron + "-" + utils::format_date(calendar::to_date(entry.start_at)) + "-" +
           utils::format_date(calendar::to_date(entry.end_at));
}

} // namespace cronspan::cron
